#include "membuffer/format/structured.hpp"

#include "test_main.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace {

using membuffer::format::Reader;
using membuffer::format::Writer;
using membuffer::format::add_structured_entry;
using membuffer::format::errc;
using membuffer::format::load_structured_entry;
using membuffer::format::type_tag;

struct Inner final {
  std::string name;
  std::vector<std::uint64_t> values;
};

struct HeavyStruct final {
  std::int32_t id{0};
  std::string label;
  std::vector<Inner> items;
  std::map<std::string, double> weights;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Inner, name, values)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(HeavyStruct, id, label, items, weights)

void test_struct_roundtrip() {
  HeavyStruct value;
  value.id = 17;
  value.label = "\xE5\x9C\xB0\xE7\x90\x83";
  value.items.push_back(Inner{"first", {1, 2, 3}});
  value.items.push_back(Inner{"second", {}});
  value.weights["a"] = 0.5;

  Writer writer;
  TEST_EXPECT_OK(add_structured_entry(writer, 0, value));
  TEST_EXPECT_OK(writer.add_entry(1, std::int32_t{5}));
  const auto buffer = writer.finalize();

  Reader reader;
  TEST_EXPECT_OK(Reader::parse(buffer, reader));
  // 结构化字段以 Text 类型存储。
  TEST_EXPECT(reader.find(0)->type == type_tag::text);

  const auto loaded = load_structured_entry<HeavyStruct>(reader, 0);
  TEST_EXPECT_OK(loaded.ec);
  TEST_EXPECT_EQ(loaded.value.id, 17);
  TEST_EXPECT_EQ(loaded.value.label, value.label);
  TEST_EXPECT_EQ(loaded.value.items.size(), 2u);
  TEST_EXPECT_EQ(loaded.value.items[0].name, "first");
  TEST_EXPECT(loaded.value.items[0].values == value.items[0].values);
  TEST_EXPECT(loaded.value.items[1].values.empty());
  TEST_EXPECT_EQ(loaded.value.weights.at("a"), 0.5);

  // 文本本身是合法 JSON。
  const auto text = reader.load_entry<std::string_view>(0);
  TEST_EXPECT_OK(text.ec);
  TEST_EXPECT(nlohmann::json::accept(text.value));
}

void test_plain_containers() {
  Writer writer;
  TEST_EXPECT_OK(add_structured_entry(writer, 3, std::vector<std::string>{"x", "y"}));
  const auto buffer = writer.finalize();

  Reader reader;
  TEST_EXPECT_OK(Reader::parse(buffer, reader));
  const auto loaded = load_structured_entry<std::vector<std::string>>(reader, 3);
  TEST_EXPECT_OK(loaded.ec);
  TEST_EXPECT_EQ(loaded.value.size(), 2u);
  TEST_EXPECT_EQ(loaded.value[1], "y");
}

void test_non_json_text_is_decode_error() {
  Writer writer;
  TEST_EXPECT_OK(writer.add_entry(0, "not json {"));
  TEST_EXPECT_OK(add_structured_entry(writer, 1, std::vector<std::string>{"x"}));
  const auto buffer = writer.finalize();

  Reader reader;
  TEST_EXPECT_OK(Reader::parse(buffer, reader));
  TEST_EXPECT_ERR(load_structured_entry<HeavyStruct>(reader, 0).ec, errc::structured_decode);
  // 合法 JSON 但结构不符。
  TEST_EXPECT_ERR(load_structured_entry<HeavyStruct>(reader, 1).ec, errc::structured_decode);
}

void test_lookup_errors_pass_through() {
  Writer writer;
  TEST_EXPECT_OK(writer.add_entry(0, std::int32_t{1}));
  const auto buffer = writer.finalize();

  Reader reader;
  TEST_EXPECT_OK(Reader::parse(buffer, reader));

  const auto mismatch = load_structured_entry<HeavyStruct>(reader, 0);
  TEST_EXPECT_ERR(mismatch.ec, errc::type_mismatch);
  TEST_EXPECT(mismatch.actual_type == type_tag::integer32);
  TEST_EXPECT(mismatch.requested_type == type_tag::text);

  TEST_EXPECT_ERR(load_structured_entry<HeavyStruct>(reader, 9).ec, errc::unknown_field);
}

void test_invalid_utf8_string_is_encode_error() {
  Writer writer;
  const std::string bad{"\xC3\x28"};
  TEST_EXPECT_ERR(add_structured_entry(writer, 0, bad), errc::structured_encode);
  TEST_EXPECT(writer.empty());
  TEST_EXPECT_EQ(writer.payload_size(), 0u);
}

}  // namespace

int main() {
  test_struct_roundtrip();
  test_plain_containers();
  test_non_json_text_is_decode_error();
  test_lookup_errors_pass_through();
  test_invalid_utf8_string_is_encode_error();
  return ::membuffer::tests::run_and_report();
}
