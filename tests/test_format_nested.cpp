#include "membuffer/format/reader.hpp"
#include "membuffer/format/writer.hpp"

#include "test_main.hpp"

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <vector>

namespace {

using membuffer::format::FieldDescriptor;
using membuffer::format::Position;
using membuffer::format::Reader;
using membuffer::format::ReaderOptions;
using membuffer::format::Writer;
using membuffer::format::byte;
using membuffer::format::errc;
using membuffer::format::type_tag;

void test_nested_roundtrip() {
  Writer inner;
  TEST_EXPECT_OK(inner.add_entry(1, "Moon"));
  TEST_EXPECT_OK(inner.add_entry(2, std::int32_t{384400}));

  Writer outer;
  TEST_EXPECT_OK(outer.add_entry(0, "Earth"));
  TEST_EXPECT_OK(outer.add_entry(7, inner));
  // 嵌套字段的长度就是内层 finalize() 的字节数。
  TEST_EXPECT_EQ(outer.payload_size(), 5 + inner.finalized_size());

  const auto buffer = outer.finalize();
  Reader reader;
  TEST_EXPECT_OK(Reader::parse(buffer, reader));
  TEST_EXPECT(reader.find(7)->type == type_tag::nested_buffer);
  TEST_EXPECT_EQ(static_cast<std::size_t>(reader.find(7)->position.length), inner.finalized_size());

  const auto nested = reader.load_recursive_reader(7);
  TEST_EXPECT_OK(nested.ec);
  TEST_EXPECT_EQ(nested.value.size(), 2u);
  TEST_EXPECT_EQ(nested.value.load_entry<std::string_view>(1).value, "Moon");
  TEST_EXPECT_EQ(nested.value.load_entry<std::int32_t>(2).value, 384400);

  // 内层 buffer 与外层共享存储。
  const auto inner_bytes = reader.load_raw_entry(7, type_tag::nested_buffer);
  TEST_EXPECT_OK(inner_bytes.ec);
  TEST_EXPECT(nested.value.payload().data() + nested.value.payload_size() ==
              inner_bytes.value.data() + inner_bytes.value.size());

  // 内层 buffer 单独解析的结果一致。
  const auto standalone = inner.finalize();
  TEST_EXPECT(std::equal(standalone.begin(), standalone.end(), inner_bytes.value.begin(), inner_bytes.value.end()));
}

void test_writer_reused_after_nesting() {
  Writer inner;
  TEST_EXPECT_OK(inner.add_entry(1, std::int32_t{1}));

  Writer outer;
  TEST_EXPECT_OK(outer.add_entry(1, inner));
  // 写入的是当时的快照，之后修改 inner 不影响 outer。
  TEST_EXPECT_OK(inner.add_entry(2, std::int32_t{2}));
  TEST_EXPECT_OK(outer.add_entry(2, inner));

  const auto buffer = outer.finalize();
  Reader reader;
  TEST_EXPECT_OK(Reader::parse(buffer, reader));
  TEST_EXPECT_EQ(reader.load_recursive_reader(1).value.size(), 1u);
  TEST_EXPECT_EQ(reader.load_recursive_reader(2).value.size(), 2u);
}

void test_deep_nesting() {
  Writer level3;
  TEST_EXPECT_OK(level3.add_entry(0, "deep"));
  Writer level2;
  TEST_EXPECT_OK(level2.add_entry(0, level3));
  Writer level1;
  TEST_EXPECT_OK(level1.add_entry(0, level2));

  const auto buffer = level1.finalize();
  Reader reader;
  TEST_EXPECT_OK(Reader::parse(buffer, reader));

  const auto r2 = reader.load_recursive_reader(0);
  TEST_EXPECT_OK(r2.ec);
  const auto r3 = r2.value.load_entry<Reader>(0);
  TEST_EXPECT_OK(r3.ec);
  const auto leaf = r3.value.load_entry<std::string_view>(0);
  TEST_EXPECT_OK(leaf.ec);
  TEST_EXPECT_EQ(leaf.value, "deep");
}

void test_nested_type_mismatch() {
  Writer writer;
  TEST_EXPECT_OK(writer.add_entry(1, "plain"));
  const auto buffer = writer.finalize();

  Reader reader;
  TEST_EXPECT_OK(Reader::parse(buffer, reader));
  const auto nested = reader.load_recursive_reader(1);
  TEST_EXPECT_ERR(nested.ec, errc::type_mismatch);
  TEST_EXPECT(nested.actual_type == type_tag::text);
  TEST_EXPECT(nested.requested_type == type_tag::nested_buffer);
  TEST_EXPECT_ERR(reader.load_recursive_reader(2).ec, errc::unknown_field);
}

void test_malformed_nested_buffer() {
  // 嵌套字段的字节里没有 sentinel。
  std::vector<byte> buffer;
  membuffer::format::encode_header(
    std::vector<FieldDescriptor>{FieldDescriptor{Position{0, 6}, type_tag::nested_buffer, 1}}, buffer);
  for (byte b = 0; b < 6; ++b) {
    buffer.push_back(b);
  }

  Reader reader;
  TEST_EXPECT_OK(Reader::parse(buffer, reader));
  TEST_EXPECT_ERR(reader.load_recursive_reader(1).ec, errc::malformed_header);
}

void test_nested_reader_inherits_options() {
  Writer inner;
  TEST_EXPECT_OK(inner.add_raw_entry(1, type_tag::text, std::vector<byte>{0xFF}));
  Writer outer;
  TEST_EXPECT_OK(outer.add_entry(1, inner));
  const auto buffer = outer.finalize();

  Reader strict;
  TEST_EXPECT_OK(Reader::parse(buffer, strict));
  TEST_EXPECT_ERR(strict.load_recursive_reader(1).value.load_entry<std::string_view>(1).ec, errc::invalid_utf8);

  ReaderOptions options;
  options.validate_utf8 = false;
  Reader lenient;
  TEST_EXPECT_OK(Reader::parse(buffer, lenient, options));
  const auto nested = lenient.load_recursive_reader(1);
  TEST_EXPECT(!nested.value.options().validate_utf8);
  TEST_EXPECT_OK(nested.value.load_entry<std::string_view>(1).ec);
}

}  // namespace

int main() {
  test_nested_roundtrip();
  test_writer_reused_after_nesting();
  test_deep_nesting();
  test_nested_type_mismatch();
  test_malformed_nested_buffer();
  test_nested_reader_inherits_options();
  return ::membuffer::tests::run_and_report();
}
