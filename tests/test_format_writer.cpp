#include "membuffer/format/reader.hpp"
#include "membuffer/format/writer.hpp"

#include "test_main.hpp"

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace {

using membuffer::format::FieldDescriptor;
using membuffer::format::Position;
using membuffer::format::Reader;
using membuffer::format::Writer;
using membuffer::format::WriterOptions;
using membuffer::format::byte;
using membuffer::format::bytes_view;
using membuffer::format::errc;
using membuffer::format::header_size;
using membuffer::format::kSentinel;
using membuffer::format::read_i32;
using membuffer::format::type_tag;

Reader parse_or_fail(const std::vector<byte>& buffer) {
  Reader reader;
  TEST_EXPECT_OK(Reader::parse(buffer, reader));
  return reader;
}

void test_empty_writer() {
  Writer writer;
  TEST_EXPECT(writer.empty());
  TEST_EXPECT_EQ(writer.finalized_size(), header_size(0));

  const auto out = writer.finalize();
  TEST_EXPECT_EQ(out.size(), 4u);
  TEST_EXPECT_EQ(read_i32(out, 0), kSentinel);
}

void test_offsets_follow_insertion_order() {
  Writer writer;
  TEST_EXPECT_OK(writer.add_entry(10, std::string_view{"abc"}));
  TEST_EXPECT_OK(writer.add_entry(2, std::vector<byte>{1, 2}));
  TEST_EXPECT_OK(writer.add_entry(5, std::string{"xyzw"}));
  TEST_EXPECT_EQ(writer.payload_size(), 9u);

  const auto out = writer.finalize();
  const auto reader = parse_or_fail(out);
  TEST_EXPECT_EQ(reader.size(), 3u);

  // payload 区间按写入顺序单调递增，与 key 无关。
  TEST_EXPECT(reader.find(10)->position == (Position{0, 3}));
  TEST_EXPECT(reader.find(2)->position == (Position{3, 2}));
  TEST_EXPECT(reader.find(5)->position == (Position{5, 4}));

  // 记录按 key 升序排列。
  const auto& fields = reader.descriptors();
  TEST_EXPECT_EQ(fields[0].key, 2);
  TEST_EXPECT_EQ(fields[1].key, 5);
  TEST_EXPECT_EQ(fields[2].key, 10);
}

void test_inline_integer_uses_no_payload() {
  Writer writer;
  TEST_EXPECT_OK(writer.add_entry(1, std::int32_t{-12345}));
  TEST_EXPECT_EQ(writer.payload_size(), 0u);

  const auto out = writer.finalize();
  TEST_EXPECT_EQ(out.size(), header_size(1));
  TEST_EXPECT_EQ(read_i32(out, 0), -12345);
  TEST_EXPECT_EQ(read_i32(out, 4), 0);
  TEST_EXPECT_EQ(read_i32(out, 8), static_cast<std::int32_t>(type_tag::integer32));
  TEST_EXPECT_EQ(read_i32(out, 12), 1);
}

void test_finalize_is_repeatable() {
  Writer writer;
  TEST_EXPECT_OK(writer.add_entry(1, "Earth"));
  TEST_EXPECT_OK(writer.add_entry(2, std::int32_t{7}));

  const auto a = writer.finalize();
  const auto b = writer.finalize();
  TEST_EXPECT(a == b);
  TEST_EXPECT_EQ(a.size(), writer.finalized_size());

  // finalize 之后继续写入仍然有效。
  TEST_EXPECT_OK(writer.add_entry(3, std::int32_t{8}));
  const auto c = writer.finalize();
  TEST_EXPECT_EQ(c.size(), a.size() + 16);

  std::vector<byte> appended{0xAA};
  writer.finalize_to(appended);
  TEST_EXPECT_EQ(appended.size(), c.size() + 1);
  TEST_EXPECT(std::equal(c.begin(), c.end(), appended.begin() + 1));
}

void test_last_write_wins() {
  Writer writer;
  TEST_EXPECT_OK(writer.add_entry(1, "first"));
  TEST_EXPECT_OK(writer.add_entry(1, std::int32_t{99}));
  TEST_EXPECT_EQ(writer.size(), 1u);
  // 被覆盖字段的字节仍留在 payload 中。
  TEST_EXPECT_EQ(writer.payload_size(), 5u);

  const auto out = writer.finalize();
  const auto reader = parse_or_fail(out);
  TEST_EXPECT_EQ(reader.size(), 1u);

  const auto value = reader.load_entry<std::int32_t>(1);
  TEST_EXPECT_OK(value.ec);
  TEST_EXPECT_EQ(value.value, 99);

  const auto text = reader.load_entry<std::string_view>(1);
  TEST_EXPECT_ERR(text.ec, errc::type_mismatch);
}

void test_payload_overflow_leaves_writer_unchanged() {
  WriterOptions options;
  options.max_payload_size = 8;
  Writer writer{options};

  TEST_EXPECT_OK(writer.add_entry(1, "12345"));
  TEST_EXPECT_ERR(writer.add_entry(2, "6789"), errc::payload_overflow);
  TEST_EXPECT_EQ(writer.size(), 1u);
  TEST_EXPECT_EQ(writer.payload_size(), 5u);
  TEST_EXPECT(!writer.contains(2));

  TEST_EXPECT_OK(writer.add_entry(2, "678"));
  TEST_EXPECT_EQ(writer.payload_size(), 8u);

  // 内联整数不占 payload，上限已满时仍可写入。
  TEST_EXPECT_OK(writer.add_entry(3, std::int32_t{1}));
}

void test_options_are_clamped() {
  WriterOptions options;
  options.max_payload_size = static_cast<std::size_t>(-1);
  options.reserve_payload = 64;
  Writer writer{options};
  TEST_EXPECT_EQ(writer.options().max_payload_size, membuffer::format::kMaxPayloadSize);
}

void test_sentinel_value_is_rejected() {
  Writer writer;
  TEST_EXPECT_ERR(writer.add_entry(1, std::int32_t{kSentinel}), errc::reserved_value);
  TEST_EXPECT(writer.empty());

  TEST_EXPECT_OK(writer.add_entry(1, std::int32_t{kSentinel - 1}));
  const auto out = writer.finalize();
  const auto reader = parse_or_fail(out);
  TEST_EXPECT_EQ(reader.load_entry<std::int32_t>(1).value, kSentinel - 1);
}

void test_u64_and_bytes_entries() {
  Writer writer;
  const std::vector<std::uint64_t> words{1, 0xFFFFFFFFFFFFFFFFull, 42};
  TEST_EXPECT_OK(writer.add_entry(1, words));
  TEST_EXPECT_OK(writer.add_entry(2, std::span<const std::uint64_t>{words.data(), 1}));
  std::vector<std::uint64_t> mutable_words{7, 8};
  TEST_EXPECT_OK(writer.add_entry(4, std::span{mutable_words}));
  const std::vector<byte> raw{9, 8, 7};
  TEST_EXPECT_OK(writer.add_entry(3, bytes_view{raw}));
  TEST_EXPECT_EQ(writer.payload_size(), 3 * 8 + 8 + 2 * 8 + 3u);

  const auto out = writer.finalize();
  const auto reader = parse_or_fail(out);
  TEST_EXPECT(reader.find(1)->type == type_tag::vector_u64);
  TEST_EXPECT(reader.find(1)->position == (Position{0, 24}));
  TEST_EXPECT(reader.find(3)->type == type_tag::vector_u8);

  const auto loaded = reader.load_entry<std::vector<std::uint64_t>>(1);
  TEST_EXPECT_OK(loaded.ec);
  TEST_EXPECT(loaded.value == words);

  const auto from_span = reader.load_entry<std::vector<std::uint64_t>>(4);
  TEST_EXPECT_OK(from_span.ec);
  TEST_EXPECT(from_span.value == mutable_words);
}

void test_raw_entry_with_user_type() {
  Writer writer;
  const std::vector<byte> raw{1, 2, 3};
  const auto tag = membuffer::format::user_type(2);
  TEST_EXPECT_OK(writer.add_raw_entry(4, tag, raw));

  const auto out = writer.finalize();
  const auto reader = parse_or_fail(out);
  TEST_EXPECT(reader.find(4)->type == tag);

  const auto loaded = reader.load_raw_entry(4, tag);
  TEST_EXPECT_OK(loaded.ec);
  TEST_EXPECT_EQ(loaded.value.size(), 3u);
  TEST_EXPECT_EQ(loaded.value[2], byte{3});
}

void test_raw_entry_rejects_inline_and_negative_tags() {
  Writer writer;
  TEST_EXPECT_OK(writer.add_entry(0, "pad"));
  const std::vector<byte> raw{0x2A, 0, 0, 0};

  TEST_EXPECT_ERR(writer.add_raw_entry(1, type_tag::integer32, raw), membuffer::core::errc::invalid_argument);
  TEST_EXPECT_ERR(writer.add_raw_entry(2, static_cast<type_tag>(-1), raw), membuffer::core::errc::invalid_argument);
  TEST_EXPECT_EQ(writer.size(), 1u);
  TEST_EXPECT_EQ(writer.payload_size(), 3u);

  // 内置的 payload 类型仍可用原始字节写入。
  TEST_EXPECT_OK(writer.add_raw_entry(3, type_tag::vector_u8, raw));
  const auto out = writer.finalize();
  const auto reader = parse_or_fail(out);
  TEST_EXPECT(reader.find(1) == nullptr);
  TEST_EXPECT(reader.find(3)->position == (Position{3, 4}));
}

void test_self_nesting_is_rejected() {
  Writer writer;
  TEST_EXPECT_OK(writer.add_entry(1, "x"));
  const auto ec = writer.add_entry(2, writer);
  TEST_EXPECT_ERR(ec, membuffer::core::errc::invalid_argument);
  TEST_EXPECT_EQ(writer.size(), 1u);
  TEST_EXPECT_EQ(writer.payload_size(), 1u);
}

}  // namespace

int main() {
  test_empty_writer();
  test_offsets_follow_insertion_order();
  test_inline_integer_uses_no_payload();
  test_finalize_is_repeatable();
  test_last_write_wins();
  test_payload_overflow_leaves_writer_unchanged();
  test_options_are_clamped();
  test_sentinel_value_is_rejected();
  test_u64_and_bytes_entries();
  test_raw_entry_with_user_type();
  test_raw_entry_rejects_inline_and_negative_tags();
  test_self_nesting_is_rejected();
  return ::membuffer::tests::run_and_report();
}
