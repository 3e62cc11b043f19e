#include "membuffer/core/error.hpp"
#include "membuffer/format/error.hpp"

#include "test_main.hpp"

#include <string_view>

namespace {

using membuffer::core::errc;
using membuffer::core::make_error_code;

void test_error_category_and_messages() {
  auto ec = make_error_code(errc::invalid_argument);
  TEST_EXPECT(ec.category().name() != nullptr);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "membuffer.core");
  TEST_EXPECT(!ec.message().empty());

  TEST_EXPECT_EQ(make_error_code(errc::buffer_overflow), make_error_code(errc::buffer_overflow));
}

void test_all_error_codes() {
  TEST_EXPECT_EQ(make_error_code(errc::ok).message(), "ok");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_argument).message(), "invalid argument");
  TEST_EXPECT_EQ(make_error_code(errc::buffer_overflow).message(), "buffer overflow");
}

void test_unknown_error_code() {
  std::error_code ec(9999, membuffer::core::error_category());
  TEST_EXPECT_EQ(ec.message(), "unknown membuffer.core error");
}

void test_format_error_messages() {
  using membuffer::format::errc;
  using membuffer::format::make_error_code;

  TEST_EXPECT_EQ(std::string_view(make_error_code(errc::unknown_field).category().name()), "membuffer.format");
  TEST_EXPECT_EQ(make_error_code(errc::unknown_field).message(), "field unknown");
  TEST_EXPECT_EQ(make_error_code(errc::type_mismatch).message(), "field has a different type than requested");
  TEST_EXPECT_EQ(make_error_code(errc::malformed_header).message(), "reached end of buffer before end of header");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_utf8).message(), "text field is not valid utf-8");
  TEST_EXPECT_EQ(make_error_code(errc::structured_decode).message(), "structured value could not be parsed");

  std::error_code unknown(9999, membuffer::format::error_category());
  TEST_EXPECT_EQ(unknown.message(), "unknown membuffer.format error");
}

void test_error_domains_are_distinct() {
  // 同一数值在不同错误域中互不相等。
  const std::error_code core_ec = membuffer::core::make_error_code(membuffer::core::errc::invalid_argument);
  const std::error_code format_ec = membuffer::format::make_error_code(membuffer::format::errc::unknown_field);
  TEST_EXPECT_EQ(core_ec.value(), format_ec.value());
  TEST_EXPECT(core_ec != format_ec);

  const std::error_code implicit = membuffer::format::errc::type_mismatch;
  TEST_EXPECT_EQ(implicit, membuffer::format::make_error_code(membuffer::format::errc::type_mismatch));
}

}  // namespace

int main() {
  test_error_category_and_messages();
  test_all_error_codes();
  test_unknown_error_code();
  test_format_error_messages();
  test_error_domains_are_distinct();
  return ::membuffer::tests::run_and_report();
}
