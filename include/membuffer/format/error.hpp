#pragma once

#include <system_error>

namespace membuffer::format {

/**
 * @brief 编码格式相关的错误码（错误域 "membuffer.format"）。
 *
 * - unknown_field / type_mismatch / malformed_header 是读取端的三类基本错误；
 * - field_out_of_range / invalid_utf8 / length_mismatch 只在按需解码某个字段时
 *   才会出现（构造 Reader 时不检查 payload 内容）；
 * - payload_overflow / reserved_value 由 Writer 在写入时返回。
 */
enum class errc : int {
  ok = 0,
  unknown_field = 1,
  type_mismatch = 2,
  malformed_header = 3,
  field_out_of_range = 4,
  invalid_utf8 = 5,
  length_mismatch = 6,
  payload_overflow = 7,
  reserved_value = 8,
  too_many_fields = 9,
  structured_encode = 10,
  structured_decode = 11,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace membuffer::format

namespace std {
template <>
struct is_error_code_enum<membuffer::format::errc> : true_type {};
}  // namespace std
