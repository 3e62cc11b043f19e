#pragma once

#include <system_error>

namespace membuffer::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有编解码接口返回 std::error_code，不向调用方抛异常；
 * - 与具体格式相关的错误见 membuffer::format::errc。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  buffer_overflow = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace membuffer::core

namespace std {
template <>
struct is_error_code_enum<membuffer::core::errc> : true_type {};
}  // namespace std
