#pragma once

#include "membuffer/core/common.hpp"

#include <cstddef>
#include <cstdint>

namespace membuffer::format {

using byte = membuffer::core::byte;
using bytes_view = membuffer::core::bytes_view;
using mutable_bytes_view = membuffer::core::mutable_bytes_view;

/**
 * @brief 字段的类型标签（写入描述符的 type 槽，4 字节有符号整数）。
 *
 * 这是一个“开放枚举”：
 * - 0..last_predefined-1 为内置类型；
 * - 调用方自定义类型从 last_predefined 开始编号（见 user_type()），
 *   无需运行时注册，解码时只做整数相等比较。
 */
enum class type_tag : std::int32_t {
  text = 0,
  integer32 = 1,
  vector_u8 = 2,
  vector_u64 = 3,
  nested_buffer = 4,
  last_predefined = 5,
};

inline constexpr std::int32_t kLastPredefinedType = static_cast<std::int32_t>(type_tag::last_predefined);

[[nodiscard]] constexpr std::int32_t to_underlying(type_tag t) noexcept { return static_cast<std::int32_t>(t); }

// 第 index 个自定义类型标签：user_type(0) == last_predefined。
[[nodiscard]] constexpr type_tag user_type(std::int32_t index) noexcept {
  return static_cast<type_tag>(kLastPredefinedType + index);
}

[[nodiscard]] constexpr bool is_builtin(type_tag t) noexcept {
  const auto v = to_underlying(t);
  return v >= 0 && v < kLastPredefinedType;
}

[[nodiscard]] constexpr bool is_user_defined(type_tag t) noexcept { return to_underlying(t) >= kLastPredefinedType; }

// 内置类型返回固定名称（"text"/"i32"/...），自定义类型返回 "user"，负值返回 "invalid"。
[[nodiscard]] const char* type_tag_name(type_tag t) noexcept;

}  // namespace membuffer::format
