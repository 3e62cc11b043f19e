#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace membuffer::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 调试输出默认只展示前 256 字节，避免 MB 级 payload 刷屏。
inline constexpr std::size_t kDefaultDumpBytes = 256;

}  // 命名空间 membuffer::core
