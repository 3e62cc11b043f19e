#pragma once

#include "membuffer/core/common.hpp"
#include "membuffer/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace membuffer::utils {

/**
 * @brief 16 进制格式化/解析工具。
 *
 * 典型使用场景：
 * - 把一段 buffer（或其中的 payload 区间）以 hexdump 形式打印出来排查字段；
 * - 测试中用 "FE CA FE 7A ..." 字符串手工构造畸形输入。
 */
struct HexDumpOptions final {
    // 每行字节数。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分打印截断提示。
    std::size_t max_bytes{core::kDefaultDumpBytes};

    // 行首偏移的起点：dump 子区间时可显示其在整个 buffer 中的位置。
    std::size_t base_offset{0};

    // 是否输出行首偏移。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（不可打印字符显示为 '.'）。
    bool show_ascii{false};

    // 是否输出 ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string hex_dump(core::bytes_view bytes, HexDumpOptions options = {});

// 紧凑形式："7afecafe0a00"（小写、无分隔符）。
[[nodiscard]] std::string to_hex(core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持大小写、常见分隔符（空白 , : - _）以及每个 token 前可选的 0x/0X 前缀。
 * 非法字符或奇数个 nibble 返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text, std::vector<core::byte> &out);

} // namespace membuffer::utils
