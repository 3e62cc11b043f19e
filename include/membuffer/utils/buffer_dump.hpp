#pragma once

#include "membuffer/core/common.hpp"
#include "membuffer/format/reader.hpp"
#include "membuffer/utils/hex.hpp"

#include <cstddef>
#include <string>

namespace membuffer::utils {

/**
 * @brief 编码 buffer 的可视化输出（调试/排查用途）。
 */
struct BufferDumpOptions final {
    // 是否输出字段内容预览（文本前缀、整数值、u64 元素等）。
    bool show_values{true};

    // 文本/字节预览的最大字节数。
    std::size_t preview_bytes{32};

    // 嵌套 buffer 递归展开的最大深度（0 表示只列出描述符，不展开）。
    std::size_t max_depth{8};

    // 是否在末尾附上 payload 的 hexdump。
    bool include_hex{false};

    // hexdump 选项（include_hex=true 时生效）。
    HexDumpOptions hex{};

    // 是否输出 ANSI 颜色控制码。
    bool enable_color{false};

    // 解析 buffer 时使用的选项（UTF-8 校验等）。
    format::ReaderOptions reader{};
};

/**
 * @brief 解析并输出完整 buffer（描述符表 + 字段预览）。
 *
 * 解析失败时返回的字符串包含错误信息；单个字段解码失败只影响该行。
 */
[[nodiscard]] std::string dump_buffer(core::bytes_view buffer, BufferDumpOptions options = {});

// 输出已构造的 Reader。
[[nodiscard]] std::string dump_reader(const format::Reader &reader, BufferDumpOptions options = {});

} // namespace membuffer::utils
