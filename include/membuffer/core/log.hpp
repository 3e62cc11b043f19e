#pragma once

#include <cstdint>

namespace membuffer::core {

/**
 * @brief 日志级别（控制库内 spdlog 输出）。
 *
 * 说明：
 * - 库内部日志使用 spdlog，public headers 不暴露 spdlog 类型；
 * - Writer 覆盖同名 key、Reader 拒绝非法头部时输出 debug 日志；
 * - 业务侧可通过 set_log_level 调整全局日志级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

} // namespace membuffer::core
