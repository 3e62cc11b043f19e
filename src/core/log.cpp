#include "membuffer/core/log.hpp"

#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <memory>

namespace membuffer::core {
namespace {

constexpr const char *kLoggerName = "membuffer";

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    default:
        return LogLevel::off;
    }
}

[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger() {
    // 业务侧可能已经注册同名 logger（例如自定义 sink），优先复用。
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    created->set_level(spdlog::get_level());
    // 注册后 spdlog::get / set_level / set_pattern 等全局配置同样作用于它。
    try {
        spdlog::register_logger(created);
    } catch (const spdlog::spdlog_ex &) {
        // 并发注册了同名 logger。
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        throw;
    }
    return created;
}

} // namespace

namespace detail {

spdlog::logger &logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    try {
        detail::logger().set_level(to_spdlog_level(level));
    } catch (const std::exception &) {
        // logger 创建失败（含 bad_alloc）时退回全局级别。
        spdlog::set_level(to_spdlog_level(level));
    }
}

LogLevel log_level() noexcept {
    try {
        return from_spdlog_level(detail::logger().level());
    } catch (const std::exception &) {
        return from_spdlog_level(spdlog::get_level());
    }
}

} // namespace membuffer::core
