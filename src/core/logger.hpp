#pragma once

#include <spdlog/spdlog.h>

namespace membuffer::core::detail {

// 库内共享 logger（名称 "membuffer"，输出到 stderr）。仅供 src/ 内部使用。
[[nodiscard]] spdlog::logger &logger();

} // namespace membuffer::core::detail
