#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace membuffer::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t data_size;
    int iterations;
    double mean_ms;
    double min_ms;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// 防止编译器把只读不写的结果优化掉。
template <class T>
inline void do_not_optimize(const T &value) {
    asm volatile("" : : "r,m"(value) : "memory");
}

/**
 * @brief 执行 iterations 次 func，记录平均与最快一次的耗时。
 *
 * 说明：
 * - 先执行一次预热（不计时），让页缓存/分配器进入稳定状态；
 * - data_size 用于换算吞吐，不参与计时。
 */
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t data_size,
                          int iterations,
                          Func &&func) {
    using clock = std::chrono::steady_clock;

    func();

    double total_ms = 0.0;
    double min_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        const auto start = clock::now();
        func();
        const auto elapsed =
            std::chrono::duration<double, std::milli>(clock::now() - start).count();
        total_ms += elapsed;
        min_ms = i == 0 ? elapsed : std::min(min_ms, elapsed);
    }

    const double mean_ms = iterations > 0 ? total_ms / iterations : 0.0;
    results().push_back({name, data_size, iterations, mean_ms, min_ms});
}

[[nodiscard]] inline std::string format_size(std::size_t bytes) {
    if (bytes >= 1'000'000) {
        return std::to_string(bytes / 1'000'000) + " MB";
    }
    if (bytes >= 1'000) {
        return std::to_string(bytes / 1'000) + " KB";
    }
    return std::to_string(bytes) + " B";
}

// 以最快一次的耗时换算吞吐（GB/s），耗时为 0 时返回 0。
[[nodiscard]] inline double throughput_gbps(const BenchmarkResult &r) {
    if (r.min_ms <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(r.data_size) / 1e9 / (r.min_ms / 1000.0);
}

inline void print_results() {
    const auto rule = std::string(96, '-');
    std::cout << '\n' << rule << '\n';
    std::cout << std::left << std::setw(44) << "benchmark" << std::setw(10) << "size"
              << std::setw(8) << "iters" << std::setw(12) << "mean ms"
              << std::setw(12) << "min ms" << "GB/s\n";
    std::cout << rule << '\n';

    for (const auto &r : results()) {
        std::cout << std::left << std::setw(44) << r.name << std::setw(10)
                  << format_size(r.data_size) << std::setw(8) << r.iterations
                  << std::fixed << std::setprecision(4) << std::setw(12) << r.mean_ms
                  << std::setw(12) << r.min_ms;
        const auto gbps = throughput_gbps(r);
        if (gbps > 0.0) {
            std::cout << std::setprecision(2) << gbps;
        } else {
            std::cout << '-';
        }
        std::cout << '\n';
    }
    std::cout << rule << "\n\n";
}

} // namespace membuffer::benchmarks

// 代码块允许包含顶层逗号（例如花括号初始化）。
#define BENCH_RUN(name, size, iterations, ...)                                 \
    ::membuffer::benchmarks::run_benchmark(name, size, iterations,             \
                                           [&]() { __VA_ARGS__; })
