/**
 * @file buffer_dump.cpp
 * @brief 解析一段十六进制文本形式的 membuffer，并以可读格式输出。
 *
 * 运行：
 * - 无参数：构造内置示例 buffer（含嵌套字段）并输出；
 * - ./build/examples/membuffer_buffer_dump "<hex>" [--no-hex] [--no-color] [--no-utf8-check]
 */

#include <membuffer/core/log.hpp>
#include <membuffer/format/writer.hpp>
#include <membuffer/utils/buffer_dump.hpp>
#include <membuffer/utils/hex.hpp>

#include <cstdint>
#include <iostream>
#include <string_view>
#include <system_error>
#include <vector>

using namespace membuffer;

namespace {

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

std::error_code builtin_sample(std::vector<core::byte> &out) {
    format::Writer inner;
    auto ec = inner.add_entry(0, "inner text");
    if (!ec) {
        ec = inner.add_entry(1, std::vector<std::uint64_t>{1, 2, 3});
    }

    format::Writer outer;
    if (!ec) {
        ec = outer.add_entry(0, "Earth");
    }
    if (!ec) {
        ec = outer.add_entry(1, std::int32_t{42});
    }
    if (!ec) {
        ec = outer.add_entry(2, std::vector<core::byte>{0xDE, 0xAD, 0xBE, 0xEF});
    }
    if (!ec) {
        ec = outer.add_entry(3, inner);
    }
    if (!ec) {
        out = outer.finalize();
    }
    return ec;
}

} // namespace

int main(int argc, char **argv) {
    core::set_log_level(core::LogLevel::debug);

    utils::BufferDumpOptions opt;
    opt.include_hex = !has_flag(argc, argv, "--no-hex");
    opt.enable_color = !has_flag(argc, argv, "--no-color");
    opt.hex.show_ascii = true;
    opt.reader.validate_utf8 = !has_flag(argc, argv, "--no-utf8-check");

    std::vector<core::byte> buffer;
    if (argc > 1 && std::string_view{argv[1]}.substr(0, 2) != "--") {
        const auto ec = utils::parse_hex(argv[1], buffer);
        if (ec) {
            std::cerr << "十六进制解析失败: " << ec.message() << "\n";
            return 1;
        }
    } else {
        const auto ec = builtin_sample(buffer);
        if (ec) {
            std::cerr << "示例构造失败: " << ec.message() << "\n";
            return 1;
        }
    }

    std::cout << utils::dump_buffer(buffer, opt);
    return 0;
}
