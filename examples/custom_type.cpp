/**
 * @file custom_type.cpp
 * @brief 演示通过特化 codec 扩展字段类型，以及嵌套 buffer 的读写。
 */

#include <membuffer/format/reader.hpp>
#include <membuffer/format/writer.hpp>

#include <cstdint>
#include <iostream>
#include <string_view>
#include <vector>

struct Vec3 final {
    std::int32_t x{0};
    std::int32_t y{0};
    std::int32_t z{0};
};

namespace membuffer::format {

// 自定义类型标签从 user_type(0) 开始编号，读写两端约定一致即可。
template <>
struct codec<Vec3> {
    static constexpr type_tag tag = user_type(0);

    static std::size_t encoded_size(const Vec3 &) noexcept {
        return 3 * sizeof(std::int32_t);
    }

    static void encode(const Vec3 &value, Position &, std::vector<byte> &payload) {
        append_i32(value.x, payload);
        append_i32(value.y, payload);
        append_i32(value.z, payload);
    }

    static std::error_code decode(const Position &position,
                                  bytes_view payload,
                                  const ReaderOptions &,
                                  Vec3 &out) {
        bytes_view field;
        auto ec = slice_payload(position, payload, field);
        if (ec) {
            return ec;
        }
        if (field.size() != 3 * sizeof(std::int32_t)) {
            return make_error_code(errc::length_mismatch);
        }
        out.x = read_i32(field, 0);
        out.y = read_i32(field, 4);
        out.z = read_i32(field, 8);
        return {};
    }
};

} // namespace membuffer::format

using namespace membuffer::format;

int main() {
    Writer body;
    auto ec = body.add_entry(0, Vec3{1, 2, 3});
    if (!ec) {
        ec = body.add_entry(1, "probe");
    }

    Writer envelope;
    if (!ec) {
        ec = envelope.add_entry(0, std::int32_t{1});
    }
    if (!ec) {
        ec = envelope.add_entry(1, body);
    }
    if (ec) {
        std::cerr << "写入失败: " << ec.message() << "\n";
        return 1;
    }
    const auto buffer = envelope.finalize();

    Reader reader;
    ec = Reader::parse(buffer, reader);
    if (ec) {
        std::cerr << "解析失败: " << ec.message() << "\n";
        return 1;
    }

    const auto nested = reader.load_recursive_reader(1);
    if (!nested.ok()) {
        std::cerr << "嵌套 buffer 读取失败: " << nested.ec.message() << "\n";
        return 1;
    }
    const auto v = nested.value.load_entry<Vec3>(0);
    if (!v.ok()) {
        std::cerr << "Vec3 读取失败: " << v.ec.message() << "\n";
        return 1;
    }
    std::cout << "Vec3(" << v.value.x << ", " << v.value.y << ", " << v.value.z << ")\n";
    return 0;
}
