#include <membuffer/format/reader.hpp>
#include <membuffer/format/structured.hpp>
#include <membuffer/format/writer.hpp>

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

using namespace membuffer::format;

int main() {
    std::cout << "=== membuffer 基本用法示例 ===\n\n";

    // 写入：文本、内联整数、u64 数组、结构化字段
    Writer writer;
    auto ec = writer.add_entry(0, "Earth");
    if (!ec) {
        ec = writer.add_entry(1, std::int32_t{3});
    }
    if (!ec) {
        ec = writer.add_entry(2, std::vector<std::uint64_t>{149'600'000, 384'400});
    }
    if (!ec) {
        ec = add_structured_entry(
            writer, 3, std::map<std::string, double>{{"mass", 5.972e24}, {"radius", 6371.0}});
    }
    if (ec) {
        std::cerr << "写入失败: " << ec.message() << "\n";
        return 1;
    }

    const auto buffer = writer.finalize();
    std::cout << "编码成功: " << buffer.size() << " 字节, " << writer.size() << " 个字段\n";

    // 读取：构造时只解析描述符表
    Reader reader;
    ec = Reader::parse(buffer, reader);
    if (ec) {
        std::cerr << "解析失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << describe(reader) << "\n";

    const auto name = reader.load_entry<std::string_view>(0);
    const auto index = reader.load_entry<std::int32_t>(1);
    const auto distances = reader.load_entry<U64View>(2);
    const auto facts = load_structured_entry<std::map<std::string, double>>(reader, 3);
    if (!name.ok() || !index.ok() || !distances.ok() || !facts.ok()) {
        std::cerr << "读取失败\n";
        return 1;
    }

    std::cout << "name=" << name.value << " index=" << index.value << "\n";
    for (const auto d : distances.value) {
        std::cout << "distance=" << d << "\n";
    }
    std::cout << "mass=" << facts.value.at("mass") << "\n";

    // 类型不符：错误中带有实际类型与请求类型
    const auto wrong = reader.load_entry<std::int32_t>(0);
    if (wrong.ec == errc::type_mismatch && wrong.actual_type) {
        std::cout << "key 0 不是 " << type_tag_name(wrong.requested_type) << "，而是 "
                  << type_tag_name(*wrong.actual_type) << "\n";
    }

    return 0;
}
