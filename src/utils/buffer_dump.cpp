#include "membuffer/utils/buffer_dump.hpp"

#include "membuffer/format/header.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace membuffer::utils {
namespace {

using membuffer::format::FieldDescriptor;
using membuffer::format::Reader;
using membuffer::format::type_tag;

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *header = "\033[1;36m";
    static constexpr const char *key = "\033[1;32m";
    static constexpr const char *type = "\033[1;33m";
    static constexpr const char *value = "\033[1;37m";
    static constexpr const char *dim = "\033[2m";
    static constexpr const char *error = "\033[1;31m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

void indent_(std::ostringstream &oss, std::size_t indent) {
    oss << std::string(2 * indent, ' ');
}

void append_text_preview_(std::ostringstream &oss,
                          std::string_view text,
                          std::size_t limit) {
    oss << '"';
    const auto n = std::min(text.size(), limit);
    for (std::size_t i = 0; i < n; ++i) {
        const char c = text[i];
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\t':
            oss << "\\t";
            break;
        default: {
            const auto u = static_cast<unsigned char>(c);
            // 控制字符（含 ESC/CR）与 DEL 用 \xHH，UTF-8 多字节序列原样输出。
            if (u < 0x20 || u == 0x7F) {
                oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(u) << std::dec << std::setfill(' ');
            } else {
                oss << c;
            }
            break;
        }
        }
    }
    oss << '"';
    if (text.size() > limit) {
        oss << "...";
    }
}

void append_reader_(std::ostringstream &oss,
                    const Reader &reader,
                    const BufferDumpOptions &options,
                    std::size_t indent,
                    std::size_t level);

// 输出字段值；返回 true 表示展开了嵌套 buffer（输出已以换行结尾）。
bool append_value_(std::ostringstream &oss,
                   const Reader &reader,
                   const FieldDescriptor &field,
                   const BufferDumpOptions &options,
                   std::size_t indent,
                   std::size_t level) {
    const auto *reset = ansi_(options.enable_color, Ansi::reset);
    const auto *value = ansi_(options.enable_color, Ansi::value);
    const auto *dim = ansi_(options.enable_color, Ansi::dim);
    const auto *error = ansi_(options.enable_color, Ansi::error);

    switch (field.type) {
    case type_tag::text: {
        const auto r = reader.load_entry<std::string_view>(field.key);
        if (!r.ok()) {
            oss << ' ' << error << r.ec.message() << reset;
            return false;
        }
        oss << ' ' << value;
        append_text_preview_(oss, r.value, options.preview_bytes);
        oss << reset;
        return false;
    }
    case type_tag::integer32:
        oss << ' ' << value << field.position.offset << reset;
        return false;
    case type_tag::vector_u8: {
        const auto r = reader.load_entry<core::bytes_view>(field.key);
        if (!r.ok()) {
            oss << ' ' << error << r.ec.message() << reset;
            return false;
        }
        const auto n = std::min(r.value.size(), options.preview_bytes);
        oss << ' ' << value << to_hex(r.value.first(n)) << reset;
        if (r.value.size() > n) {
            oss << dim << "..." << reset;
        }
        return false;
    }
    case type_tag::vector_u64: {
        const auto r = reader.load_entry<format::U64View>(field.key);
        if (!r.ok()) {
            oss << ' ' << error << r.ec.message() << reset;
            return false;
        }
        // 最多展示 preview_bytes/8 个元素（至少 1 个）。
        const auto limit =
            std::max<std::size_t>(1, options.preview_bytes / sizeof(std::uint64_t));
        oss << ' ' << dim << "count=" << reset << value << r.value.size() << reset
            << " [";
        std::size_t i = 0;
        for (const auto word : r.value) {
            if (i == limit) {
                oss << ", ...";
                break;
            }
            oss << (i == 0 ? "" : ", ") << value << word << reset;
            ++i;
        }
        oss << ']';
        return false;
    }
    case type_tag::nested_buffer: {
        const auto r = reader.load_recursive_reader(field.key);
        if (!r.ok()) {
            oss << ' ' << error << r.ec.message() << reset;
            return false;
        }
        if (level >= options.max_depth) {
            oss << ' ' << dim << "(not expanded)" << reset;
            return false;
        }
        oss << '\n';
        append_reader_(oss, r.value, options, indent + 1, level + 1);
        return true;
    }
    default:
        break;
    }

    // 自定义类型：只展示原始字节长度。
    const auto raw = reader.load_raw_entry(field.key, field.type);
    if (!raw.ok()) {
        oss << ' ' << error << raw.ec.message() << reset;
        return false;
    }
    oss << ' ' << dim << '<' << raw.value.size() << " bytes>" << reset;
    return false;
}

void append_reader_(std::ostringstream &oss,
                    const Reader &reader,
                    const BufferDumpOptions &options,
                    std::size_t indent,
                    std::size_t level) {
    const auto *reset = ansi_(options.enable_color, Ansi::reset);
    const auto *header = ansi_(options.enable_color, Ansi::header);
    const auto *key = ansi_(options.enable_color, Ansi::key);
    const auto *type = ansi_(options.enable_color, Ansi::type);
    const auto *dim = ansi_(options.enable_color, Ansi::dim);

    indent_(oss, indent);
    oss << header << "MemBuffer:" << reset << " fields=" << reader.size()
        << " payload=" << reader.payload_size() << '\n';

    for (const auto &field : reader.descriptors()) {
        indent_(oss, indent + 1);
        oss << key << '[' << field.key << ']' << reset << ' ' << type
            << format::type_tag_name(field.type);
        if (format::is_user_defined(field.type)) {
            oss << '(' << format::to_underlying(field.type) << ')';
        }
        oss << reset;
        if (field.type != type_tag::integer32) {
            oss << ' ' << dim << "off=" << field.position.offset
                << " len=" << field.position.length << reset;
        }
        const bool expanded =
            options.show_values &&
            append_value_(oss, reader, field, options, indent + 1, level);
        if (!expanded) {
            oss << '\n';
        }
    }
}

} // namespace

std::string dump_reader(const format::Reader &reader, BufferDumpOptions options) {
    std::ostringstream oss;
    append_reader_(oss, reader, options, 0, 0);
    if (options.include_hex && !reader.payload().empty()) {
        auto hex = options.hex;
        hex.enable_color = options.enable_color;
        oss << ansi_(options.enable_color, Ansi::header) << "Payload:"
            << ansi_(options.enable_color, Ansi::reset) << '\n';
        oss << hex_dump(reader.payload(), hex);
    }
    return oss.str();
}

std::string dump_buffer(core::bytes_view buffer, BufferDumpOptions options) {
    format::Reader reader;
    const auto ec = format::Reader::parse(buffer, reader, options.reader);
    if (ec) {
        std::ostringstream oss;
        oss << ansi_(options.enable_color, Ansi::header) << "MemBuffer:"
            << ansi_(options.enable_color, Ansi::reset) << ' '
            << ansi_(options.enable_color, Ansi::error) << "parse_failed: "
            << ec.message() << ansi_(options.enable_color, Ansi::reset) << '\n';
        return oss.str();
    }
    if (options.include_hex) {
        // 偏移以整个 buffer 为基准。
        options.hex.base_offset = buffer.size() - reader.payload_size();
    }
    return dump_reader(reader, options);
}

} // namespace membuffer::utils
