#include "membuffer/utils/hex.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace membuffer::utils {
namespace {

constexpr const char *kDigits = "0123456789abcdef";

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *offset = "\033[2m";
    static constexpr const char *bytes = "\033[1;33m";
    static constexpr const char *ascii = "\033[1;32m";
    static constexpr const char *warn = "\033[1;31m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

[[nodiscard]] int nibble_(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(char c) noexcept {
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case ',':
    case ':':
    case '-':
    case '_':
        return true;
    default:
        return false;
    }
}

void put_byte_(std::ostringstream &oss, core::byte b) {
    oss << kDigits[(b >> 4) & 0x0F] << kDigits[b & 0x0F];
}

} // namespace

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
    const auto *reset = ansi_(options.enable_color, Ansi::reset);
    const auto *offset_color = ansi_(options.enable_color, Ansi::offset);
    const auto *bytes_color = ansi_(options.enable_color, Ansi::bytes);
    const auto *ascii_color = ansi_(options.enable_color, Ansi::ascii);
    const auto *warn = ansi_(options.enable_color, Ansi::warn);

    const std::size_t per_line =
        options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line;
    const std::size_t shown = options.max_bytes == 0
                                  ? bytes.size()
                                  : std::min(bytes.size(), options.max_bytes);

    std::ostringstream oss;
    for (std::size_t line = 0; line < shown; line += per_line) {
        const std::size_t n = std::min(per_line, shown - line);

        if (options.show_offset) {
            oss << offset_color << std::hex << std::setw(8) << std::setfill('0')
                << (options.base_offset + line) << std::dec << reset << "  ";
        }

        oss << bytes_color;
        for (std::size_t i = 0; i < per_line; ++i) {
            if (i < n) {
                put_byte_(oss, bytes[line + i]);
            } else if (options.show_ascii) {
                // 末行补齐，保持 ASCII 列对齐。
                oss << "  ";
            } else {
                break;
            }
            if (i + 1 < per_line && (i + 1 < n || options.show_ascii)) {
                oss << ' ';
            }
        }
        oss << reset;

        if (options.show_ascii) {
            oss << "  |" << ascii_color;
            for (std::size_t i = 0; i < n; ++i) {
                const auto c = bytes[line + i];
                oss << ((c >= 0x20 && c <= 0x7E) ? static_cast<char>(c) : '.');
            }
            oss << reset << '|';
        }
        oss << '\n';
    }

    if (shown < bytes.size()) {
        oss << warn << "... " << (bytes.size() - shown) << " more bytes (total "
            << bytes.size() << ")" << reset << '\n';
    }
    return oss.str();
}

std::string to_hex(core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(kDigits[(b >> 4) & 0x0F]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

std::error_code parse_hex(std::string_view text, std::vector<core::byte> &out) {
    out.clear();
    int high = -1;

    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (is_separator_(c)) {
            ++i;
            continue;
        }
        // 0x 前缀只允许出现在 byte 边界上。
        if (high < 0 && c == '0' && i + 1 < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            i += 2;
            continue;
        }

        const int v = nibble_(c);
        if (v < 0) {
            out.clear();
            return core::make_error_code(core::errc::invalid_argument);
        }
        if (high < 0) {
            high = v;
        } else {
            out.push_back(static_cast<core::byte>((high << 4) | v));
            high = -1;
        }
        ++i;
    }

    if (high >= 0) {
        out.clear();
        return core::make_error_code(core::errc::invalid_argument);
    }
    return {};
}

} // namespace membuffer::utils
