#include "membuffer/c_api.h"

#include "membuffer/core/error.hpp"
#include "membuffer/core/log.hpp"
#include "membuffer/format/error.hpp"
#include "membuffer/format/reader.hpp"
#include "membuffer/format/writer.hpp"

#include <cstdlib>
#include <cstring>
#include <new>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

/*
 * C API（C ABI）实现文件。
 *
 * - 不透明句柄在本文件中定义为真实的 C++ struct；
 * - 错误统一用 `membuffer_error_t{value, category}` 表达，对应 std::error_code；
 * - 跨 ABI 返回的堆内存统一使用 malloc/free，避免跨 CRT 释放不匹配；
 * - C++ 异常禁止跨越 C 边界：内部捕获并映射到 `membuffer.c_api` 错误域。
 */

struct membuffer_writer final {
    membuffer::format::Writer writer{};
};

struct membuffer_reader final {
    explicit membuffer_reader(membuffer::format::Reader r) : reader(std::move(r)) {}
    membuffer::format::Reader reader;
};

namespace {

using membuffer::core::byte;
using membuffer::core::bytes_view;
using membuffer::format::LoadResult;
using membuffer::format::type_tag;

constexpr const char *kCApiCategory = "membuffer.c_api";

[[nodiscard]] membuffer_error_t ok() noexcept {
    return membuffer_error_t{0, kCApiCategory};
}

[[nodiscard]] membuffer_error_t c_api_err(membuffer_c_api_errc_t code) noexcept {
    return membuffer_error_t{static_cast<int>(code), kCApiCategory};
}

[[nodiscard]] membuffer_error_t from_error_code(const std::error_code &ec) noexcept {
    if (!ec) {
        return ok();
    }
    return membuffer_error_t{ec.value(), ec.category().name()};
}

[[nodiscard]] const std::error_category *
category_from_name(const char *name) noexcept {
    if (name == nullptr) {
        return nullptr;
    }
    if (std::strcmp(name, membuffer::core::error_category().name()) == 0) {
        return &membuffer::core::error_category();
    }
    if (std::strcmp(name, membuffer::format::error_category().name()) == 0) {
        return &membuffer::format::error_category();
    }
    if (std::strcmp(name, std::generic_category().name()) == 0) {
        return &std::generic_category();
    }
    return nullptr;
}

[[nodiscard]] std::string c_api_message_for(int value) {
    switch (static_cast<membuffer_c_api_errc_t>(value)) {
    case MEMBUFFER_C_API_OK:
        return "ok";
    case MEMBUFFER_C_API_INVALID_ARGUMENT:
        return "invalid argument";
    case MEMBUFFER_C_API_OUT_OF_MEMORY:
        return "out of memory";
    case MEMBUFFER_C_API_EXCEPTION:
        return "exception caught inside C API";
    }
    return "unknown membuffer.c_api error";
}

[[nodiscard]] char *dup_string(const std::string &s) noexcept {
    auto *out = static_cast<char *>(std::malloc(s.size() + 1));
    if (!out) {
        return nullptr;
    }
    std::memcpy(out, s.data(), s.size());
    out[s.size()] = '\0';
    return out;
}

template <class Fn>
membuffer_error_t guard_error(Fn &&fn) noexcept {
    try {
        return fn();
    } catch (const std::bad_alloc &) {
        return c_api_err(MEMBUFFER_C_API_OUT_OF_MEMORY);
    } catch (const std::exception &) {
        return c_api_err(MEMBUFFER_C_API_EXCEPTION);
    }
}

template <class T>
[[nodiscard]] membuffer_error_t from_load_result(const LoadResult<T> &r) noexcept {
    return from_error_code(r.ec);
}

} // namespace

extern "C" {

void *membuffer_malloc(size_t n) { return std::malloc(n); }

void membuffer_free(void *p) { std::free(p); }

char *membuffer_error_message(membuffer_error_t err) {
    try {
        if (err.value == 0) {
            return dup_string("ok");
        }
        if (err.category && std::strcmp(err.category, kCApiCategory) == 0) {
            return dup_string(c_api_message_for(err.value));
        }

        const auto *cat = category_from_name(err.category);
        if (!cat) {
            std::string msg = "unknown error category";
            if (err.category) {
                msg += ": ";
                msg += err.category;
            }
            msg += " (";
            msg += std::to_string(err.value);
            msg += ")";
            return dup_string(msg);
        }
        return dup_string(std::error_code{err.value, *cat}.message());
    } catch (const std::exception &) {
        return nullptr;
    }
}

const char *membuffer_version_string(void) {
#ifdef MEMBUFFER_VERSION_STRING
    return MEMBUFFER_VERSION_STRING;
#else
    return "0.1.0";
#endif
}

membuffer_error_t membuffer_log_set_level(membuffer_log_level_t level) {
    using membuffer::core::LogLevel;
    switch (level) {
    case MEMBUFFER_LOG_TRACE:
        membuffer::core::set_log_level(LogLevel::trace);
        return ok();
    case MEMBUFFER_LOG_DEBUG:
        membuffer::core::set_log_level(LogLevel::debug);
        return ok();
    case MEMBUFFER_LOG_INFO:
        membuffer::core::set_log_level(LogLevel::info);
        return ok();
    case MEMBUFFER_LOG_WARN:
        membuffer::core::set_log_level(LogLevel::warn);
        return ok();
    case MEMBUFFER_LOG_ERROR:
        membuffer::core::set_log_level(LogLevel::error);
        return ok();
    case MEMBUFFER_LOG_CRITICAL:
        membuffer::core::set_log_level(LogLevel::critical);
        return ok();
    case MEMBUFFER_LOG_OFF:
        membuffer::core::set_log_level(LogLevel::off);
        return ok();
    }
    return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
}

// ----------------------------- Writer -----------------------------

membuffer_error_t membuffer_writer_create(membuffer_writer_t **out_writer) {
    if (!out_writer) {
        return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
    }
    *out_writer = nullptr;
    auto *h = new (std::nothrow) membuffer_writer();
    if (!h) {
        return c_api_err(MEMBUFFER_C_API_OUT_OF_MEMORY);
    }
    *out_writer = h;
    return ok();
}

void membuffer_writer_destroy(membuffer_writer_t *writer) { delete writer; }

membuffer_error_t membuffer_writer_add_text(membuffer_writer_t *writer,
                                            int32_t key,
                                            const char *bytes,
                                            size_t n) {
    return guard_error([&]() -> membuffer_error_t {
        if (!writer || (!bytes && n != 0)) {
            return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
        }
        const std::string_view text = n == 0 ? std::string_view{} : std::string_view{bytes, n};
        return from_error_code(writer->writer.add_entry(key, text));
    });
}

membuffer_error_t membuffer_writer_add_i32(membuffer_writer_t *writer,
                                           int32_t key,
                                           int32_t value) {
    return guard_error([&]() -> membuffer_error_t {
        if (!writer) {
            return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
        }
        return from_error_code(writer->writer.add_entry(key, value));
    });
}

membuffer_error_t membuffer_writer_add_bytes(membuffer_writer_t *writer,
                                             int32_t key,
                                             const uint8_t *bytes,
                                             size_t n) {
    return guard_error([&]() -> membuffer_error_t {
        if (!writer || (!bytes && n != 0)) {
            return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
        }
        const bytes_view view = n == 0 ? bytes_view{} : bytes_view{bytes, n};
        return from_error_code(writer->writer.add_entry(key, view));
    });
}

membuffer_error_t membuffer_writer_add_u64(membuffer_writer_t *writer,
                                           int32_t key,
                                           const uint64_t *values,
                                           size_t n) {
    return guard_error([&]() -> membuffer_error_t {
        if (!writer || (!values && n != 0)) {
            return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
        }
        const auto words = n == 0 ? std::span<const std::uint64_t>{}
                                  : std::span<const std::uint64_t>{values, n};
        return from_error_code(writer->writer.add_entry(key, words));
    });
}

membuffer_error_t membuffer_writer_add_writer(membuffer_writer_t *writer,
                                              int32_t key,
                                              const membuffer_writer_t *inner) {
    return guard_error([&]() -> membuffer_error_t {
        if (!writer || !inner) {
            return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
        }
        return from_error_code(writer->writer.add_entry(key, inner->writer));
    });
}

membuffer_error_t membuffer_writer_add_raw(membuffer_writer_t *writer,
                                           int32_t key,
                                           int32_t type,
                                           const uint8_t *bytes,
                                           size_t n) {
    return guard_error([&]() -> membuffer_error_t {
        if (!writer || (!bytes && n != 0)) {
            return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
        }
        const bytes_view view = n == 0 ? bytes_view{} : bytes_view{bytes, n};
        return from_error_code(
            writer->writer.add_raw_entry(key, static_cast<type_tag>(type), view));
    });
}

membuffer_error_t membuffer_writer_finalize(const membuffer_writer_t *writer,
                                            uint8_t **out_bytes,
                                            size_t *out_n) {
    return guard_error([&]() -> membuffer_error_t {
        if (!writer || !out_bytes || !out_n) {
            return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
        }
        *out_bytes = nullptr;
        *out_n = 0;

        const auto out = writer->writer.finalize();
        auto *buf = static_cast<uint8_t *>(membuffer_malloc(out.size()));
        if (!buf) {
            return c_api_err(MEMBUFFER_C_API_OUT_OF_MEMORY);
        }
        std::memcpy(buf, out.data(), out.size());
        *out_bytes = buf;
        *out_n = out.size();
        return ok();
    });
}

// ----------------------------- Reader -----------------------------

membuffer_error_t membuffer_reader_create(const uint8_t *bytes,
                                          size_t n,
                                          membuffer_reader_t **out_reader) {
    return guard_error([&]() -> membuffer_error_t {
        if (!out_reader || (!bytes && n != 0)) {
            return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
        }
        *out_reader = nullptr;

        membuffer::format::Reader reader;
        const bytes_view buffer = n == 0 ? bytes_view{} : bytes_view{bytes, n};
        const auto ec = membuffer::format::Reader::parse(buffer, reader);
        if (ec) {
            return from_error_code(ec);
        }
        auto *h = new (std::nothrow) membuffer_reader(std::move(reader));
        if (!h) {
            return c_api_err(MEMBUFFER_C_API_OUT_OF_MEMORY);
        }
        *out_reader = h;
        return ok();
    });
}

void membuffer_reader_destroy(membuffer_reader_t *reader) { delete reader; }

membuffer_error_t membuffer_reader_size(const membuffer_reader_t *reader,
                                        size_t *out_n) {
    if (!reader || !out_n) {
        return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
    }
    *out_n = reader->reader.size();
    return ok();
}

membuffer_error_t membuffer_reader_payload_size(const membuffer_reader_t *reader,
                                                size_t *out_n) {
    if (!reader || !out_n) {
        return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
    }
    *out_n = reader->reader.payload_size();
    return ok();
}

membuffer_error_t membuffer_reader_field_type(const membuffer_reader_t *reader,
                                              int32_t key,
                                              int32_t *out_type) {
    if (!reader || !out_type) {
        return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
    }
    const auto *field = reader->reader.find(key);
    if (!field) {
        return from_error_code(
            membuffer::format::make_error_code(membuffer::format::errc::unknown_field));
    }
    *out_type = membuffer::format::to_underlying(field->type);
    return ok();
}

membuffer_error_t membuffer_reader_text_view(const membuffer_reader_t *reader,
                                             int32_t key,
                                             const char **out_bytes,
                                             size_t *out_n) {
    if (!reader || !out_bytes || !out_n) {
        return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
    }
    *out_bytes = nullptr;
    *out_n = 0;
    const auto r = reader->reader.load_entry<std::string_view>(key);
    if (!r.ok()) {
        return from_load_result(r);
    }
    *out_bytes = r.value.data();
    *out_n = r.value.size();
    return ok();
}

membuffer_error_t membuffer_reader_i32(const membuffer_reader_t *reader,
                                       int32_t key,
                                       int32_t *out_value) {
    if (!reader || !out_value) {
        return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
    }
    const auto r = reader->reader.load_entry<std::int32_t>(key);
    if (!r.ok()) {
        return from_load_result(r);
    }
    *out_value = r.value;
    return ok();
}

membuffer_error_t membuffer_reader_bytes_view(const membuffer_reader_t *reader,
                                              int32_t key,
                                              const uint8_t **out_bytes,
                                              size_t *out_n) {
    if (!reader || !out_bytes || !out_n) {
        return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
    }
    *out_bytes = nullptr;
    *out_n = 0;
    const auto r = reader->reader.load_entry<bytes_view>(key);
    if (!r.ok()) {
        return from_load_result(r);
    }
    *out_bytes = r.value.data();
    *out_n = r.value.size();
    return ok();
}

membuffer_error_t membuffer_reader_u64_copy(const membuffer_reader_t *reader,
                                            int32_t key,
                                            uint64_t **out_values,
                                            size_t *out_n) {
    if (!reader || !out_values || !out_n) {
        return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
    }
    *out_values = nullptr;
    *out_n = 0;
    const auto r = reader->reader.load_entry<membuffer::format::U64View>(key);
    if (!r.ok()) {
        return from_load_result(r);
    }
    if (r.value.empty()) {
        return ok();
    }
    auto *buf = static_cast<uint64_t *>(
        membuffer_malloc(r.value.size() * sizeof(std::uint64_t)));
    if (!buf) {
        return c_api_err(MEMBUFFER_C_API_OUT_OF_MEMORY);
    }
    *out_n = r.value.copy_to(std::span<std::uint64_t>{buf, r.value.size()});
    *out_values = buf;
    return ok();
}

membuffer_error_t membuffer_reader_raw_view(const membuffer_reader_t *reader,
                                            int32_t key,
                                            int32_t type,
                                            const uint8_t **out_bytes,
                                            size_t *out_n) {
    if (!reader || !out_bytes || !out_n) {
        return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
    }
    *out_bytes = nullptr;
    *out_n = 0;
    const auto r = reader->reader.load_raw_entry(key, static_cast<type_tag>(type));
    if (!r.ok()) {
        return from_load_result(r);
    }
    *out_bytes = r.value.data();
    *out_n = r.value.size();
    return ok();
}

membuffer_error_t membuffer_reader_nested(const membuffer_reader_t *reader,
                                          int32_t key,
                                          membuffer_reader_t **out_reader) {
    return guard_error([&]() -> membuffer_error_t {
        if (!reader || !out_reader) {
            return c_api_err(MEMBUFFER_C_API_INVALID_ARGUMENT);
        }
        *out_reader = nullptr;
        auto r = reader->reader.load_recursive_reader(key);
        if (!r.ok()) {
            return from_load_result(r);
        }
        auto *h = new (std::nothrow) membuffer_reader(std::move(r.value));
        if (!h) {
            return c_api_err(MEMBUFFER_C_API_OUT_OF_MEMORY);
        }
        *out_reader = h;
        return ok();
    });
}

} // extern "C"
