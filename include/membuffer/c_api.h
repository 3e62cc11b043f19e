/*
 * membuffer/c_api.h
 *
 * C 语言对外接口（C ABI）。
 *
 * 设计目标：
 * - 允许纯 C 工程通过 `#include <membuffer/c_api.h>` 写入/读取 membuffer；
 * - 所有 C++ 类型均通过不透明句柄（opaque handle）隐藏；
 * - 错误使用 `membuffer_error_t` 表达（value + category），兼容 std::error_code；
 * - 任何由库分配的内存都使用 `membuffer_free()` 释放；
 * - C API 内部不允许异常跨越 C 边界（若发生异常，将转为 `membuffer.c_api` 错误）。
 *
 * 生命周期注意：
 * - reader 借用 membuffer_reader_create 传入的字节，调用方必须保证这段内存
 *   比 reader 以及从 reader 取出的所有 view/嵌套 reader 活得更久。
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* C API 版本（用于 ABI 变更时做兼容分支） */
#define MEMBUFFER_C_API_VERSION 1

/* ----------------------------- 错误与内存 ----------------------------- */

/*
 * `membuffer_error_t` 对应 C++ 的 std::error_code。
 *
 * - value==0 表示成功；
 * - category 指向静态字符串，典型值：
 *   "membuffer.c_api" / "membuffer.core" / "membuffer.format"。
 */
typedef struct membuffer_error {
    int value;
    const char *category;
} membuffer_error_t;

static inline int membuffer_error_is_ok(membuffer_error_t err) {
    return err.value == 0;
}

/* 本 C API 自身的错误码（category="membuffer.c_api"） */
typedef enum membuffer_c_api_errc {
    MEMBUFFER_C_API_OK = 0,
    MEMBUFFER_C_API_INVALID_ARGUMENT = 1,
    MEMBUFFER_C_API_OUT_OF_MEMORY = 2,
    MEMBUFFER_C_API_EXCEPTION = 3
} membuffer_c_api_errc_t;

/* 与 membuffer::format::type_tag 一致；自定义类型从 LAST_PREDEFINED 开始。 */
typedef enum membuffer_type {
    MEMBUFFER_TYPE_TEXT = 0,
    MEMBUFFER_TYPE_INTEGER32 = 1,
    MEMBUFFER_TYPE_VECTOR_U8 = 2,
    MEMBUFFER_TYPE_VECTOR_U64 = 3,
    MEMBUFFER_TYPE_NESTED_BUFFER = 4,
    MEMBUFFER_TYPE_LAST_PREDEFINED = 5
} membuffer_type_t;

void *membuffer_malloc(size_t n);
void membuffer_free(void *p);

/* 生成可读错误信息（返回的字符串需用 membuffer_free 释放）。 */
char *membuffer_error_message(membuffer_error_t err);

/* 版本信息（静态字符串，勿释放）。 */
const char *membuffer_version_string(void);

/* ----------------------------- 日志 ----------------------------- */

typedef enum membuffer_log_level {
    MEMBUFFER_LOG_TRACE = 0,
    MEMBUFFER_LOG_DEBUG = 1,
    MEMBUFFER_LOG_INFO = 2,
    MEMBUFFER_LOG_WARN = 3,
    MEMBUFFER_LOG_ERROR = 4,
    MEMBUFFER_LOG_CRITICAL = 5,
    MEMBUFFER_LOG_OFF = 6
} membuffer_log_level_t;

membuffer_error_t membuffer_log_set_level(membuffer_log_level_t level);

/* ----------------------------- Writer ----------------------------- */

typedef struct membuffer_writer membuffer_writer_t;

membuffer_error_t membuffer_writer_create(membuffer_writer_t **out_writer);
void membuffer_writer_destroy(membuffer_writer_t *writer);

membuffer_error_t membuffer_writer_add_text(membuffer_writer_t *writer,
                                            int32_t key,
                                            const char *bytes,
                                            size_t n);
membuffer_error_t membuffer_writer_add_i32(membuffer_writer_t *writer,
                                           int32_t key,
                                           int32_t value);
membuffer_error_t membuffer_writer_add_bytes(membuffer_writer_t *writer,
                                             int32_t key,
                                             const uint8_t *bytes,
                                             size_t n);
membuffer_error_t membuffer_writer_add_u64(membuffer_writer_t *writer,
                                           int32_t key,
                                           const uint64_t *values,
                                           size_t n);
/* 把 inner 的 finalize 结果作为嵌套 buffer 写入（inner 不能是 writer 自身）。 */
membuffer_error_t membuffer_writer_add_writer(membuffer_writer_t *writer,
                                              int32_t key,
                                              const membuffer_writer_t *inner);
/* 自定义类型标签 + 原始字节（type 为 INTEGER32 或负值时返回 invalid argument）。 */
membuffer_error_t membuffer_writer_add_raw(membuffer_writer_t *writer,
                                           int32_t key,
                                           int32_t type,
                                           const uint8_t *bytes,
                                           size_t n);

/* 输出完整 buffer（out_bytes 需用 membuffer_free 释放；可重复调用）。 */
membuffer_error_t membuffer_writer_finalize(const membuffer_writer_t *writer,
                                            uint8_t **out_bytes,
                                            size_t *out_n);

/* ----------------------------- Reader ----------------------------- */

typedef struct membuffer_reader membuffer_reader_t;

membuffer_error_t membuffer_reader_create(const uint8_t *bytes,
                                          size_t n,
                                          membuffer_reader_t **out_reader);
void membuffer_reader_destroy(membuffer_reader_t *reader);

membuffer_error_t membuffer_reader_size(const membuffer_reader_t *reader,
                                        size_t *out_n);
membuffer_error_t membuffer_reader_payload_size(const membuffer_reader_t *reader,
                                                size_t *out_n);
membuffer_error_t membuffer_reader_field_type(const membuffer_reader_t *reader,
                                              int32_t key,
                                              int32_t *out_type);

/* view 类接口返回指向原始 buffer 的指针（不拷贝，不以 '\0' 结尾）。 */
membuffer_error_t membuffer_reader_text_view(const membuffer_reader_t *reader,
                                             int32_t key,
                                             const char **out_bytes,
                                             size_t *out_n);
membuffer_error_t membuffer_reader_i32(const membuffer_reader_t *reader,
                                       int32_t key,
                                       int32_t *out_value);
membuffer_error_t membuffer_reader_bytes_view(const membuffer_reader_t *reader,
                                              int32_t key,
                                              const uint8_t **out_bytes,
                                              size_t *out_n);
/* payload 不保证 8 字节对齐，u64 数组总是复制（out_values 需用 membuffer_free 释放）。 */
membuffer_error_t membuffer_reader_u64_copy(const membuffer_reader_t *reader,
                                            int32_t key,
                                            uint64_t **out_values,
                                            size_t *out_n);
membuffer_error_t membuffer_reader_raw_view(const membuffer_reader_t *reader,
                                            int32_t key,
                                            int32_t type,
                                            const uint8_t **out_bytes,
                                            size_t *out_n);
/* 嵌套 reader 同样借用最外层 buffer，需单独 destroy。 */
membuffer_error_t membuffer_reader_nested(const membuffer_reader_t *reader,
                                          int32_t key,
                                          membuffer_reader_t **out_reader);

#ifdef __cplusplus
} /* extern "C" */
#endif
