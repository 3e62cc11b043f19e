#pragma once

#include "membuffer/format/error.hpp"
#include "membuffer/format/types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace membuffer::format {

/*
 * 线格式（所有整数均为 4 字节有符号、主机字节序）：
 *
 *   [record]*  : offset:i32 | length:i32 | type:i32 | key:i32   (16B/条)
 *   sentinel   : i32 = 0x7AFECAFE                                 (4B)
 *   payload    : 所有非内联字段的原始字节
 *
 * 不存条目数：读取端顺序扫描到 sentinel 为止。
 * 注意：主机字节序意味着大端/小端机器之间不能直接交换 buffer。
 */
inline constexpr std::int32_t kSentinel = 0x7AFECAFE;
inline constexpr std::size_t kFieldBytes = sizeof(std::int32_t);
inline constexpr std::size_t kRecordSize = 4 * kFieldBytes;
inline constexpr std::size_t kSentinelSize = kFieldBytes;

// payload 上限：任何 offset 都必须 < sentinel，否则会被误判为表尾。
inline constexpr std::size_t kMaxPayloadSize = static_cast<std::size_t>(kSentinel) - 1;

/**
 * @brief 字段在 payload 中的字节区间。
 *
 * 内联类型（Integer32）不占 payload：length 恒为 0，offset 直接存值本身。
 */
struct Position final {
  std::int32_t offset{0};
  std::int32_t length{0};
  friend bool operator==(const Position&, const Position&) = default;
};

struct FieldDescriptor final {
  Position position{};
  type_tag type{type_tag::text};
  std::int32_t key{0};
  friend bool operator==(const FieldDescriptor&, const FieldDescriptor&) = default;
};

// 以主机字节序读取 in[offset..offset+4)；调用方保证不越界。
[[nodiscard]] std::int32_t read_i32(bytes_view in, std::size_t offset) noexcept;
void append_i32(std::int32_t value, std::vector<byte>& out);

// field_count 条记录 + sentinel 的总字节数。
[[nodiscard]] constexpr std::size_t header_size(std::size_t field_count) noexcept {
  return field_count * kRecordSize + kSentinelSize;
}

void append_record(const FieldDescriptor& field, std::vector<byte>& out);
void append_sentinel(std::vector<byte>& out);

/**
 * @brief 编码完整描述符表（按 fields 顺序写记录，最后写 sentinel），追加到 out。
 */
void encode_header(std::span<const FieldDescriptor> fields, std::vector<byte>& out);

/**
 * @brief 从 buffer 头部扫描描述符表。
 *
 * 成功时：
 * - out 按记录出现顺序填充；
 * - consumed 为描述符表 + sentinel 的字节数（payload 从此处开始）。
 *
 * 失败时返回 errc::malformed_header（不足 4 字节，或记录在 sentinel 之前被截断），
 * 记录数超过 max_fields（非 0 时）返回 errc::too_many_fields。
 * payload 内容在此阶段不做任何检查。
 */
std::error_code decode_header(
  bytes_view in,
  std::vector<FieldDescriptor>& out,
  std::size_t& consumed,
  std::size_t max_fields = 0);

/**
 * @brief 校验 position 并取出 payload 中对应的子区间。
 *
 * offset/length 为负，或 offset+length 超出 payload 时返回 errc::field_out_of_range。
 */
std::error_code slice_payload(const Position& position, bytes_view payload, bytes_view& out) noexcept;

}  // namespace membuffer::format
