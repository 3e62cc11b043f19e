#include "membuffer/format/header.hpp"

#include "core/logger.hpp"

#include <cstring>

namespace membuffer::format {

std::int32_t read_i32(bytes_view in, std::size_t offset) noexcept {
  std::int32_t v = 0;
  std::memcpy(&v, in.data() + offset, sizeof(v));
  return v;
}

void append_i32(std::int32_t value, std::vector<byte>& out) {
  const auto at = out.size();
  out.resize(at + sizeof(value));
  std::memcpy(out.data() + at, &value, sizeof(value));
}

void append_record(const FieldDescriptor& field, std::vector<byte>& out) {
  append_i32(field.position.offset, out);
  append_i32(field.position.length, out);
  append_i32(to_underlying(field.type), out);
  append_i32(field.key, out);
}

void append_sentinel(std::vector<byte>& out) { append_i32(kSentinel, out); }

void encode_header(std::span<const FieldDescriptor> fields, std::vector<byte>& out) {
  out.reserve(out.size() + header_size(fields.size()));
  for (const auto& field : fields) {
    append_record(field, out);
  }
  append_sentinel(out);
}

std::error_code decode_header(
  bytes_view in,
  std::vector<FieldDescriptor>& out,
  std::size_t& consumed,
  std::size_t max_fields) {
  out.clear();
  consumed = 0;

  std::size_t pos = 0;
  for (;;) {
    // 每一轮先读一个候选 offset：等于 sentinel 即表尾，否则必须有完整的一条记录。
    if (in.size() - pos < kFieldBytes) {
      core::detail::logger().debug(
        "membuffer: header truncated at byte {} of {} (no sentinel)", pos, in.size());
      return make_error_code(errc::malformed_header);
    }
    const auto offset = read_i32(in, pos);
    if (offset == kSentinel) {
      consumed = pos + kSentinelSize;
      return {};
    }
    if (in.size() - pos < kRecordSize) {
      core::detail::logger().debug(
        "membuffer: descriptor record at byte {} truncated ({} of {} bytes)", pos, in.size() - pos, kRecordSize);
      return make_error_code(errc::malformed_header);
    }
    if (max_fields != 0 && out.size() >= max_fields) {
      core::detail::logger().debug("membuffer: descriptor table exceeds limit of {} fields", max_fields);
      return make_error_code(errc::too_many_fields);
    }

    FieldDescriptor field;
    field.position.offset = offset;
    field.position.length = read_i32(in, pos + kFieldBytes);
    field.type = static_cast<type_tag>(read_i32(in, pos + 2 * kFieldBytes));
    field.key = read_i32(in, pos + 3 * kFieldBytes);
    out.push_back(field);
    pos += kRecordSize;
  }
}

std::error_code slice_payload(const Position& position, bytes_view payload, bytes_view& out) noexcept {
  if (position.offset < 0 || position.length < 0) {
    return make_error_code(errc::field_out_of_range);
  }
  const auto begin = static_cast<std::size_t>(position.offset);
  const auto length = static_cast<std::size_t>(position.length);
  if (begin > payload.size() || length > payload.size() - begin) {
    return make_error_code(errc::field_out_of_range);
  }
  out = payload.subspan(begin, length);
  return {};
}

}  // namespace membuffer::format
