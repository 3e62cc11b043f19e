#include "membuffer/format/writer.hpp"

#include "core/logger.hpp"

#include <algorithm>

namespace membuffer::format {

Writer::Writer(WriterOptions options) : options_(options) {
  options_.max_payload_size = std::min(options_.max_payload_size, kMaxPayloadSize);
  if (options_.reserve_payload != 0) {
    payload_.reserve(std::min(options_.reserve_payload, options_.max_payload_size));
  }
}

std::error_code Writer::check_capacity(std::size_t additional) const noexcept {
  const auto limit = std::min(options_.max_payload_size, kMaxPayloadSize);
  if (payload_.size() > limit || additional > limit - payload_.size()) {
    return make_error_code(errc::payload_overflow);
  }
  return {};
}

std::error_code Writer::add_raw_entry(std::int32_t key, type_tag type, bytes_view bytes) {
  // integer32 的值存放在描述符 offset 中，没有 payload 字节可写。
  if (type == type_tag::integer32 || to_underlying(type) < 0) {
    return make_error_code(core::errc::invalid_argument);
  }
  auto ec = check_capacity(bytes.size());
  if (ec) {
    return ec;
  }
  const auto before = payload_.size();
  append_bytes(bytes, payload_);
  const Position position{static_cast<std::int32_t>(before), static_cast<std::int32_t>(bytes.size())};
  return commit(key, type, position, before);
}

std::error_code Writer::commit(std::int32_t key, type_tag type, Position position, std::size_t rollback_size) {
  // 内联值与 sentinel 相同时，读取端会在这条记录处提前结束描述符表。
  if (position.offset == kSentinel) {
    payload_.resize(rollback_size);
    return make_error_code(errc::reserved_value);
  }

  const FieldDescriptor field{position, type, key};
  auto [it, inserted] = fields_.try_emplace(key, field);
  if (!inserted) {
    core::detail::logger().debug(
      "membuffer: key {} overwritten ({} -> {}), {} payload bytes orphaned",
      key,
      type_tag_name(it->second.type),
      type_tag_name(type),
      it->second.type == type_tag::integer32 ? 0 : it->second.position.length);
    it->second = field;
  }
  return {};
}

std::size_t Writer::finalized_size() const noexcept { return header_size(fields_.size()) + payload_.size(); }

std::vector<byte> Writer::finalize() const {
  std::vector<byte> out;
  finalize_to(out);
  return out;
}

void Writer::finalize_to(std::vector<byte>& out) const {
  out.reserve(out.size() + finalized_size());
  for (const auto& entry : fields_) {
    append_record(entry.second, out);
  }
  append_sentinel(out);
  append_bytes(bytes_view{payload_.data(), payload_.size()}, out);
}

}  // namespace membuffer::format
