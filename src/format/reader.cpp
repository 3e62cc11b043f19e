#include "membuffer/format/reader.hpp"

#include "core/logger.hpp"

#include <utility>

namespace membuffer::format {

std::error_code Reader::parse(bytes_view buffer, Reader& out, ReaderOptions options) {
  std::vector<FieldDescriptor> table;
  std::size_t consumed = 0;
  auto ec = decode_header(buffer, table, consumed, options.max_fields);
  if (ec) {
    return ec;
  }

  Reader reader;
  reader.options_ = options;
  reader.payload_ = buffer.subspan(consumed);
  reader.fields_.reserve(table.size());
  reader.index_.reserve(table.size());
  for (const auto& field : table) {
    // 外部构造的 buffer 可能含重复 key：与 Writer 一致，后出现的记录覆盖前者。
    auto [it, inserted] = reader.index_.try_emplace(field.key, reader.fields_.size());
    if (inserted) {
      reader.fields_.push_back(field);
    } else {
      reader.fields_[it->second] = field;
    }
  }

  core::detail::logger().trace(
    "membuffer: parsed {} fields, header {} bytes, payload {} bytes",
    reader.fields_.size(),
    consumed,
    reader.payload_.size());

  out = std::move(reader);
  return {};
}

const FieldDescriptor* Reader::find(std::int32_t key) const noexcept {
  const auto it = index_.find(key);
  if (it == index_.end()) {
    return nullptr;
  }
  return &fields_[it->second];
}

std::error_code Reader::resolve(std::int32_t key, type_tag requested, const FieldDescriptor*& out) const noexcept {
  out = find(key);
  if (out == nullptr) {
    return make_error_code(errc::unknown_field);
  }
  if (out->type != requested) {
    return make_error_code(errc::type_mismatch);
  }
  return {};
}

LoadResult<Reader> Reader::load_recursive_reader(std::int32_t key) const { return load_entry<Reader>(key); }

LoadResult<bytes_view> Reader::load_raw_entry(std::int32_t key, type_tag type) const {
  LoadResult<bytes_view> result;
  result.requested_type = type;

  const FieldDescriptor* field = nullptr;
  result.ec = resolve(key, type, field);
  if (field != nullptr) {
    result.actual_type = field->type;
  }
  if (result.ec) {
    return result;
  }
  // 内联整数没有 payload 区间，原始字节视图为空。
  if (field->type == type_tag::integer32) {
    return result;
  }
  result.ec = slice_payload(field->position, payload_, result.value);
  return result;
}

std::error_code codec<Reader>::decode(
  const Position& position,
  bytes_view payload,
  const ReaderOptions& options,
  Reader& out) {
  bytes_view field;
  auto ec = slice_payload(position, payload, field);
  if (ec) {
    return ec;
  }
  return Reader::parse(field, out, options);
}

std::string describe(const Reader& reader) {
  return "Found memory buffer with payload size " + std::to_string(reader.payload_size());
}

}  // namespace membuffer::format
