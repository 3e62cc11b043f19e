#pragma once

#include "membuffer/format/codec.hpp"
#include "membuffer/format/error.hpp"
#include "membuffer/format/header.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace membuffer::format {

/**
 * @brief 单个字段的读取结果。
 *
 * - ec 为空表示成功，value 有效；
 * - errc::type_mismatch 时 actual_type 为描述符中的类型，requested_type 为请求的类型；
 * - errc::unknown_field 时 actual_type 为空。
 */
template <class T>
struct LoadResult final {
  T value{};
  std::error_code ec{};
  std::optional<type_tag> actual_type{};
  type_tag requested_type{type_tag::text};

  [[nodiscard]] bool ok() const noexcept { return !ec; }
};

/**
 * @brief 字段读取器：只解析描述符表，字段内容在请求时才解码。
 *
 * 约定：
 * - Reader 借用构造时传入的 buffer（不拷贝 payload），buffer 必须比 Reader
 *   以及由它取出的所有视图（string_view/bytes_view/U64View/嵌套 Reader）活得更久；
 * - 构造后不可变：任意多个线程可以同时调用 const 成员；
 * - 构造只检查描述符表结构，payload 的越界/UTF-8/对齐问题在 load 时报告。
 */
class Reader final {
 public:
  Reader() = default;

  /**
   * @brief 解析 buffer 的描述符表。
   *
   * 失败返回 errc::malformed_header（buffer 不足 4 字节，或描述符表在 sentinel 前被截断）
   * 或 errc::too_many_fields；失败时 out 不变。
   */
  static std::error_code parse(bytes_view buffer, Reader& out, ReaderOptions options = {});

  // 字段数（重复 key 只计一次）。
  [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
  [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
  [[nodiscard]] std::size_t payload_size() const noexcept { return payload_.size(); }
  [[nodiscard]] bytes_view payload() const noexcept { return payload_; }
  [[nodiscard]] const ReaderOptions& options() const noexcept { return options_; }

  // 按 buffer 中的记录顺序（重复 key 保留最后一条）。
  [[nodiscard]] const std::vector<FieldDescriptor>& descriptors() const noexcept { return fields_; }

  [[nodiscard]] const FieldDescriptor* find(std::int32_t key) const noexcept;
  [[nodiscard]] bool contains(std::int32_t key) const noexcept { return find(key) != nullptr; }

  /**
   * @brief 按 key 读取并解码字段，T 必须有带 decode 的 codec<T> 特化。
   *
   * 变长类型（std::string_view/bytes_view/U64View/Reader）直接引用 payload，不拷贝。
   */
  template <class T>
    requires DecodableField<T>
  [[nodiscard]] LoadResult<T> load_entry(std::int32_t key) const;

  // 读取 nested_buffer 字段并在其字节区间上构造新的 Reader（继承本 Reader 的选项）。
  [[nodiscard]] LoadResult<Reader> load_recursive_reader(std::int32_t key) const;

  // 以原始字节读取任意类型标签的字段（与 Writer::add_raw_entry 对应）。
  [[nodiscard]] LoadResult<bytes_view> load_raw_entry(std::int32_t key, type_tag type) const;

 private:
  // 查找并校验类型；类型不符时 out 仍指向该描述符，便于上报实际类型。
  std::error_code resolve(std::int32_t key, type_tag requested, const FieldDescriptor*& out) const noexcept;

  std::vector<FieldDescriptor> fields_;
  std::unordered_map<std::int32_t, std::size_t> index_;
  bytes_view payload_{};
  ReaderOptions options_{};
};

template <>
struct codec<Reader> {
  static constexpr type_tag tag = type_tag::nested_buffer;

  static std::error_code decode(
    const Position& position,
    bytes_view payload,
    const ReaderOptions& options,
    Reader& out);
};

template <class T>
  requires DecodableField<T>
LoadResult<T> Reader::load_entry(std::int32_t key) const {
  LoadResult<T> result;
  result.requested_type = codec<T>::tag;

  const FieldDescriptor* field = nullptr;
  result.ec = resolve(key, codec<T>::tag, field);
  if (field != nullptr) {
    result.actual_type = field->type;
  }
  if (result.ec) {
    return result;
  }
  result.ec = codec<T>::decode(field->position, payload_, options_, result.value);
  return result;
}

/**
 * @brief 调试用的一行描述："Found memory buffer with payload size N"。
 */
[[nodiscard]] std::string describe(const Reader& reader);

}  // namespace membuffer::format
