#pragma once

#include "membuffer/core/error.hpp"
#include "membuffer/format/codec.hpp"
#include "membuffer/format/error.hpp"
#include "membuffer/format/header.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <system_error>
#include <type_traits>
#include <vector>

namespace membuffer::format {

struct WriterOptions final {
  // payload 上限（字节）。超过 kMaxPayloadSize 的值会被收紧到 kMaxPayloadSize。
  std::size_t max_payload_size{kMaxPayloadSize};

  // 构造时预留的 payload 容量（已知总大小时可避免反复扩容）。
  std::size_t reserve_payload{0};
};

/**
 * @brief 字段写入器：累积字段，finalize() 时一次性输出“描述符表 + sentinel + payload”。
 *
 * 约定：
 * - 字段按 key（i32）寻址；同一 key 再次写入时后写覆盖前写，
 *   被覆盖字段的 payload 字节保留在 payload 中（不回收）；
 * - 字段一旦写入不可修改/删除，offset 始终等于写入时 payload 的长度；
 * - finalize() 不修改状态，可重复调用，输出按 key 升序排列、逐字节一致。
 *
 * 注意：
 * - 本类不做线程安全保证（构建阶段只应由单一所有者操作）。
 */
class Writer final {
 public:
  Writer() = default;
  explicit Writer(WriterOptions options);

  /**
   * @brief 写入一个字段。T 必须有 codec<T> 特化（见 codec.hpp）。
   *
   * 失败时 Writer 状态不变：
   * - errc::payload_overflow：payload 将超过上限；
   * - errc::reserved_value：内联整数等于 sentinel；
   * - core::errc::invalid_argument：把 Writer 嵌入它自己。
   */
  template <class T>
    requires EncodableField<std::decay_t<const T>>
  std::error_code add_entry(std::int32_t key, const T& value);

  /**
   * @brief 以原始字节写入任意类型标签的字段（用于没有 codec 的自定义类型）。
   *
   * 字节原样追加到 payload。type 为 integer32（内联值，无 payload）或负值时返回
   * core::errc::invalid_argument，Writer 不变。
   */
  std::error_code add_raw_entry(std::int32_t key, type_tag type, bytes_view bytes);

  [[nodiscard]] std::vector<byte> finalize() const;

  // 将 finalize() 的结果追加到 out 末尾（嵌套写入时直接写进外层 payload）。
  void finalize_to(std::vector<byte>& out) const;

  [[nodiscard]] std::size_t finalized_size() const noexcept;
  [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
  [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
  [[nodiscard]] std::size_t payload_size() const noexcept { return payload_.size(); }
  [[nodiscard]] bool contains(std::int32_t key) const noexcept { return fields_.find(key) != fields_.end(); }
  [[nodiscard]] const WriterOptions& options() const noexcept { return options_; }

 private:
  std::error_code check_capacity(std::size_t additional) const noexcept;

  // 记录描述符；payload 已由 codec 追加完毕。失败时回滚 payload 到 rollback_size。
  std::error_code commit(std::int32_t key, type_tag type, Position position, std::size_t rollback_size);

  WriterOptions options_{};
  std::map<std::int32_t, FieldDescriptor> fields_;
  std::vector<byte> payload_;
};

/**
 * @brief 嵌套 buffer：把整个 Writer 的 finalize() 结果作为一个字段写入。
 */
template <>
struct codec<Writer> {
  static constexpr type_tag tag = type_tag::nested_buffer;

  static std::size_t encoded_size(const Writer& value) noexcept { return value.finalized_size(); }

  static void encode(const Writer& value, Position&, std::vector<byte>& payload) { value.finalize_to(payload); }
};

template <class T>
  requires EncodableField<std::decay_t<const T>>
std::error_code Writer::add_entry(std::int32_t key, const T& value) {
  using field_codec = codec<std::decay_t<const T>>;

  if constexpr (std::is_same_v<std::decay_t<const T>, Writer>) {
    // finalize_to 会读取 value.payload_ 并同时向 this->payload_ 追加。
    if (&value == this) {
      return core::make_error_code(core::errc::invalid_argument);
    }
  }

  auto ec = check_capacity(field_codec::encoded_size(value));
  if (ec) {
    return ec;
  }

  const auto before = payload_.size();
  Position position{static_cast<std::int32_t>(before), 0};
  field_codec::encode(value, position, payload_);
  position.length = static_cast<std::int32_t>(payload_.size() - before);
  return commit(key, field_codec::tag, position, before);
}

}  // namespace membuffer::format
