#pragma once

#include "membuffer/format/error.hpp"
#include "membuffer/format/header.hpp"
#include "membuffer/format/types.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace membuffer::format {

/**
 * @brief Reader 的解码选项（嵌套 Reader 继承同一份选项）。
 */
struct ReaderOptions final {
  // Text 字段解码时校验 UTF-8。关闭后按原始字节返回，由调用方保证输入可信。
  bool validate_utf8{true};

  // 描述符表条目上限（0 表示不限制），用于约束不可信输入的内存占用。
  std::size_t max_fields{0};
};

/**
 * @brief 严格 UTF-8 校验（拒绝过长编码、代理区与 > U+10FFFF 的码点）。
 */
[[nodiscard]] bool is_valid_utf8(bytes_view bytes) noexcept;

/**
 * @brief U64Vector 字段的零拷贝只读视图。
 *
 * payload 中的字节不保证 8 字节对齐，因此不做指针重解释：
 * 逐元素通过 memcpy 按主机字节序读取。字节长度必须是 8 的整数倍。
 */
class U64View final {
 public:
  class const_iterator final {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::uint64_t;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = std::uint64_t;

    const_iterator() = default;
    explicit const_iterator(const byte* p) noexcept : p_(p) {}

    reference operator*() const noexcept {
      std::uint64_t v = 0;
      std::memcpy(&v, p_, sizeof(v));
      return v;
    }

    const_iterator& operator++() noexcept {
      p_ += sizeof(std::uint64_t);
      return *this;
    }

    const_iterator operator++(int) noexcept {
      auto tmp = *this;
      ++*this;
      return tmp;
    }

    friend bool operator==(const const_iterator&, const const_iterator&) = default;

   private:
    const byte* p_{nullptr};
  };

  U64View() = default;

  // 以已有的 64 位字数组构造（用于写入）。
  explicit U64View(std::span<const std::uint64_t> words) noexcept
      : bytes_(reinterpret_cast<const byte*>(words.data()), words.size_bytes()) {}

  /**
   * @brief 从字节区间构造视图；长度不是 8 的整数倍时返回 errc::length_mismatch。
   */
  static std::error_code from_bytes(bytes_view bytes, U64View& out) noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return bytes_.size() / sizeof(std::uint64_t); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return bytes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }
  [[nodiscard]] bytes_view bytes() const noexcept { return bytes_; }

  // 调用方保证 index < size()。
  [[nodiscard]] std::uint64_t operator[](std::size_t index) const noexcept {
    std::uint64_t v = 0;
    std::memcpy(&v, bytes_.data() + index * sizeof(std::uint64_t), sizeof(v));
    return v;
  }

  [[nodiscard]] const_iterator begin() const noexcept { return const_iterator{bytes_.data()}; }
  [[nodiscard]] const_iterator end() const noexcept { return const_iterator{bytes_.data() + bytes_.size()}; }

  [[nodiscard]] std::vector<std::uint64_t> to_vector() const;

  // 复制 min(size(), out.size()) 个元素，返回复制的数量。
  std::size_t copy_to(std::span<std::uint64_t> out) const noexcept;

  friend bool operator==(const U64View& lhs, const U64View& rhs) noexcept;

 private:
  explicit U64View(bytes_view bytes) noexcept : bytes_(bytes) {}

  bytes_view bytes_{};
};

/**
 * @brief 字段类型的编解码规则（扩展点）。
 *
 * 写入端要求：
 * - static constexpr type_tag tag;
 * - static std::size_t encoded_size(const T&)：追加到 payload 的字节数；
 * - static void encode(const T&, Position&, std::vector<byte>& payload)：
 *   调用前 position.offset 已设为 payload 当前长度；内联类型改写 offset 且不追加字节。
 *
 * 读取端要求：
 * - static std::error_code decode(const Position&, bytes_view payload, const ReaderOptions&, T& out)。
 *
 * 自定义类型：特化 codec<MyType>，tag 取 user_type(n)。
 */
template <class T>
struct codec;

template <class T>
concept EncodableField = requires(const T& value, Position& position, std::vector<byte>& payload) {
  { codec<T>::tag } -> std::convertible_to<type_tag>;
  { codec<T>::encoded_size(value) } -> std::same_as<std::size_t>;
  codec<T>::encode(value, position, payload);
};

template <class T>
concept DecodableField =
  requires(const Position& position, bytes_view payload, const ReaderOptions& options, T& out) {
    { codec<T>::tag } -> std::convertible_to<type_tag>;
    { codec<T>::decode(position, payload, options, out) } -> std::same_as<std::error_code>;
  };

// 追加原始字节到 payload（各 codec 共用）。
inline void append_bytes(bytes_view bytes, std::vector<byte>& payload) {
  payload.insert(payload.end(), bytes.begin(), bytes.end());
}

// ----------------------------- Text -----------------------------

template <>
struct codec<std::string_view> {
  static constexpr type_tag tag = type_tag::text;

  static std::size_t encoded_size(std::string_view value) noexcept { return value.size(); }

  static void encode(std::string_view value, Position&, std::vector<byte>& payload) {
    append_bytes(bytes_view{reinterpret_cast<const byte*>(value.data()), value.size()}, payload);
  }

  // 零拷贝：返回指向 payload 的 string_view。
  static std::error_code decode(
    const Position& position,
    bytes_view payload,
    const ReaderOptions& options,
    std::string_view& out) noexcept;
};

template <>
struct codec<std::string> {
  static constexpr type_tag tag = type_tag::text;

  static std::size_t encoded_size(const std::string& value) noexcept { return value.size(); }

  static void encode(const std::string& value, Position& position, std::vector<byte>& payload) {
    codec<std::string_view>::encode(value, position, payload);
  }

  // 拷贝到 std::string。
  static std::error_code decode(
    const Position& position,
    bytes_view payload,
    const ReaderOptions& options,
    std::string& out);
};

template <>
struct codec<const char*> {
  static constexpr type_tag tag = type_tag::text;

  static std::size_t encoded_size(const char* value) noexcept { return std::string_view{value}.size(); }

  static void encode(const char* value, Position& position, std::vector<byte>& payload) {
    codec<std::string_view>::encode(value, position, payload);
  }
};

// ----------------------------- Integer32（内联） -----------------------------

template <>
struct codec<std::int32_t> {
  static constexpr type_tag tag = type_tag::integer32;

  static std::size_t encoded_size(std::int32_t) noexcept { return 0; }

  // 值直接写入描述符的 offset 槽，不占 payload。
  static void encode(std::int32_t value, Position& position, std::vector<byte>&) noexcept {
    position.offset = value;
  }

  static std::error_code decode(
    const Position& position,
    bytes_view,
    const ReaderOptions&,
    std::int32_t& out) noexcept {
    out = position.offset;
    return {};
  }
};

// ----------------------------- ByteVector -----------------------------

template <>
struct codec<bytes_view> {
  static constexpr type_tag tag = type_tag::vector_u8;

  static std::size_t encoded_size(bytes_view value) noexcept { return value.size(); }

  static void encode(bytes_view value, Position&, std::vector<byte>& payload) { append_bytes(value, payload); }

  static std::error_code decode(
    const Position& position,
    bytes_view payload,
    const ReaderOptions& options,
    bytes_view& out) noexcept;
};

template <>
struct codec<std::vector<byte>> {
  static constexpr type_tag tag = type_tag::vector_u8;

  static std::size_t encoded_size(const std::vector<byte>& value) noexcept { return value.size(); }

  static void encode(const std::vector<byte>& value, Position&, std::vector<byte>& payload) {
    append_bytes(bytes_view{value.data(), value.size()}, payload);
  }

  static std::error_code decode(
    const Position& position,
    bytes_view payload,
    const ReaderOptions& options,
    std::vector<byte>& out);
};

// ----------------------------- U64Vector -----------------------------

template <>
struct codec<U64View> {
  static constexpr type_tag tag = type_tag::vector_u64;

  static std::size_t encoded_size(const U64View& value) noexcept { return value.size_bytes(); }

  static void encode(const U64View& value, Position&, std::vector<byte>& payload) {
    append_bytes(value.bytes(), payload);
  }

  static std::error_code decode(
    const Position& position,
    bytes_view payload,
    const ReaderOptions& options,
    U64View& out) noexcept;
};

template <>
struct codec<std::span<const std::uint64_t>> {
  static constexpr type_tag tag = type_tag::vector_u64;

  static std::size_t encoded_size(std::span<const std::uint64_t> value) noexcept { return value.size_bytes(); }

  static void encode(std::span<const std::uint64_t> value, Position& position, std::vector<byte>& payload) {
    codec<U64View>::encode(U64View{value}, position, payload);
  }
};

template <>
struct codec<std::span<std::uint64_t>> {
  static constexpr type_tag tag = type_tag::vector_u64;

  static std::size_t encoded_size(std::span<std::uint64_t> value) noexcept { return value.size_bytes(); }

  static void encode(std::span<std::uint64_t> value, Position& position, std::vector<byte>& payload) {
    codec<U64View>::encode(U64View{std::span<const std::uint64_t>{value}}, position, payload);
  }
};

template <>
struct codec<std::vector<std::uint64_t>> {
  static constexpr type_tag tag = type_tag::vector_u64;

  static std::size_t encoded_size(const std::vector<std::uint64_t>& value) noexcept {
    return value.size() * sizeof(std::uint64_t);
  }

  static void encode(const std::vector<std::uint64_t>& value, Position& position, std::vector<byte>& payload) {
    codec<U64View>::encode(U64View{std::span<const std::uint64_t>{value}}, position, payload);
  }

  static std::error_code decode(
    const Position& position,
    bytes_view payload,
    const ReaderOptions& options,
    std::vector<std::uint64_t>& out);
};

}  // namespace membuffer::format
