#include "membuffer/format/codec.hpp"

#include <algorithm>

namespace membuffer::format {
namespace {

constexpr bool is_continuation(byte b) noexcept { return (b & 0xC0u) == 0x80u; }

}  // namespace

bool is_valid_utf8(bytes_view bytes) noexcept {
  std::size_t i = 0;
  const std::size_t n = bytes.size();
  while (i < n) {
    const byte b0 = bytes[i];
    if (b0 < 0x80u) {
      ++i;
      continue;
    }

    // 按首字节确定序列长度，以及第二字节的合法范围（排除过长编码/代理区/超范围码点）。
    std::size_t len = 0;
    byte lo = 0x80u;
    byte hi = 0xBFu;
    if (b0 >= 0xC2u && b0 <= 0xDFu) {
      len = 2;
    } else if (b0 == 0xE0u) {
      len = 3;
      lo = 0xA0u;
    } else if ((b0 >= 0xE1u && b0 <= 0xECu) || b0 == 0xEEu || b0 == 0xEFu) {
      len = 3;
    } else if (b0 == 0xEDu) {
      len = 3;
      hi = 0x9Fu;
    } else if (b0 == 0xF0u) {
      len = 4;
      lo = 0x90u;
    } else if (b0 >= 0xF1u && b0 <= 0xF3u) {
      len = 4;
    } else if (b0 == 0xF4u) {
      len = 4;
      hi = 0x8Fu;
    } else {
      return false;
    }

    if (n - i < len) {
      return false;
    }
    const byte b1 = bytes[i + 1];
    if (b1 < lo || b1 > hi) {
      return false;
    }
    for (std::size_t k = 2; k < len; ++k) {
      if (!is_continuation(bytes[i + k])) {
        return false;
      }
    }
    i += len;
  }
  return true;
}

// ----------------------------- U64View -----------------------------

std::error_code U64View::from_bytes(bytes_view bytes, U64View& out) noexcept {
  if (bytes.size() % sizeof(std::uint64_t) != 0) {
    return make_error_code(errc::length_mismatch);
  }
  out = U64View{bytes};
  return {};
}

std::vector<std::uint64_t> U64View::to_vector() const {
  std::vector<std::uint64_t> out(size());
  copy_to(out);
  return out;
}

std::size_t U64View::copy_to(std::span<std::uint64_t> out) const noexcept {
  const auto count = std::min(size(), out.size());
  if (count != 0) {
    std::memcpy(out.data(), bytes_.data(), count * sizeof(std::uint64_t));
  }
  return count;
}

bool operator==(const U64View& lhs, const U64View& rhs) noexcept {
  return std::equal(lhs.bytes_.begin(), lhs.bytes_.end(), rhs.bytes_.begin(), rhs.bytes_.end());
}

// ----------------------------- 解码 -----------------------------

std::error_code codec<std::string_view>::decode(
  const Position& position,
  bytes_view payload,
  const ReaderOptions& options,
  std::string_view& out) noexcept {
  bytes_view field;
  auto ec = slice_payload(position, payload, field);
  if (ec) {
    return ec;
  }
  if (options.validate_utf8 && !is_valid_utf8(field)) {
    return make_error_code(errc::invalid_utf8);
  }
  out = std::string_view{reinterpret_cast<const char*>(field.data()), field.size()};
  return {};
}

std::error_code codec<std::string>::decode(
  const Position& position,
  bytes_view payload,
  const ReaderOptions& options,
  std::string& out) {
  std::string_view view;
  auto ec = codec<std::string_view>::decode(position, payload, options, view);
  if (ec) {
    return ec;
  }
  out.assign(view.data(), view.size());
  return {};
}

std::error_code codec<bytes_view>::decode(
  const Position& position,
  bytes_view payload,
  const ReaderOptions&,
  bytes_view& out) noexcept {
  return slice_payload(position, payload, out);
}

std::error_code codec<std::vector<byte>>::decode(
  const Position& position,
  bytes_view payload,
  const ReaderOptions& options,
  std::vector<byte>& out) {
  bytes_view field;
  auto ec = codec<bytes_view>::decode(position, payload, options, field);
  if (ec) {
    return ec;
  }
  out.assign(field.begin(), field.end());
  return {};
}

std::error_code codec<U64View>::decode(
  const Position& position,
  bytes_view payload,
  const ReaderOptions&,
  U64View& out) noexcept {
  bytes_view field;
  auto ec = slice_payload(position, payload, field);
  if (ec) {
    return ec;
  }
  return U64View::from_bytes(field, out);
}

std::error_code codec<std::vector<std::uint64_t>>::decode(
  const Position& position,
  bytes_view payload,
  const ReaderOptions& options,
  std::vector<std::uint64_t>& out) {
  U64View view;
  auto ec = codec<U64View>::decode(position, payload, options, view);
  if (ec) {
    return ec;
  }
  out = view.to_vector();
  return {};
}

}  // namespace membuffer::format
