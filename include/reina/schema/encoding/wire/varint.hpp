#pragma once
#include <reina/schema/encoding/wire/error.hpp>
#include <reina/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>

namespace reina::schema::encoding::wire {

/// Longest valid varint: ceil(64 / 7).
inline constexpr std::size_t kMaxVarintSize = 10;

/// Number of bytes `encode_varint` writes for value (minimum 1).
constexpr std::size_t varint_size(uint64_t value) noexcept {
  auto size = std::size_t{1};
  while (value >= 0x80u) {
    value >>= 7u;
    ++size;
  }
  return size;
}

constexpr uint64_t zigzag_encode(const int64_t value) noexcept {
  return (static_cast<uint64_t>(value) << 1u) ^
         static_cast<uint64_t>(value >> 63);
}

constexpr uint32_t zigzag_encode(const int32_t value) noexcept {
  return (static_cast<uint32_t>(value) << 1u) ^
         static_cast<uint32_t>(value >> 31);
}

constexpr int64_t zigzag_decode(const uint64_t value) noexcept {
  return static_cast<int64_t>((value >> 1u) ^ (~(value & 1u) + 1u));
}

constexpr int32_t zigzag_decode(const uint32_t value) noexcept {
  return static_cast<int32_t>((value >> 1u) ^ (~(value & 1u) + 1u));
}

/// Base-128 little-endian varint: 7 value bits per byte, high bit set on
/// every byte except the last. Fails with buffer_too_small before writing
/// anything when the whole varint does not fit.
result_t<std::size_t> encode_varint(uint64_t value,
                                    const mutable_bytes_view_t& buffer);

/// Reads one varint from the front of buffer. An unterminated varint, an
/// accumulated shift of 64 or more, or value bits beyond bit 63 are
/// invalid_data.
result_t<decoded<uint64_t>> decode_varint(const bytes_view_t& buffer);

/// As decode_varint, additionally rejecting values above UINT32_MAX.
result_t<decoded<uint32_t>> decode_varint_u32(const bytes_view_t& buffer);

}  // namespace reina::schema::encoding::wire
