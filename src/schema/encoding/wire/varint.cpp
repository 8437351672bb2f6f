#include <reina/schema/encoding/wire/varint.hpp>

#include <limits>

namespace reina::schema::encoding::wire {

result_t<std::size_t> encode_varint(uint64_t value,
                                    const mutable_bytes_view_t& buffer) {
  const auto size = varint_size(value);
  if (buffer.size() < size) {
    return codec_error_t{buffer_too_small{size, buffer.size()}};
  }
  auto i = std::size_t{0};
  while (value >= 0x80u) {
    buffer[i++] = static_cast<uint8_t>((value & 0x7Fu) | 0x80u);
    value >>= 7u;
  }
  buffer[i++] = static_cast<uint8_t>(value);
  return i;
}

result_t<decoded<uint64_t>> decode_varint(const bytes_view_t& buffer) {
  auto value = uint64_t{0};
  auto shift = 0u;
  for (auto i = std::size_t{0}; i < buffer.size(); ++i) {
    const auto byte = buffer[i];
    const auto part = static_cast<uint64_t>(byte & 0x7Fu);
    // Only one value bit is left at shift 63.
    if (shift == 63u && part > 1u) {
      return codec_error_t{invalid_data{"varint overflow"}};
    }
    value |= part << shift;
    if ((byte & 0x80u) == 0) {
      return decoded<uint64_t>{value, i + 1};
    }
    shift += 7u;
    if (shift >= 64u) {
      return codec_error_t{invalid_data{"varint overflow"}};
    }
  }
  return codec_error_t{
      invalid_data{"buffer ended unexpectedly while reading varint"}};
}

result_t<decoded<uint32_t>> decode_varint_u32(const bytes_view_t& buffer) {
  auto wide = decode_varint(buffer);
  if (wide.has_error()) {
    return wide.error();
  }
  if (wide.value().value > std::numeric_limits<uint32_t>::max()) {
    return codec_error_t{invalid_data{"u32 varint overflow"}};
  }
  return decoded<uint32_t>{static_cast<uint32_t>(wide.value().value),
                           wide.value().consumed};
}

}  // namespace reina::schema::encoding::wire
