#pragma once
#include <reina/schema/encoding/wire/primitives.hpp>

namespace reina::schema::encoding::wire {

// Sequential field access for composite records. Each call encodes or
// decodes one field at offset and advances offset by the bytes used; offset
// is left untouched on failure.

template <typename T>
result_t<void> write_field(const T& value,
                           const mutable_bytes_view_t& buffer,
                           const endianness order,
                           std::size_t& offset) {
  auto written = encode_to(value, buffer.subspan(offset), order);
  if (written.has_error()) {
    return written.error();
  }
  offset += written.value();
  return outcome::success();
}

template <typename T>
result_t<void> read_field(const bytes_view_t& buffer,
                          const endianness order,
                          std::size_t& offset,
                          T& out) {
  auto consumed = decode_from(buffer.subspan(offset), order, out);
  if (consumed.has_error()) {
    return consumed.error();
  }
  offset += consumed.value();
  return outcome::success();
}

}  // namespace reina::schema::encoding::wire
