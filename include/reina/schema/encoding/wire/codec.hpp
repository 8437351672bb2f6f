#pragma once
#include <reina/schema/encoding/wire/block.hpp>
#include <reina/schema/encoding/wire/primitives.hpp>
#include <reina/schema/encoding/wire/transfer.hpp>
#include <utility>

namespace reina::schema::encoding::wire {

/// Encodes value into a freshly allocated buffer of exactly
/// encoded_size(value) bytes.
template <typename T>
result_t<bytes_t> encode(const T& value, const endianness order) {
  const auto size = encoded_size(value);
  auto out = bytes_t(size);
  auto written = encode_to(value, mutable_bytes_view_t{out}, order);
  if (written.has_error()) {
    return written.error();
  }
  if (written.value() != size) {
    return codec_error_t{invalid_data{"encoded size mismatch"}};
  }
  return out;
}

/// Decodes one T from the front of buffer. Trailing bytes are not an error
/// here; the consumed count tells the caller where T ended.
template <typename T>
result_t<decoded<T>> decode(const bytes_view_t& buffer,
                            const endianness order) {
  auto value = T{};
  auto consumed = decode_from(buffer, order, value);
  if (consumed.has_error()) {
    return consumed.error();
  }
  return decoded<T>{std::move(value), consumed.value()};
}

}  // namespace reina::schema::encoding::wire
