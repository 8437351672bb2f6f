#pragma once
#include <reina/blake3/hash.hpp>
#include <reina/schema/encoding/wire/codec.hpp>
#include <reina/schema/encoding/wire/fixed.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace reina::framing {

inline constexpr std::size_t kLengthPrefixSize = 4;
inline constexpr std::size_t kChecksumSize = 32;

/// Checks that a payload of payload_size bytes fits an envelope: the total
/// must fit size_t and the length prefix must fit u32.
schema::encoding::wire::result_t<std::size_t> envelope_size(
    std::size_t payload_size);

/// Writes the length prefix and the BLAKE3 trailer around a payload already
/// sitting at buffer[4, 4 + payload_size). buffer must be exactly
/// envelope_size(payload_size) bytes.
schema::encoding::wire::result_t<void> seal_envelope(
    const schema::mutable_bytes_view_t& buffer,
    std::size_t payload_size,
    schema::encoding::wire::endianness order);

/// Validates [u32 length][payload][32-byte hash] and returns a view of the
/// payload. The view aliases buffer.
schema::encoding::wire::result_t<schema::bytes_view_t> open_envelope(
    const schema::bytes_view_t& buffer,
    schema::encoding::wire::endianness order);

/// Frames one record: [u32 length][payload][BLAKE3(payload)] where
/// length = payload size + 32. Allocates once.
template <typename T>
schema::encoding::wire::result_t<schema::bytes_t> serialize(
    const T& value,
    const schema::encoding::wire::endianness order) {
  namespace wire = reina::schema::encoding::wire;
  const auto payload_size = wire::encoded_size(value);
  auto total = envelope_size(payload_size);
  if (total.has_error()) {
    return total.error();
  }
  auto buffer = schema::bytes_t(total.value());
  auto payload = schema::mutable_bytes_view_t{buffer}.subspan(
      kLengthPrefixSize, payload_size);
  auto written = wire::encode_to(value, payload, order);
  if (written.has_error()) {
    return written.error();
  }
  if (written.value() != payload_size) {
    return wire::codec_error_t{wire::invalid_data{"encoded size mismatch"}};
  }
  if (auto r = seal_envelope(buffer, payload_size, order); r.has_error()) {
    return r.error();
  }
  return buffer;
}

/// Inverse of serialize. The payload must decode to exactly one T with no
/// bytes left over.
template <typename T>
schema::encoding::wire::result_t<T> deserialize(
    const schema::bytes_view_t& buffer,
    const schema::encoding::wire::endianness order) {
  namespace wire = reina::schema::encoding::wire;
  auto payload = open_envelope(buffer, order);
  if (payload.has_error()) {
    return payload.error();
  }
  auto value = T{};
  auto consumed = wire::decode_from(payload.value(), order, value);
  if (consumed.has_error()) {
    return consumed.error();
  }
  if (consumed.value() != payload.value().size()) {
    spdlog::debug("envelope payload has {} trailing byte(s)",
                  payload.value().size() - consumed.value());
    return wire::codec_error_t{
        wire::invalid_data{"extra bytes found in payload after decoding"}};
  }
  return value;
}

}  // namespace reina::framing
