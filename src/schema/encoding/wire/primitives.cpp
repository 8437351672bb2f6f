#include <reina/schema/encoding/wire/fixed.hpp>
#include <reina/schema/encoding/wire/primitives.hpp>
#include <reina/schema/encoding/wire/varint.hpp>

#include <algorithm>
#include <limits>
#include <string_view>

namespace reina::schema::encoding::wire {

namespace {

std::size_t length_prefixed_size(const std::size_t length) {
  return varint_size(length) + length;
}

result_t<std::size_t> encode_length_prefixed(
    const bytes_view_t& value,
    const mutable_bytes_view_t& buffer) {
  const auto required = length_prefixed_size(value.size());
  if (buffer.size() < required) {
    return codec_error_t{buffer_too_small{required, buffer.size()}};
  }
  auto written = encode_varint(value.size(), buffer);
  if (written.has_error()) {
    return written.error();
  }
  std::copy(std::begin(value), std::end(value),
            std::begin(buffer) + static_cast<std::ptrdiff_t>(written.value()));
  return written.value() + value.size();
}

/// Returns the view of the length-prefixed body and the total consumed
/// count (prefix included).
result_t<decoded<bytes_view_t>> decode_length_prefixed(
    const bytes_view_t& buffer,
    const std::string_view what) {
  auto length = decode_varint(buffer);
  if (length.has_error()) {
    return length.error();
  }
  const auto prefix = length.value().consumed;
  if (length.value().value >
      std::numeric_limits<std::size_t>::max() - prefix) {
    return codec_error_t{overflow{"declared " + std::string{what} +
                                  " length overflows"}};
  }
  const auto total = prefix + static_cast<std::size_t>(length.value().value);
  if (buffer.size() < total) {
    return codec_error_t{
        invalid_data{"not enough bytes for " + std::string{what}}};
  }
  return decoded<bytes_view_t>{buffer.subspan(prefix, total - prefix), total};
}

}  // namespace

std::size_t encoded_size(const uint64_t value) {
  return varint_size(value);
}

std::size_t encoded_size(const uint32_t value) {
  return varint_size(value);
}

std::size_t encoded_size(const int64_t value) {
  return varint_size(zigzag_encode(value));
}

std::size_t encoded_size(const int32_t value) {
  return varint_size(zigzag_encode(value));
}

std::size_t encoded_size(const bool) {
  return 1;
}

std::size_t encoded_size(const double) {
  return kFixedF64Size;
}

std::size_t encoded_size(const bytes_t& value) {
  return length_prefixed_size(value.size());
}

std::size_t encoded_size(const std::string& value) {
  return length_prefixed_size(value.size());
}

result_t<std::size_t> encode_to(const uint64_t value,
                                const mutable_bytes_view_t& buffer,
                                const endianness) {
  return encode_varint(value, buffer);
}

result_t<std::size_t> encode_to(const uint32_t value,
                                const mutable_bytes_view_t& buffer,
                                const endianness) {
  return encode_varint(value, buffer);
}

result_t<std::size_t> encode_to(const int64_t value,
                                const mutable_bytes_view_t& buffer,
                                const endianness) {
  return encode_varint(zigzag_encode(value), buffer);
}

result_t<std::size_t> encode_to(const int32_t value,
                                const mutable_bytes_view_t& buffer,
                                const endianness) {
  return encode_varint(zigzag_encode(value), buffer);
}

result_t<std::size_t> encode_to(const bool value,
                                const mutable_bytes_view_t& buffer,
                                const endianness) {
  return encode_byte(static_cast<uint8_t>(value ? 1 : 0), buffer);
}

result_t<std::size_t> encode_to(const double value,
                                const mutable_bytes_view_t& buffer,
                                const endianness order) {
  return encode_fixed_f64(value, buffer, order);
}

result_t<std::size_t> encode_to(const bytes_t& value,
                                const mutable_bytes_view_t& buffer,
                                const endianness) {
  return encode_length_prefixed(make_bytes_view(value), buffer);
}

result_t<std::size_t> encode_to(const std::string& value,
                                const mutable_bytes_view_t& buffer,
                                const endianness) {
  return encode_length_prefixed(make_bytes_view(value), buffer);
}

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  const endianness,
                                  uint64_t& out) {
  auto result = decode_varint(buffer);
  if (result.has_error()) {
    return result.error();
  }
  out = result.value().value;
  return result.value().consumed;
}

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  const endianness,
                                  uint32_t& out) {
  auto result = decode_varint_u32(buffer);
  if (result.has_error()) {
    return result.error();
  }
  out = result.value().value;
  return result.value().consumed;
}

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  const endianness,
                                  int64_t& out) {
  auto result = decode_varint(buffer);
  if (result.has_error()) {
    return result.error();
  }
  out = zigzag_decode(result.value().value);
  return result.value().consumed;
}

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  const endianness,
                                  int32_t& out) {
  auto result = decode_varint_u32(buffer);
  if (result.has_error()) {
    return result.error();
  }
  out = zigzag_decode(result.value().value);
  return result.value().consumed;
}

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  const endianness,
                                  bool& out) {
  if (buffer.empty()) {
    return codec_error_t{invalid_data{"empty buffer when expecting bool"}};
  }
  switch (buffer[0]) {
    case 0:
      out = false;
      return std::size_t{1};
    case 1:
      out = true;
      return std::size_t{1};
    default:
      return codec_error_t{invalid_data{"invalid bool value " +
                                        std::to_string(buffer[0])}};
  }
}

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  const endianness order,
                                  double& out) {
  auto result = decode_fixed_f64(buffer, order);
  if (result.has_error()) {
    return result.error();
  }
  out = result.value().value;
  return result.value().consumed;
}

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  const endianness,
                                  bytes_t& out) {
  auto body = decode_length_prefixed(buffer, "byte sequence");
  if (body.has_error()) {
    return body.error();
  }
  out = make_bytes(body.value().value);
  return body.value().consumed;
}

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  const endianness,
                                  std::string& out) {
  auto body = decode_length_prefixed(buffer, "string");
  if (body.has_error()) {
    return body.error();
  }
  if (!is_valid_utf8(body.value().value)) {
    return codec_error_t{invalid_data{"string is not valid UTF-8"}};
  }
  out = make_string(body.value().value);
  return body.value().consumed;
}

result_t<std::size_t> encode_byte(const uint8_t value,
                                  const mutable_bytes_view_t& buffer) {
  if (buffer.empty()) {
    return codec_error_t{buffer_too_small{1, 0}};
  }
  buffer[0] = value;
  return std::size_t{1};
}

result_t<std::size_t> decode_byte(const bytes_view_t& buffer, uint8_t& out) {
  if (buffer.empty()) {
    return codec_error_t{invalid_data{"empty buffer when expecting byte"}};
  }
  out = buffer[0];
  return std::size_t{1};
}

}  // namespace reina::schema::encoding::wire
