#pragma once
#include <reina/schema/encoding/wire/endianness.hpp>
#include <reina/schema/encoding/wire/error.hpp>
#include <reina/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace reina::schema::encoding::wire {

// Every wire type provides the same three operations:
//   encoded_size(v)                  exact byte count encode_to writes
//   encode_to(v, buffer, order)      bytes written
//   decode_from(buffer, order, out)  bytes consumed
// Unsigned integers are varints, signed integers are zig-zag varints, f64 is
// eight bytes in `order`, bool is one byte (0 or 1), byte sequences and text
// carry a varint length prefix.

std::size_t encoded_size(uint64_t value);
std::size_t encoded_size(uint32_t value);
std::size_t encoded_size(int64_t value);
std::size_t encoded_size(int32_t value);
std::size_t encoded_size(bool value);
std::size_t encoded_size(double value);
std::size_t encoded_size(const bytes_t& value);
std::size_t encoded_size(const std::string& value);

result_t<std::size_t> encode_to(uint64_t value,
                                const mutable_bytes_view_t& buffer,
                                endianness order);
result_t<std::size_t> encode_to(uint32_t value,
                                const mutable_bytes_view_t& buffer,
                                endianness order);
result_t<std::size_t> encode_to(int64_t value,
                                const mutable_bytes_view_t& buffer,
                                endianness order);
result_t<std::size_t> encode_to(int32_t value,
                                const mutable_bytes_view_t& buffer,
                                endianness order);
result_t<std::size_t> encode_to(bool value,
                                const mutable_bytes_view_t& buffer,
                                endianness order);
result_t<std::size_t> encode_to(double value,
                                const mutable_bytes_view_t& buffer,
                                endianness order);
result_t<std::size_t> encode_to(const bytes_t& value,
                                const mutable_bytes_view_t& buffer,
                                endianness order);
result_t<std::size_t> encode_to(const std::string& value,
                                const mutable_bytes_view_t& buffer,
                                endianness order);

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  endianness order,
                                  uint64_t& out);
result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  endianness order,
                                  uint32_t& out);
result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  endianness order,
                                  int64_t& out);
result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  endianness order,
                                  int32_t& out);
result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  endianness order,
                                  bool& out);
result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  endianness order,
                                  double& out);
result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  endianness order,
                                  bytes_t& out);
/// Rejects text that is not valid UTF-8.
result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  endianness order,
                                  std::string& out);

/// Raw single byte, no varint. Used for schema version fields.
result_t<std::size_t> encode_byte(uint8_t value,
                                  const mutable_bytes_view_t& buffer);
result_t<std::size_t> decode_byte(const bytes_view_t& buffer, uint8_t& out);

}  // namespace reina::schema::encoding::wire
