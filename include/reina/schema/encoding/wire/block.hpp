#pragma once
#include <reina/schema/block.hpp>
#include <reina/schema/encoding/wire/endianness.hpp>
#include <reina/schema/encoding/wire/error.hpp>

namespace reina::schema::encoding::wire {

/// Field order on the wire: version (raw byte), number, previous_hash,
/// transaction count (varint), transactions back to back.
std::size_t encoded_size(const block<1>& value);

result_t<std::size_t> encode_to(const block<1>& value,
                                const mutable_bytes_view_t& buffer,
                                endianness order);

/// A declared transaction count larger than the remaining bytes could hold
/// is invalid_data and is rejected before any allocation.
result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  endianness order,
                                  block<1>& out);

}  // namespace reina::schema::encoding::wire
