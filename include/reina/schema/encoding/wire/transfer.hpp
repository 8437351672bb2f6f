#pragma once
#include <reina/schema/encoding/wire/endianness.hpp>
#include <reina/schema/encoding/wire/error.hpp>
#include <reina/schema/transfer.hpp>

namespace reina::schema::encoding::wire {

/// Smallest possible encoded transfer: one byte varints, eight byte fee,
/// version byte and three empty length-prefixed fields.
inline constexpr std::size_t kMinTransferSize = 14;

/// Field order on the wire: id, amount, fee, version (raw byte), sender,
/// recipient, signature.
std::size_t encoded_size(const transfer<1>& value);

/// Stops at the first field that does not fit; bytes for earlier fields
/// remain in buffer.
result_t<std::size_t> encode_to(const transfer<1>& value,
                                const mutable_bytes_view_t& buffer,
                                endianness order);

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  endianness order,
                                  transfer<1>& out);

}  // namespace reina::schema::encoding::wire
