#pragma once
#include <reina/framing/envelope.hpp>
#include <reina/schema/transfer.hpp>
#include <array>

namespace reina::framing {

inline constexpr std::size_t kUltraIdSize = 8;
inline constexpr std::size_t kUltraAmountSize = 8;
inline constexpr std::size_t kUltraFeeSize = 8;
inline constexpr std::size_t kUltraVersionSize = 1;
inline constexpr std::size_t kUltraSenderSize = 16;
inline constexpr std::size_t kUltraRecipientSize = 16;
inline constexpr std::size_t kUltraSignatureSize = 64;
inline constexpr std::size_t kUltraTransferSize =
    kUltraIdSize + kUltraAmountSize + kUltraFeeSize + kUltraVersionSize +
    kUltraSenderSize + kUltraRecipientSize + kUltraSignatureSize;

static_assert(kUltraTransferSize == 121);

using ultra_frame_t = std::array<uint8_t, kUltraTransferSize>;

/// Constant-size transfer frame with no length prefix and no checksum.
/// Sender, recipient and signature longer than their field are truncated
/// byte-wise; shorter values are zero padded.
schema::encoding::wire::result_t<ultra_frame_t> serialize_ultra_fixed(
    const reina::schema::transfer_t& tx,
    schema::encoding::wire::endianness order);

/// Writes the frame into the first 121 bytes of a caller-owned buffer.
schema::encoding::wire::result_t<std::size_t> serialize_ultra_fixed(
    const reina::schema::transfer_t& tx,
    const schema::mutable_bytes_view_t& buffer,
    schema::encoding::wire::endianness order);

/// Trailing zero bytes are stripped from sender and recipient before UTF-8
/// validation. The signature comes back as all 64 bytes, padding included.
schema::encoding::wire::result_t<reina::schema::transfer_t> deserialize_ultra_fixed(
    const ultra_frame_t& frame,
    schema::encoding::wire::endianness order);

/// As above for an arbitrary view; any size other than 121 is invalid_data.
schema::encoding::wire::result_t<reina::schema::transfer_t> deserialize_ultra_fixed(
    const schema::bytes_view_t& buffer,
    schema::encoding::wire::endianness order);

}  // namespace reina::framing
