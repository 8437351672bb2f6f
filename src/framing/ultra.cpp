#include <reina/framing/ultra.hpp>

namespace reina::framing {

namespace wire = reina::schema::encoding::wire;

using reina::schema::bytes_view_t;
using reina::schema::mutable_bytes_view_t;
using wire::codec_error_t;
using wire::endianness;
using wire::result_t;

namespace {

void write_padded(const bytes_view_t& value,
                  const mutable_bytes_view_t& field) {
  const auto count = std::min(value.size(), field.size());
  std::copy_n(std::begin(value), count, std::begin(field));
  std::fill(std::begin(field) + static_cast<std::ptrdiff_t>(count),
            std::end(field), uint8_t{0});
}

result_t<std::string> read_padded_text(const bytes_view_t& field,
                                       const std::string_view name) {
  auto length = field.size();
  while (length > 0 && field[length - 1] == 0) {
    --length;
  }
  const auto text = field.first(length);
  if (!reina::schema::is_valid_utf8(text)) {
    return codec_error_t{
        wire::invalid_data{std::string{name} + " is not valid UTF-8"}};
  }
  return reina::schema::make_string(text);
}

}  // namespace

result_t<ultra_frame_t> serialize_ultra_fixed(
    const reina::schema::transfer_t& tx,
    const endianness order) {
  auto frame = ultra_frame_t{};
  auto written = serialize_ultra_fixed(tx, frame, order);
  if (written.has_error()) {
    return written.error();
  }
  return frame;
}

result_t<std::size_t> serialize_ultra_fixed(
    const reina::schema::transfer_t& tx,
    const mutable_bytes_view_t& buffer,
    const endianness order) {
  if (buffer.size() < kUltraTransferSize) {
    return codec_error_t{
        wire::buffer_too_small{kUltraTransferSize, buffer.size()}};
  }
  auto offset = std::size_t{0};
  if (auto r = wire::encode_fixed_u64(tx.id, buffer.subspan(offset), order);
      r.has_error()) {
    return r.error();
  }
  offset += kUltraIdSize;
  if (auto r =
          wire::encode_fixed_u64(tx.amount, buffer.subspan(offset), order);
      r.has_error()) {
    return r.error();
  }
  offset += kUltraAmountSize;
  if (auto r = wire::encode_fixed_f64(tx.fee, buffer.subspan(offset), order);
      r.has_error()) {
    return r.error();
  }
  offset += kUltraFeeSize;
  buffer[offset] = tx.version;
  offset += kUltraVersionSize;
  write_padded(reina::schema::make_bytes_view(tx.sender),
               buffer.subspan(offset, kUltraSenderSize));
  offset += kUltraSenderSize;
  write_padded(reina::schema::make_bytes_view(tx.recipient),
               buffer.subspan(offset, kUltraRecipientSize));
  offset += kUltraRecipientSize;
  write_padded(reina::schema::make_bytes_view(tx.signature),
               buffer.subspan(offset, kUltraSignatureSize));
  offset += kUltraSignatureSize;
  return offset;
}

result_t<reina::schema::transfer_t> deserialize_ultra_fixed(
    const ultra_frame_t& frame,
    const endianness order) {
  const auto buffer = bytes_view_t{frame};
  auto tx = reina::schema::transfer_t{};
  auto offset = std::size_t{0};

  auto id = wire::decode_fixed_u64(buffer.subspan(offset), order);
  if (id.has_error()) {
    return id.error();
  }
  tx.id = id.value().value;
  offset += kUltraIdSize;

  auto amount = wire::decode_fixed_u64(buffer.subspan(offset), order);
  if (amount.has_error()) {
    return amount.error();
  }
  tx.amount = amount.value().value;
  offset += kUltraAmountSize;

  auto fee = wire::decode_fixed_f64(buffer.subspan(offset), order);
  if (fee.has_error()) {
    return fee.error();
  }
  tx.fee = fee.value().value;
  offset += kUltraFeeSize;

  tx.version = buffer[offset];
  offset += kUltraVersionSize;

  auto sender =
      read_padded_text(buffer.subspan(offset, kUltraSenderSize), "sender");
  if (sender.has_error()) {
    return sender.error();
  }
  tx.sender = std::move(sender).value();
  offset += kUltraSenderSize;

  auto recipient = read_padded_text(
      buffer.subspan(offset, kUltraRecipientSize), "recipient");
  if (recipient.has_error()) {
    return recipient.error();
  }
  tx.recipient = std::move(recipient).value();
  offset += kUltraRecipientSize;

  tx.signature = reina::schema::make_bytes(
      buffer.subspan(offset, kUltraSignatureSize));
  return tx;
}

result_t<reina::schema::transfer_t> deserialize_ultra_fixed(
    const bytes_view_t& buffer,
    const endianness order) {
  if (buffer.size() != kUltraTransferSize) {
    return codec_error_t{wire::invalid_data{
        "ultra frame must be " + std::to_string(kUltraTransferSize) +
        " bytes, got " + std::to_string(buffer.size())}};
  }
  auto frame = ultra_frame_t{};
  std::copy(std::begin(buffer), std::end(buffer), std::begin(frame));
  return deserialize_ultra_fixed(frame, order);
}

}  // namespace reina::framing
