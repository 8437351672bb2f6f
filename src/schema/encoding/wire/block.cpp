#include <reina/schema/encoding/wire/block.hpp>
#include <reina/schema/encoding/wire/field.hpp>
#include <reina/schema/encoding/wire/transfer.hpp>
#include <reina/schema/encoding/wire/varint.hpp>

namespace reina::schema::encoding::wire {

std::size_t encoded_size(const block<1>& value) {
  auto size = 1 + encoded_size(value.number) +
              encoded_size(value.previous_hash) +
              varint_size(value.transactions.size());
  for (const auto& tx : value.transactions) {
    size += encoded_size(tx);
  }
  return size;
}

result_t<std::size_t> encode_to(const block<1>& value,
                                const mutable_bytes_view_t& buffer,
                                const endianness order) {
  auto offset = std::size_t{0};
  auto version = encode_byte(value.version, buffer);
  if (version.has_error()) {
    return version.error();
  }
  offset += version.value();
  if (auto r = write_field(value.number, buffer, order, offset);
      r.has_error()) {
    return r.error();
  }
  if (auto r = write_field(value.previous_hash, buffer, order, offset);
      r.has_error()) {
    return r.error();
  }
  auto count = encode_varint(value.transactions.size(), buffer.subspan(offset));
  if (count.has_error()) {
    return count.error();
  }
  offset += count.value();
  for (const auto& tx : value.transactions) {
    auto written = encode_to(tx, buffer.subspan(offset), order);
    if (written.has_error()) {
      return written.error();
    }
    offset += written.value();
  }
  return offset;
}

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  const endianness order,
                                  block<1>& out) {
  if (buffer.empty()) {
    return codec_error_t{invalid_data{"empty buffer for block"}};
  }
  auto value = block<1>{};
  auto offset = std::size_t{0};
  auto version = decode_byte(buffer, value.version);
  if (version.has_error()) {
    return version.error();
  }
  offset += version.value();
  if (auto r = read_field(buffer, order, offset, value.number);
      r.has_error()) {
    return r.error();
  }
  if (auto r = read_field(buffer, order, offset, value.previous_hash);
      r.has_error()) {
    return r.error();
  }
  auto count = decode_varint(buffer.subspan(offset));
  if (count.has_error()) {
    return count.error();
  }
  offset += count.value().consumed;
  const auto remaining = buffer.size() - offset;
  if (count.value().value > remaining / kMinTransferSize) {
    return codec_error_t{invalid_data{
        "declared transaction count " + std::to_string(count.value().value) +
        " exceeds remaining " + std::to_string(remaining) + " bytes"}};
  }
  const auto tx_count = static_cast<std::size_t>(count.value().value);
  value.transactions.reserve(tx_count);
  for (auto i = std::size_t{0}; i < tx_count; ++i) {
    auto tx = transfer<1>{};
    auto consumed = decode_from(buffer.subspan(offset), order, tx);
    if (consumed.has_error()) {
      return consumed.error();
    }
    offset += consumed.value();
    value.transactions.push_back(std::move(tx));
  }
  out = std::move(value);
  return offset;
}

}  // namespace reina::schema::encoding::wire
