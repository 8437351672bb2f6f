#include <reina/schema/encoding/wire/field.hpp>
#include <reina/schema/encoding/wire/transfer.hpp>

namespace reina::schema::encoding::wire {

std::size_t encoded_size(const transfer<1>& value) {
  return encoded_size(value.id) + encoded_size(value.amount) +
         encoded_size(value.fee) + 1 + encoded_size(value.sender) +
         encoded_size(value.recipient) + encoded_size(value.signature);
}

result_t<std::size_t> encode_to(const transfer<1>& value,
                                const mutable_bytes_view_t& buffer,
                                const endianness order) {
  auto offset = std::size_t{0};
  if (auto r = write_field(value.id, buffer, order, offset); r.has_error()) {
    return r.error();
  }
  if (auto r = write_field(value.amount, buffer, order, offset);
      r.has_error()) {
    return r.error();
  }
  if (auto r = write_field(value.fee, buffer, order, offset); r.has_error()) {
    return r.error();
  }
  auto version = encode_byte(value.version, buffer.subspan(offset));
  if (version.has_error()) {
    return version.error();
  }
  offset += version.value();
  if (auto r = write_field(value.sender, buffer, order, offset);
      r.has_error()) {
    return r.error();
  }
  if (auto r = write_field(value.recipient, buffer, order, offset);
      r.has_error()) {
    return r.error();
  }
  if (auto r = write_field(value.signature, buffer, order, offset);
      r.has_error()) {
    return r.error();
  }
  return offset;
}

result_t<std::size_t> decode_from(const bytes_view_t& buffer,
                                  const endianness order,
                                  transfer<1>& out) {
  auto value = transfer<1>{};
  auto offset = std::size_t{0};
  if (auto r = read_field(buffer, order, offset, value.id); r.has_error()) {
    return r.error();
  }
  if (auto r = read_field(buffer, order, offset, value.amount);
      r.has_error()) {
    return r.error();
  }
  if (auto r = read_field(buffer, order, offset, value.fee); r.has_error()) {
    return r.error();
  }
  auto version = decode_byte(buffer.subspan(offset), value.version);
  if (version.has_error()) {
    return version.error();
  }
  offset += version.value();
  if (auto r = read_field(buffer, order, offset, value.sender);
      r.has_error()) {
    return r.error();
  }
  if (auto r = read_field(buffer, order, offset, value.recipient);
      r.has_error()) {
    return r.error();
  }
  if (auto r = read_field(buffer, order, offset, value.signature);
      r.has_error()) {
    return r.error();
  }
  out = std::move(value);
  return offset;
}

}  // namespace reina::schema::encoding::wire
