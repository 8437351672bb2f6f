#include <reina/schema/encoding/wire/fixed.hpp>

#include <boost/endian/conversion.hpp>
#include <bit>

namespace reina::schema::encoding::wire {

namespace {

codec_error_t unsupported_order(const endianness order) {
  return io_error{"unsupported byte order " +
                  std::to_string(static_cast<int>(order))};
}

codec_error_t short_read(const std::string_view field,
                         const std::size_t available) {
  return invalid_data{"buffer too small for fixed " + std::string{field} +
                      " (" + std::to_string(available) + " byte(s))"};
}

}  // namespace

result_t<std::size_t> encode_fixed_u32(const uint32_t value,
                                       const mutable_bytes_view_t& buffer,
                                       const endianness order) {
  if (buffer.size() < kFixedU32Size) {
    return codec_error_t{buffer_too_small{kFixedU32Size, buffer.size()}};
  }
  switch (order) {
    case endianness::little:
      boost::endian::store_little_u32(buffer.data(), value);
      return kFixedU32Size;
    case endianness::big:
      boost::endian::store_big_u32(buffer.data(), value);
      return kFixedU32Size;
  }
  return unsupported_order(order);
}

result_t<std::size_t> encode_fixed_u64(const uint64_t value,
                                       const mutable_bytes_view_t& buffer,
                                       const endianness order) {
  if (buffer.size() < kFixedU64Size) {
    return codec_error_t{buffer_too_small{kFixedU64Size, buffer.size()}};
  }
  switch (order) {
    case endianness::little:
      boost::endian::store_little_u64(buffer.data(), value);
      return kFixedU64Size;
    case endianness::big:
      boost::endian::store_big_u64(buffer.data(), value);
      return kFixedU64Size;
  }
  return unsupported_order(order);
}

result_t<std::size_t> encode_fixed_f64(const double value,
                                       const mutable_bytes_view_t& buffer,
                                       const endianness order) {
  return encode_fixed_u64(std::bit_cast<uint64_t>(value), buffer, order);
}

result_t<decoded<uint32_t>> decode_fixed_u32(const bytes_view_t& buffer,
                                             const endianness order) {
  if (buffer.size() < kFixedU32Size) {
    return short_read("u32", buffer.size());
  }
  switch (order) {
    case endianness::little:
      return decoded<uint32_t>{boost::endian::load_little_u32(buffer.data()),
                               kFixedU32Size};
    case endianness::big:
      return decoded<uint32_t>{boost::endian::load_big_u32(buffer.data()),
                               kFixedU32Size};
  }
  return unsupported_order(order);
}

result_t<decoded<uint64_t>> decode_fixed_u64(const bytes_view_t& buffer,
                                             const endianness order) {
  if (buffer.size() < kFixedU64Size) {
    return short_read("u64", buffer.size());
  }
  switch (order) {
    case endianness::little:
      return decoded<uint64_t>{boost::endian::load_little_u64(buffer.data()),
                               kFixedU64Size};
    case endianness::big:
      return decoded<uint64_t>{boost::endian::load_big_u64(buffer.data()),
                               kFixedU64Size};
  }
  return unsupported_order(order);
}

result_t<decoded<double>> decode_fixed_f64(const bytes_view_t& buffer,
                                           const endianness order) {
  if (buffer.size() < kFixedF64Size) {
    return short_read("f64", buffer.size());
  }
  auto bits = decode_fixed_u64(buffer, order);
  if (bits.has_error()) {
    return bits.error();
  }
  return decoded<double>{std::bit_cast<double>(bits.value().value),
                         bits.value().consumed};
}

}  // namespace reina::schema::encoding::wire
