#include <reina/framing/envelope.hpp>

namespace reina::framing {

namespace wire = reina::schema::encoding::wire;

using reina::schema::bytes_view_t;
using reina::schema::hash32_t;
using reina::schema::mutable_bytes_view_t;
using wire::codec_error_t;
using wire::endianness;
using wire::result_t;

result_t<std::size_t> envelope_size(const std::size_t payload_size) {
  constexpr auto overhead = kLengthPrefixSize + kChecksumSize;
  if (payload_size > std::numeric_limits<std::size_t>::max() - overhead) {
    return codec_error_t{wire::overflow{"envelope size overflows size_t"}};
  }
  if (payload_size >
      std::numeric_limits<uint32_t>::max() - kChecksumSize) {
    return codec_error_t{
        wire::overflow{"payload of " + std::to_string(payload_size) +
                       " bytes does not fit a u32 length prefix"}};
  }
  return payload_size + overhead;
}

result_t<void> seal_envelope(const mutable_bytes_view_t& buffer,
                             const std::size_t payload_size,
                             const endianness order) {
  auto total = envelope_size(payload_size);
  if (total.has_error()) {
    return total.error();
  }
  if (buffer.size() != total.value()) {
    return codec_error_t{wire::invalid_data{"envelope buffer size mismatch"}};
  }
  const auto payload = bytes_view_t{buffer}.subspan(kLengthPrefixSize,
                                                    payload_size);
  const auto digest = reina::blake3::hash(payload);
  std::copy(std::begin(digest), std::end(digest),
            std::begin(buffer) +
                static_cast<std::ptrdiff_t>(kLengthPrefixSize + payload_size));
  auto prefix = wire::encode_fixed_u32(
      static_cast<uint32_t>(payload_size + kChecksumSize), buffer, order);
  if (prefix.has_error()) {
    return prefix.error();
  }
  return wire::outcome::success();
}

result_t<bytes_view_t> open_envelope(const bytes_view_t& buffer,
                                     const endianness order) {
  if (buffer.size() < kLengthPrefixSize) {
    spdlog::debug("envelope rejected: {} byte(s) cannot hold a length prefix",
                  buffer.size());
    return codec_error_t{
        wire::invalid_data{"buffer too small for length prefix"}};
  }
  auto prefix = wire::decode_fixed_u32(buffer, order);
  if (prefix.has_error()) {
    return prefix.error();
  }
  const auto length = static_cast<std::size_t>(prefix.value().value);
  if (buffer.size() - kLengthPrefixSize != length) {
    spdlog::debug("envelope rejected: length prefix {} but {} byte(s) follow",
                  length, buffer.size() - kLengthPrefixSize);
    return codec_error_t{
        wire::invalid_data{"length prefix does not match buffer size"}};
  }
  if (length < kChecksumSize) {
    spdlog::debug("envelope rejected: length prefix {} below checksum size",
                  length);
    return codec_error_t{wire::invalid_data{
        "payload length too small to contain checksum"}};
  }
  const auto payload =
      buffer.subspan(kLengthPrefixSize, length - kChecksumSize);
  const auto trailer = buffer.subspan(kLengthPrefixSize + payload.size());
  auto stored = hash32_t{};
  std::copy(std::begin(trailer), std::end(trailer), std::begin(stored));
  const auto computed = reina::blake3::hash(payload);
  if (stored != computed) {
    spdlog::debug("checksum mismatch over {} payload byte(s)", payload.size());
    return codec_error_t{wire::checksum_mismatch{stored, computed}};
  }
  return payload;
}

}  // namespace reina::framing
