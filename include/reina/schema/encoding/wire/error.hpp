#pragma once
#include <reina/schema/primitives.hpp>
#include <boost/outcome/result.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace reina::schema::encoding::wire {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

// Error kinds have no converting constructors: a codec_error_t is only ever
// built from one of these kinds, never from a bare size or string.

/// Destination lacks capacity for the next field. Nothing was written past
/// the end of the destination.
struct buffer_too_small final {
  buffer_too_small() = default;
  buffer_too_small(const std::size_t required, const std::size_t available)
      : required{required}, available{available} {}

  std::size_t required{};
  std::size_t available{};
};

/// Stored content hash differs from the hash recomputed over the payload.
struct checksum_mismatch final {
  checksum_mismatch() = default;
  checksum_mismatch(const reina::schema::hash32_t& stored,
                    const reina::schema::hash32_t& computed)
      : stored{stored}, computed{computed} {}

  reina::schema::hash32_t stored{};
  reina::schema::hash32_t computed{};
};

/// Structural violation: malformed varint, invalid UTF-8, length/size
/// disagreement, trailing bytes.
struct invalid_data final {
  invalid_data() = default;
  explicit invalid_data(std::string reason) : reason{std::move(reason)} {}

  std::string reason;
};

/// Size or length arithmetic would wrap.
struct overflow final {
  overflow() = default;
  explicit overflow(std::string reason) : reason{std::move(reason)} {}

  std::string reason;
};

/// Lower level fixed-width field access failed.
struct io_error final {
  io_error() = default;
  explicit io_error(std::string reason) : reason{std::move(reason)} {}

  std::string reason;
};

using codec_error_t = std::variant<buffer_too_small,
                                   checksum_mismatch,
                                   invalid_data,
                                   overflow,
                                   io_error>;

template <typename T>
using result_t = outcome::checked<T, codec_error_t>;

template <typename T>
struct decoded final {
  T value;
  std::size_t consumed{};
};

std::string_view kind_name(const codec_error_t& error);
std::string to_string(const codec_error_t& error);

template <typename Kind>
bool holds(const codec_error_t& error) {
  return std::holds_alternative<Kind>(error);
}

}  // namespace reina::schema::encoding::wire
