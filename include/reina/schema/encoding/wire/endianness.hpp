#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace reina::schema::encoding::wire {

/// Byte order of every fixed-width field written or read during one call.
/// Varints are byte-order independent.
enum class endianness : uint8_t {
  little = 0,
  big = 1,
};

std::optional<endianness> try_parse_endianness(std::string_view value);
std::string_view to_string(endianness order);

}  // namespace reina::schema::encoding::wire
