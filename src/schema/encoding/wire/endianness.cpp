#include <reina/schema/encoding/wire/endianness.hpp>

namespace reina::schema::encoding::wire {

std::optional<endianness> try_parse_endianness(const std::string_view value) {
  if (value == "little" || value == "le") {
    return endianness::little;
  }
  if (value == "big" || value == "be") {
    return endianness::big;
  }
  return std::nullopt;
}

std::string_view to_string(const endianness order) {
  switch (order) {
    case endianness::little:
      return "little";
    case endianness::big:
      return "big";
  }
  return "unknown";
}

}  // namespace reina::schema::encoding::wire
