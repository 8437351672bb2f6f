#pragma once
#include <reina/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace reina::schema {

template <uint16_t Version>
struct transfer;

template <>
struct transfer<1> final {
  uint64_t id{};
  uint64_t amount{};
  double fee{};
  uint8_t version{1};
  std::string sender;
  std::string recipient;
  bytes_t signature;

  bool operator==(const transfer&) const = default;
};

using transfer_t = transfer<1>;

}  // namespace reina::schema
