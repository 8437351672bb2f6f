#pragma once
#include <reina/schema/primitives.hpp>
#include <reina/schema/transfer.hpp>
#include <cstdint>
#include <vector>

namespace reina::schema {

template <uint16_t Version>
struct block;

template <>
struct block<1> final {
  uint8_t version{1};
  uint64_t number{};
  bytes_t previous_hash;
  // Order is significant and preserved by the codec.
  std::vector<transfer_t> transactions;

  bool operator==(const block&) const = default;
};

using block_t = block<1>;

}  // namespace reina::schema
