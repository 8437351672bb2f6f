#pragma once

#include <reina/schema/block.hpp>
#include <reina/schema/encoding/wire/error.hpp>
#include <reina/schema/primitives.hpp>
#include <reina/schema/transfer.hpp>

#include <cstdint>
#include <string>

namespace reina::testing {

/// {42, 1000, 0.01, 1, "Alice", "Bob", [1, 2, 3, 4]}
inline reina::schema::transfer_t make_reference_transfer() {
  return reina::schema::transfer_t{.id = 42,
                                   .amount = 1000,
                                   .fee = 0.01,
                                   .version = 1,
                                   .sender = "Alice",
                                   .recipient = "Bob",
                                   .signature = {1, 2, 3, 4}};
}

inline reina::schema::transfer_t make_transfer(const uint64_t seed) {
  auto signature = reina::schema::bytes_t(64);
  for (std::size_t i = 0; i < signature.size(); ++i) {
    signature[i] = static_cast<uint8_t>(seed + i);
  }
  return reina::schema::transfer_t{
      .id = seed,
      .amount = seed * 1000 + 7,
      .fee = static_cast<double>(seed) / 8.0,
      .version = 1,
      .sender = "sender-" + std::to_string(seed),
      .recipient = "recipient-" + std::to_string(seed),
      .signature = signature};
}

inline reina::schema::block_t make_block(const uint64_t number,
                                         const std::size_t transactions) {
  auto block = reina::schema::block_t{
      .version = 1,
      .number = number,
      .previous_hash = reina::schema::bytes_t(32, 0xAB),
      .transactions = {}};
  for (std::size_t i = 0; i < transactions; ++i) {
    block.transactions.push_back(make_transfer(number * 100 + i));
  }
  return block;
}

/// True when result holds an error of the given kind.
template <typename Kind, typename Result>
bool fails_with(const Result& result) {
  return result.has_error() &&
         reina::schema::encoding::wire::holds<Kind>(result.error());
}

template <typename Result>
std::string error_text(const Result& result) {
  if (!result.has_error()) {
    return "no error";
  }
  return reina::schema::encoding::wire::to_string(result.error());
}

}  // namespace reina::testing
