#pragma once
#include <reina/schema/primitives.hpp>
#include <string_view>

namespace reina::blake3 {

/// Unkeyed BLAKE3 digest of the input.
reina::schema::hash32_t hash(const std::string_view& str);
reina::schema::hash32_t hash(const reina::schema::bytes_view_t& bytes);

}  // namespace reina::blake3
