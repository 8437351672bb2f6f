#pragma once
#include <reina/schema/encoding/wire/endianness.hpp>
#include <reina/schema/encoding/wire/error.hpp>
#include <reina/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>

namespace reina::schema::encoding::wire {

inline constexpr std::size_t kFixedU32Size = 4;
inline constexpr std::size_t kFixedU64Size = 8;
inline constexpr std::size_t kFixedF64Size = 8;

/// Fixed-width writers. A destination shorter than the field is
/// buffer_too_small; only the leading field bytes of the destination are
/// touched.
result_t<std::size_t> encode_fixed_u32(uint32_t value,
                                       const mutable_bytes_view_t& buffer,
                                       endianness order);
result_t<std::size_t> encode_fixed_u64(uint64_t value,
                                       const mutable_bytes_view_t& buffer,
                                       endianness order);
result_t<std::size_t> encode_fixed_f64(double value,
                                       const mutable_bytes_view_t& buffer,
                                       endianness order);

/// Fixed-width readers. A source shorter than the field is invalid_data.
result_t<decoded<uint32_t>> decode_fixed_u32(const bytes_view_t& buffer,
                                             endianness order);
result_t<decoded<uint64_t>> decode_fixed_u64(const bytes_view_t& buffer,
                                             endianness order);
result_t<decoded<double>> decode_fixed_f64(const bytes_view_t& buffer,
                                           endianness order);

}  // namespace reina::schema::encoding::wire
