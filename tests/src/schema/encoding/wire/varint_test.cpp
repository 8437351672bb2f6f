#include <gtest/gtest.h>
#include <reina/schema/encoding/wire/varint.hpp>
#include <reina/testing/common.hpp>

#include <array>
#include <cstdint>
#include <limits>
#include <vector>

namespace wire = reina::schema::encoding::wire;

namespace {

reina::schema::bytes_t encode(const uint64_t value) {
  auto buffer = reina::schema::bytes_t(wire::kMaxVarintSize);
  auto written = wire::encode_varint(value, buffer);
  EXPECT_TRUE(written.has_value()) << reina::testing::error_text(written);
  buffer.resize(written.value());
  return buffer;
}

}  // namespace

TEST(varint, size_grows_every_seven_bits) {
  EXPECT_EQ(wire::varint_size(0), 1u);
  EXPECT_EQ(wire::varint_size(127), 1u);
  EXPECT_EQ(wire::varint_size(128), 2u);
  EXPECT_EQ(wire::varint_size((uint64_t{1} << 21u) - 1), 3u);
  EXPECT_EQ(wire::varint_size(uint64_t{1} << 21u), 4u);
  EXPECT_EQ(wire::varint_size(std::numeric_limits<uint64_t>::max()), 10u);
}

TEST(varint, boundary_values_round_trip_with_predicted_size) {
  const auto values = std::vector<uint64_t>{
      0,
      1,
      127,
      128,
      300,
      (uint64_t{1} << 21u) - 1,
      uint64_t{1} << 21u,
      std::numeric_limits<uint32_t>::max(),
      uint64_t{1} << 63u,
      std::numeric_limits<uint64_t>::max()};
  for (const auto value : values) {
    auto bytes = encode(value);
    EXPECT_EQ(bytes.size(), wire::varint_size(value)) << value;
    auto decoded = wire::decode_varint(bytes);
    ASSERT_TRUE(decoded.has_value()) << reina::testing::error_text(decoded);
    EXPECT_EQ(decoded.value().value, value);
    EXPECT_EQ(decoded.value().consumed, bytes.size());
  }
}

TEST(varint, encodes_low_group_first_with_continuation_bits) {
  EXPECT_EQ(encode(300), (reina::schema::bytes_t{0xAC, 0x02}));
  EXPECT_EQ(encode(1000), (reina::schema::bytes_t{0xE8, 0x07}));
  auto max = encode(std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(max.back(), 0x01);
}

TEST(varint, decode_reports_consumed_and_ignores_trailing_bytes) {
  auto bytes = reina::schema::bytes_t{0xAC, 0x02, 0xFF, 0xFF};
  auto decoded = wire::decode_varint(bytes);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded.value().value, 300u);
  EXPECT_EQ(decoded.value().consumed, 2u);
}

TEST(varint, encode_into_short_buffer_writes_nothing) {
  auto buffer = std::array<uint8_t, 2>{0x11, 0x22};
  auto written = wire::encode_varint(uint64_t{1} << 21u, buffer);
  ASSERT_TRUE(reina::testing::fails_with<wire::buffer_too_small>(written));
  const auto& error = std::get<wire::buffer_too_small>(written.error());
  EXPECT_EQ(error.required, 4u);
  EXPECT_EQ(error.available, 2u);
  EXPECT_EQ(buffer[0], 0x11);
  EXPECT_EQ(buffer[1], 0x22);
}

TEST(varint, empty_and_unterminated_input_is_invalid_data) {
  EXPECT_TRUE(reina::testing::fails_with<wire::invalid_data>(
      wire::decode_varint(reina::schema::bytes_view_t{})));
  auto unterminated = reina::schema::bytes_t{0x80, 0x80, 0x80};
  EXPECT_TRUE(reina::testing::fails_with<wire::invalid_data>(
      wire::decode_varint(unterminated)));
}

TEST(varint, eleven_byte_continuation_run_is_rejected) {
  auto bytes = reina::schema::bytes_t(10, 0x80);
  bytes.push_back(0x00);
  EXPECT_TRUE(reina::testing::fails_with<wire::invalid_data>(
      wire::decode_varint(bytes)));
}

TEST(varint, all_ones_buffer_is_rejected) {
  auto bytes = reina::schema::bytes_t(32, 0xFF);
  EXPECT_TRUE(reina::testing::fails_with<wire::invalid_data>(
      wire::decode_varint(bytes)));
}

TEST(varint, tenth_byte_may_only_carry_bit_63) {
  auto bytes = reina::schema::bytes_t(9, 0xFF);
  bytes.push_back(0x01);
  auto max = wire::decode_varint(bytes);
  ASSERT_TRUE(max.has_value());
  EXPECT_EQ(max.value().value, std::numeric_limits<uint64_t>::max());

  bytes.back() = 0x02;
  EXPECT_TRUE(reina::testing::fails_with<wire::invalid_data>(
      wire::decode_varint(bytes)));
}

TEST(varint, u32_decode_rejects_values_above_u32_max) {
  auto fits = encode(std::numeric_limits<uint32_t>::max());
  auto decoded = wire::decode_varint_u32(fits);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded.value().value, std::numeric_limits<uint32_t>::max());

  auto too_wide =
      encode(uint64_t{std::numeric_limits<uint32_t>::max()} + 1);
  EXPECT_TRUE(reina::testing::fails_with<wire::invalid_data>(
      wire::decode_varint_u32(too_wide)));
}

TEST(zigzag, maps_small_magnitudes_to_small_codes) {
  EXPECT_EQ(wire::zigzag_encode(int64_t{0}), 0u);
  EXPECT_EQ(wire::zigzag_encode(int64_t{-1}), 1u);
  EXPECT_EQ(wire::zigzag_encode(int64_t{1}), 2u);
  EXPECT_EQ(wire::zigzag_encode(int64_t{-2}), 3u);
  EXPECT_EQ(wire::zigzag_encode(std::numeric_limits<int64_t>::max()),
            std::numeric_limits<uint64_t>::max() - 1);
  EXPECT_EQ(wire::zigzag_encode(std::numeric_limits<int64_t>::min()),
            std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(wire::zigzag_encode(std::numeric_limits<int32_t>::min()),
            std::numeric_limits<uint32_t>::max());
}

TEST(zigzag, boundary_values_round_trip) {
  for (const auto value : {std::numeric_limits<int64_t>::min(), int64_t{-1},
                           int64_t{0}, int64_t{1},
                           std::numeric_limits<int64_t>::max()}) {
    EXPECT_EQ(wire::zigzag_decode(wire::zigzag_encode(value)), value);
  }
  for (const auto value : {std::numeric_limits<int32_t>::min(), int32_t{-1},
                           int32_t{0}, int32_t{1},
                           std::numeric_limits<int32_t>::max()}) {
    EXPECT_EQ(wire::zigzag_decode(wire::zigzag_encode(value)), value);
  }
}
