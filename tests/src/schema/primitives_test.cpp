#include <gtest/gtest.h>
#include <reina/schema/primitives.hpp>

#include <string>

namespace {

bool valid(const reina::schema::bytes_t& bytes) {
  return reina::schema::is_valid_utf8(reina::schema::make_bytes_view(bytes));
}

}  // namespace

TEST(primitives, hex_round_trips_bytes) {
  auto bytes = reina::schema::bytes_t{0x00, 0x01, 0x7F, 0x80, 0xAB, 0xFF};
  auto hex = reina::schema::to_hex(reina::schema::make_bytes_view(bytes));
  EXPECT_EQ(hex, "00017f80abff");
  auto decoded = reina::schema::try_from_hex(hex);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes);
}

TEST(primitives, try_from_hex_accepts_prefix_and_upper_case) {
  auto decoded = reina::schema::try_from_hex("0xDEADbeef");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, (reina::schema::bytes_t{0xDE, 0xAD, 0xBE, 0xEF}));
}

TEST(primitives, try_from_hex_rejects_odd_length_and_bad_digits) {
  EXPECT_FALSE(reina::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(reina::schema::try_from_hex("zz").has_value());
  auto empty = reina::schema::try_from_hex("");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(primitives, string_and_bytes_views_alias_the_same_bytes) {
  auto text = std::string{"Alice"};
  auto view = reina::schema::make_bytes_view(text);
  EXPECT_EQ(view.size(), 5u);
  EXPECT_EQ(view[0], 'A');
  EXPECT_EQ(reina::schema::make_string(view), text);
  EXPECT_EQ(reina::schema::make_string_view(view), "Alice");
}

TEST(primitives, utf8_accepts_well_formed_sequences) {
  EXPECT_TRUE(valid({}));
  EXPECT_TRUE(valid({'B', 'o', 'b'}));
  // U+00E9, U+20AC, U+1F600
  EXPECT_TRUE(valid({0xC3, 0xA9}));
  EXPECT_TRUE(valid({0xE2, 0x82, 0xAC}));
  EXPECT_TRUE(valid({0xF0, 0x9F, 0x98, 0x80}));
  // U+10FFFF is the last code point.
  EXPECT_TRUE(valid({0xF4, 0x8F, 0xBF, 0xBF}));
}

TEST(primitives, utf8_rejects_malformed_sequences) {
  // Lone continuation byte.
  EXPECT_FALSE(valid({0x80}));
  // Truncated two byte sequence.
  EXPECT_FALSE(valid({'a', 0xC3}));
  // Overlong encodings of '/' and U+0000.
  EXPECT_FALSE(valid({0xC0, 0xAF}));
  EXPECT_FALSE(valid({0xE0, 0x80, 0x80}));
  // Surrogate U+D800.
  EXPECT_FALSE(valid({0xED, 0xA0, 0x80}));
  // Above U+10FFFF.
  EXPECT_FALSE(valid({0xF4, 0x90, 0x80, 0x80}));
  // Invalid lead bytes.
  EXPECT_FALSE(valid({0xF8, 0x88, 0x80, 0x80, 0x80}));
  EXPECT_FALSE(valid({0xFF}));
}
