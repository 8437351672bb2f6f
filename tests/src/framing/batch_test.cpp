#include <gtest/gtest.h>
#include <reina/framing/batch.hpp>
#include <reina/testing/common.hpp>

#include <cstdint>
#include <vector>

namespace wire = reina::schema::encoding::wire;

namespace {

std::vector<reina::schema::bytes_t> make_frames(const std::size_t count,
                                                const wire::endianness order) {
  auto frames = std::vector<reina::schema::bytes_t>{};
  frames.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto frame = reina::framing::serialize(reina::testing::make_transfer(i),
                                           order);
    EXPECT_TRUE(frame.has_value());
    frames.push_back(frame.value());
  }
  return frames;
}

}  // namespace

TEST(batch, records_share_one_prefix_and_checksum) {
  constexpr auto kCount = std::size_t{10};
  auto items = std::vector<reina::schema::transfer_t>(
      kCount, reina::testing::make_reference_transfer());
  auto frame = reina::framing::serialize_batch(items, wire::endianness::little);
  ASSERT_TRUE(frame.has_value()) << reina::testing::error_text(frame);
  EXPECT_EQ(frame.value().size(), 4u + kCount * 27u + 32u);
  EXPECT_EQ(frame.value()[0], static_cast<uint8_t>(kCount * 27u + 32u));
}

TEST(batch, verified_payload_can_be_walked_record_by_record) {
  constexpr auto kCount = std::size_t{25};
  auto tx = reina::testing::make_reference_transfer();
  auto items = std::vector<reina::schema::transfer_t>(kCount, tx);
  auto frame = reina::framing::serialize_batch(items, wire::endianness::big);
  ASSERT_TRUE(frame.has_value());

  auto payload =
      reina::framing::open_envelope(frame.value(), wire::endianness::big);
  ASSERT_TRUE(payload.has_value()) << reina::testing::error_text(payload);
  auto decoded = std::vector<reina::schema::transfer_t>{};
  auto offset = std::size_t{0};
  while (offset < payload.value().size()) {
    auto item = wire::decode<reina::schema::transfer_t>(
        payload.value().subspan(offset), wire::endianness::big);
    ASSERT_TRUE(item.has_value()) << reina::testing::error_text(item);
    offset += item.value().consumed;
    decoded.push_back(item.value().value);
  }
  EXPECT_EQ(decoded, items);
}

TEST(batch, deserialize_batch_preserves_order) {
  auto items = std::vector<reina::schema::transfer_t>{};
  for (uint64_t i = 0; i < 40; ++i) {
    items.push_back(reina::testing::make_transfer(i));
  }
  auto frame = reina::framing::serialize_batch(items, wire::endianness::big);
  ASSERT_TRUE(frame.has_value());
  auto decoded = reina::framing::deserialize_batch<reina::schema::transfer_t>(
      frame.value(), wire::endianness::big);
  ASSERT_TRUE(decoded.has_value()) << reina::testing::error_text(decoded);
  EXPECT_EQ(decoded.value(), items);
}

TEST(batch, blocks_batch_like_transfers) {
  auto items = std::vector<reina::schema::block_t>{
      reina::testing::make_block(1, 0), reina::testing::make_block(2, 3)};
  auto frame =
      reina::framing::serialize_batch(items, wire::endianness::little);
  ASSERT_TRUE(frame.has_value());
  auto decoded = reina::framing::deserialize_batch<reina::schema::block_t>(
      frame.value(), wire::endianness::little);
  ASSERT_TRUE(decoded.has_value()) << reina::testing::error_text(decoded);
  EXPECT_EQ(decoded.value(), items);
}

TEST(batch, empty_batch_is_only_prefix_and_checksum) {
  auto frame = reina::framing::serialize_batch(
      std::vector<reina::schema::transfer_t>{}, wire::endianness::little);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame.value().size(), 36u);
  auto decoded = reina::framing::deserialize_batch<reina::schema::transfer_t>(
      frame.value(), wire::endianness::little);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded.value().empty());
}

TEST(batch, one_flipped_bit_invalidates_the_whole_batch) {
  auto items = std::vector<reina::schema::transfer_t>(
      8, reina::testing::make_reference_transfer());
  auto frame = reina::framing::serialize_batch(items, wire::endianness::little);
  ASSERT_TRUE(frame.has_value());
  auto tampered = frame.value();
  tampered[4 + 27 * 5 + 3] ^= 0x01;
  EXPECT_TRUE(reina::testing::fails_with<wire::checksum_mismatch>(
      reina::framing::deserialize_batch<reina::schema::transfer_t>(
          tampered, wire::endianness::little)));
}

TEST(batch, payload_ending_inside_a_record_fails) {
  auto encoded = wire::encode(reina::testing::make_reference_transfer(),
                              wire::endianness::little);
  ASSERT_TRUE(encoded.has_value());
  // One whole record followed by all but the last byte of a second one.
  auto payload = encoded.value();
  payload.insert(std::end(payload), std::begin(encoded.value()),
                 std::end(encoded.value()) - 1);
  auto size = reina::framing::envelope_size(payload.size());
  ASSERT_TRUE(size.has_value());
  auto frame = reina::schema::bytes_t(size.value());
  std::copy(std::begin(payload), std::end(payload), std::begin(frame) + 4);
  ASSERT_TRUE(reina::framing::seal_envelope(frame, payload.size(),
                                            wire::endianness::little)
                  .has_value());
  EXPECT_TRUE(reina::testing::fails_with<wire::invalid_data>(
      reina::framing::deserialize_batch<reina::schema::transfer_t>(
          frame, wire::endianness::little)));
}

TEST(parallel_deserialize, preserves_input_order_across_chunks) {
  constexpr auto kCount = std::size_t{1100};
  auto frames = make_frames(kCount, wire::endianness::little);
  auto decoded =
      reina::framing::parallel_deserialize<reina::schema::transfer_t>(
          frames, wire::endianness::little);
  ASSERT_TRUE(decoded.has_value()) << reina::testing::error_text(decoded);
  ASSERT_EQ(decoded.value().size(), kCount);
  for (std::size_t i = 0; i < kCount; ++i) {
    EXPECT_EQ(decoded.value()[i], reina::testing::make_transfer(i)) << i;
  }
}

TEST(parallel_deserialize, honours_custom_chunk_size_and_threads) {
  auto frames = make_frames(101, wire::endianness::big);
  for (const auto threads : {std::size_t{1}, std::size_t{3}, std::size_t{64}}) {
    auto decoded =
        reina::framing::parallel_deserialize<reina::schema::transfer_t>(
            frames, wire::endianness::big,
            reina::framing::parallel_options{.chunk_size = 7,
                                             .worker_threads = threads});
    ASSERT_TRUE(decoded.has_value()) << reina::testing::error_text(decoded);
    ASSERT_EQ(decoded.value().size(), 101u);
    EXPECT_EQ(decoded.value().front(), reina::testing::make_transfer(0));
    EXPECT_EQ(decoded.value().back(), reina::testing::make_transfer(100));
  }
}

TEST(parallel_deserialize, empty_input_yields_empty_output) {
  auto decoded =
      reina::framing::parallel_deserialize<reina::schema::transfer_t>(
          {}, wire::endianness::little);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded.value().empty());
}

TEST(parallel_deserialize, zero_chunk_size_is_invalid_data) {
  auto frames = make_frames(2, wire::endianness::little);
  EXPECT_TRUE(reina::testing::fails_with<wire::invalid_data>(
      reina::framing::parallel_deserialize<reina::schema::transfer_t>(
          frames, wire::endianness::little,
          reina::framing::parallel_options{.chunk_size = 0})));
}

TEST(parallel_deserialize, reports_error_of_lowest_failing_index) {
  auto frames = make_frames(1100, wire::endianness::little);
  // Index 600 (second chunk) has a corrupted payload; index 1050 (third
  // chunk) is truncated.
  frames[600][10] ^= 0x01;
  frames[1050].pop_back();
  auto decoded =
      reina::framing::parallel_deserialize<reina::schema::transfer_t>(
          frames, wire::endianness::little);
  EXPECT_TRUE(reina::testing::fails_with<wire::checksum_mismatch>(decoded))
      << reina::testing::error_text(decoded);

  // A failure in the first chunk wins over one in a later chunk.
  frames[3].pop_back();
  decoded = reina::framing::parallel_deserialize<reina::schema::transfer_t>(
      frames, wire::endianness::little);
  EXPECT_TRUE(reina::testing::fails_with<wire::invalid_data>(decoded))
      << reina::testing::error_text(decoded);
}

TEST(parallel_deserialize, worker_count_is_bounded_by_chunk_count) {
  auto threads = reina::framing::resolve_worker_threads(
      reina::framing::parallel_options{.chunk_size = 512, .worker_threads = 8},
      3);
  ASSERT_TRUE(threads.has_value());
  EXPECT_EQ(threads.value(), 3u);

  auto automatic = reina::framing::resolve_worker_threads(
      reina::framing::parallel_options{}, 1);
  ASSERT_TRUE(automatic.has_value());
  EXPECT_EQ(automatic.value(), 1u);
}

TEST(parallel_deserialize, chunk_larger_than_input_decodes_everything) {
  auto frames = make_frames(3, wire::endianness::little);
  for (const auto chunk_size : {std::size_t{4}, SIZE_MAX - 1, SIZE_MAX}) {
    auto decoded =
        reina::framing::parallel_deserialize<reina::schema::transfer_t>(
            frames, wire::endianness::little,
            reina::framing::parallel_options{.chunk_size = chunk_size});
    ASSERT_TRUE(decoded.has_value()) << reina::testing::error_text(decoded);
    ASSERT_EQ(decoded.value().size(), 3u) << chunk_size;
    EXPECT_EQ(decoded.value()[2], reina::testing::make_transfer(2));
  }
}

TEST(parallel_deserialize, chunk_count_rounds_up_without_wrapping) {
  auto count = [](const std::size_t size, const std::size_t chunk) {
    auto chunks = reina::framing::count_chunks(size, chunk);
    EXPECT_TRUE(chunks.has_value());
    return chunks.value();
  };
  EXPECT_EQ(count(0, 512), 0u);
  EXPECT_EQ(count(512, 512), 1u);
  EXPECT_EQ(count(513, 512), 2u);
  EXPECT_EQ(count(3, SIZE_MAX - 1), 1u);
  EXPECT_EQ(count(SIZE_MAX, 1), SIZE_MAX);
  EXPECT_EQ(count(SIZE_MAX, SIZE_MAX), 1u);
  EXPECT_TRUE(reina::testing::fails_with<wire::invalid_data>(
      reina::framing::count_chunks(3, 0)));
}
