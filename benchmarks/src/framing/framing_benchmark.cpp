#include <benchmark/benchmark.h>

#include <reina/blake3/hash.hpp>
#include <reina/framing/batch.hpp>
#include <reina/framing/envelope.hpp>
#include <reina/framing/ultra.hpp>
#include <reina/testing/common.hpp>

#include <array>
#include <cstdint>
#include <iterator>
#include <utility>
#include <vector>

namespace reina::framing {

namespace wire = reina::schema::encoding::wire;

static constexpr auto kOrder{wire::endianness::little};

std::vector<schema::bytes_t> make_frames(const size_t count) {
  auto frames = std::vector<schema::bytes_t>{};
  frames.reserve(count);
  const auto tx = reina::testing::make_reference_transfer();
  for (size_t i = 0; i < count; ++i) {
    frames.push_back(serialize(tx, kOrder).value());
  }
  return frames;
}

// Same frame as serialize, built by growing vectors instead of sizing once.
schema::bytes_t serialize_growing(const schema::transfer_t& tx) {
  auto payload = schema::bytes_t{};
  auto encoded = wire::encode(tx, kOrder).value();
  payload.insert(std::end(payload), std::begin(encoded), std::end(encoded));
  const auto digest = reina::blake3::hash(schema::make_bytes_view(payload));
  payload.insert(std::end(payload), std::begin(digest), std::end(digest));
  auto output = schema::bytes_t{};
  const auto length = static_cast<uint32_t>(payload.size());
  for (auto shift = 0; shift < 32; shift += 8) {
    output.push_back(static_cast<uint8_t>(length >> shift));
  }
  output.insert(std::end(output), std::begin(payload), std::end(payload));
  return output;
}

void bench_transfer_serialize(benchmark::State& state) {
  const auto tx = reina::testing::make_reference_transfer();
  for ([[maybe_unused]] auto _ : state) {
    auto frame = serialize(tx, kOrder);
    benchmark::DoNotOptimize(frame);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

void bench_transfer_serialize_growing(benchmark::State& state) {
  const auto tx = reina::testing::make_reference_transfer();
  for ([[maybe_unused]] auto _ : state) {
    auto frame = serialize_growing(tx);
    benchmark::DoNotOptimize(frame.data());
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

void bench_transfer_deserialize(benchmark::State& state) {
  const auto frame = make_frames(1).front();
  for ([[maybe_unused]] auto _ : state) {
    auto tx = deserialize<schema::transfer_t>(frame, kOrder);
    benchmark::DoNotOptimize(tx);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

void bench_serialize_batch(benchmark::State& state) {
  const auto items = std::vector<schema::transfer_t>(
      static_cast<size_t>(state.range()),
      reina::testing::make_reference_transfer());
  for ([[maybe_unused]] auto _ : state) {
    auto frame = serialize_batch(items, kOrder);
    benchmark::DoNotOptimize(frame);
  }
  state.SetItemsProcessed(state.range() *
                          static_cast<int64_t>(state.iterations()));
}

void bench_deserialize_batch(benchmark::State& state) {
  const auto items = std::vector<schema::transfer_t>(
      static_cast<size_t>(state.range()),
      reina::testing::make_reference_transfer());
  const auto frame = serialize_batch(items, kOrder).value();
  for ([[maybe_unused]] auto _ : state) {
    auto decoded = deserialize_batch<schema::transfer_t>(frame, kOrder);
    benchmark::DoNotOptimize(decoded);
  }
  state.SetItemsProcessed(state.range() *
                          static_cast<int64_t>(state.iterations()));
}

void bench_sequential_deserialize(benchmark::State& state) {
  const auto frames = make_frames(static_cast<size_t>(state.range()));
  for ([[maybe_unused]] auto _ : state) {
    auto decoded = std::vector<schema::transfer_t>{};
    decoded.reserve(frames.size());
    for (const auto& frame : frames) {
      auto tx = deserialize<schema::transfer_t>(frame, kOrder);
      if (!tx) {
        state.SkipWithError("sequential deserialize failed");
        return;
      }
      decoded.push_back(std::move(tx).value());
    }
    benchmark::DoNotOptimize(decoded.data());
  }
  state.SetItemsProcessed(state.range() *
                          static_cast<int64_t>(state.iterations()));
}

void bench_parallel_deserialize(benchmark::State& state) {
  const auto frames = make_frames(static_cast<size_t>(state.range()));
  for ([[maybe_unused]] auto _ : state) {
    auto decoded = parallel_deserialize<schema::transfer_t>(frames, kOrder);
    if (!decoded) {
      state.SkipWithError("parallel deserialize failed");
      return;
    }
    benchmark::DoNotOptimize(decoded);
  }
  state.SetItemsProcessed(state.range() *
                          static_cast<int64_t>(state.iterations()));
}

void bench_ultra_serialize(benchmark::State& state) {
  const auto tx = reina::testing::make_reference_transfer();
  auto buffer = std::array<uint8_t, 128>{};
  for ([[maybe_unused]] auto _ : state) {
    auto written = serialize_ultra_fixed(tx, buffer, kOrder);
    benchmark::DoNotOptimize(written);
    benchmark::DoNotOptimize(buffer.data());
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

void bench_ultra_deserialize(benchmark::State& state) {
  const auto frame =
      serialize_ultra_fixed(reina::testing::make_reference_transfer(), kOrder)
          .value();
  for ([[maybe_unused]] auto _ : state) {
    auto tx = deserialize_ultra_fixed(frame, kOrder);
    benchmark::DoNotOptimize(tx);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

// Cost of rejecting short, garbage, mislabelled and misaligned inputs.
void bench_malformed_deserialize(benchmark::State& state) {
  auto shifted = make_frames(1).front();
  shifted.erase(std::begin(shifted));
  const auto cases = std::vector<schema::bytes_t>{
      schema::bytes_t(10, 0x00),
      schema::bytes_t(100, 0xFF),
      schema::bytes_t{0, 1, 2, 3, 4, 5, 6, 7},
      shifted};
  for ([[maybe_unused]] auto _ : state) {
    for (const auto& input : cases) {
      auto tx = deserialize<schema::transfer_t>(input, kOrder);
      if (tx) {
        state.SkipWithError("malformed input decoded");
        return;
      }
      benchmark::DoNotOptimize(tx);
    }
  }
  state.SetItemsProcessed(static_cast<int64_t>(cases.size()) *
                          static_cast<int64_t>(state.iterations()));
}

BENCHMARK(bench_transfer_serialize);
BENCHMARK(bench_transfer_serialize_growing);
BENCHMARK(bench_transfer_deserialize);
BENCHMARK(bench_serialize_batch)->RangeMultiplier(10)->Range(1'000, 1'000'000);
BENCHMARK(bench_deserialize_batch)->RangeMultiplier(10)->Range(100, 100'000);
BENCHMARK(bench_sequential_deserialize)
    ->RangeMultiplier(10)
    ->Range(100, 100'000);
BENCHMARK(bench_parallel_deserialize)
    ->RangeMultiplier(10)
    ->Range(100, 100'000)
    ->UseRealTime();
BENCHMARK(bench_ultra_serialize);
BENCHMARK(bench_ultra_deserialize);
BENCHMARK(bench_malformed_deserialize);

}  // namespace reina::framing
