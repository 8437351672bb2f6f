#include <benchmark/benchmark.h>

#include <reina/schema/encoding/wire/fixed.hpp>
#include <reina/schema/encoding/wire/varint.hpp>

#include <array>
#include <cstdint>

namespace reina::schema::encoding::wire {

static constexpr uint64_t kValue{123456789};

void bench_u64_varint_encode(benchmark::State& state) {
  auto buffer = std::array<uint8_t, 10>{};
  auto value = kValue;
  for ([[maybe_unused]] auto _ : state) {
    benchmark::DoNotOptimize(value);
    auto written = encode_varint(value, buffer);
    benchmark::DoNotOptimize(written);
    benchmark::DoNotOptimize(buffer.data());
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

void bench_u64_fixed_encode(benchmark::State& state) {
  auto buffer = std::array<uint8_t, 8>{};
  for ([[maybe_unused]] auto _ : state) {
    auto written = encode_fixed_u64(kValue, buffer, endianness::little);
    benchmark::DoNotOptimize(written);
    benchmark::DoNotOptimize(buffer.data());
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

void bench_u64_varint_decode(benchmark::State& state) {
  auto buffer = std::array<uint8_t, 10>{};
  if (!encode_varint(kValue, buffer)) {
    state.SkipWithError("varint encode failed");
    return;
  }
  for ([[maybe_unused]] auto _ : state) {
    auto value = decode_varint(buffer);
    benchmark::DoNotOptimize(value);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

void bench_u64_fixed_decode(benchmark::State& state) {
  auto buffer = std::array<uint8_t, 8>{};
  if (!encode_fixed_u64(kValue, buffer, endianness::little)) {
    state.SkipWithError("fixed encode failed");
    return;
  }
  for ([[maybe_unused]] auto _ : state) {
    auto value = decode_fixed_u64(buffer, endianness::little);
    benchmark::DoNotOptimize(value);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(bench_u64_varint_encode);
BENCHMARK(bench_u64_fixed_encode);
BENCHMARK(bench_u64_varint_decode);
BENCHMARK(bench_u64_fixed_decode);

}  // namespace reina::schema::encoding::wire
