#include <benchmark/benchmark.h>

#include <reina/blake3/hash.hpp>

#include <cstdint>

namespace reina::blake3 {

static constexpr int64_t kMinInputSize{64};
static constexpr int64_t kMaxInputSize{1024 * 1024};
static constexpr int kInputSizeMultiplier{8};

void bench_blake3(benchmark::State& state) {
  const auto data = reina::schema::bytes_t(static_cast<size_t>(state.range()));
  for ([[maybe_unused]] auto _ : state) {
    auto digest = hash(reina::schema::make_bytes_view(data));
    benchmark::DoNotOptimize(digest);
  }
  state.SetBytesProcessed(state.range() *
                          static_cast<int64_t>(state.iterations()));
}

// Baseline for the checksum: copying the same payload once.
void bench_payload_copy(benchmark::State& state) {
  const auto data = reina::schema::bytes_t(static_cast<size_t>(state.range()));
  for ([[maybe_unused]] auto _ : state) {
    auto copy = data;
    benchmark::DoNotOptimize(copy.data());
  }
  state.SetBytesProcessed(state.range() *
                          static_cast<int64_t>(state.iterations()));
}

BENCHMARK(bench_blake3)
    ->RangeMultiplier(kInputSizeMultiplier)
    ->Range(kMinInputSize, kMaxInputSize);
BENCHMARK(bench_payload_copy)->Arg(64 * 1024);

}  // namespace reina::blake3
