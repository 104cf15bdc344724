#include <benchmark/benchmark.h>

#include <string>
#include <vector>

#include "tuid/core/base62.hpp"
#include "tuid/core/tuid.hpp"
#include "tuid/util/time.hpp"

using namespace tuid;
using namespace tuid::core;

// Benchmark TUID generation at the current time
static void BM_TuidGeneration(benchmark::State& state) {
  for (auto _ : state) {
    auto id = Tuid::generate();
    benchmark::DoNotOptimize(id);
  }
}
BENCHMARK(BM_TuidGeneration);

// Benchmark generation with fixed fields (no clock or random source)
static void BM_TuidGenerationFixed(benchmark::State& state) {
  auto timestamp = util::Time::now();
  for (auto _ : state) {
    auto id = Tuid::generate(timestamp, 0xDEADBEEF);
    benchmark::DoNotOptimize(id);
  }
}
BENCHMARK(BM_TuidGenerationFixed);

// Benchmark decoding timestamp and entropy
static void BM_TuidInfo(benchmark::State& state) {
  std::vector<Tuid> ids;
  for (int i = 0; i < 1000; ++i) {
    ids.push_back(Tuid::generate());
  }

  size_t index = 0;
  for (auto _ : state) {
    auto info = ids[index % ids.size()].info();
    benchmark::DoNotOptimize(info);
    ++index;
  }
}
BENCHMARK(BM_TuidInfo);

// Benchmark range validation
static void BM_TuidIsValid(benchmark::State& state) {
  Tuid id("91Mq07yx9IxHCi5Y");
  for (auto _ : state) {
    bool valid = isValid(id);
    benchmark::DoNotOptimize(valid);
  }
}
BENCHMARK(BM_TuidIsValid);

// Benchmark base-62 encoding of integers of growing width
static void BM_Base62Encode(benchmark::State& state) {
  BigInt value = 1;
  value <<= state.range(0);
  value -= 1;

  for (auto _ : state) {
    auto encoded = encode(value);
    benchmark::DoNotOptimize(encoded);
  }
}
BENCHMARK(BM_Base62Encode)->Arg(32)->Arg(64)->Arg(96)->Arg(128)->Arg(256);

// Benchmark base-62 decoding of strings of growing length
static void BM_Base62Decode(benchmark::State& state) {
  std::string text(static_cast<size_t>(state.range(0)), 'z');

  for (auto _ : state) {
    auto decoded = decode(text);
    benchmark::DoNotOptimize(decoded);
  }
}
BENCHMARK(BM_Base62Decode)->Arg(8)->Arg(16)->Arg(32)->Arg(64);

// Benchmark timestamp formatting
static void BM_Rfc3339Format(benchmark::State& state) {
  auto timestamp = util::Time::now();
  for (auto _ : state) {
    auto text = util::Time::toRfc3339Nano(timestamp);
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_Rfc3339Format);

BENCHMARK_MAIN();
