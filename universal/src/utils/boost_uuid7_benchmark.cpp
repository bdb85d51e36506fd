#include <sys/time.h>
#include <chrono>
#include <cstdint>
#include <ctime>

#include <benchmark/benchmark.h>

#include <chronoid/utils/boost_uuid7.hpp>
#include <chronoid/utils/datetime.hpp>
#include <chronoid/utils/uuid7.hpp>
#include <utils/impl/uuid7_encoder.hpp>
#include <utils/impl/uuid7_timestamp.hpp>

CHRONOID_NAMESPACE_BEGIN

namespace {

// Timestamps in 100ns ticks, the unit of the UUID v7 timestamp source

uint64_t ChronoTimestamp() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
             .count() /
         100;
}

uint64_t GettimeofdayTimestamp() {
  struct timeval tp {};
  gettimeofday(&tp, nullptr);

  return static_cast<uint64_t>(tp.tv_sec) * 10'000'000 + tp.tv_usec * 10;
}

uint64_t ClockRealtimeTimestamp() {
  ::timespec tp{};
  ::clock_gettime(CLOCK_REALTIME, &tp);

  return static_cast<uint64_t>(tp.tv_sec) * 10'000'000 + tp.tv_nsec / 100;
}

uint64_t ClockRealtimeCoarseTimestamp() {
  ::timespec tp{};
  ::clock_gettime(CLOCK_REALTIME_COARSE, &tp);

  return static_cast<uint64_t>(tp.tv_sec) * 10'000'000 + tp.tv_nsec / 100;
}

uint64_t DatetimeNowTimestamp() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             utils::datetime::Now().time_since_epoch())
             .count() /
         100;
}

}  // namespace

template <typename TimestampFunc>
void CurrentTimestampSeries(TimestampFunc func, benchmark::State& state) {
  for ([[maybe_unused]] auto _ : state) {
    for (int i = 0; i < state.range(0); ++i) {
      benchmark::DoNotOptimize(func());
    }
  }
}

void ChronoTimestampSeries(benchmark::State& state) {
  CurrentTimestampSeries(&ChronoTimestamp, state);
}

void GettimeofdayTimestampSeries(benchmark::State& state) {
  CurrentTimestampSeries(&GettimeofdayTimestamp, state);
}

void ClockRealtimeTimestampSeries(benchmark::State& state) {
  CurrentTimestampSeries(&ClockRealtimeTimestamp, state);
}

void ClockRealtimeCoarseTimestampSeries(benchmark::State& state) {
  CurrentTimestampSeries(&ClockRealtimeCoarseTimestamp, state);
}

void DatetimeNowTimestampSeries(benchmark::State& state) {
  CurrentTimestampSeries(&DatetimeNowTimestamp, state);
}

BENCHMARK(ChronoTimestampSeries)->RangeMultiplier(2)->Range(1, 1 << 20);
BENCHMARK(GettimeofdayTimestampSeries)->RangeMultiplier(2)->Range(1, 1 << 20);
BENCHMARK(ClockRealtimeTimestampSeries)->RangeMultiplier(2)->Range(1, 1 << 20);
BENCHMARK(ClockRealtimeCoarseTimestampSeries)
    ->RangeMultiplier(2)
    ->Range(1, 1 << 20);
BENCHMARK(DatetimeNowTimestampSeries)->RangeMultiplier(2)->Range(1, 1 << 20);

// Shows the cost of CAS retries when several threads share the source
void NextInstantContended(benchmark::State& state) {
  auto& source = utils::generators::impl::GetUuid7TimestampSource();
  for ([[maybe_unused]] auto _ : state) {
    benchmark::DoNotOptimize(source.NextInstant());
  }
}

BENCHMARK(NextInstantContended)->ThreadRange(1, 16);

void EncodeUuid7Bits(benchmark::State& state) {
  uint64_t instant_ns = 1'700'000'000'000'000'000ull;
  for ([[maybe_unused]] auto _ : state) {
    instant_ns += 300;
    benchmark::DoNotOptimize(
        utils::generators::impl::EncodeUuid7(instant_ns, instant_ns * 31));
  }
}

BENCHMARK(EncodeUuid7Bits);

template <typename UuidGeneratorFunc>
void GenerateUuidSeries(UuidGeneratorFunc generator, benchmark::State& state) {
  for ([[maybe_unused]] auto _ : state) {
    for (int i = 0; i < state.range(0); ++i) {
      benchmark::DoNotOptimize(generator());
    }
  }
}

void GenerateUuidV7Series(benchmark::State& state) {
  GenerateUuidSeries(&utils::generators::GenerateBoostUuid7, state);
}

void GenerateUuidV7StringSeries(benchmark::State& state) {
  GenerateUuidSeries(&utils::generators::GenerateUuid7, state);
}

BENCHMARK(GenerateUuidV7Series)->RangeMultiplier(2)->Range(1, 1 << 20);
BENCHMARK(GenerateUuidV7StringSeries)->RangeMultiplier(2)->Range(1, 1 << 16);

void GenerateUuidV7Contended(benchmark::State& state) {
  for ([[maybe_unused]] auto _ : state) {
    benchmark::DoNotOptimize(utils::generators::GenerateBoostUuid7());
  }
}

BENCHMARK(GenerateUuidV7Contended)->ThreadRange(1, 16);

CHRONOID_NAMESPACE_END
