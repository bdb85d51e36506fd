#include <utils/impl/uuid7_timestamp.hpp>

#include <algorithm>
#include <chrono>
#include <ratio>

#include <spdlog/spdlog.h>

#include <chronoid/utils/datetime.hpp>
#include <utils/impl/uuid7_constants.hpp>

CHRONOID_NAMESPACE_BEGIN

namespace utils::generators::impl {

namespace {

using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10'000'000>>;

// Drift below this is normal under bursts of calls and is not reported
constexpr std::uint64_t kDriftReportThresholdTicks = 1000 * kTicksPerMillisecond;

std::uint64_t CurrentTicks() {
  const auto ticks = std::chrono::duration_cast<Ticks>(
                         utils::datetime::Now().time_since_epoch())
                         .count();
  // a clock set before the epoch is handled like a backward jump
  return ticks > 0 ? static_cast<std::uint64_t>(ticks) : 0;
}

}  // namespace

std::uint64_t Uuid7TimestampSource::NextInstant() {
  auto prev = last_emitted_.load(std::memory_order_acquire);

  while (true) {
    const auto now = CurrentTicks();
    const auto candidate = std::max(now, prev + kMinStepTicks);

    // On failure `prev` is reloaded with the value stored by the thread that
    // won the race, so every retry implies progress of another caller.
    if (last_emitted_.compare_exchange_strong(prev, candidate,
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
      ReportDrift(now, candidate);
      return candidate * kNanosecondsPerTick;
    }
  }
}

void Uuid7TimestampSource::ReportDrift(std::uint64_t now_ticks,
                                       std::uint64_t emitted_ticks) {
  if (emitted_ticks > now_ticks + kDriftReportThresholdTicks) {
    if (!drift_reported_.load(std::memory_order_relaxed) &&
        !drift_reported_.exchange(true)) {
      spdlog::warn(
          "UUID v7 timestamps run {}ms ahead of the wall clock, the clock "
          "went backwards or is too coarse",
          (emitted_ticks - now_ticks) / kTicksPerMillisecond);
    }
  } else if (emitted_ticks == now_ticks &&
             drift_reported_.load(std::memory_order_relaxed) &&
             drift_reported_.exchange(false)) {
    spdlog::info("Wall clock caught up with UUID v7 timestamps");
  }
}

Uuid7TimestampSource& GetUuid7TimestampSource() {
  static Uuid7TimestampSource source;
  return source;
}

}  // namespace utils::generators::impl

CHRONOID_NAMESPACE_END
