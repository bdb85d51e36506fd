#pragma once

#include <cstdint>

#ifndef CHRONOID_UUID7_STEP_BITS
#define CHRONOID_UUID7_STEP_BITS 12
#endif

CHRONOID_NAMESPACE_BEGIN

namespace utils::generators::impl {

/// Number of sub-millisecond precision bits of rand_a that are guaranteed to
/// advance between two consecutive UUIDs. Chosen per platform at build time.
inline constexpr int kStepBits = CHRONOID_UUID7_STEP_BITS;
static_assert(kStepBits == 10 || kStepBits == 12,
              "CHRONOID_UUID7_STEP_BITS must be 10 or 12");

/// Timestamp source works in 100ns ticks
inline constexpr std::uint64_t kNanosecondsPerTick = 100;
inline constexpr std::uint64_t kTicksPerMillisecond = 10'000;
inline constexpr std::uint64_t kNanosecondsPerMillisecond = 1'000'000;

/// Smallest increment between two timestamps handed out by
/// Uuid7TimestampSource, large enough to change the top kStepBits of rand_a.
inline constexpr std::uint64_t kMinStepTicks =
    kTicksPerMillisecond / (std::uint64_t{1} << kStepBits) + 1;

/// rand_a carries 12 bits of sub-millisecond precision
inline constexpr std::uint64_t kRandAPrecision = 4096;

}  // namespace utils::generators::impl

CHRONOID_NAMESPACE_END
