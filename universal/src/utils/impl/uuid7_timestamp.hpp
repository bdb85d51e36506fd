#pragma once

#include <atomic>
#include <cstdint>

CHRONOID_NAMESPACE_BEGIN

namespace utils::generators::impl {

/// @brief Lock-free allocator of strictly increasing wall clock timestamps.
///
/// Each NextInstant() result is greater than every result previously returned
/// by the same instance from any thread, and at least kMinStepTicks ahead of
/// the previous one. If the wall clock has not advanced enough or went
/// backwards, the timestamp is pushed forward from the last emitted one, so
/// the source may run ahead of the wall clock until the clock catches up.
class Uuid7TimestampSource final {
 public:
  Uuid7TimestampSource() = default;

  Uuid7TimestampSource(const Uuid7TimestampSource&) = delete;
  Uuid7TimestampSource& operator=(const Uuid7TimestampSource&) = delete;

  /// @returns nanoseconds since the Unix epoch, a multiple of 100
  /// @throws std::system_error if the wall clock cannot be read
  std::uint64_t NextInstant();

 private:
  void ReportDrift(std::uint64_t now_ticks, std::uint64_t emitted_ticks);

  // last emitted timestamp in 100ns ticks
  std::atomic<std::uint64_t> last_emitted_{0};
  std::atomic<bool> drift_reported_{false};
};

/// Process-wide timestamp source shared by all UUID v7 generators
Uuid7TimestampSource& GetUuid7TimestampSource();

}  // namespace utils::generators::impl

CHRONOID_NAMESPACE_END
