#include <chronoid/utils/mock_now.hpp>

#include <atomic>
#include <cstdint>
#include <stdexcept>

CHRONOID_NAMESPACE_BEGIN

namespace utils::datetime {

namespace {

using Clock = std::chrono::system_clock;

std::atomic<bool> is_mock_now{false};
std::atomic<std::int64_t> mocked_now_ns{0};

Clock::time_point FromNanoseconds(std::int64_t ns) {
  return Clock::time_point{
      std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds{ns})};
}

std::int64_t ToNanoseconds(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace

void MockNowSet(Clock::time_point new_mocked_now) {
  mocked_now_ns.store(ToNanoseconds(new_mocked_now));
  is_mock_now.store(true);
}

void MockSleep(std::chrono::nanoseconds duration) {
  if (!IsMockNow()) {
    throw std::logic_error("MockSleep() called without MockNowSet()");
  }
  mocked_now_ns.fetch_add(duration.count());
}

void MockNowUnset() noexcept { is_mock_now.store(false); }

bool IsMockNow() noexcept { return is_mock_now.load(); }

Clock::time_point MockNow() noexcept {
  return FromNanoseconds(mocked_now_ns.load());
}

}  // namespace utils::datetime

CHRONOID_NAMESPACE_END
