#include <chronoid/utils/datetime.hpp>

#include <time.h>

#include <chronoid/utils/check_syscall.hpp>
#include <chronoid/utils/mock_now.hpp>

CHRONOID_NAMESPACE_BEGIN

namespace utils::datetime {

std::chrono::system_clock::time_point Now() {
  if (IsMockNow()) return MockNow();

  ::timespec tp{};
  utils::CheckSyscall(::clock_gettime(CLOCK_REALTIME, &tp),
                      "reading CLOCK_REALTIME");

  const std::chrono::nanoseconds since_epoch =
      std::chrono::seconds{tp.tv_sec} + std::chrono::nanoseconds{tp.tv_nsec};
  return std::chrono::system_clock::time_point{
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          since_epoch)};
}

}  // namespace utils::datetime

CHRONOID_NAMESPACE_END
