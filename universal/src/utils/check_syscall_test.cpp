#include <chronoid/utils/check_syscall.hpp>

#include <cerrno>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

CHRONOID_NAMESPACE_BEGIN

TEST(CheckSyscall, PassesResult) {
  EXPECT_EQ(utils::CheckSyscall(0, "noop"), 0);
  EXPECT_EQ(utils::CheckSyscall(42L, "read of fd {}", 3), 42L);
}

TEST(CheckSyscall, ThrowsOnFailure) {
  errno = EINVAL;
  try {
    utils::CheckSyscall(-1, "reading clock {}", "CLOCK_REALTIME");
    FAIL() << "no exception thrown";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code(), std::error_code(EINVAL, std::generic_category()));
    EXPECT_NE(std::string{ex.what()}.find("reading clock CLOCK_REALTIME"),
              std::string::npos)
        << ex.what();
  }
}

CHRONOID_NAMESPACE_END
