#pragma once

/// @file chronoid/utils/mock_now.hpp
/// @brief Mocking of utils::datetime::Now() for tests

#include <chrono>

CHRONOID_NAMESPACE_BEGIN

namespace utils::datetime {

/// Makes utils::datetime::Now() return `new_mocked_now` until changed or
/// unset. Affects all threads.
void MockNowSet(std::chrono::system_clock::time_point new_mocked_now);

/// Advances the mocked time by `duration`. Mocking must be enabled.
void MockSleep(std::chrono::nanoseconds duration);

/// Makes utils::datetime::Now() read the real clock again.
void MockNowUnset() noexcept;

bool IsMockNow() noexcept;

/// @returns the mocked time. Mocking must be enabled.
std::chrono::system_clock::time_point MockNow() noexcept;

}  // namespace utils::datetime

CHRONOID_NAMESPACE_END
