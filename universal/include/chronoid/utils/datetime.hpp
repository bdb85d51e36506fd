#pragma once

/// @file chronoid/utils/datetime.hpp
/// @brief Wall clock access

#include <chrono>

CHRONOID_NAMESPACE_BEGIN

namespace utils::datetime {

/// @brief Current wall clock time, or the mocked time if
/// utils::datetime::MockNowSet() is in effect.
///
/// Reads CLOCK_REALTIME with nanosecond precision.
/// @throws std::system_error if the clock cannot be read
std::chrono::system_clock::time_point Now();

}  // namespace utils::datetime

CHRONOID_NAMESPACE_END
