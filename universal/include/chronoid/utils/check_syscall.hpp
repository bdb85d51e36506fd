#pragma once

/// @file chronoid/utils/check_syscall.hpp
/// @brief @copybrief utils::CheckSyscall

#include <cerrno>
#include <system_error>
#include <utility>

#include <fmt/format.h>

CHRONOID_NAMESPACE_BEGIN

namespace utils {

/// @brief Returns `ret` unchanged, throws std::system_error with the current
/// errno if `ret` is -1.
///
/// The message is built by formatting `format` with `args`.
template <typename T, typename... Args>
T CheckSyscall(T ret, fmt::format_string<Args...> format, Args&&... args) {
  if (ret == -1) {
    const auto err_value = errno;
    throw std::system_error(
        err_value, std::generic_category(),
        fmt::format(format, std::forward<Args>(args)...));
  }
  return ret;
}

}  // namespace utils

CHRONOID_NAMESPACE_END
