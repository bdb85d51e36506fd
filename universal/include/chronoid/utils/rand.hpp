#pragma once

/// @file chronoid/utils/rand.hpp
/// @brief Random number generators

#include <cstdint>
#include <limits>
#include <utility>

CHRONOID_NAMESPACE_BEGIN

namespace utils {

/// @brief Virtual base class for random number generators.
///
/// Satisfies the UniformRandomBitGenerator requirements, so it may be passed
/// to Boost.Random and standard distributions.
class RandomBase {
 public:
  using result_type = std::uint64_t;

  virtual ~RandomBase() = default;

  virtual result_type operator()() = 0;

  static constexpr result_type min() {
    return std::numeric_limits<result_type>::min();
  }

  static constexpr result_type max() {
    return std::numeric_limits<result_type>::max();
  }
};

namespace impl {

RandomBase& GetDefaultRandom();

}  // namespace impl

/// @brief Calls `func` with the thread-local default random generator.
///
/// The generator is a 64-bit Mersenne twister seeded from the OS entropy
/// source the first time it is used on a thread. The reference must not be
/// stored beyond the lifetime of the current thread.
///
/// @throws boost::random exceptions if the entropy source cannot be read while
/// seeding. The next call on the same thread tries seeding again.
template <typename Func>
decltype(auto) WithDefaultRandom(Func&& func) {
  return std::forward<Func>(func)(impl::GetDefaultRandom());
}

}  // namespace utils

CHRONOID_NAMESPACE_END
