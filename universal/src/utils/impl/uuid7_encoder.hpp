#pragma once

#include <cstdint>

#include <boost/uuid/uuid.hpp>

CHRONOID_NAMESPACE_BEGIN

namespace utils::generators::impl {

/// @brief Packs a timestamp and 64 random bits into the UUID v7 layout.
///
/// `instant_ns` (nanoseconds since the Unix epoch) supplies unix_ts_ms and the
/// 12-bit sub-millisecond precision in rand_a. Bytes of `random_bits` fill
/// var and rand_b, least significant byte first. Version and variant are set
/// last.
boost::uuids::uuid EncodeUuid7(std::uint64_t instant_ns,
                               std::uint64_t random_bits) noexcept;

}  // namespace utils::generators::impl

CHRONOID_NAMESPACE_END
