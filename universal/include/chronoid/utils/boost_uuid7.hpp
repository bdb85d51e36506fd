#pragma once

/// @file chronoid/utils/boost_uuid7.hpp
/// @brief @copybrief utils::generators::GenerateBoostUuid7()

#include <cstdint>

#include <boost/uuid/uuid.hpp>

CHRONOID_NAMESPACE_BEGIN

namespace utils {

/// Generators
namespace generators {

/// @brief Generates UUID v7
///
/// UUIDs generated by any thread of the process are strictly increasing in
/// byte-wise order: rand_a carries sub-millisecond precision taken from a
/// process-wide monotonic timestamp, rand_b is random.
///
/// Thread-safe.
///
/// @throws std::system_error if the wall clock cannot be read
/// @throws boost::system::system_error if the entropy source for the thread's
/// random generator is unavailable
///
/// See
/// https://datatracker.ietf.org/doc/html/rfc9562#name-uuid-version-7
boost::uuids::uuid GenerateBoostUuid7();

/// @returns the 4-bit version field (bits 48-51), 7 for UUID v7
std::uint8_t GetUuidVersion(const boost::uuids::uuid& uuid) noexcept;

/// @returns the 2-bit variant field (bits 64-65), 2 for RFC 9562 UUIDs
std::uint8_t GetUuidVariant(const boost::uuids::uuid& uuid) noexcept;

}  // namespace generators

}  // namespace utils

CHRONOID_NAMESPACE_END
