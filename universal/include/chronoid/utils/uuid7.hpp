#pragma once

/// @file chronoid/utils/uuid7.hpp
/// @brief @copybrief utils::generators::GenerateUuid7

#include <string>

CHRONOID_NAMESPACE_BEGIN

namespace utils::generators {

/// @brief Generate a UUID v7 string in canonical
/// `xxxxxxxx-xxxx-7xxx-yxxx-xxxxxxxxxxxx` form
std::string GenerateUuid7();

}  // namespace utils::generators

CHRONOID_NAMESPACE_END
