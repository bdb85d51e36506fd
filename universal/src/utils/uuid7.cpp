#include <chronoid/utils/uuid7.hpp>

#include <boost/uuid/uuid_io.hpp>

#include <chronoid/utils/boost_uuid7.hpp>

CHRONOID_NAMESPACE_BEGIN

namespace utils::generators {

std::string GenerateUuid7() {
  return boost::uuids::to_string(GenerateBoostUuid7());
}

}  // namespace utils::generators

CHRONOID_NAMESPACE_END
