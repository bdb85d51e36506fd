#include <chronoid/utils/uuid7.hpp>

#include <algorithm>
#include <string>

#include <gtest/gtest.h>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <chronoid/utils/boost_uuid7.hpp>

CHRONOID_NAMESPACE_BEGIN

TEST(UUIDv7, String) {
  const auto str = utils::generators::GenerateUuid7();

  constexpr unsigned kCanonicalLength = 36;
  EXPECT_EQ(str.size(), kCanonicalLength);
  EXPECT_EQ(std::count(str.begin(), str.end(), '-'), 4);
  EXPECT_EQ(str[14], '7') << str;
  EXPECT_NE(std::string{"89ab"}.find(str[19]), std::string::npos) << str;

  EXPECT_NE(utils::generators::GenerateUuid7(),
            utils::generators::GenerateUuid7());
}

TEST(UUIDv7, StringRoundTrip) {
  const auto uuid = utils::generators::GenerateBoostUuid7();
  const auto str = boost::uuids::to_string(uuid);

  EXPECT_EQ(boost::uuids::string_generator{}(str), uuid) << str;

  const auto generated = utils::generators::GenerateUuid7();
  EXPECT_EQ(boost::uuids::to_string(boost::uuids::string_generator{}(generated)),
            generated);
}

TEST(UUIDv7, StringOrder) {
  // lowercase hex of a byte-wise ordered value sorts the same way
  const auto first = utils::generators::GenerateUuid7();
  const auto second = utils::generators::GenerateUuid7();
  EXPECT_LT(first, second);
}

CHRONOID_NAMESPACE_END
