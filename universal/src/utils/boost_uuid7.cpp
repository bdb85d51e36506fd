#include <chronoid/utils/boost_uuid7.hpp>

#include <cstdint>
#include <limits>

#include <boost/random/uniform_int.hpp>
#include <boost/random/variate_generator.hpp>
#include <boost/uuid/uuid.hpp>

#include <chronoid/compiler/thread_local.hpp>
#include <chronoid/utils/rand.hpp>
#include <utils/impl/uuid7_encoder.hpp>
#include <utils/impl/uuid7_timestamp.hpp>

CHRONOID_NAMESPACE_BEGIN

namespace utils {

namespace generators {

namespace {

class UuidV7Generator {
 public:
  UuidV7Generator(RandomBase& rng, impl::Uuid7TimestampSource& timestamps)
      : generator_(&rng, boost::uniform_int<uint64_t>(
                             std::numeric_limits<uint64_t>::min(),
                             std::numeric_limits<uint64_t>::max())),
        timestamps_(timestamps) {}

  boost::uuids::uuid operator()() {
    // Timestamps are strictly increasing across threads, so the UUID order
    // is decided by unix_ts_ms and rand_a before rand_b is ever compared.
    const auto instant_ns = timestamps_.NextInstant();
    return impl::EncodeUuid7(instant_ns, generator_());
  }

 private:
  boost::random::variate_generator<RandomBase*, boost::uniform_int<uint64_t>>
      generator_;
  impl::Uuid7TimestampSource& timestamps_;
};

compiler::ThreadLocal local_uuid7_generator = [] {
  return WithDefaultRandom([](RandomBase& rng) {
    return UuidV7Generator(rng, impl::GetUuid7TimestampSource());
  });
};

}  // namespace

boost::uuids::uuid GenerateBoostUuid7() {
  auto generator = local_uuid7_generator.Use();
  return (*generator)();
}

std::uint8_t GetUuidVersion(const boost::uuids::uuid& uuid) noexcept {
  return uuid.data[6] >> 4;
}

std::uint8_t GetUuidVariant(const boost::uuids::uuid& uuid) noexcept {
  return uuid.data[8] >> 6;
}

}  // namespace generators

}  // namespace utils

CHRONOID_NAMESPACE_END
