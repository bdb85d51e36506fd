#include <chronoid/utils/rand.hpp>

#include <exception>

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/random_device.hpp>
#include <boost/random/seed_seq.hpp>
#include <spdlog/spdlog.h>

CHRONOID_NAMESPACE_BEGIN

namespace utils {

namespace {

class RandomImpl final : public RandomBase {
 public:
  RandomImpl() {
    try {
      boost::random::random_device device;
      boost::random::seed_seq seed{device(), device(), device(), device(),
                                   device(), device(), device(), device()};
      engine_.seed(seed);
    } catch (const std::exception& ex) {
      spdlog::error("Failed to seed thread random generator: {}", ex.what());
      throw;
    }
  }

  result_type operator()() override { return engine_(); }

 private:
  boost::random::mt19937_64 engine_;
};

}  // namespace

namespace impl {

RandomBase& GetDefaultRandom() {
  thread_local RandomImpl random;
  return random;
}

}  // namespace impl

}  // namespace utils

CHRONOID_NAMESPACE_END
