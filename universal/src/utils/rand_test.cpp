#include <chronoid/utils/rand.hpp>

#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

CHRONOID_NAMESPACE_BEGIN

namespace {

const utils::RandomBase* CurrentRandom() {
  return utils::WithDefaultRandom(
      [](utils::RandomBase& rng) -> const utils::RandomBase* { return &rng; });
}

}  // namespace

TEST(Rand, SameGeneratorWithinThread) {
  EXPECT_EQ(CurrentRandom(), CurrentRandom());
}

TEST(Rand, GeneratorPerThread) {
  const auto* main_random = CurrentRandom();
  const utils::RandomBase* other_random = nullptr;
  std::thread([&other_random] { other_random = CurrentRandom(); }).join();

  EXPECT_NE(other_random, nullptr);
  EXPECT_NE(main_random, other_random);
}

TEST(Rand, ThreadsAreSeededIndependently) {
  static constexpr auto kThreads = 16;

  std::vector<utils::RandomBase::result_type> first_values(kThreads);
  std::vector<std::thread> threads;
  for (auto& value : first_values) {
    threads.emplace_back([&value] {
      value = utils::WithDefaultRandom([](utils::RandomBase& rng) { return rng(); });
    });
  }
  for (auto& thread : threads) thread.join();

  const std::set<utils::RandomBase::result_type> unique(first_values.begin(),
                                                        first_values.end());
  EXPECT_EQ(unique.size(), first_values.size());
}

CHRONOID_NAMESPACE_END
