#include "flake/config/generator_config.h"
#include "flake/id/generator.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <thread>
#include <vector>

using namespace flake;

// These tests run against the real clocks.

TEST_CASE("Generator: identifiers are unique and increasing under counter exhaustion",
          "[generator][system]") {
  config::GeneratorConfig cfg;
  cfg.layout = id::Layout{41, 10, 1};  // two identifiers per millisecond

  const auto result = id::Generator::create(cfg);
  REQUIRE(result.has_value());
  auto& generator = *result.value();

  id::Snowflake previous = generator.generate();
  for (int i = 0; i < 50; ++i) {
    const auto current = generator.generate();
    REQUIRE(previous < current);
    REQUIRE(generator.decompose(current).counter <= generator.max_counter());
    previous = current;
  }
}

TEST_CASE("Generator: concurrent callers never receive the same identifier",
          "[generator][system][concurrency]") {
  config::GeneratorConfig cfg;
  cfg.layout = id::Layout{41, 10, 8};

  const auto result = id::Generator::create(cfg);
  REQUIRE(result.has_value());
  auto& generator = *result.value();

  constexpr int kThreads = 8;
  constexpr int kPerThread = 2000;

  std::vector<std::vector<id::Snowflake>> per_thread(kThreads);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&generator, &ids = per_thread[t]] {
      ids.reserve(kPerThread);
      for (int i = 0; i < kPerThread; ++i) {
        ids.push_back(generator.generate());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<id::Snowflake> all;
  for (const auto& ids : per_thread) {
    // Each caller observes its own identifiers in increasing order.
    CHECK(std::is_sorted(ids.begin(), ids.end()));
    all.insert(ids.begin(), ids.end());
  }
  CHECK(all.size() == static_cast<std::size_t>(kThreads * kPerThread));
}
