#include "webio/expiry_tracker.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

using namespace std::chrono_literals;

namespace {

auto at(std::chrono::seconds const offset) -> webio::expiry_tracker::time_point {
  return webio::expiry_tracker::time_point() + std::chrono::hours(1000) + offset;
}

} // anonymous

TEST_CASE("Our expiry tracker") {
  auto tracker = webio::expiry_tracker();

  SECTION("should record and forget identifiers") {
    tracker.touch("a", at(0s));
    tracker.touch("b", at(1s));

    CHECK(tracker.size() == 2);
    CHECK(tracker.contains("a"));
    CHECK(tracker.contains("b"));
    CHECK(!tracker.contains("c"));

    CHECK(tracker.erase("a"));
    CHECK(!tracker.erase("a"));
    CHECK(tracker.size() == 1);
    CHECK(!tracker.contains("a"));
  }

  SECTION("should evict exactly the idle prefix, oldest first") {
    tracker.touch("a", at(0s));
    tracker.touch("b", at(10s));
    tracker.touch("c", at(20s));
    tracker.touch("d", at(30s));

    auto evicted = std::vector<std::string>();
    auto const count = tracker.evict_expired(
      at(120s), 100s,
      [&](std::string const& id) { evicted.push_back(id); });

    CHECK(count == 3);
    CHECK(evicted == std::vector<std::string>{"a", "b", "c"});
    CHECK(tracker.size() == 1);
    CHECK(tracker.contains("d"));
  }

  SECTION("should treat an idle time equal to the budget as expired") {
    tracker.touch("a", at(0s));

    CHECK(tracker.evict_expired(at(99s), 100s, nullptr) == 0);
    CHECK(tracker.evict_expired(at(100s), 100s, nullptr) == 1);
    CHECK(tracker.size() == 0);
  }

  SECTION("should move touched identifiers to the fresh end") {
    tracker.touch("a", at(0s));
    tracker.touch("b", at(10s));
    tracker.touch("a", at(50s));

    auto evicted = std::vector<std::string>();
    tracker.evict_expired(
      at(120s), 100s,
      [&](std::string const& id) { evicted.push_back(id); });

    CHECK(evicted == std::vector<std::string>{"b"});
    CHECK(tracker.contains("a"));
    CHECK(tracker.last_active("a") == at(50s));
  }

  SECTION("should never let a late touch go back in time") {
    tracker.touch("a", at(30s));
    tracker.touch("b", at(10s));

    CHECK(tracker.last_active("b") == at(30s));

    // "b" was the most recent touch so it outlives "a"
    //
    auto evicted = std::vector<std::string>();
    tracker.evict_expired(
      at(130s), 100s,
      [&](std::string const& id) { evicted.push_back(id); });

    CHECK(evicted == std::vector<std::string>{"a", "b"});
  }

  SECTION("should stop at the first fresh entry") {
    tracker.touch("fresh", at(100s));

    CHECK(tracker.evict_expired(at(150s), 100s, nullptr) == 0);
    CHECK(tracker.size() == 1);
  }
}
