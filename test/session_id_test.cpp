#include "webio/session_id.hpp"

#include <set>
#include <string>
#include <algorithm>

#include <catch2/catch.hpp>

namespace {

auto is_alphanumeric(char const c) -> bool {
  return (c >= 'a' && c <= 'z')
      || (c >= 'A' && c <= 'Z')
      || (c >= '0' && c <= '9');
}

} // anonymous

TEST_CASE("Our session identifier generator") {
  SECTION("should produce 24 alphanumeric characters by default") {
    auto const id = webio::make_session_id();

    REQUIRE(id.size() == 24);
    CHECK(std::all_of(id.begin(), id.end(), is_alphanumeric));
  }

  SECTION("should honor the requested length") {
    CHECK(webio::make_session_id(0).empty());
    CHECK(webio::make_session_id(1).size() == 1);
    CHECK(webio::make_session_id(200).size() == 200);
  }

  SECTION("should not repeat itself") {
    auto ids = std::set<std::string>();
    for (auto i = 0; i < 1000; ++i) {
      ids.insert(webio::make_session_id());
    }
    CHECK(ids.size() == 1000);
  }

  SECTION("should eventually use the whole alphabet") {
    auto seen = std::set<char>();
    for (auto i = 0; i < 200; ++i) {
      for (auto const c : webio::make_session_id()) {
        seen.insert(c);
      }
    }
    CHECK(seen.size() == 62);
  }
}
