#include "webio/error.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <sstream>
#include <string>

#include <catch2/catch.hpp>

using boost::system::error_code;
using boost::system::system_error;

using webio::error::errc;

TEST_CASE("Our error category") {
  SECTION("should convert our enum into error codes implicitly") {
    error_code ec = errc::session_closed;

    CHECK(ec);
    CHECK(ec == errc::session_closed);
    CHECK(ec != errc::event_queue_full);
    CHECK(ec.category() == webio::error::category());
    CHECK(std::string(ec.category().name()) == "webio");
  }

  SECTION("should describe every code") {
    for (auto const e : {
      errc::session_closed,
      errc::event_queue_full,
      errc::malformed_event,
      errc::invalid_config}) {

      auto const ec = webio::error::make_error_code(e);
      CHECK(!ec.message().empty());
      CHECK(ec.message() != "unknown webio error");
    }
  }

  SECTION("should print the enumerator name") {
    auto os = std::ostringstream();
    os << errc::event_queue_full;
    CHECK(os.str() == "event_queue_full");
  }

  SECTION("should travel through system_error") {
    try {
      throw system_error(errc::invalid_config, "port");
    } catch (system_error const& e) {
      CHECK(e.code() == errc::invalid_config);
      CHECK(std::string(e.what()).find("port") != std::string::npos);
    }
  }
}
