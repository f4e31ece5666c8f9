#include "webio/thread_session.hpp"
#include "webio/error.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <stdexcept>

#include <catch2/catch.hpp>

using namespace std::chrono_literals;

using boost::system::error_code;
using boost::system::system_error;

using webio::error::errc;

namespace {

// pulls until `count` messages arrived or the deadline passed
//
auto pull_at_least(
  webio::session&                  session,
  std::size_t const                count,
  std::chrono::milliseconds const  deadline = 5000ms)
  -> std::vector<webio::message> {

  auto messages = std::vector<webio::message>();
  auto const until = std::chrono::steady_clock::now() + deadline;

  while (messages.size() < count && std::chrono::steady_clock::now() < until) {
    for (auto& msg : session.pull()) {
      messages.push_back(std::move(msg));
    }
    std::this_thread::sleep_for(5ms);
  }
  return messages;
}

auto echo_entry() -> webio::thread_session::entry_point {
  return [](webio::thread_session::context& ctx) -> void {
    while (true) {
      auto ev = ctx.next_event();
      if (ev.value("event", std::string()) == "close") {
        return;
      }
      ctx.send({{"command", "output"}, {"echo", ev}});
    }
  };
}

} // anonymous

TEST_CASE("Our thread session") {

  SECTION("should deliver events to the application and its output back") {
    auto session = webio::thread_session(echo_entry());

    auto ec = error_code();
    session.push({{"event", "click"}, {"id", 1}}, ec);
    REQUIRE(!ec);
    session.push({{"event", "click"}, {"id", 2}}, ec);
    REQUIRE(!ec);

    auto const messages = pull_at_least(session, 2);

    REQUIRE(messages.size() == 2);
    CHECK(messages[0]["echo"]["id"] == 1);
    CHECK(messages[1]["echo"]["id"] == 2);
    CHECK(!session.closed());
  }

  SECTION("should close once the application returns") {
    auto session = webio::thread_session(echo_entry());

    auto ec = error_code();
    session.push({{"event", "close"}}, ec);
    REQUIRE(!ec);

    auto const messages = pull_at_least(session, 1);

    REQUIRE(messages.size() == 1);
    CHECK(messages[0] == webio::close_session_message());
    CHECK(session.closed());

    session.push({{"event", "late"}}, ec);
    CHECK(ec == errc::session_closed);
  }

  SECTION("should not report closed before the close message was pulled") {
    auto session = webio::thread_session(
      [](webio::thread_session::context&) -> void {});

    // give the worker time to finish without pulling anything
    //
    std::this_thread::sleep_for(50ms);
    CHECK(!session.closed());

    auto const messages = pull_at_least(session, 1);
    REQUIRE(messages.size() == 1);
    CHECK(session.closed());
  }

  SECTION("should report application faults and close") {
    auto session = webio::thread_session(
      [](webio::thread_session::context& ctx) -> void {
        ctx.send({{"command", "output"}});
        throw std::runtime_error("application blew up");
      });

    auto const messages = pull_at_least(session, 3);

    REQUIRE(messages.size() == 3);
    CHECK(messages[0]["command"] == "output");
    CHECK(messages[1]["command"] == "error");
    CHECK(messages[1]["message"] == "application blew up");
    CHECK(messages[2] == webio::close_session_message());
    CHECK(session.closed());
  }

  SECTION("should survive an application throwing a non-exception") {
    auto session = webio::thread_session(
      [](webio::thread_session::context& ctx) -> void {
        auto ev = ctx.next_event();
        throw ev.value("id", 0);
      });

    auto ec = error_code();
    session.push({{"event", "click"}, {"id", 42}}, ec);
    REQUIRE(!ec);

    auto const messages = pull_at_least(session, 2);

    REQUIRE(messages.size() == 2);
    CHECK(messages[0]["command"] == "error");
    CHECK(messages[0]["message"] == "unknown exception");
    CHECK(messages[1] == webio::close_session_message());
    CHECK(session.closed());
  }

  SECTION("should time out pushing into a full queue") {
    auto release = std::make_shared<std::promise<void>>();
    auto gate    = release->get_future().share();

    auto opts = webio::thread_session::options();
    opts.event_queue_capacity = 1;
    opts.push_timeout         = 50ms;

    auto session = webio::thread_session(
      [gate](webio::thread_session::context& ctx) -> void {
        gate.wait();
        while (true) {
          ctx.next_event();
        }
      },
      opts);

    auto ec = error_code();
    session.push({{"event", "first"}}, ec);
    CHECK(!ec);

    auto const started = std::chrono::steady_clock::now();
    session.push({{"event", "second"}}, ec);
    CHECK(ec == errc::event_queue_full);
    CHECK(std::chrono::steady_clock::now() - started >= 50ms);

    release->set_value();
  }

  SECTION("should unblock a waiting application on teardown") {
    auto unwound = std::make_shared<std::atomic<bool>>(false);

    {
      auto session = webio::thread_session(
        [unwound](webio::thread_session::context& ctx) -> void {
          try {
            ctx.next_event();
          } catch (system_error const& e) {
            if (e.code() == errc::session_closed) {
              unwound->store(true);
            }
            throw;
          }
        });

      std::this_thread::sleep_for(20ms);
    }

    auto const until = std::chrono::steady_clock::now() + 5s;
    while (!unwound->load() && std::chrono::steady_clock::now() < until) {
      std::this_thread::sleep_for(5ms);
    }
    CHECK(unwound->load());
  }

  SECTION("should give up waiting for an event after a timeout") {
    auto result = std::make_shared<std::promise<bool>>();
    auto timed_out = result->get_future();

    auto session = webio::thread_session(
      [result](webio::thread_session::context& ctx) -> void {
        result->set_value(!ctx.next_event(20ms).has_value());
      });

    REQUIRE(timed_out.wait_for(5s) == std::future_status::ready);
    CHECK(timed_out.get());
  }

  SECTION("should build sessions through its factory") {
    auto factory = webio::thread_session::factory(
      echo_entry(), webio::thread_session::options());

    auto a = factory();
    auto b = factory();

    REQUIRE(a);
    REQUIRE(b);
    CHECK(a != b);
  }
}
