#include "webio/server.hpp"
#include "webio/coroutine.hpp"
#include "webio/dispatcher.hpp"
#include "webio/client_connection.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <chrono>
#include <string>
#include <optional>

#include <catch2/catch.hpp>

namespace asio = boost::asio;
namespace http = boost::beast::http;

using namespace std::chrono_literals;

using boost::system::error_code;

namespace {

using response_type = http::response<http::string_body>;

auto echo_application() -> webio::application {
  auto app = webio::application();

  app.thread_entry = [](webio::thread_session::context& ctx) -> void {
    while (true) {
      auto ev = ctx.next_event();
      if (ev.value("event", std::string()) == "close") {
        return;
      }
      ctx.send({{"command", "output"}, {"echo", ev}});
    }
  };

  app.coroutine_entry =
    [](webio::coroutine_session::context& ctx) -> webio::awaitable<void> {
      while (true) {
        auto ev = co_await ctx.next_event();
        if (ev.value("event", std::string()) == "close") {
          co_return;
        }
        ctx.send({{"command", "output"}, {"echo", ev}});
      }
    };

  return app;
}

auto exchange(
  webio::client_connection&         conn,
  http::verb const                  method,
  std::string const&                target,
  std::optional<std::string> const& id,
  std::string const&                body,
  error_code&                       ec) -> webio::awaitable<response_type> {

  auto request = http::request<http::string_body>(method, target, 11);
  request.set(http::field::host, "127.0.0.1");
  if (id) {
    request.set(webio::session_id_header, *id);
  }
  request.body() = body;
  request.prepare_payload();

  auto parser = http::response_parser<http::string_body>();

  co_await conn.async_request(
    request, parser, webio::redirect_error(webio::use_awaitable, ec));

  co_return parser.release();
}

// drives a whole conversation through a running server over one keep-alive
// connection; `done` is only set if every step went through
//
auto converse(std::uint16_t const port, bool& done)
  -> webio::awaitable<void> {

  auto executor = co_await webio::this_coro::executor;

  auto ec   = error_code();
  auto conn = webio::client_connection(executor);

  co_await conn.async_connect(
    "127.0.0.1", std::to_string(port),
    webio::redirect_error(webio::use_awaitable, ec));
  REQUIRE(!ec);

  auto none = std::optional<std::string>();

  auto probe = co_await exchange(
    conn, http::verb::get, "/io?test=1", none, "", ec);
  REQUIRE(!ec);
  CHECK(probe.body() == "ok");

  auto missing = co_await exchange(
    conn, http::verb::get, "/elsewhere", none, "", ec);
  REQUIRE(!ec);
  CHECK(missing.result() == http::status::not_found);

  auto start = co_await exchange(conn, http::verb::get, "/io", none, "", ec);
  REQUIRE(!ec);
  REQUIRE(start.result() == http::status::ok);

  auto const header = start.find(webio::session_id_header);
  REQUIRE(header != start.end());
  auto const id = std::optional<std::string>(header->value().to_string());

  auto pushed = co_await exchange(
    conn, http::verb::post, "/io", id, R"({"event":"click"})", ec);
  REQUIRE(!ec);
  CHECK(pushed.result() == http::status::ok);

  auto timer    = asio::steady_timer(executor);
  auto received = nlohmann::json::array();

  for (auto i = 0; i < 500 && received.empty(); ++i) {
    auto const body = nlohmann::json::parse(pushed.body());
    for (auto const& msg : body) {
      received.push_back(msg);
    }

    if (!received.empty()) {
      break;
    }

    timer.expires_after(10ms);
    co_await timer.async_wait(webio::redirect_error(webio::use_awaitable, ec));

    pushed = co_await exchange(conn, http::verb::get, "/io", id, "", ec);
    REQUIRE(!ec);
  }

  REQUIRE(received.size() == 1);
  CHECK(received[0]["echo"]["event"] == "click");

  auto closing = co_await exchange(
    conn, http::verb::post, "/io", id, R"({"event":"close"})", ec);
  REQUIRE(!ec);

  auto closed = false;
  for (auto i = 0; i < 500 && !closed; ++i) {
    for (auto const& msg : nlohmann::json::parse(closing.body())) {
      closed = closed || msg["command"] == "close_session";
    }

    if (closed) {
      break;
    }

    timer.expires_after(10ms);
    co_await timer.async_wait(webio::redirect_error(webio::use_awaitable, ec));

    closing = co_await exchange(conn, http::verb::get, "/io", id, "", ec);
    REQUIRE(!ec);
  }
  CHECK(closed);

  // the conversation is over, the identifier is now unknown
  //
  auto after = co_await exchange(conn, http::verb::get, "/io", id, "", ec);
  REQUIRE(!ec);
  CHECK(nlohmann::json::parse(after.body()) ==
    nlohmann::json::array({ webio::close_session_message() }));

  conn.shutdown(ec);
  done = true;
}

auto loopback_config(webio::session_kind const kind) -> webio::server_config {
  auto config = webio::server_config();
  config.host         = "127.0.0.1";
  config.port         = 0;
  config.threads      = 2;
  config.session_type = kind;
  return config;
}

} // anonymous

TEST_CASE("Our webio server") {

  SECTION("should bind an ephemeral port before starting") {
    auto server = webio::server(
      loopback_config(webio::session_kind::thread), echo_application());

    CHECK(server.local_endpoint().port() != 0);
  }

  SECTION("should hold a conversation with thread sessions") {
    auto server = webio::server(
      loopback_config(webio::session_kind::thread), echo_application());
    server.start();

    auto io   = asio::io_context();
    auto done = false;

    webio::co_spawn(
      io, converse(server.local_endpoint().port(), done), webio::detached);
    io.run();

    CHECK(done);
    CHECK(server.registry().size() == 0);
    server.stop();
  }

  SECTION("should hold a conversation with coroutine sessions") {
    auto server = webio::server(
      loopback_config(webio::session_kind::coroutine), echo_application());
    server.start();

    auto io   = asio::io_context();
    auto done = false;

    webio::co_spawn(
      io, converse(server.local_endpoint().port(), done), webio::detached);
    io.run();

    CHECK(done);
    server.stop();
  }

  SECTION("should run coroutine sessions on the HTTP threads if asked to") {
    auto config = loopback_config(webio::session_kind::coroutine);
    config.coroutine_thread = false;

    auto server = webio::server(config, echo_application());
    server.start();

    auto io   = asio::io_context();
    auto done = false;

    webio::co_spawn(
      io, converse(server.local_endpoint().port(), done), webio::detached);
    io.run();

    CHECK(done);
    server.stop();
  }

  SECTION("should refuse an application without the configured entry point") {
    auto app = webio::application();

    CHECK_THROWS_AS(
      webio::server(loopback_config(webio::session_kind::thread), app),
      boost::system::system_error);
  }
}
