#include "webio/log.hpp"
#include "webio/query.hpp"
#include "webio/config.hpp"
#include "webio/server.hpp"
#include "webio/coroutine.hpp"
#include "webio/client_connection.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>

#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/string_body.hpp>

#include <boost/system/system_error.hpp>

#include <csignal>
#include <string>
#include <optional>
#include <iostream>

namespace asio  = boost::asio;
namespace ssl   = asio::ssl;
namespace beast = boost::beast;
namespace http  = beast::http;

using boost::system::error_code;
using boost::system::system_error;

namespace {

auto welcome() -> webio::message {
  return {
    {"command", "output"},
    {"type",    "text"},
    {"content", "connected, every event you send is echoed back"}
  };
}

auto echo(webio::event const& ev) -> webio::message {
  return {
    {"command", "output"},
    {"type",    "text"},
    {"content", ev.dump()}
  };
}

auto is_close(webio::event const& ev) -> bool {
  return ev.is_object() && ev.value("event", std::string()) == "close";
}

// the demo application: echo until the client asks to close
//
auto demo_application() -> webio::application {
  auto app = webio::application();

  app.thread_entry = [](webio::thread_session::context& ctx) -> void {
    ctx.send(welcome());

    while (true) {
      auto ev = ctx.next_event();
      if (is_close(ev)) {
        return;
      }
      ctx.send(echo(ev));
    }
  };

  app.coroutine_entry =
    [](webio::coroutine_session::context& ctx) -> webio::awaitable<void> {
      ctx.send(welcome());

      while (true) {
        auto ev = co_await ctx.next_event();
        if (is_close(ev)) {
          co_return;
        }
        ctx.send(echo(ev));
      }
    };

  return app;
}

// GET <io_path>?test=1 against a running server; healthy iff it answers "ok"
//
auto probe(std::string const& authority, webio::server_config const& config)
  -> int {

  auto host = std::string();
  auto port = std::string();

  if (!webio::parse_host_port(authority, host, port)) {
    std::cerr << "--probe: expected host:port, got \"" << authority << "\"\n";
    return 1;
  }

  auto io      = asio::io_context();
  auto ctx     = std::optional<ssl::context>();
  auto healthy = false;

  if (config.tls) {
    ctx.emplace(ssl::context::tls_client);
    ctx->set_verify_mode(ssl::verify_none);
  }

  webio::co_spawn(
    io,
    [&]() -> webio::awaitable<void> {
      auto ec          = error_code();
      auto error_token = webio::redirect_error(webio::use_awaitable, ec);

      auto conn = ctx
        ? webio::client_connection(io.get_executor(), *ctx)
        : webio::client_connection(io.get_executor());

      co_await conn.async_connect(host, port, error_token);
      if (ec) {
        webio::log_error(ec, "probe connect");
        co_return;
      }

      auto request = http::request<http::empty_body>(
        http::verb::get, config.io_path + "?test=1", 11);

      request.set(http::field::host, host);
      request.keep_alive(false);

      auto parser = http::response_parser<http::string_body>();

      co_await conn.async_request(request, parser, error_token);
      if (ec) {
        webio::log_error(ec, "probe request");
        co_return;
      }

      auto& response = parser.get();
      healthy =
        response.result() == http::status::ok && response.body() == "ok";

      if (conn.is_ssl()) {
        co_await conn.async_ssl_shutdown(error_token);
      } else {
        conn.shutdown(ec);
      }
    },
    webio::detached);

  io.run();

  std::cout << (healthy ? "ok" : "unhealthy") << "\n";
  return healthy ? 0 : 1;
}

} // anonymous

int main(int argc, char** argv) {
  auto cmd    = webio::command_line();
  auto config = webio::server_config();

  try {
    cmd = webio::parse_command_line(argc, argv);
    if (cmd.help) {
      std::cout << webio::usage();
      return 0;
    }

    config = webio::resolve_config(cmd);

  } catch (system_error const& e) {
    std::cerr << e.what() << "\n\n" << webio::usage();
    return 1;
  }

  if (cmd.probe) {
    return probe(*cmd.probe, config);
  }

  try {
    auto server = webio::server(config, demo_application());

    // signals are waited on here, away from the HTTP threads
    //
    auto signals_io = asio::io_context(1);
    auto signals    = asio::signal_set(signals_io, SIGINT, SIGTERM);

    signals.async_wait([&](error_code ec, int signal) -> void {
      if (!ec) {
        webio::log_info("caught signal " + std::to_string(signal) + ", stopping");
      }
      server.stop();
    });

    server.start();
    signals_io.run();

  } catch (system_error const& e) {
    webio::log_error(e.code(), e.what());
    return 1;
  }

  return 0;
}
