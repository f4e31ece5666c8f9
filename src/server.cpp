#include "webio/server.hpp"

#include "webio/log.hpp"
#include "webio/error.hpp"
#include "webio/query.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ssl/error.hpp>

#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>

#include <boost/system/system_error.hpp>

#include <string>
#include <utility>
#include <exception>
#include <string_view>

namespace asio  = boost::asio;
namespace ssl   = asio::ssl;
namespace beast = boost::beast;
namespace http  = beast::http;

using boost::system::error_code;
using boost::system::system_error;

namespace {

// the ways a client legitimately goes away; not worth a log line
//
auto is_disconnect(error_code const ec) -> bool {
  return ec == http::error::end_of_stream
      || ec == asio::error::eof
      || ec == asio::error::operation_aborted
      || ec == asio::error::bad_descriptor
      || ec == asio::error::connection_reset
      || ec == ssl::error::stream_truncated;
}

auto make_ssl_context(webio::tls_config const& tls) -> ssl::context {
  auto ctx = ssl::context(ssl::context::tls_server);

  ctx.set_options(
    ssl::context::default_workarounds |
    ssl::context::no_sslv2 |
    ssl::context::no_sslv3);

  ctx.use_certificate_chain_file(tls.cert_path);
  ctx.use_private_key_file(tls.key_path, ssl::context::pem);

  return ctx;
}

auto plain_response(
  webio::dispatcher::request_type const& request,
  http::status const                     status,
  std::string                            body)
  -> webio::dispatcher::response_type {

  auto response = webio::dispatcher::response_type(status, request.version());
  response.set(http::field::content_type, "text/plain");
  response.keep_alive(request.keep_alive());
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

} // anonymous

webio::server::server(server_config config, application app)
: config_(std::move(config))
, ssl_ctx_(
    config_.tls
    ? std::optional<ssl::context>(make_ssl_context(*config_.tls))
    : std::nullopt)
, dispatcher_(
    registry_,
    make_factory(std::move(app)),
    dispatcher_options{
      config_.session_expire, config_.sweep_interval, config_.verbose})
, acceptor_(
    io_,
    endpoint_type(asio::ip::make_address(config_.host), config_.port),
    true)
{
}

webio::server::~server() {
  stop();
}

auto webio::server::make_factory(application app) -> session_factory {
  if (config_.session_type == session_kind::thread) {
    if (!app.thread_entry) {
      throw system_error(
        error::errc::invalid_config,
        "session_type is thread but the application has no thread entry point");
    }

    return thread_session::factory(
      std::move(app.thread_entry),
      thread_session::options{
        config_.event_queue_capacity, config_.push_timeout});
  }

  if (!app.coroutine_entry) {
    throw system_error(
      error::errc::invalid_config,
      "session_type is coroutine but the application has no coroutine entry point");
  }

  auto executor = config_.coroutine_thread
    ? coroutine_session::executor_type(runner_.get_executor())
    : coroutine_session::executor_type(io_.get_executor());

  return coroutine_session::factory(executor, std::move(app.coroutine_entry));
}

auto webio::server::start() -> void {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  if (stopped_ || !threads_.empty()) {
    return;
  }

  if (config_.session_type == session_kind::coroutine &&
      config_.coroutine_thread) {
    runner_.start();
  }

  webio::co_spawn(io_, accept(), webio::detached);

  threads_.reserve(config_.threads);
  for (auto i = std::size_t{0}; i < config_.threads; ++i) {
    threads_.emplace_back([this]() -> void {
      while (true) {
        try {
          io_.run();
          break;
        } catch (std::exception const& e) {
          webio::log_error(std::string("HTTP handler threw: ") + e.what());
        } catch (...) {
          webio::log_error("HTTP handler threw a non-exception");
        }
      }
    });
  }

  webio::log_info(
    "listening on " + local_endpoint().address().to_string() + ":" +
    std::to_string(local_endpoint().port()) + config_.io_path +
    (ssl_ctx_ ? " (https)" : ""));
}

auto webio::server::stop() -> void {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  if (stopped_) {
    return;
  }
  stopped_ = true;

  io_.stop();
  for (auto& thread : threads_) {
    thread.join();
  }
  threads_.clear();

  // nothing else touches the acceptor once the threads are gone
  //
  auto ec = error_code();
  acceptor_.close(ec);

  runner_.stop();
}

auto webio::server::local_endpoint() const -> endpoint_type {
  return acceptor_.local_endpoint();
}

auto webio::server::config() const -> server_config const& {
  return config_;
}

auto webio::server::registry() -> session_registry& {
  return registry_;
}

auto webio::server::accept() -> awaitable<void> {
  auto ec          = error_code();
  auto error_token = webio::redirect_error(webio::use_awaitable, ec);

  while (true) {
    // every connection gets a strand of its own; the idle deadline timer
    // borrows it from the socket
    //
    auto socket = asio::ip::tcp::socket(asio::make_strand(io_));

    co_await acceptor_.async_accept(socket, error_token);
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        webio::log_error(ec, "connection acceptance");
      }
      break;
    }

    auto executor = socket.get_executor();

    auto conn = ssl_ctx_
      ? server_connection(std::move(socket), *ssl_ctx_)
      : server_connection(std::move(socket));

    webio::co_spawn(executor, serve(std::move(conn)), webio::detached);
  }
}

auto webio::server::route(dispatcher::request_type const& request)
  -> dispatcher::response_type {

  auto const target = request.target();
  auto const path   = webio::split_target(
    std::string_view(target.data(), target.size())).first;

  if (path == config_.io_path) {
    try {
      return dispatcher_.handle(request);
    } catch (std::exception const& e) {
      webio::log_error(std::string("dispatching request threw: ") + e.what());
    } catch (...) {
      webio::log_error("dispatching request threw a non-exception");
    }

    return plain_response(
      request, http::status::internal_server_error, "Internal server error\n");
  }

  return plain_response(request, http::status::not_found, "Not found\n");
}

auto webio::server::serve(server_connection conn) -> awaitable<void> {
  auto ec          = error_code();
  auto error_token = webio::redirect_error(webio::use_awaitable, ec);

  auto const timeout = config_.connection_timeout;

  if (conn.is_ssl()) {
    conn.expires_after(timeout);
    co_await conn.async_handshake(error_token);
    if (ec) {
      if (!is_disconnect(ec)) {
        webio::log_error(ec, "TLS handshake");
      }
      conn.cancel_expiry();
      co_return;
    }
  }

  while (true) {
    conn.expires_after(timeout);

    auto parser = http::request_parser<http::string_body>();

    co_await conn.async_read(parser, error_token);
    if (ec) {
      if (!is_disconnect(ec)) {
        webio::log_error(ec, "reading request");
      }
      break;
    }

    // a thread session push may take a while, that is not the client idling
    //
    conn.cancel_expiry();

    auto request  = parser.release();
    auto response = route(request);

    conn.expires_after(timeout);
    co_await conn.async_write(response, error_token);
    if (ec) {
      if (!is_disconnect(ec)) {
        webio::log_error(ec, "writing response");
      }
      break;
    }

    if (!response.keep_alive()) {
      break;
    }
  }

  conn.cancel_expiry();

  if (conn.is_ssl()) {
    co_await conn.async_ssl_shutdown(error_token);
    co_return;
  }

  auto shutdown_ec = error_code();
  conn.shutdown(shutdown_ec);
}
