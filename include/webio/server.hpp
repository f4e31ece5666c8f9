#ifndef WEBIO_SERVER_HPP_
#define WEBIO_SERVER_HPP_

#include "webio/config.hpp"
#include "webio/dispatcher.hpp"
#include "webio/task_runner.hpp"
#include "webio/server_connection.hpp"
#include "webio/thread_session.hpp"
#include "webio/session_registry.hpp"
#include "webio/coroutine_session.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <mutex>
#include <thread>
#include <vector>
#include <optional>

namespace webio {

// the application a server hosts, one entry point per execution model; only
// the one matching `server_config::session_type` has to be set
//
struct application {
  thread_session::entry_point    thread_entry;
  coroutine_session::entry_point coroutine_entry;
};

// server owns everything a running webio instance needs: the HTTP threads,
// the acceptor, the session registry, the dispatcher and, for coroutine
// sessions, the task runner
//
// the listening socket is bound on construction so `local_endpoint` is
// meaningful before `start` (useful with port 0)
//
struct server {
public:
  using acceptor_type = boost::asio::ip::tcp::acceptor;
  using endpoint_type = boost::asio::ip::tcp::endpoint;

private:
  server_config                            config_;
  task_runner                              runner_;
  boost::asio::io_context                  io_;
  std::optional<boost::asio::ssl::context> ssl_ctx_;
  session_registry                         registry_;
  dispatcher                               dispatcher_;
  acceptor_type                            acceptor_;

  std::mutex               mtx_;
  std::vector<std::thread> threads_;
  bool                     stopped_ = false;

  auto make_factory(application app) -> session_factory;

  auto accept() -> awaitable<void>;

  auto route(dispatcher::request_type const& request)
    -> dispatcher::response_type;

  auto serve(server_connection conn) -> awaitable<void>;

public:
  // throws `boost::system::system_error` when the address cannot be bound,
  // the TLS files cannot be loaded or `app` lacks the configured entry point
  //
  server(server_config config, application app);

  server()              = delete;
  server(server const&) = delete;
  server(server&&)      = delete;

  ~server();

  // spawns the HTTP threads and, if needed, the task runner
  //
  auto start() -> void;

  // stops accepting, abandons open connections and joins every thread;
  // registered sessions stay alive until the server is destroyed
  //
  auto stop() -> void;

  auto local_endpoint() const -> endpoint_type;
  auto config() const -> server_config const&;
  auto registry() -> session_registry&;
};

} // webio

#endif // WEBIO_SERVER_HPP_
