#ifndef WEBIO_SERVER_CONNECTION_HPP_
#define WEBIO_SERVER_CONNECTION_HPP_

#include "webio/coroutine.hpp"
#include "webio/multi_stream.hpp"
#include "webio/detail/connection.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/asio/ssl/context.hpp>

#include <boost/system/error_code.hpp>

#include <chrono>

namespace webio {

// the server side of an accepted HTTP connection
//
struct server_connection : public detail::connection {

public:
  using timer_type    = detail::connection_state::timer_type;
  using buffer_type   = detail::connection_state::buffer_type;
  using stream_type   = detail::connection_state::stream_type;
  using executor_type = detail::connection_state::executor_type;

  server_connection()                         = delete;
  server_connection(server_connection const&) = default;
  server_connection(server_connection&&)      = default;

  explicit
  server_connection(stream_type::stream_type socket);

  // connections constructed with an SSL context must complete
  // `async_handshake` before anything is read and should be closed with
  // `async_ssl_shutdown`
  //
  server_connection(
    stream_type::stream_type   socket,
    boost::asio::ssl::context& ctx);

  template <typename HandshakeHandler>
  auto async_handshake(
    HandshakeHandler&& handshake_handler
  ) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
    HandshakeHandler, void(boost::system::error_code));

  template <typename ShutdownHandler>
  auto async_ssl_shutdown(
    ShutdownHandler&& shutdown_handler
  ) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
    ShutdownHandler, void(boost::system::error_code));

  // arms the idle deadline: unless re-armed or cancelled within `timeout`,
  // the TCP layer is closed and any pending operation completes with an
  // error
  //
  auto expires_after(std::chrono::steady_clock::duration timeout) -> void;
  auto cancel_expiry() -> void;

  auto shutdown(boost::system::error_code& ec) -> void;
};

} // webio

#include "webio/impl/server_connection.impl.hpp"

#endif // WEBIO_SERVER_CONNECTION_HPP_
