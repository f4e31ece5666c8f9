#ifndef WEBIO_CLIENT_CONNECTION_HPP_
#define WEBIO_CLIENT_CONNECTION_HPP_

#include "webio/coroutine.hpp"
#include "webio/multi_stream.hpp"
#include "webio/detail/connection.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/ssl/context.hpp>

#include <boost/system/error_code.hpp>

#include <string>

namespace webio {

struct client_connection : public detail::connection {

public:
  using timer_type    = detail::connection_state::timer_type;
  using buffer_type   = detail::connection_state::buffer_type;
  using stream_type   = detail::connection_state::stream_type;
  using executor_type = detail::connection_state::executor_type;

  // client connections cannot be default-constructed as they require an
  // executor
  //
  client_connection()                         = delete;

  client_connection(client_connection const&) = default;
  client_connection(client_connection&&)      = default;

  explicit
  client_connection(executor_type const& executor);

  // when constructed with an SSL context, the `client_connection` will
  // perform an SSL handshake with the remote when calling `async_connect`
  //
  client_connection(
    executor_type const&       executor,
    boost::asio::ssl::context& ctx);

  // `async_connect` performs forward name resolution on the specified host
  // and then attempts to form a TCP connection
  // `service` is the same as the original `asio::async_connect` function
  //
  template <typename ConnectHandler>
  auto async_connect(
    std::string      host,
    std::string      service,
    ConnectHandler&& connect_handler
  ) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
    ConnectHandler,
    void(boost::system::error_code, boost::asio::ip::tcp::endpoint));

  // `async_request` writes a `http::request` to the remotely connected host
  // and then uses the supplied `http::response_parser` to store the response
  //
  template <
    typename Request,
    typename ResponseParser,
    typename RequestHandler
  >
  auto async_request(
    Request&         request,
    ResponseParser&  parser,
    RequestHandler&& request_handler
  ) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
    RequestHandler, void(boost::system::error_code));

  // use `shutdown` in the case of a non-SSL `client_connection`
  //
  auto shutdown(boost::system::error_code& ec) -> void;

  template <typename ShutdownHandler>
  auto async_ssl_shutdown(
    ShutdownHandler&& shutdown_handler
  ) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
    ShutdownHandler, void(boost::system::error_code));
};

} // webio

#include "webio/impl/client_connection.impl.hpp"

#endif // WEBIO_CLIENT_CONNECTION_HPP_
