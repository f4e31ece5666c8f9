#include "webio/server_connection.hpp"

#include <utility>

template <typename HandshakeHandler>
auto webio::server_connection::async_handshake(
  HandshakeHandler&& handshake_handler
) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
  HandshakeHandler, void(boost::system::error_code)
) {
  namespace ssl = boost::asio::ssl;

  return s_->stream.ssl_stream().async_handshake(
    ssl::stream_base::server,
    std::forward<HandshakeHandler>(handshake_handler));
}

template <typename ShutdownHandler>
auto webio::server_connection::async_ssl_shutdown(
  ShutdownHandler&& shutdown_handler
) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
  ShutdownHandler, void(boost::system::error_code)
) {
  return s_->stream.ssl_stream().async_shutdown(
    std::forward<ShutdownHandler>(shutdown_handler));
}
