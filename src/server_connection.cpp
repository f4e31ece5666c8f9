#include "webio/server_connection.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace asio = boost::asio;

using boost::system::error_code;

webio::server_connection::server_connection(stream_type::stream_type socket)
: detail::connection(std::move(socket))
{
}

webio::server_connection::server_connection(
  stream_type::stream_type   socket,
  boost::asio::ssl::context& ctx)
: detail::connection(std::move(socket), ctx)
{
}

auto webio::server_connection::expires_after(
  std::chrono::steady_clock::duration timeout) -> void {

  auto& timer = s_->timer;
  timer.expires_after(timeout);

  // the timer shares the socket's executor (the connection strand), so the
  // close below never races the connection's own operations
  //
  timer.async_wait([s = s_](error_code ec) -> void {
    if (ec == asio::error::operation_aborted) {
      return;
    }

    // re-armed after this wait had already completed
    //
    if (s->timer.expiry() > timer_type::clock_type::now()) {
      return;
    }

    auto close_ec = error_code();
    s->stream.stream().close(close_ec);
  });
}

auto webio::server_connection::cancel_expiry() -> void {
  s_->timer.cancel();
}

auto webio::server_connection::shutdown(error_code& ec) -> void {
  auto& multi_stream = s_->stream;

  multi_stream
    .stream()
    .shutdown(asio::ip::tcp::socket::shutdown_send, ec);
}
