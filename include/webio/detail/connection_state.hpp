#ifndef WEBIO_DETAIL_CONNECTION_STATE_HPP_
#define WEBIO_DETAIL_CONNECTION_STATE_HPP_

#include "webio/multi_stream.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/context.hpp>

#include <boost/beast/core/flat_buffer.hpp>

namespace webio {
namespace detail {

struct connection_state {
  using timer_type    = boost::asio::steady_timer;
  using buffer_type   = boost::beast::flat_buffer;
  using stream_type   = multi_stream;
  using executor_type = multi_stream::executor_type;

  // `stream` must be declared first, the timer borrows its executor
  //
  stream_type stream;
  timer_type  timer;
  buffer_type buffer;

  connection_state()                        = delete;
  connection_state(connection_state const&) = delete;
  connection_state(connection_state&&)      = delete;

  explicit
  connection_state(executor_type const& executor);

  connection_state(
    executor_type const&       executor,
    boost::asio::ssl::context& ctx);

  explicit
  connection_state(stream_type::stream_type socket);

  connection_state(
    stream_type::stream_type   socket,
    boost::asio::ssl::context& ctx);
};

} // detail
} // webio

#endif // WEBIO_DETAIL_CONNECTION_STATE_HPP_
