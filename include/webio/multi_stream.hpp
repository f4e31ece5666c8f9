#ifndef WEBIO_MULTI_STREAM_HPP_
#define WEBIO_MULTI_STREAM_HPP_

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/context.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <utility>
#include <optional>

namespace webio {

// multi_stream is a dual-stream type that is either a plain TCP socket or a
// TLS stream layered over one, decided once at construction time
//
// multi_stream meets the requirements of AsyncStream
//
// it is neither copyable nor movable; it lives inside the shared state of a
// connection and is always constructed in place
//
struct multi_stream {

public:
  using stream_type     = boost::asio::ip::tcp::socket;
  using ssl_stream_type = boost::asio::ssl::stream<stream_type>;
  using executor_type   = stream_type::executor_type;

private:
  std::optional<stream_type>     stream_;
  std::optional<ssl_stream_type> ssl_stream_;

public:
  multi_stream()                    = delete;
  multi_stream(multi_stream const&) = delete;
  multi_stream(multi_stream&&)      = delete;

  // unconnected streams, used by clients
  //
  explicit
  multi_stream(executor_type const& executor);

  multi_stream(executor_type const& executor, boost::asio::ssl::context& ctx);

  // already-accepted sockets, used by the server
  //
  explicit
  multi_stream(stream_type socket);

  multi_stream(stream_type socket, boost::asio::ssl::context& ctx);

  auto get_executor() -> executor_type;

  template <
    typename MutableBufferSequence,
    typename ReadHandler
  >
  auto async_read_some(
    MutableBufferSequence const& buffers,
    ReadHandler&&                handler
  ) {
    if (is_ssl()) {
      return ssl_stream_->async_read_some(
        buffers, std::forward<ReadHandler>(handler));
    }
    return stream_->async_read_some(
      buffers, std::forward<ReadHandler>(handler));
  }

  template<
    typename ConstBufferSequence,
    typename WriteHandler
  >
  auto async_write_some(
    ConstBufferSequence const& buffers,
    WriteHandler&&             handler
  ) {
    if (is_ssl()) {
      return ssl_stream_->async_write_some(
        buffers, std::forward<WriteHandler>(handler));
    }
    return stream_->async_write_some(
      buffers, std::forward<WriteHandler>(handler));
  }

  auto is_ssl() const -> bool;

  // the TCP layer, regardless of whether TLS sits on top of it
  //
  auto stream() &     -> stream_type&;
  auto ssl_stream() & -> ssl_stream_type&;
};

} // webio

#endif // WEBIO_MULTI_STREAM_HPP_
