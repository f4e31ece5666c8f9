#ifndef WEBIO_DETAIL_CONNECTION_HPP_
#define WEBIO_DETAIL_CONNECTION_HPP_

#include "webio/coroutine.hpp"
#include "webio/type_traits.hpp"
#include "webio/detail/connection_state.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/asio/ssl/context.hpp>

#include <boost/system/error_code.hpp>

#include <memory>
#include <type_traits>

namespace webio {
namespace detail {

// connection is the handle shared by the server and client sides of an HTTP
// connection
//
// copies are cheap and refer to the same underlying state, which stays alive
// for as long as any copy or any in-flight operation holds it
//
struct connection {
protected:
  std::shared_ptr<connection_state> s_;

public:
  using timer_type    = connection_state::timer_type;
  using buffer_type   = connection_state::buffer_type;
  using stream_type   = connection_state::stream_type;
  using executor_type = connection_state::executor_type;

  connection()                  = delete;
  connection(connection const&) = default;
  connection(connection&&)      = default;

  explicit
  connection(executor_type const& executor);

  // when constructed with an SSL context, the connection will use the TLS
  // side of the `webio::multi_stream`
  //
  connection(executor_type const& executor, boost::asio::ssl::context& ctx);

  explicit
  connection(stream_type::stream_type socket);

  connection(
    stream_type::stream_type   socket,
    boost::asio::ssl::context& ctx);

  auto get_executor() -> executor_type;
  auto is_ssl() const -> bool;

  template <
    typename Message,
    typename WriteHandler,
    std::enable_if_t<webio::is_message_v<Message>, int> = 0
  >
  auto
  async_write(
    Message&       message,
    WriteHandler&& write_handler
  ) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
    WriteHandler, void(boost::system::error_code));

  template <
    typename Parser,
    typename ReadHandler
  >
  auto
  async_read(
    Parser&       parser,
    ReadHandler&& read_handler
  ) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
    ReadHandler, void(boost::system::error_code));
};

} // detail
} // webio

#include "webio/impl/connection.impl.hpp"

#endif // WEBIO_DETAIL_CONNECTION_HPP_
