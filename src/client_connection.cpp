#include "webio/client_connection.hpp"

webio::client_connection::client_connection(executor_type const& executor)
: detail::connection(executor)
{
}

webio::client_connection::client_connection(
  executor_type const&       executor,
  boost::asio::ssl::context& ctx)
: detail::connection(executor, ctx)
{
}

auto webio::client_connection::shutdown(
  boost::system::error_code& ec) -> void {

  auto& multi_stream = s_->stream;

  multi_stream
    .stream()
    .shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
}
