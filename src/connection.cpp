#include "webio/detail/connection.hpp"

webio::detail::connection::connection(executor_type const& executor)
: s_(std::make_shared<connection_state>(executor))
{
}

webio::detail::connection::connection(
  executor_type const&       executor,
  boost::asio::ssl::context& ctx)
: s_(std::make_shared<connection_state>(executor, ctx))
{
}

webio::detail::connection::connection(stream_type::stream_type socket)
: s_(std::make_shared<connection_state>(std::move(socket)))
{
}

webio::detail::connection::connection(
  stream_type::stream_type   socket,
  boost::asio::ssl::context& ctx)
: s_(std::make_shared<connection_state>(std::move(socket), ctx))
{
}

auto webio::detail::connection::get_executor() -> executor_type {
  return s_->stream.get_executor();
}

auto webio::detail::connection::is_ssl() const -> bool {
  return s_->stream.is_ssl();
}
