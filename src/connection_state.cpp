#include "webio/detail/connection_state.hpp"

webio::detail::connection_state::connection_state(
  executor_type const& executor)
: stream(executor)
, timer(stream.get_executor())
{
}

webio::detail::connection_state::connection_state(
  executor_type const&       executor,
  boost::asio::ssl::context& ctx)
: stream(executor, ctx)
, timer(stream.get_executor())
{
}

webio::detail::connection_state::connection_state(
  stream_type::stream_type socket)
: stream(std::move(socket))
, timer(stream.get_executor())
{
}

webio::detail::connection_state::connection_state(
  stream_type::stream_type   socket,
  boost::asio::ssl::context& ctx)
: stream(std::move(socket), ctx)
, timer(stream.get_executor())
{
}
