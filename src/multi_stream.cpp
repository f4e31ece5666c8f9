#include "webio/multi_stream.hpp"

webio::multi_stream::multi_stream(executor_type const& executor)
: stream_(std::in_place, executor)
{
}

webio::multi_stream::multi_stream(
  executor_type const&       executor,
  boost::asio::ssl::context& ctx)
: ssl_stream_(std::in_place, executor, ctx)
{
}

webio::multi_stream::multi_stream(stream_type socket)
: stream_(std::in_place, std::move(socket))
{
}

webio::multi_stream::multi_stream(
  stream_type                socket,
  boost::asio::ssl::context& ctx)
: ssl_stream_(std::in_place, std::move(socket), ctx)
{
}

auto webio::multi_stream::get_executor() -> executor_type {
  return stream().get_executor();
}

auto webio::multi_stream::is_ssl() const -> bool {
  return ssl_stream_.has_value();
}

auto webio::multi_stream::stream() & -> stream_type& {
  if (is_ssl()) {
    return ssl_stream_->next_layer();
  }
  return *stream_;
}

auto webio::multi_stream::ssl_stream() & -> ssl_stream_type& {
  return *ssl_stream_;
}
