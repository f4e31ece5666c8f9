#include "webio/detail/connection.hpp"
#include "webio/detail/get_strand.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/associated_executor.hpp>

#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/core/bind_handler.hpp>

#include <boost/core/ignore_unused.hpp>

template <
  typename Message,
  typename WriteHandler,
  std::enable_if_t<webio::is_message_v<Message>, int>
>
auto
webio::detail::connection::async_write(
  Message&       message,
  WriteHandler&& write_handler
) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
  WriteHandler, void(boost::system::error_code)
) {
  using boost::system::error_code;
  using boost::ignore_unused;

  namespace beast = boost::beast;
  namespace asio  = boost::asio;
  namespace http  = beast::http;

  return asio::async_initiate<WriteHandler, void(error_code)>(
    [&message, s = s_](auto handler) mutable -> void {

      auto strand = webio::detail::get_strand(
        handler, s->stream.get_executor());

      webio::co_spawn(
        strand,
        [
          &message,
          s       = std::move(s),
          handler = std::move(handler)
        ]() mutable -> webio::awaitable<void> {

          auto executor =
            asio::get_associated_executor(handler, s->stream.get_executor());

          auto ec          = error_code();
          auto error_token = webio::redirect_error(webio::use_awaitable, ec);

          ignore_unused(
            co_await http::async_write(s->stream, message, error_token));

          asio::post(
            executor, beast::bind_handler(std::move(handler), ec));
        },
        webio::detached);
    },
    write_handler);
}

template <
  typename Parser,
  typename ReadHandler
>
auto
webio::detail::connection::async_read(
  Parser&       parser,
  ReadHandler&& read_handler
) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
  ReadHandler, void(boost::system::error_code)
) {
  using boost::ignore_unused;
  using boost::system::error_code;

  namespace beast = boost::beast;
  namespace asio  = boost::asio;
  namespace http  = beast::http;

  return asio::async_initiate<ReadHandler, void(error_code)>(
    [&parser, s = s_](auto handler) mutable -> void {

      auto strand = webio::detail::get_strand(
        handler, s->stream.get_executor());

      webio::co_spawn(
        strand,
        [
          &parser,
          s       = std::move(s),
          handler = std::move(handler)
        ]() mutable -> webio::awaitable<void> {

          auto executor =
            asio::get_associated_executor(handler, s->stream.get_executor());

          auto ec          = error_code();
          auto error_token = webio::redirect_error(webio::use_awaitable, ec);

          ignore_unused(
            co_await http::async_read(
              s->stream,
              s->buffer,
              parser,
              error_token));

          asio::post(
            executor, beast::bind_handler(std::move(handler), ec));
        },
        webio::detached);
    },
    read_handler);
}
