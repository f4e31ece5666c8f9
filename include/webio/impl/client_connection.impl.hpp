#include "webio/client_connection.hpp"

#include "webio/detail/get_strand.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/coroutine.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/associated_executor.hpp>

#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/core/bind_handler.hpp>

#include <boost/core/ignore_unused.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <memory>
#include <optional>

namespace webio {
namespace detail {

template <class Executor, class Lambda>
auto lift(Executor executor, Lambda lambda) {
  struct callable : public Lambda {

    Executor executor_;

    callable(Executor e, Lambda l)
    : Lambda(std::move(l))
    , executor_(e)
    {}

    using Lambda::operator();
    using executor_type = Executor;
    auto get_executor() const noexcept -> executor_type {
      return executor_;
    }
  };

  return callable(executor, std::move(lambda));
}

template <class Handler>
struct async_connect_op : public boost::asio::coroutine {
private:

  struct frame;

  std::shared_ptr<connection_state> s_;
  std::unique_ptr<frame>            frame_;

  // everything that must survive between resumptions lives here so that
  // moving the op itself stays cheap
  //
  struct frame {
    std::optional<boost::asio::ip::tcp::resolver>               resolver;
    std::optional<boost::asio::ip::tcp::resolver::results_type> endpoints;
    std::optional<boost::asio::ip::tcp::endpoint>               endpoint;
    std::string                                                 host;
    std::string                                                 service;
    Handler                                                     handler;

    frame(std::string host_, std::string service_, Handler h_)
    : host(std::move(host_))
    , service(std::move(service_))
    , handler(std::move(h_))
    {}
  };

  auto complete(boost::system::error_code ec) -> void {
    auto h        = std::move(frame_->handler);
    auto endpoint = frame_->endpoint.value_or(boost::asio::ip::tcp::endpoint());
    frame_.reset();
    h(ec, std::move(endpoint));
  }

public:
  async_connect_op()                        = delete;
  async_connect_op(async_connect_op const&) = delete;
  async_connect_op(async_connect_op&&)      = default;

  template <class DeducedHandler>
  async_connect_op(
    std::string                       host,
    std::string                       service,
    std::shared_ptr<connection_state> s,
    DeducedHandler&&                  handler)
  : s_(std::move(s))
  , frame_(std::make_unique<frame>(
      std::move(host),
      std::move(service),
      std::forward<DeducedHandler>(handler)))
  {
  }

  using executor_type = boost::asio::associated_executor_t<
    Handler, connection_state::executor_type>;

  auto get_executor() const noexcept -> executor_type {
    return boost::asio::get_associated_executor(
      frame_->handler,
      s_->stream.get_executor());
  }

  #include <boost/asio/yield.hpp>
  auto operator()(boost::system::error_code ec = {}) -> void {

    using boost::asio::ip::tcp;
    using boost::system::error_code;

    namespace ssl  = boost::asio::ssl;
    namespace asio = boost::asio;

    reenter(this) {
      yield asio::post(std::move(*this));

      if (s_->stream.is_ssl()) {
        auto const res = SSL_set_tlsext_host_name(
          s_->stream.ssl_stream().native_handle(), frame_->host.c_str());

        if (res != 1) {
          ec.assign(
            static_cast<int>(::ERR_get_error()),
            asio::error::get_ssl_category());

          return complete(ec);
        }
      }

      frame_->resolver.emplace(s_->stream.get_executor());

      yield {
        auto& resolver = *(frame_->resolver);
        auto  executor = this->get_executor();
        auto  host     = frame_->host;
        auto  service  = frame_->service;

        resolver.async_resolve(
          host, service, lift(
            executor,
            [self = std::move(*this)]
            (error_code ec, tcp::resolver::results_type endpoints) mutable
            -> void {
              self.frame_->endpoints.emplace(std::move(endpoints));
              self(ec);
            }));
      }

      if (ec) {
        return complete(ec);
      }

      yield {
        auto& stream    = s_->stream.stream();
        auto  endpoints = *(frame_->endpoints);
        auto  executor  = this->get_executor();

        asio::async_connect(
          stream, std::move(endpoints),
          lift(
            executor,
            [self = std::move(*this)]
            (error_code ec, tcp::endpoint endpoint) mutable -> void {
              self.frame_->endpoint.emplace(std::move(endpoint));
              self(ec);
            }));
      }

      if (ec) {
        return complete(ec);
      }

      if (s_->stream.is_ssl()) {
        yield {
          auto& ssl_stream = s_->stream.ssl_stream();
          ssl_stream.async_handshake(
            ssl::stream_base::client, std::move(*this));
        }

        if (ec) {
          return complete(ec);
        }
      }

      return complete({});
    }
  }
  #include <boost/asio/unyield.hpp>
};

} // detail
} // webio

template <typename ConnectHandler>
auto webio::client_connection::async_connect(
  std::string      host,
  std::string      service,
  ConnectHandler&& connect_handler
) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
  ConnectHandler,
  void(boost::system::error_code, boost::asio::ip::tcp::endpoint)
) {
  using boost::asio::ip::tcp;
  using boost::system::error_code;

  namespace asio = boost::asio;

  return asio::async_initiate<
    ConnectHandler, void(error_code, tcp::endpoint)
  >(
    [s = s_](auto handler, std::string host, std::string service) mutable {
      using handler_type = decltype(handler);

      webio::detail::async_connect_op<handler_type>(
        std::move(host), std::move(service), std::move(s),
        std::move(handler))();
    },
    connect_handler, std::move(host), std::move(service));
}

template <
  typename Request,
  typename ResponseParser,
  typename RequestHandler
>
auto webio::client_connection::async_request(
  Request&         request,
  ResponseParser&  parser,
  RequestHandler&& request_handler
) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
  RequestHandler, void(boost::system::error_code)
) {
  using boost::ignore_unused;
  using boost::system::error_code;

  namespace beast = boost::beast;
  namespace asio  = boost::asio;
  namespace http  = boost::beast::http;

  return asio::async_initiate<RequestHandler, void(error_code)>(
    [&request, &parser, s = s_](auto handler) mutable -> void {

      auto strand = webio::detail::get_strand(
        handler, s->stream.get_executor());

      webio::co_spawn(
        strand,
        [
          &request, &parser,
          s       = std::move(s),
          handler = std::move(handler)
        ]() mutable -> webio::awaitable<void> {

          auto ec          = error_code();
          auto error_token = webio::redirect_error(webio::use_awaitable, ec);

          auto executor =
            asio::get_associated_executor(handler, s->stream.get_executor());

          ignore_unused(
            co_await http::async_write(s->stream, request, error_token));

          if (ec) {
            co_return asio::post(
              executor,
              beast::bind_handler(std::move(handler), ec));
          }

          ignore_unused(
            co_await http::async_read(
              s->stream,
              s->buffer,
              parser,
              error_token));

          asio::post(
            executor,
            beast::bind_handler(std::move(handler), ec));
        },
        webio::detached);
    },
    request_handler);
}

template <typename ShutdownHandler>
auto webio::client_connection::async_ssl_shutdown(
  ShutdownHandler&& shutdown_handler
) & -> BOOST_ASIO_INITFN_RESULT_TYPE(
  ShutdownHandler, void(boost::system::error_code)
) {
  return s_->stream.ssl_stream().async_shutdown(
    std::forward<ShutdownHandler>(shutdown_handler));
}
