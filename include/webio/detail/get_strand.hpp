#ifndef WEBIO_DETAIL_GET_STRAND_HPP_
#define WEBIO_DETAIL_GET_STRAND_HPP_

#include "webio/type_traits.hpp"

#include <boost/asio/strand.hpp>
#include <boost/asio/associated_executor.hpp>

#include <type_traits>

namespace webio {
namespace detail {

// returns the handler's associated executor if it already is a strand,
// otherwise wraps it in a fresh one
//
// wrapping an executor that is itself running inside a strand keeps the
// outer ordering, so operations started from a connection coroutine stay
// serialized with everything else on that connection
//
template <typename Handler, typename Executor>
auto get_strand(Handler const& handler, Executor const& ex) {

  namespace asio = boost::asio;

  using handler_executor_type =
    std::decay_t<decltype(asio::get_associated_executor(handler, ex))>;

  if constexpr (webio::is_strand_v<handler_executor_type>) {
    return asio::get_associated_executor(handler, ex);

  } else {

    return asio::strand<handler_executor_type>(
      asio::get_associated_executor(handler, ex));
  }
}

} // detail
} // webio

#endif // WEBIO_DETAIL_GET_STRAND_HPP_
