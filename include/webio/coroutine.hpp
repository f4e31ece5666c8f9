#ifndef WEBIO_COROUTINE_HPP_
#define WEBIO_COROUTINE_HPP_

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/any_io_executor.hpp>

namespace webio {

// the coroutine vocabulary used throughout webio, all of it re-exported from
// asio so that call sites read `webio::co_spawn(...)` regardless of where the
// underlying machinery lives
//
template <typename T, typename Executor = boost::asio::any_io_executor>
using awaitable = boost::asio::awaitable<T, Executor>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;
using boost::asio::redirect_error;

namespace this_coro = boost::asio::this_coro;

} // webio

#endif // WEBIO_COROUTINE_HPP_
