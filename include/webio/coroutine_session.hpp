#ifndef WEBIO_COROUTINE_SESSION_HPP_
#define WEBIO_COROUTINE_SESSION_HPP_

#include "webio/session.hpp"
#include "webio/coroutine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/system/error_code.hpp>

#include <memory>
#include <functional>

namespace webio {

// coroutine_session runs the application as a coroutine on a strand of the
// supplied executor, normally the `webio::task_runner`
//
// pushing never blocks: the event is queued and the strand is poked to wake
// the application if it is suspended in `next_event`
//
// destroying the session makes a suspended or later `next_event` throw
// `boost::system::system_error` with `error::errc::session_closed`
//
struct coroutine_session : public session {
private:
  struct state;

public:
  struct context;

  using executor_type = boost::asio::any_io_executor;
  using entry_point   = std::function<awaitable<void>(context&)>;

  coroutine_session(executor_type const& executor, entry_point entry);

  coroutine_session(coroutine_session const&) = delete;
  coroutine_session(coroutine_session&&)      = delete;

  ~coroutine_session() override;

  auto push(event ev, boost::system::error_code& ec) -> void override;
  auto pull() -> std::vector<message> override;
  auto closed() const -> bool override;

  static auto factory(
    executor_type const& executor,
    entry_point          entry) -> session_factory;

private:
  std::shared_ptr<state> s_;
};

struct coroutine_session::context {
private:
  std::shared_ptr<state> s_;

public:
  explicit
  context(std::shared_ptr<state> s);

  auto send(message msg) -> void;

  // must be awaited from the session's own coroutine
  //
  auto next_event() -> awaitable<event>;

  // the session strand, for applications that want timers of their own
  //
  auto get_executor() -> executor_type;
};

} // webio

#endif // WEBIO_COROUTINE_SESSION_HPP_
