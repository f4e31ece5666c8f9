#ifndef WEBIO_THREAD_SESSION_HPP_
#define WEBIO_THREAD_SESSION_HPP_

#include "webio/session.hpp"

#include <boost/system/error_code.hpp>

#include <chrono>
#include <memory>
#include <thread>
#include <cstddef>
#include <optional>
#include <functional>

namespace webio {

// thread_session runs the application on a dedicated worker thread
//
// the application talks to the client through a `thread_session::context`;
// `next_event` blocks the worker until the client pushes something
//
// destroying the session asks the application to stop: a blocked or later
// `next_event` throws `boost::system::system_error` with
// `error::errc::session_closed`. The worker is then detached, it owns
// everything it touches, so no request thread ever waits on application code
//
struct thread_session : public session {
private:
  struct state;

public:
  struct context;

  using entry_point = std::function<void(context&)>;

  struct options {
    std::size_t               event_queue_capacity = 64;
    std::chrono::milliseconds push_timeout         = std::chrono::seconds(5);
  };

  explicit
  thread_session(entry_point entry);

  thread_session(entry_point entry, options opts);

  thread_session(thread_session const&) = delete;
  thread_session(thread_session&&)      = delete;

  ~thread_session() override;

  // waits at most `options::push_timeout` for room in the inbound queue
  //
  auto push(event ev, boost::system::error_code& ec) -> void override;
  auto pull() -> std::vector<message> override;
  auto closed() const -> bool override;

  static auto factory(entry_point entry, options opts) -> session_factory;

private:
  std::shared_ptr<state>    s_;
  std::chrono::milliseconds push_timeout_;
  std::thread               worker_;
};

struct thread_session::context {
private:
  std::shared_ptr<state> s_;

public:
  explicit
  context(std::shared_ptr<state> s);

  // queues a message for the client's next poll
  //
  auto send(message msg) -> void;

  // blocks until the client pushes an event
  //
  auto next_event() -> event;

  // as above, but gives up after `timeout` and returns nothing
  //
  auto next_event(std::chrono::steady_clock::duration timeout)
    -> std::optional<event>;
};

} // webio

#endif // WEBIO_THREAD_SESSION_HPP_
