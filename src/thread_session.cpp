#include "webio/thread_session.hpp"

#include "webio/log.hpp"
#include "webio/error.hpp"
#include "webio/detail/outbox.hpp"

#include <boost/system/system_error.hpp>

#include <mutex>
#include <deque>
#include <string>
#include <utility>
#include <exception>
#include <condition_variable>

using boost::system::error_code;
using boost::system::system_error;

using webio::error::errc;

struct webio::thread_session::state {
  std::mutex              mtx;
  std::condition_variable event_cv;
  std::condition_variable space_cv;
  std::deque<event>       events;
  std::size_t const       capacity;
  bool                    stop_requested = false;

  detail::outbox outbox;

  explicit
  state(std::size_t const capacity_)
  : capacity(capacity_ == 0 ? 1 : capacity_)
  {
  }

  // the application returned or threw; whatever it never consumed is dropped
  // and anybody still waiting to push is woken up to fail
  //
  auto finish(std::optional<message> last) -> void {
    if (last) {
      outbox.finish(std::move(*last));
    } else {
      outbox.finish();
    }

    {
      auto lock = std::lock_guard<std::mutex>(mtx);
      events.clear();
    }
    space_cv.notify_all();
  }
};

webio::thread_session::thread_session(entry_point entry)
: thread_session(std::move(entry), options())
{
}

webio::thread_session::thread_session(entry_point entry, options opts)
: s_(std::make_shared<state>(opts.event_queue_capacity))
, push_timeout_(opts.push_timeout)
{
  worker_ = std::thread(
    [s = s_, entry = std::move(entry)]() -> void {
      auto ctx = context(s);

      try {
        entry(ctx);
        s->finish(std::nullopt);

      } catch (system_error const& e) {
        // session_closed is how a torn down session unwinds the application
        //
        if (e.code() == errc::session_closed) {
          s->finish(std::nullopt);
          return;
        }

        webio::log_error(e.code(), "thread session application");
        s->finish(webio::error_message(e.what()));

      } catch (std::exception const& e) {
        webio::log_error(
          std::string("thread session application threw: ") + e.what());
        s->finish(webio::error_message(e.what()));

      } catch (...) {
        webio::log_error("thread session application threw a non-exception");
        s->finish(webio::error_message("unknown exception"));
      }
    });
}

webio::thread_session::~thread_session() {
  {
    auto lock = std::lock_guard<std::mutex>(s_->mtx);
    s_->stop_requested = true;
  }
  s_->event_cv.notify_all();
  s_->space_cv.notify_all();

  if (!worker_.joinable()) {
    return;
  }

  if (s_->outbox.finished()) {
    worker_.join();
  } else {
    worker_.detach();
  }
}

auto webio::thread_session::push(event ev, error_code& ec) -> void {
  auto lock = std::unique_lock<std::mutex>(s_->mtx);

  auto const is_closed = [&] {
    return s_->stop_requested || s_->outbox.finished();
  };

  if (is_closed()) {
    ec = errc::session_closed;
    return;
  }

  auto const has_room = s_->space_cv.wait_for(
    lock, push_timeout_,
    [&] { return is_closed() || s_->events.size() < s_->capacity; });

  if (!has_room) {
    ec = errc::event_queue_full;
    return;
  }

  if (is_closed()) {
    ec = errc::session_closed;
    return;
  }

  s_->events.push_back(std::move(ev));
  lock.unlock();

  s_->event_cv.notify_one();
  ec = {};
}

auto webio::thread_session::pull() -> std::vector<message> {
  return s_->outbox.drain();
}

auto webio::thread_session::closed() const -> bool {
  return s_->outbox.closed();
}

auto webio::thread_session::factory(
  entry_point entry,
  options     opts) -> session_factory {

  return [entry = std::move(entry), opts]() -> std::shared_ptr<session> {
    return std::make_shared<thread_session>(entry, opts);
  };
}

webio::thread_session::context::context(std::shared_ptr<state> s)
: s_(std::move(s))
{
}

auto webio::thread_session::context::send(message msg) -> void {
  if (!s_->outbox.post(std::move(msg))) {
    throw system_error(errc::session_closed);
  }
}

auto webio::thread_session::context::next_event() -> event {
  auto lock = std::unique_lock<std::mutex>(s_->mtx);
  s_->event_cv.wait(
    lock, [&] { return s_->stop_requested || !s_->events.empty(); });

  if (s_->stop_requested) {
    throw system_error(errc::session_closed);
  }

  auto ev = std::move(s_->events.front());
  s_->events.pop_front();
  lock.unlock();

  s_->space_cv.notify_one();
  return ev;
}

auto webio::thread_session::context::next_event(
  std::chrono::steady_clock::duration timeout) -> std::optional<event> {

  auto lock = std::unique_lock<std::mutex>(s_->mtx);
  auto const ready = s_->event_cv.wait_for(
    lock, timeout,
    [&] { return s_->stop_requested || !s_->events.empty(); });

  if (s_->stop_requested) {
    throw system_error(errc::session_closed);
  }

  if (!ready) {
    return std::nullopt;
  }

  auto ev = std::move(s_->events.front());
  s_->events.pop_front();
  lock.unlock();

  s_->space_cv.notify_one();
  return ev;
}
