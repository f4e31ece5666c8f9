#include "webio/coroutine_session.hpp"

#include "webio/log.hpp"
#include "webio/error.hpp"
#include "webio/detail/outbox.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>

#include <boost/system/system_error.hpp>

#include <mutex>
#include <deque>
#include <string>
#include <utility>
#include <optional>
#include <exception>

namespace asio = boost::asio;

using boost::system::error_code;
using boost::system::system_error;

using webio::error::errc;

struct webio::coroutine_session::state {
  using strand_type = asio::strand<executor_type>;

  strand_type strand;

  // never expires on its own; cancelling it is how the strand wakes the
  // application out of `next_event`. Only ever touched on `strand`
  //
  asio::steady_timer signal;

  std::mutex        mtx;
  std::deque<event> events;
  bool              stop_requested = false;

  detail::outbox outbox;

  explicit
  state(executor_type const& executor)
  : strand(asio::make_strand(executor))
  , signal(strand)
  {
    signal.expires_at(asio::steady_timer::time_point::max());
  }

  auto finish(std::optional<message> last) -> void {
    if (last) {
      outbox.finish(std::move(*last));
    } else {
      outbox.finish();
    }

    auto lock = std::lock_guard<std::mutex>(mtx);
    events.clear();
  }
};

namespace {

template <typename State>
auto wake(std::shared_ptr<State> const& s) -> void {
  asio::post(s->strand, [s]() -> void { s->signal.cancel(); });
}

} // anonymous

webio::coroutine_session::coroutine_session(
  executor_type const& executor,
  entry_point          entry)
: s_(std::make_shared<state>(executor))
{
  webio::co_spawn(
    s_->strand,
    [s = s_, entry = std::move(entry)]() mutable -> awaitable<void> {
      auto ctx  = context(s);
      auto last = std::optional<message>();

      try {
        co_await entry(ctx);

      } catch (system_error const& e) {
        // session_closed is how a torn down session unwinds the application
        //
        if (e.code() != errc::session_closed) {
          webio::log_error(e.code(), "coroutine session application");
          last = webio::error_message(e.what());
        }

      } catch (std::exception const& e) {
        webio::log_error(
          std::string("coroutine session application threw: ") + e.what());
        last = webio::error_message(e.what());

      } catch (...) {
        webio::log_error("coroutine session application threw a non-exception");
        last = webio::error_message("unknown exception");
      }

      s->finish(std::move(last));
    },
    webio::detached);
}

webio::coroutine_session::~coroutine_session() {
  {
    auto lock = std::lock_guard<std::mutex>(s_->mtx);
    s_->stop_requested = true;
  }
  wake(s_);
}

auto webio::coroutine_session::push(event ev, error_code& ec) -> void {
  {
    auto lock = std::lock_guard<std::mutex>(s_->mtx);
    if (s_->stop_requested || s_->outbox.finished()) {
      ec = errc::session_closed;
      return;
    }
    s_->events.push_back(std::move(ev));
  }

  wake(s_);
  ec = {};
}

auto webio::coroutine_session::pull() -> std::vector<message> {
  return s_->outbox.drain();
}

auto webio::coroutine_session::closed() const -> bool {
  return s_->outbox.closed();
}

auto webio::coroutine_session::factory(
  executor_type const& executor,
  entry_point          entry) -> session_factory {

  return [executor, entry = std::move(entry)]() -> std::shared_ptr<session> {
    return std::make_shared<coroutine_session>(executor, entry);
  };
}

webio::coroutine_session::context::context(std::shared_ptr<state> s)
: s_(std::move(s))
{
}

auto webio::coroutine_session::context::send(message msg) -> void {
  if (!s_->outbox.post(std::move(msg))) {
    throw system_error(errc::session_closed);
  }
}

auto webio::coroutine_session::context::next_event() -> awaitable<event> {
  auto s = s_;

  while (true) {
    auto ev = std::optional<event>();

    {
      auto lock = std::lock_guard<std::mutex>(s->mtx);
      if (s->stop_requested) {
        throw system_error(errc::session_closed);
      }

      if (!s->events.empty()) {
        ev.emplace(std::move(s->events.front()));
        s->events.pop_front();
      }
    }

    if (ev) {
      co_return std::move(*ev);
    }

    // nothing can slip in between the check above and this wait: wake-ups
    // are posted to the same strand and run only once we are suspended
    //
    auto ec = error_code();
    co_await s->signal.async_wait(webio::redirect_error(webio::use_awaitable, ec));
  }
}

auto webio::coroutine_session::context::get_executor() -> executor_type {
  return s_->strand;
}
