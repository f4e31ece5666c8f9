#ifndef WEBIO_SESSION_HPP_
#define WEBIO_SESSION_HPP_

#include <boost/system/error_code.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>
#include <functional>

namespace webio {

// events travel client -> session, messages session -> client; both are JSON
// objects, messages are conventionally tagged with a "command" member
//
using event   = nlohmann::json;
using message = nlohmann::json;

// session is the contract every execution model (dedicated thread,
// cooperative coroutine) offers to the request dispatcher
//
// implementations must be safe to call from any request thread; the dispatcher
// never calls into the same session from two threads at once unless a client
// misbehaves by issuing concurrent requests for one conversation
//
struct session {
  virtual ~session() = default;

  // hands one client event to the application
  //
  // fails with `error::errc::session_closed` once the application finished and
  // `error::errc::event_queue_full` when the session cannot accept more input
  // in time
  //
  virtual auto push(event ev, boost::system::error_code& ec) -> void = 0;

  // drains every message queued since the last pull, in enqueue order
  // never blocks
  //
  virtual auto pull() -> std::vector<message> = 0;

  // true once the final `close_session` message has been handed out by
  // `pull`
  //
  virtual auto closed() const -> bool = 0;
};

using session_factory = std::function<std::shared_ptr<session>()>;

// the terminal directive telling a client to drop its local conversation
//
auto close_session_message() -> message;

// how application faults are reported to the client before the session closes
//
auto error_message(std::string const& what) -> message;

} // webio

#endif // WEBIO_SESSION_HPP_
