#ifndef WEBIO_DISPATCHER_HPP_
#define WEBIO_DISPATCHER_HPP_

#include "webio/session.hpp"
#include "webio/session_registry.hpp"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <mutex>
#include <chrono>
#include <optional>
#include <functional>

namespace webio {

// the header carrying the session identifier in both directions
//
inline constexpr char session_id_header[] = "webio-session-id";

struct dispatcher_options {
  std::chrono::seconds session_expire = std::chrono::hours(4);
  std::chrono::seconds sweep_interval = std::chrono::minutes(2);
  bool                 verbose        = false;
};

// dispatcher turns requests against the session endpoint into push/pull
// calls on the session they belong to
//
// a request without an identifier starts a new session, an identifier the
// registry does not know is told to close, anything else is routed to its
// session: the POSTed event (if any) is pushed, idle sessions are swept when
// a sweep is due, pending messages are pulled and a session that closed is
// removed, all before the response is built
//
// `handle` is safe to call from any number of threads
//
struct dispatcher {
public:
  using clock_type    = session_registry::time_point::clock;
  using time_point    = session_registry::time_point;
  using now_function  = std::function<time_point()>;
  using request_type  = boost::beast::http::request<
    boost::beast::http::string_body>;
  using response_type = boost::beast::http::response<
    boost::beast::http::string_body>;

private:
  session_registry&  registry_;
  session_factory    factory_;
  dispatcher_options opts_;
  now_function       now_;

  std::mutex                sweep_mtx_;
  std::optional<time_point> last_sweep_;

  auto sweep_if_due(time_point const now) -> void;

public:
  dispatcher(
    session_registry&  registry,
    session_factory    factory,
    dispatcher_options opts);

  // `now` replaces the steady clock, tests use it to travel in time
  //
  dispatcher(
    session_registry&  registry,
    session_factory    factory,
    dispatcher_options opts,
    now_function       now);

  dispatcher(dispatcher const&) = delete;
  dispatcher(dispatcher&&)      = delete;

  auto handle(request_type const& request) -> response_type;
};

} // webio

#endif // WEBIO_DISPATCHER_HPP_
