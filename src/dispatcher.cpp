#include "webio/dispatcher.hpp"

#include "webio/log.hpp"
#include "webio/error.hpp"
#include "webio/query.hpp"

#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>

#include <tuple>
#include <string>
#include <vector>
#include <utility>
#include <exception>

namespace beast = boost::beast;
namespace http  = beast::http;

using boost::system::error_code;

using webio::error::errc;

namespace {

auto make_response(
  webio::dispatcher::request_type const& request,
  http::status const                     status,
  std::string                            body,
  char const*                            content_type)
  -> webio::dispatcher::response_type {

  auto response = webio::dispatcher::response_type(status, request.version());

  response.set(http::field::content_type, content_type);
  response.set(http::field::cache_control, "no-cache");
  response.keep_alive(request.keep_alive());
  response.body() = std::move(body);
  response.prepare_payload();

  return response;
}

auto json_response(
  webio::dispatcher::request_type const& request,
  http::status const                     status,
  nlohmann::json const&                  body)
  -> webio::dispatcher::response_type {

  return make_response(request, status, body.dump(), "application/json");
}

auto error_body(char const* name, std::string const& what) -> nlohmann::json {
  auto body = nlohmann::json::object();
  body["error"]   = name;
  body["message"] = what;
  return body;
}

} // anonymous

webio::dispatcher::dispatcher(
  session_registry&  registry,
  session_factory    factory,
  dispatcher_options opts)
: dispatcher(
    registry, std::move(factory), opts,
    []() -> time_point { return clock_type::now(); })
{
}

webio::dispatcher::dispatcher(
  session_registry&  registry,
  session_factory    factory,
  dispatcher_options opts,
  now_function       now)
: registry_(registry)
, factory_(std::move(factory))
, opts_(opts)
, now_(std::move(now))
{
}

auto webio::dispatcher::sweep_if_due(time_point const now) -> void {
  auto evicted = std::vector<session_registry::handle_type>();

  {
    auto lock = std::lock_guard<std::mutex>(sweep_mtx_);
    if (last_sweep_ && now - *last_sweep_ < opts_.sweep_interval) {
      return;
    }
    last_sweep_ = now;

    evicted = registry_.evict_expired(now, opts_.session_expire);
  }

  if (opts_.verbose && !evicted.empty()) {
    webio::log_info(
      "evicted " + std::to_string(evicted.size()) + " idle session(s), " +
      std::to_string(registry_.size()) + " remaining");
  }

  // the sessions are torn down here, outside of both locks
  //
  evicted.clear();
}

auto webio::dispatcher::handle(request_type const& request) -> response_type {
  auto const target = request.target();
  auto const query  = webio::split_target(
    std::string_view(target.data(), target.size())).second;

  auto const params = webio::parse_query(query);
  if (auto test = webio::find_param(params, "test"); test && !test->empty()) {
    return make_response(request, http::status::ok, "ok", "text/plain");
  }

  auto const method = request.method();
  if (method != http::verb::get && method != http::verb::post) {
    auto response = make_response(
      request, http::status::method_not_allowed,
      "Only GET and POST are supported\n", "text/plain");
    response.set(http::field::allow, "GET, POST");
    return response;
  }

  auto const now = now_();

  auto const header = request.find(session_id_header);
  auto id = (header == request.end())
    ? std::string()
    : header->value().to_string();

  auto handle = session_registry::handle_type();

  if (!id.empty()) {
    handle = registry_.lookup(id, now);
    if (!handle) {
      return json_response(
        request, http::status::ok,
        nlohmann::json::array({ webio::close_session_message() }));
    }
  }

  auto ev = std::optional<event>();
  if (method == http::verb::post) {
    try {
      ev.emplace(nlohmann::json::parse(request.body()));
    } catch (nlohmann::json::parse_error const& e) {
      return json_response(
        request, http::status::bad_request,
        error_body("malformed_event", e.what()));
    }
  }

  auto const created = !handle;
  if (created) {
    try {
      std::tie(id, handle) = registry_.create(factory_, now);
    } catch (std::exception const& e) {
      webio::log_error(std::string("session creation failed: ") + e.what());
      return make_response(
        request, http::status::internal_server_error,
        "Unable to start a session\n", "text/plain");
    } catch (...) {
      webio::log_error("session creation failed with a non-exception");
      return make_response(
        request, http::status::internal_server_error,
        "Unable to start a session\n", "text/plain");
    }

    if (opts_.verbose) {
      webio::log_info(
        "new session " + id + ", " +
        std::to_string(registry_.size()) + " live");
    }
  }

  if (ev) {
    auto ec = error_code();
    handle->push(std::move(*ev), ec);

    if (ec == errc::event_queue_full) {
      webio::log_error(ec, "pushing an event into session " + id);

      auto response = json_response(
        request, http::status::service_unavailable,
        error_body("event_queue_full", ec.message()));

      if (created) {
        response.set(session_id_header, id);
      }
      return response;
    }

    // a session that already finished is about to hand out its close message
    //
    if (ec && ec != errc::session_closed) {
      webio::log_error(ec, "pushing an event into session " + id);
    }
  }

  sweep_if_due(now);

  auto messages = handle->pull();

  auto removed = false;
  if (handle->closed()) {
    removed = static_cast<bool>(registry_.remove(id));

    if (opts_.verbose) {
      webio::log_info("session " + id + " closed");
    }
  }

  auto body = nlohmann::json::array();
  for (auto& msg : messages) {
    body.push_back(std::move(msg));
  }

  auto response = json_response(request, http::status::ok, body);
  if (created && !removed) {
    response.set(session_id_header, id);
  }

  return response;
}
