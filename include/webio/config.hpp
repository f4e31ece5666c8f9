#ifndef WEBIO_CONFIG_HPP_
#define WEBIO_CONFIG_HPP_

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace webio {

enum class session_kind {
  thread,
  coroutine
};

struct tls_config {
  std::string cert_path;
  std::string key_path;
};

auto default_thread_count() -> std::size_t;

// everything a `webio::server` needs to know, with the defaults used when
// neither the configuration file nor the command line say otherwise
//
struct server_config {
  std::string   host    = "0.0.0.0";
  std::uint16_t port    = 8080;
  std::size_t   threads = default_thread_count();

  session_kind session_type     = session_kind::thread;
  bool         coroutine_thread = true;

  std::chrono::seconds      session_expire       = std::chrono::hours(4);
  std::chrono::seconds      sweep_interval       = std::chrono::minutes(2);
  std::size_t               event_queue_capacity = 64;
  std::chrono::milliseconds push_timeout         = std::chrono::seconds(5);
  std::chrono::seconds      connection_timeout   = std::chrono::seconds(60);

  std::string io_path = "/io";

  // HTTPS is served only when both paths are set
  //
  std::optional<tls_config> tls;

  bool verbose = false;
};

// overlays the members present in `doc` onto `config`; unknown keys are
// ignored
//
// throws `boost::system::system_error` with `error::errc::invalid_config`
// naming the offending key when a value has the wrong type or range
//
auto apply_json(nlohmann::json const& doc, server_config& config) -> void;

// reads and applies a JSON configuration file, same errors as `apply_json`
// plus an unreadable or malformed file
//
auto load_config(std::string const& path, server_config& config) -> void;

// checks the cross-field constraints, e.g. a non-empty `io_path` starting
// with '/'
//
auto validate(server_config const& config) -> void;

// the command line of the `webio` binary
//
struct command_line {
  std::optional<std::string> config_path;
  std::optional<std::string> probe;

  std::optional<std::string>          host;
  std::optional<std::uint16_t>        port;
  std::optional<std::size_t>          threads;
  std::optional<session_kind>         session_type;
  std::optional<std::chrono::seconds> session_expire;

  bool no_coroutine_thread = false;
  bool verbose             = false;
  bool help                = false;
};

// throws `boost::system::system_error` with `error::errc::invalid_config` on
// unknown flags, missing or malformed flag values
//
auto parse_command_line(int argc, char const* const* argv) -> command_line;

// defaults, then the file named by `--config`, then the flags; validated
//
auto resolve_config(command_line const& cmd) -> server_config;

auto usage() -> char const*;

} // webio

#endif // WEBIO_CONFIG_HPP_
