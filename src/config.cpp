#include "webio/config.hpp"
#include "webio/error.hpp"

#include <boost/system/system_error.hpp>
#include <boost/spirit/home/x3.hpp>

#include <limits>
#include <thread>
#include <fstream>
#include <algorithm>
#include <string_view>

namespace x3 = boost::spirit::x3;

using boost::system::system_error;

using webio::error::errc;

namespace {

[[noreturn]]
auto invalid(std::string const& what) -> void {
  throw system_error(errc::invalid_config, what);
}

auto read_unsigned(
  nlohmann::json const& doc,
  char const*           key,
  std::uint64_t const   max) -> std::optional<std::uint64_t> {

  auto it = doc.find(key);
  if (it == doc.end()) {
    return std::nullopt;
  }

  // nlohmann reports non-negative literals as unsigned
  //
  if (it->is_number_unsigned()) {
    auto const value = it->get<std::uint64_t>();
    if (value <= max) {
      return value;
    }
  }

  invalid(
    std::string(key) + ": expected an integer in [0, " +
    std::to_string(max) + "]");
}

auto read_string(nlohmann::json const& doc, char const* key)
  -> std::optional<std::string> {

  auto it = doc.find(key);
  if (it == doc.end()) {
    return std::nullopt;
  }

  if (!it->is_string()) {
    invalid(std::string(key) + ": expected a string");
  }
  return it->get<std::string>();
}

auto read_bool(nlohmann::json const& doc, char const* key)
  -> std::optional<bool> {

  auto it = doc.find(key);
  if (it == doc.end()) {
    return std::nullopt;
  }

  if (!it->is_boolean()) {
    invalid(std::string(key) + ": expected true or false");
  }
  return it->get<bool>();
}

auto parse_session_kind(std::string_view const name, char const* key)
  -> webio::session_kind {

  if (name == "thread") {
    return webio::session_kind::thread;
  }
  if (name == "coroutine") {
    return webio::session_kind::coroutine;
  }

  invalid(std::string(key) + ": expected \"thread\" or \"coroutine\"");
}

// the whole argument must be digits and fit `max`
//
auto parse_number(
  std::string_view const arg,
  char const*            flag,
  std::uint64_t const    max) -> std::uint64_t {

  auto value = std::uint64_t{0};

  auto begin = arg.begin();
  auto const parsed = x3::parse(begin, arg.end(), x3::ulong_long, value);

  if (!parsed || begin != arg.end() || value > max) {
    invalid(
      std::string(flag) + ": expected an integer in [0, " +
      std::to_string(max) + "]");
  }
  return value;
}

constexpr auto max_port = std::uint64_t{65535};

// generous upper bounds that keep the durations below clearly representable
//
constexpr auto max_seconds = std::uint64_t{10} * 365 * 24 * 60 * 60;
constexpr auto max_threads = std::uint64_t{1024};

} // anonymous

auto webio::default_thread_count() -> std::size_t {
  return std::max(1u, std::thread::hardware_concurrency());
}

auto webio::apply_json(nlohmann::json const& doc, server_config& config)
  -> void {

  if (!doc.is_object()) {
    invalid("configuration: expected a JSON object");
  }

  if (auto v = read_string(doc, "host")) {
    config.host = *v;
  }

  if (auto v = read_unsigned(doc, "port", max_port)) {
    config.port = static_cast<std::uint16_t>(*v);
  }

  if (auto v = read_unsigned(doc, "threads", max_threads)) {
    config.threads = static_cast<std::size_t>(*v);
  }

  if (auto v = read_string(doc, "session_type")) {
    config.session_type = parse_session_kind(*v, "session_type");
  }

  if (auto v = read_bool(doc, "coroutine_thread")) {
    config.coroutine_thread = *v;
  }

  if (auto v = read_unsigned(doc, "session_expire_seconds", max_seconds)) {
    config.session_expire = std::chrono::seconds(*v);
  }

  if (auto v = read_unsigned(doc, "sweep_interval_seconds", max_seconds)) {
    config.sweep_interval = std::chrono::seconds(*v);
  }

  if (auto v = read_unsigned(
        doc, "event_queue_capacity", std::numeric_limits<std::uint32_t>::max())) {
    config.event_queue_capacity = static_cast<std::size_t>(*v);
  }

  if (auto v = read_unsigned(doc, "push_timeout_ms", max_seconds * 1000)) {
    config.push_timeout = std::chrono::milliseconds(*v);
  }

  if (auto v = read_unsigned(doc, "connection_timeout_seconds", max_seconds)) {
    config.connection_timeout = std::chrono::seconds(*v);
  }

  if (auto v = read_string(doc, "io_path")) {
    config.io_path = *v;
  }

  if (auto tls = doc.find("tls"); tls != doc.end()) {
    if (!tls->is_object()) {
      invalid("tls: expected an object");
    }

    auto cert = read_string(*tls, "cert_path");
    auto key  = read_string(*tls, "key_path");

    if (cert && key) {
      config.tls = tls_config{*cert, *key};
    } else if (cert || key) {
      invalid("tls: cert_path and key_path must be given together");
    }
  }

  if (auto v = read_bool(doc, "verbose")) {
    config.verbose = *v;
  }
}

auto webio::load_config(std::string const& path, server_config& config)
  -> void {

  auto file = std::ifstream(path);
  if (!file.is_open()) {
    invalid(path + ": unable to open configuration file");
  }

  auto doc = nlohmann::json();
  try {
    file >> doc;
  } catch (nlohmann::json::parse_error const& e) {
    invalid(path + ": " + e.what());
  }

  apply_json(doc, config);
}

auto webio::validate(server_config const& config) -> void {
  if (config.host.empty()) {
    invalid("host: must not be empty");
  }

  if (config.threads == 0) {
    invalid("threads: must be at least 1");
  }

  if (config.io_path.empty() || config.io_path.front() != '/') {
    invalid("io_path: must start with '/'");
  }

  if (config.io_path.find('?') != std::string::npos) {
    invalid("io_path: must not contain a query");
  }

  if (config.session_expire.count() == 0) {
    invalid("session_expire_seconds: must be at least 1");
  }

  if (config.event_queue_capacity == 0) {
    invalid("event_queue_capacity: must be at least 1");
  }

  if (config.connection_timeout.count() == 0) {
    invalid("connection_timeout_seconds: must be at least 1");
  }

  if (config.tls &&
      (config.tls->cert_path.empty() || config.tls->key_path.empty())) {
    invalid("tls: cert_path and key_path must not be empty");
  }
}

auto webio::parse_command_line(int argc, char const* const* argv)
  -> command_line {

  auto cmd = command_line();

  for (auto i = 1; i < argc; ++i) {
    auto const arg = std::string_view(argv[i]);

    auto const value = [&]() -> std::string_view {
      if (i + 1 >= argc) {
        invalid(std::string(arg) + ": missing value");
      }
      return std::string_view(argv[++i]);
    };

    if (arg == "-h" || arg == "--help") {
      cmd.help = true;
    } else if (arg == "--config") {
      cmd.config_path = std::string(value());
    } else if (arg == "--probe") {
      cmd.probe = std::string(value());
    } else if (arg == "--host") {
      cmd.host = std::string(value());
    } else if (arg == "--port") {
      cmd.port = static_cast<std::uint16_t>(
        parse_number(value(), "--port", max_port));
    } else if (arg == "--threads") {
      cmd.threads = static_cast<std::size_t>(
        parse_number(value(), "--threads", max_threads));
    } else if (arg == "--session-type") {
      cmd.session_type = parse_session_kind(value(), "--session-type");
    } else if (arg == "--expire") {
      cmd.session_expire = std::chrono::seconds(
        parse_number(value(), "--expire", max_seconds));
    } else if (arg == "--no-coroutine-thread") {
      cmd.no_coroutine_thread = true;
    } else if (arg == "--verbose") {
      cmd.verbose = true;
    } else {
      invalid(std::string(arg) + ": unknown option");
    }
  }

  return cmd;
}

auto webio::resolve_config(command_line const& cmd) -> server_config {
  auto config = server_config();

  if (cmd.config_path) {
    load_config(*cmd.config_path, config);
  }

  if (cmd.host)           { config.host           = *cmd.host; }
  if (cmd.port)           { config.port           = *cmd.port; }
  if (cmd.threads)        { config.threads        = *cmd.threads; }
  if (cmd.session_type)   { config.session_type   = *cmd.session_type; }
  if (cmd.session_expire) { config.session_expire = *cmd.session_expire; }

  if (cmd.no_coroutine_thread) {
    config.coroutine_thread = false;
  }

  if (cmd.verbose) {
    config.verbose = true;
  }

  validate(config);
  return config;
}

auto webio::usage() -> char const* {
  return
    "usage: webio [options]\n"
    "\n"
    "  --config <path>        JSON configuration file\n"
    "  --host <address>       listen address (default 0.0.0.0)\n"
    "  --port <port>          listen port (default 8080, 0 picks one)\n"
    "  --threads <n>          HTTP worker threads\n"
    "  --session-type <kind>  thread or coroutine (default thread)\n"
    "  --no-coroutine-thread  run coroutine sessions on the HTTP threads\n"
    "  --expire <seconds>     idle session budget (default 14400)\n"
    "  --verbose              log session lifecycle events\n"
    "  --probe <host:port>    health-check a running server and exit\n"
    "  -h, --help             show this message\n";
}
