#include "webio/config.hpp"
#include "webio/error.hpp"

#include <boost/system/system_error.hpp>

#include <chrono>
#include <cstdio>
#include <string>
#include <fstream>
#include <vector>

#include <catch2/catch.hpp>

using namespace std::chrono_literals;

using boost::system::system_error;

using webio::error::errc;

namespace {

auto parse(std::vector<char const*> args) -> webio::command_line {
  args.insert(args.begin(), "webio");
  return webio::parse_command_line(
    static_cast<int>(args.size()), args.data());
}

auto is_invalid_config(system_error const& e) -> bool {
  return e.code() == errc::invalid_config;
}

} // anonymous

TEST_CASE("Our server configuration") {

  SECTION("should come with sensible defaults") {
    auto const config = webio::server_config();

    CHECK(config.host == "0.0.0.0");
    CHECK(config.port == 8080);
    CHECK(config.threads >= 1);
    CHECK(config.session_type == webio::session_kind::thread);
    CHECK(config.coroutine_thread);
    CHECK(config.session_expire == 14400s);
    CHECK(config.sweep_interval == 120s);
    CHECK(config.event_queue_capacity == 64);
    CHECK(config.push_timeout == 5000ms);
    CHECK(config.connection_timeout == 60s);
    CHECK(config.io_path == "/io");
    CHECK(!config.tls);
    CHECK(!config.verbose);

    CHECK_NOTHROW(webio::validate(config));
  }

  SECTION("should overlay JSON documents") {
    auto config = webio::server_config();

    webio::apply_json(
      nlohmann::json::parse(R"({
        "host": "127.0.0.1",
        "port": 9000,
        "threads": 2,
        "session_type": "coroutine",
        "coroutine_thread": false,
        "session_expire_seconds": 60,
        "sweep_interval_seconds": 5,
        "event_queue_capacity": 8,
        "push_timeout_ms": 250,
        "connection_timeout_seconds": 15,
        "io_path": "/session",
        "tls": { "cert_path": "cert.pem", "key_path": "key.pem" },
        "verbose": true,
        "some_future_key": "ignored"
      })"),
      config);

    CHECK(config.host == "127.0.0.1");
    CHECK(config.port == 9000);
    CHECK(config.threads == 2);
    CHECK(config.session_type == webio::session_kind::coroutine);
    CHECK(!config.coroutine_thread);
    CHECK(config.session_expire == 60s);
    CHECK(config.sweep_interval == 5s);
    CHECK(config.event_queue_capacity == 8);
    CHECK(config.push_timeout == 250ms);
    CHECK(config.connection_timeout == 15s);
    CHECK(config.io_path == "/session");
    REQUIRE(config.tls);
    CHECK(config.tls->cert_path == "cert.pem");
    CHECK(config.tls->key_path == "key.pem");
    CHECK(config.verbose);
  }

  SECTION("should keep defaults for absent keys") {
    auto config = webio::server_config();
    webio::apply_json(nlohmann::json::parse(R"({"port": 0})"), config);

    CHECK(config.port == 0);
    CHECK(config.host == "0.0.0.0");
    CHECK(config.io_path == "/io");
  }

  SECTION("should reject values of the wrong type or range") {
    auto const rejects = [](char const* text) -> void {
      auto config = webio::server_config();
      CHECK_THROWS_MATCHES(
        webio::apply_json(nlohmann::json::parse(text), config),
        system_error,
        Catch::Matchers::Predicate<system_error>(
          is_invalid_config, "fails with invalid_config"));
    };

    rejects(R"({"port": 70000})");
    rejects(R"({"port": -1})");
    rejects(R"({"port": "8080"})");
    rejects(R"({"session_type": "process"})");
    rejects(R"({"verbose": 1})");
    rejects(R"({"tls": {"cert_path": "only-cert.pem"}})");
    rejects(R"({"tls": "yes"})");
    rejects(R"([1, 2, 3])");
  }

  SECTION("should validate cross-field constraints") {
    auto config = webio::server_config();

    config.io_path = "io";
    CHECK_THROWS_AS(webio::validate(config), system_error);

    config.io_path = "/io";
    config.threads = 0;
    CHECK_THROWS_AS(webio::validate(config), system_error);

    config.threads        = 1;
    config.session_expire = 0s;
    CHECK_THROWS_AS(webio::validate(config), system_error);
  }

  SECTION("should load configuration files") {
    auto const path = std::string("webio_config_test.json");
    {
      auto file = std::ofstream(path);
      file << R"({"port": 1234, "verbose": true})";
    }

    auto config = webio::server_config();
    webio::load_config(path, config);
    std::remove(path.c_str());

    CHECK(config.port == 1234);
    CHECK(config.verbose);

    CHECK_THROWS_AS(
      webio::load_config("/nonexistent/webio.json", config), system_error);
  }

  SECTION("should reject malformed configuration files") {
    auto const path = std::string("webio_config_broken.json");
    {
      auto file = std::ofstream(path);
      file << "{ port: ";
    }

    auto config = webio::server_config();
    CHECK_THROWS_AS(webio::load_config(path, config), system_error);
    std::remove(path.c_str());
  }
}

TEST_CASE("Our command line") {

  SECTION("should parse every flag") {
    auto const cmd = parse({
      "--config", "webio.json",
      "--host", "127.0.0.1",
      "--port", "0",
      "--threads", "3",
      "--session-type", "coroutine",
      "--no-coroutine-thread",
      "--expire", "600",
      "--verbose",
      "--probe", "localhost:8080"});

    CHECK(cmd.config_path == std::string("webio.json"));
    CHECK(cmd.host == std::string("127.0.0.1"));
    CHECK(cmd.port == std::uint16_t{0});
    CHECK(cmd.threads == std::size_t{3});
    CHECK(cmd.session_type == webio::session_kind::coroutine);
    CHECK(cmd.no_coroutine_thread);
    CHECK(cmd.session_expire == std::chrono::seconds(600));
    CHECK(cmd.verbose);
    CHECK(cmd.probe == std::string("localhost:8080"));
    CHECK(!cmd.help);
  }

  SECTION("should let flags override defaults") {
    auto const config = webio::resolve_config(
      parse({"--port", "9999", "--session-type", "coroutine", "--verbose"}));

    CHECK(config.port == 9999);
    CHECK(config.session_type == webio::session_kind::coroutine);
    CHECK(config.verbose);
    CHECK(config.host == "0.0.0.0");
  }

  SECTION("should reject bad input") {
    CHECK_THROWS_AS(parse({"--port"}), system_error);
    CHECK_THROWS_AS(parse({"--port", "http"}), system_error);
    CHECK_THROWS_AS(parse({"--port", "65536"}), system_error);
    CHECK_THROWS_AS(parse({"--session-type", "fiber"}), system_error);
    CHECK_THROWS_AS(parse({"--frobnicate"}), system_error);
    CHECK_THROWS_AS(
      webio::resolve_config(parse({"--threads", "0"})), system_error);
  }

  SECTION("should recognize a request for help") {
    CHECK(parse({"-h"}).help);
    CHECK(parse({"--help"}).help);
    CHECK(std::string(webio::usage()).find("--probe") != std::string::npos);
  }
}
