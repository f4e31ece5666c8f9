#include "webio/task_runner.hpp"
#include "webio/log.hpp"

#include <string>
#include <exception>

webio::task_runner::task_runner()
: io_(1)
{
}

webio::task_runner::~task_runner() {
  stop();
}

auto webio::task_runner::start() -> void {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  if (thread_.joinable()) {
    return;
  }

  io_.restart();
  work_.emplace(io_.get_executor());

  thread_ = std::thread([this]() -> void {
    // a handler that throws must not take every other session down with it
    //
    while (true) {
      try {
        io_.run();
        break;
      } catch (std::exception const& e) {
        webio::log_error(std::string("task runner handler threw: ") + e.what());
      } catch (...) {
        webio::log_error("task runner handler threw a non-exception");
      }
    }
  });
}

auto webio::task_runner::stop() -> void {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  if (!thread_.joinable()) {
    return;
  }

  work_.reset();
  io_.stop();
  thread_.join();
}

auto webio::task_runner::running() -> bool {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  return thread_.joinable();
}

auto webio::task_runner::get_executor() -> executor_type {
  return io_.get_executor();
}
