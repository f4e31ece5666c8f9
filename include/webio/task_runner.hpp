#ifndef WEBIO_TASK_RUNNER_HPP_
#define WEBIO_TASK_RUNNER_HPP_

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>

#include <mutex>
#include <thread>
#include <optional>

namespace webio {

// task_runner is a single-threaded execution context on a thread of its own
//
// coroutine sessions are scheduled cooperatively on it; handing work to it
// (`asio::post`, `co_spawn` on `get_executor()`) is safe from any thread
//
struct task_runner {
public:
  using executor_type = boost::asio::io_context::executor_type;

private:
  using work_guard_type = boost::asio::executor_work_guard<executor_type>;

  boost::asio::io_context        io_;
  std::optional<work_guard_type> work_;
  std::thread                    thread_;
  std::mutex                     mtx_;

public:
  task_runner();
  task_runner(task_runner const&) = delete;
  task_runner(task_runner&&)      = delete;

  // stops and joins the thread; pending coroutines are destroyed along with
  // the io_context
  //
  ~task_runner();

  // starting or stopping twice is harmless
  //
  auto start() -> void;
  auto stop() -> void;

  auto running() -> bool;
  auto get_executor() -> executor_type;
};

} // webio

#endif // WEBIO_TASK_RUNNER_HPP_
