#include "webio/log.hpp"

#include <mutex>
#include <iostream>

namespace {

// request threads, session threads and the task runner all log; keep their
// lines from interleaving
//
std::mutex log_mtx;

} // anonymous

auto webio::log_error(
  boost::system::error_code const ec,
  std::string_view const what
) -> void {

  auto lock = std::lock_guard<std::mutex>(log_mtx);
  std::cerr << what << " : " << ec.message() << " (" << ec << ")\n";
}

auto webio::log_error(std::string_view const what) -> void {
  auto lock = std::lock_guard<std::mutex>(log_mtx);
  std::cerr << "error : " << what << "\n";
}

auto webio::log_info(std::string_view const what) -> void {
  auto lock = std::lock_guard<std::mutex>(log_mtx);
  std::cerr << what << "\n";
}
