#include "webio/detail/outbox.hpp"

#include <utility>

auto webio::detail::outbox::post(message msg) -> bool {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  if (finished_) {
    return false;
  }

  queue_.push_back(std::move(msg));
  return true;
}

auto webio::detail::outbox::finish() -> void {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  if (finished_) {
    return;
  }

  queue_.push_back(close_session_message());
  finished_ = true;
}

auto webio::detail::outbox::finish(message last) -> void {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  if (finished_) {
    return;
  }

  queue_.push_back(std::move(last));
  queue_.push_back(close_session_message());
  finished_ = true;
}

auto webio::detail::outbox::drain() -> std::vector<message> {
  auto lock = std::lock_guard<std::mutex>(mtx_);

  auto drained = std::vector<message>();
  drained.swap(queue_);

  if (finished_) {
    closed_ = true;
  }
  return drained;
}

auto webio::detail::outbox::finished() const -> bool {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  return finished_;
}

auto webio::detail::outbox::closed() const -> bool {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  return closed_;
}
