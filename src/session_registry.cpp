#include "webio/session_registry.hpp"
#include "webio/session_id.hpp"

webio::session_registry::session_registry()
: session_registry([]() -> std::string { return webio::make_session_id(); })
{
}

webio::session_registry::session_registry(id_generator next_id)
: next_id_(std::move(next_id))
{
}

auto webio::session_registry::create(
  session_factory const& factory,
  time_point const       now) -> std::pair<std::string, handle_type> {

  auto handle = factory();

  auto lock = std::lock_guard<std::mutex>(mtx_);

  auto id = next_id_();
  while (sessions_.find(id) != sessions_.end()) {
    id = next_id_();
  }

  sessions_.emplace(id, handle);
  tracker_.touch(id, now);

  return {std::move(id), std::move(handle)};
}

auto webio::session_registry::lookup(
  std::string const& id,
  time_point const   now) -> handle_type {

  auto lock = std::lock_guard<std::mutex>(mtx_);

  auto pos = sessions_.find(id);
  if (pos == sessions_.end()) {
    return nullptr;
  }

  tracker_.touch(id, now);
  return pos->second;
}

auto webio::session_registry::remove(std::string const& id) -> handle_type {
  auto lock = std::lock_guard<std::mutex>(mtx_);

  auto pos = sessions_.find(id);
  if (pos == sessions_.end()) {
    return nullptr;
  }

  auto handle = std::move(pos->second);
  sessions_.erase(pos);
  tracker_.erase(id);

  return handle;
}

auto webio::session_registry::evict_expired(
  time_point const now,
  duration const   max_idle) -> std::vector<handle_type> {

  auto evicted = std::vector<handle_type>();

  auto lock = std::lock_guard<std::mutex>(mtx_);

  tracker_.evict_expired(
    now, max_idle,
    [&](std::string const& id) -> void {
      auto pos = sessions_.find(id);
      if (pos == sessions_.end()) {
        return;
      }

      evicted.push_back(std::move(pos->second));
      sessions_.erase(pos);
    });

  return evicted;
}

auto webio::session_registry::size() const -> std::size_t {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  return sessions_.size();
}

auto webio::session_registry::contains(std::string const& id) const -> bool {
  auto lock = std::lock_guard<std::mutex>(mtx_);
  return sessions_.find(id) != sessions_.end();
}
