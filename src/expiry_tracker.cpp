#include "webio/expiry_tracker.hpp"

#include <iterator>
#include <algorithm>

auto webio::expiry_tracker::touch(std::string const& id, time_point now)
  -> void {

  if (!entries_.empty()) {
    now = std::max(now, entries_.back().second);
  }

  auto pos = index_.find(id);
  if (pos == index_.end()) {
    entries_.emplace_back(id, now);
    index_.emplace(id, std::prev(entries_.end()));
    return;
  }

  auto it = pos->second;
  it->second = now;
  entries_.splice(entries_.end(), entries_, it);
}

auto webio::expiry_tracker::erase(std::string const& id) -> bool {
  auto pos = index_.find(id);
  if (pos == index_.end()) {
    return false;
  }

  entries_.erase(pos->second);
  index_.erase(pos);
  return true;
}

auto webio::expiry_tracker::evict_expired(
  time_point const                               now,
  duration const                                 max_idle,
  std::function<void(std::string const&)> const& on_expired) -> std::size_t {

  auto evicted = std::size_t{0};

  while (!entries_.empty()) {
    auto& oldest = entries_.front();
    if (now - oldest.second < max_idle) {
      break;
    }

    auto id = std::move(oldest.first);
    index_.erase(id);
    entries_.pop_front();
    ++evicted;

    if (on_expired) {
      on_expired(id);
    }
  }

  return evicted;
}

auto webio::expiry_tracker::size() const -> std::size_t {
  return entries_.size();
}

auto webio::expiry_tracker::contains(std::string const& id) const -> bool {
  return index_.find(id) != index_.end();
}

auto webio::expiry_tracker::last_active(std::string const& id) const
  -> time_point {

  auto pos = index_.find(id);
  if (pos == index_.end()) {
    return time_point();
  }
  return pos->second->second;
}
