#ifndef WEBIO_EXPIRY_TRACKER_HPP_
#define WEBIO_EXPIRY_TRACKER_HPP_

#include <list>
#include <chrono>
#include <string>
#include <cstddef>
#include <utility>
#include <functional>
#include <unordered_map>

namespace webio {

// expiry_tracker records when each session identifier was last active, kept
// in access order: least recently touched first
//
// not thread-safe, the `webio::session_registry` serializes every call
//
struct expiry_tracker {
public:
  using clock_type = std::chrono::steady_clock;
  using time_point = clock_type::time_point;
  using duration   = clock_type::duration;

private:
  using entry_type = std::pair<std::string, time_point>;
  using list_type  = std::list<entry_type>;

  list_type                                             entries_;
  std::unordered_map<std::string, list_type::iterator> index_;

public:
  expiry_tracker()                      = default;
  expiry_tracker(expiry_tracker const&) = delete;
  expiry_tracker(expiry_tracker&&)      = default;

  // inserts `id` or moves it to the most recent end
  //
  // `now` is clamped so that it is never older than the current most recent
  // timestamp; a caller that sampled its clock a little earlier than another
  // one can therefore never break the ordering
  //
  auto touch(std::string const& id, time_point now) -> void;

  auto erase(std::string const& id) -> bool;

  // removes, oldest first, every entry idle for at least `max_idle`, calling
  // `on_expired` for each; stops at the first entry that is still fresh
  //
  auto evict_expired(
    time_point const                              now,
    duration const                                max_idle,
    std::function<void(std::string const&)> const& on_expired) -> std::size_t;

  auto size() const -> std::size_t;
  auto contains(std::string const& id) const -> bool;

  // the recorded timestamp for `id`; `time_point()` when absent
  //
  auto last_active(std::string const& id) const -> time_point;
};

} // webio

#endif // WEBIO_EXPIRY_TRACKER_HPP_
