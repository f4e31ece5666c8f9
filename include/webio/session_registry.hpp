#ifndef WEBIO_SESSION_REGISTRY_HPP_
#define WEBIO_SESSION_REGISTRY_HPP_

#include "webio/session.hpp"
#include "webio/expiry_tracker.hpp"

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <functional>
#include <unordered_map>

namespace webio {

// session_registry maps session identifiers to live sessions and keeps the
// matching expiry records; a registered identifier always has both
//
// every member function is safe to call concurrently
//
// handles leaving the registry (`remove`, `evict_expired`) are returned to
// the caller so the last reference is dropped outside the lock
//
struct session_registry {
public:
  using handle_type  = std::shared_ptr<session>;
  using time_point   = expiry_tracker::time_point;
  using duration     = expiry_tracker::duration;
  using id_generator = std::function<std::string()>;

private:
  mutable std::mutex                           mtx_;
  std::unordered_map<std::string, handle_type> sessions_;
  expiry_tracker                               tracker_;
  id_generator                                 next_id_;

public:
  session_registry();

  explicit
  session_registry(id_generator next_id);

  session_registry(session_registry const&) = delete;
  session_registry(session_registry&&)      = delete;

  // constructs a session with `factory` (outside the lock; a throwing
  // factory leaves the registry untouched) and registers it under a fresh,
  // unused identifier
  //
  auto create(session_factory const& factory, time_point const now)
    -> std::pair<std::string, handle_type>;

  // nullptr for unknown identifiers; a hit refreshes the expiry record
  //
  auto lookup(std::string const& id, time_point const now) -> handle_type;

  // idempotent, nullptr when `id` was not registered
  //
  auto remove(std::string const& id) -> handle_type;

  auto evict_expired(time_point const now, duration const max_idle)
    -> std::vector<handle_type>;

  auto size() const -> std::size_t;
  auto contains(std::string const& id) const -> bool;
};

} // webio

#endif // WEBIO_SESSION_REGISTRY_HPP_
