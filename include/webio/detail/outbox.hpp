#ifndef WEBIO_DETAIL_OUTBOX_HPP_
#define WEBIO_DETAIL_OUTBOX_HPP_

#include "webio/session.hpp"

#include <mutex>
#include <vector>

namespace webio {
namespace detail {

// outbox is the outbound half of every session: the application appends, the
// dispatcher drains
//
// once finished, the outbox holds a trailing `close_session` message and
// reports itself closed only after that message has been drained, so a
// session can never be dropped with its last words still queued
//
struct outbox {
private:
  mutable std::mutex   mtx_;
  std::vector<message> queue_;
  bool                 finished_ = false;
  bool                 closed_   = false;

public:
  outbox()              = default;
  outbox(outbox const&) = delete;
  outbox(outbox&&)      = delete;

  // false once the outbox is finished, the message is dropped
  //
  auto post(message msg) -> bool;

  // idempotent
  //
  auto finish() -> void;
  auto finish(message last) -> void;

  auto drain() -> std::vector<message>;

  auto finished() const -> bool;
  auto closed() const -> bool;
};

} // detail
} // webio

#endif // WEBIO_DETAIL_OUTBOX_HPP_
