#include "webio/error.hpp"

#include <ostream>
#include <string>

namespace {

struct category_impl : public boost::system::error_category {
  auto name() const noexcept -> char const* override {
    return "webio";
  }

  auto message(int const val) const -> std::string override {
    using webio::error::errc;

    switch (static_cast<errc>(val)) {
      case errc::session_closed:
        return "session is closed";

      case errc::event_queue_full:
        return "session event queue stayed full for the whole push timeout";

      case errc::malformed_event:
        return "request body is not a valid JSON event";

      case errc::invalid_config:
        return "invalid configuration value";
    }
    return "unknown webio error";
  }
};

} // anonymous

auto webio::error::category() -> boost::system::error_category const& {
  static auto const instance = category_impl();
  return instance;
}

auto webio::error::make_error_code(errc const e) -> boost::system::error_code {
  return boost::system::error_code(static_cast<int>(e), category());
}

auto webio::error::operator<<(std::ostream& os, errc const e) -> std::ostream& {
  switch (e) {
    case errc::session_closed:   return os << "session_closed";
    case errc::event_queue_full: return os << "event_queue_full";
    case errc::malformed_event:  return os << "malformed_event";
    case errc::invalid_config:   return os << "invalid_config";
  }
  return os << static_cast<int>(e);
}
