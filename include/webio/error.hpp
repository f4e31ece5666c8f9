#ifndef WEBIO_ERROR_HPP_
#define WEBIO_ERROR_HPP_

#include <boost/system/error_code.hpp>

#include <iosfwd>
#include <type_traits>

namespace webio {
namespace error {

// every error webio itself reports through a `boost::system::error_code`
//
enum class errc {
  // the session finished or is being torn down; nothing more can be pushed
  // into it and nothing more will come out of it
  //
  session_closed = 1,

  // a thread session's inbound queue stayed full for the whole push timeout
  //
  event_queue_full,

  // the client sent a request body that is not a JSON document
  //
  malformed_event,

  // a configuration value is missing, of the wrong type or out of range
  //
  invalid_config
};

auto category() -> boost::system::error_category const&;

auto make_error_code(errc e) -> boost::system::error_code;

auto operator<<(std::ostream& os, errc e) -> std::ostream&;

} // error
} // webio

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::webio::error::errc> : std::true_type {};

} // system
} // boost

#endif // WEBIO_ERROR_HPP_
