#ifndef WEBIO_LOG_HPP_
#define WEBIO_LOG_HPP_

#include <string_view>
#include <boost/system/error_code.hpp>

namespace webio {
  auto log_error(
    boost::system::error_code const ec,
    std::string_view const what
  ) -> void;

  auto log_error(std::string_view const what) -> void;

  auto log_info(std::string_view const what) -> void;
} // webio

#endif // WEBIO_LOG_HPP_
