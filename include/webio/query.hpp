#ifndef WEBIO_QUERY_HPP_
#define WEBIO_QUERY_HPP_

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <string_view>

namespace webio {

using query_params = std::vector<std::pair<std::string, std::string>>;

// splits a request target such as "/io?test=1" into its path and query parts;
// the query part excludes the '?' and is empty when there is none
//
auto split_target(std::string_view const target)
  -> std::pair<std::string_view, std::string_view>;

// parses "a=1&b=x%20y" into decoded key/value pairs, in order of appearance
//
// keys without '=' map to an empty value and empty segments are skipped
//
auto parse_query(std::string_view const query) -> query_params;

// the first value for `key`, if any
//
auto find_param(query_params const& params, std::string_view const key)
  -> std::optional<std::string>;

// decodes %XX escapes and '+' as used in application/x-www-form-urlencoded
// data; malformed escapes are kept verbatim
//
auto url_decode(std::string_view const encoded) -> std::string;

// parses "host:port" where the port is all digits; false if either part is
// missing
//
auto parse_host_port(
  std::string_view const authority,
  std::string&           host,
  std::string&           port) -> bool;

} // webio

#endif // WEBIO_QUERY_HPP_
