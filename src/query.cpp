#include "webio/query.hpp"

#include <boost/spirit/home/x3.hpp>
#include <boost/fusion/container/vector.hpp>

namespace x3     = boost::spirit::x3;
namespace fusion = boost::fusion;

auto webio::split_target(std::string_view const target)
  -> std::pair<std::string_view, std::string_view> {

  auto const pos = target.find('?');
  if (pos == std::string_view::npos) {
    return {target, std::string_view()};
  }

  return {target.substr(0, pos), target.substr(pos + 1)};
}

auto webio::parse_query(std::string_view const query) -> query_params {
  auto params = query_params();

  auto rest = query;
  while (!rest.empty()) {
    auto const amp     = rest.find('&');
    auto const segment = rest.substr(0, amp);

    rest = (amp == std::string_view::npos)
      ? std::string_view()
      : rest.substr(amp + 1);

    if (segment.empty()) {
      continue;
    }

    auto key   = std::string();
    auto value = std::string();

    auto key_and_value =
      fusion::vector<std::string&, std::string&>(key, value);

    auto begin = segment.begin();
    auto const parsed = x3::parse(
      begin, segment.end(),
      +(x3::char_ - '=') >> -('=' >> *x3::char_),
      key_and_value);

    // a segment like "=x" has no key
    //
    if (!parsed) {
      continue;
    }

    params.emplace_back(url_decode(key), url_decode(value));
  }

  return params;
}

auto webio::find_param(query_params const& params, std::string_view const key)
  -> std::optional<std::string> {

  for (auto const& [k, v] : params) {
    if (k == key) {
      return v;
    }
  }
  return std::nullopt;
}

auto webio::url_decode(std::string_view const encoded) -> std::string {
  auto decoded = std::string();
  decoded.reserve(encoded.size());

  auto const hex_value = [](char const c) -> int {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
  };

  for (auto i = std::size_t{0}; i < encoded.size(); ++i) {
    auto const c = encoded[i];

    if (c == '+') {
      decoded.push_back(' ');
      continue;
    }

    if (c == '%' && i + 2 < encoded.size()) {
      auto const hi = hex_value(encoded[i + 1]);
      auto const lo = hex_value(encoded[i + 2]);
      if (hi >= 0 && lo >= 0) {
        decoded.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }

    decoded.push_back(c);
  }

  return decoded;
}

auto webio::parse_host_port(
  std::string_view const authority,
  std::string&           host,
  std::string&           port) -> bool {

  host.clear();
  port.clear();

  auto host_and_port =
    fusion::vector<std::string&, std::string&>(host, port);

  auto begin = authority.begin();
  auto const parsed = x3::parse(
    begin, authority.end(),
    +(x3::char_ - ':') >> ':' >> +x3::digit,
    host_and_port);

  return parsed && begin == authority.end();
}
