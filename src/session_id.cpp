#include "webio/session_id.hpp"

#include <boost/asio/ssl/error.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <string_view>

namespace asio = boost::asio;

using boost::system::error_code;
using boost::system::system_error;

namespace {

constexpr auto alphabet = std::string_view(
  "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
  "abcdefghijklmnopqrstuvwxyz"
  "0123456789");

// 248 is the largest multiple of 62 that fits in a byte; anything at or above
// it is discarded so every character stays equally likely
//
constexpr auto rejection_limit =
  static_cast<unsigned>(256 - 256 % alphabet.size());

} // anonymous

auto webio::make_session_id(std::size_t const length) -> std::string {
  auto id = std::string();
  id.reserve(length);

  auto bytes = std::array<unsigned char, 64>();

  while (id.size() < length) {
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
      throw system_error(
        error_code(
          static_cast<int>(::ERR_get_error()),
          asio::error::get_ssl_category()),
        "RAND_bytes");
    }

    for (auto const byte : bytes) {
      if (id.size() == length) {
        break;
      }

      if (byte >= rejection_limit) {
        continue;
      }

      id.push_back(alphabet[byte % alphabet.size()]);
    }
  }

  return id;
}
