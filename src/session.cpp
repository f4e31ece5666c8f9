#include "webio/session.hpp"

auto webio::close_session_message() -> message {
  return message{{"command", "close_session"}};
}

auto webio::error_message(std::string const& what) -> message {
  return message{{"command", "error"}, {"message", what}};
}
