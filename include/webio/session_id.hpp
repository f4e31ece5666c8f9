#ifndef WEBIO_SESSION_ID_HPP_
#define WEBIO_SESSION_ID_HPP_

#include <string>
#include <cstddef>

namespace webio {

// make_session_id draws `length` characters uniformly from [A-Za-z0-9] using
// OpenSSL's CSPRNG
//
// throws `boost::system::system_error` in the (unlikely) event that the
// random generator cannot be seeded
//
auto make_session_id(std::size_t const length = 24) -> std::string;

} // webio

#endif // WEBIO_SESSION_ID_HPP_
