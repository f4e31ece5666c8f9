#ifndef WEBIO_TYPE_TRAITS_HPP_
#define WEBIO_TYPE_TRAITS_HPP_

#include <boost/asio/strand.hpp>
#include <boost/beast/http/message.hpp>

#include <type_traits>

namespace webio {

// true for `asio::strand<E>`; `detail::get_strand` uses it to avoid
// stacking a strand on top of another one
//
template <typename T>
inline constexpr bool is_strand_v = false;

template <typename Executor>
inline constexpr bool is_strand_v<boost::asio::strand<Executor>> = true;

template <typename T>
using is_strand = std::bool_constant<is_strand_v<T>>;

// true for any `http::request` or `http::response`; constrains the write
// side of a connection
//
template <typename T>
inline constexpr bool is_message_v = false;

template <bool isRequest, typename Body, typename Fields>
inline constexpr bool is_message_v<
  boost::beast::http::message<isRequest, Body, Fields>> = true;

template <typename T>
using is_message = std::bool_constant<is_message_v<T>>;

} // webio

#endif // WEBIO_TYPE_TRAITS_HPP_
