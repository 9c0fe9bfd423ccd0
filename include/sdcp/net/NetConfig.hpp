#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <system_error>   // std::error_code

namespace sdcp::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `sdcp::net::asio` as the Boost.Asio namespace.
 * - `sdcp::net::tcp` and `sdcp::net::udp` as protocol aliases.
 * - `error_code` and `milliseconds`, the currency of every blocking helper.
 *
 * Library code reports `std::error_code`; Boost codes convert implicitly at
 * the completion handlers.
 */
namespace asio = boost::asio;

using tcp = asio::ip::tcp;
using udp = asio::ip::udp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

/// The code every blocking helper returns when its deadline passes.
inline error_code timed_out() {
    return std::make_error_code(std::errc::timed_out);
}

inline bool is_timeout(const error_code& ec) {
    return ec == std::errc::timed_out;
}

} // namespace sdcp::net
