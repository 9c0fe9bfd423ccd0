#pragma once

#include <string>
#include <system_error>

namespace sdcp {

/**
 * @brief Library error codes, reported through `std::error_code` in the "sdcp" category.
 *
 * Transport failures keep their native Asio/system codes; everything the
 * protocol engine decides on its own is one of these.
 */
enum class errc {
    decode_error = 1,       ///< malformed envelope or missing required field
    handshake_timeout,      ///< no handshake acknowledgement within the deadline
    protocol_mismatch,      ///< device speaks an unsupported protocol version or refused the handshake
    command_timeout,        ///< no matching acknowledgement within the command deadline
    command_rejected,       ///< device acknowledged with a non-zero Ack
    command_unsupported,    ///< feature catalog says the device lacks the command
    connection_lost,        ///< session dropped while the command was outstanding
    session_closed,         ///< handle closed by the caller
    not_ready,              ///< session is not in the Ready state
    duplicate_request_id,   ///< a command with the same RequestID is still outstanding
    cancelled,              ///< caller cancelled the command
    retries_exhausted,      ///< supervisor gave up after the configured attempts
    liveness_timeout,       ///< no traffic (keepalives included) within the idle window
};

/**
 * @brief Coarse error taxonomy used by callers to branch on failures.
 *
 * Compare any `std::error_code` against these with `==`, e.g.
 * `if (ec == sdcp::ErrorClass::Transport)`.
 */
enum class ErrorClass {
    Transport = 1,
    Decode,
    Protocol,
    CommandTimeout,
    CommandRejected,
    SessionClosed,
};

const std::error_category& sdcp_category() noexcept;
const std::error_category& error_class_category() noexcept;

std::error_code make_error_code(errc e) noexcept;
std::error_condition make_error_condition(ErrorClass e) noexcept;

/// Human readable name of the class an error code belongs to ("transport", "decode", ...).
std::string describeErrorClass(const std::error_code& ec);

} // namespace sdcp

namespace std {
template <>
struct is_error_code_enum<sdcp::errc> : true_type {};

template <>
struct is_error_condition_enum<sdcp::ErrorClass> : true_type {};
} // namespace std
