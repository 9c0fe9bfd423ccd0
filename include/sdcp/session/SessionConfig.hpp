#pragma once

#include "sdcp/protocol/SdcpConfig.hpp"

#include <chrono>
#include <cstddef>

namespace sdcp::session {

using std::chrono::milliseconds;

/// Per-session timing. A zero keepalive interval or idle timeout disables it.
/// More than `decodeFailureTolerance` undecodable messages among the last
/// `decodeFailureWindow` received ends the session.
struct SessionConfig {
    milliseconds connectTimeout = config::SDCP_CONNECT_TIMEOUT;
    milliseconds handshakeTimeout = config::SDCP_HANDSHAKE_TIMEOUT;
    milliseconds commandTimeout = config::SDCP_COMMAND_TIMEOUT;
    milliseconds keepaliveInterval = config::SDCP_KEEPALIVE_INTERVAL;
    milliseconds idleTimeout = config::SDCP_IDLE_TIMEOUT;
    milliseconds readPollSlice = config::SDCP_READ_POLL_SLICE;
    std::size_t decodeFailureTolerance = config::SDCP_DECODE_FAILURE_TOLERANCE;
    std::size_t decodeFailureWindow = config::SDCP_DECODE_FAILURE_WINDOW;
};

struct BackoffConfig {
    milliseconds base = config::SDCP_BACKOFF_BASE;
    milliseconds cap = config::SDCP_BACKOFF_CAP;
    bool jitter = true;
    std::size_t maxAttempts = 0;  // consecutive failures before giving up; 0 = never
};

enum class SessionState {
    Disconnected,
    Connecting,
    Handshaking,
    Ready,
    Reconnecting,
    Closed,
};

const char* toString(SessionState state);

} // namespace sdcp::session
