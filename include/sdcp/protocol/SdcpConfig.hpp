#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace sdcp::config {

/**
 * @brief Constants that define SDCP networking behaviour.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short SDCP_DISCOVERY_PORT = 3000;
constexpr unsigned short SDCP_CONTROL_PORT = 3030;
constexpr std::string_view SDCP_WEBSOCKET_PATH = "/websocket";
constexpr std::string_view SDCP_BROADCAST_ADDRESS = "255.255.255.255";
constexpr std::string_view SDCP_DISCOVERY_PROBE = "M99999";
constexpr std::size_t SDCP_DATAGRAM_BUFFER_SIZE = 8192;
constexpr std::size_t SDCP_MAX_MESSAGE_SIZE = 4 * 1024 * 1024;   // one reassembled WebSocket message

// Protocol --------------------------------------------------------------------
constexpr int SDCP_PROTOCOL_MAJOR = 3;      // "V3.0.0" firmware
constexpr std::string_view SDCP_TOPIC_PREFIX = "sdcp/";
constexpr std::string_view SDCP_KEEPALIVE_REQUEST = "ping";
constexpr std::string_view SDCP_KEEPALIVE_REPLY = "pong";
constexpr int SDCP_FROM_LAN_PC = 0;         // "From" identity of a LAN client
constexpr int SDCP_ACK_SUCCESS = 0;

// Session timing defaults -------------------------------------------------------
constexpr std::chrono::milliseconds SDCP_CONNECT_TIMEOUT{3000};
constexpr std::chrono::milliseconds SDCP_HANDSHAKE_TIMEOUT{3000};
constexpr std::chrono::milliseconds SDCP_COMMAND_TIMEOUT{5000};
constexpr std::chrono::milliseconds SDCP_KEEPALIVE_INTERVAL{25000};
constexpr std::chrono::milliseconds SDCP_IDLE_TIMEOUT{60000};
constexpr std::chrono::milliseconds SDCP_READ_POLL_SLICE{250};
constexpr std::size_t SDCP_DECODE_FAILURE_TOLERANCE = 5;   // undecodable messages ...
constexpr std::size_t SDCP_DECODE_FAILURE_WINDOW = 20;     // ... among the last this many

constexpr std::chrono::milliseconds SDCP_PROBE_TIMEOUT{2000};
constexpr std::size_t SDCP_SUBSCRIPTION_DEPTH = 64;

// Reconnect backoff -----------------------------------------------------------
constexpr std::chrono::milliseconds SDCP_BACKOFF_BASE{1000};
constexpr std::chrono::milliseconds SDCP_BACKOFF_CAP{30000};

} // namespace sdcp::config
