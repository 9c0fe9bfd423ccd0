#pragma once

#include "sdcp/core/Expected.hpp"
#include "sdcp/net/NetConfig.hpp"
#include "sdcp/protocol/SdcpConfig.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace sdcp::session {

using net::error_code;

struct Endpoint {
    std::string host;
    unsigned short port = config::SDCP_CONTROL_PORT;
    std::string path = std::string(config::SDCP_WEBSOCKET_PATH);
};

/**
 * @brief Message-oriented duplex connection carrying one SDCP envelope per message.
 *
 * `send` may be called from any thread while one reader thread sits in
 * `receive`. `close` is safe from any thread and makes a blocked `receive`
 * or `connect` return promptly. A transport is single-use.
 */
class MessageTransport {
public:
    virtual ~MessageTransport() = default;

    virtual error_code connect(const Endpoint& endpoint, std::chrono::milliseconds timeout) = 0;
    virtual error_code send(std::string_view text, std::chrono::milliseconds timeout) = 0;

    /// Next text message; `net::timed_out()` when nothing arrived in time.
    virtual expected<std::string> receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

/// Produces a fresh transport for every connection attempt.
using TransportFactory = std::function<std::unique_ptr<MessageTransport>()>;

} // namespace sdcp::session
