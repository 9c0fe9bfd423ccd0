#pragma once

#include "sdcp/core/Expected.hpp"
#include "sdcp/protocol/Frame.hpp"
#include "sdcp/session/CommandCorrelator.hpp"
#include "sdcp/session/MessageTransport.hpp"
#include "sdcp/session/SessionConfig.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>

namespace sdcp::session {

struct SessionOptions {
    SessionConfig config;
    std::string deviceId;         ///< envelope `Id` of outgoing requests
    std::string mainboardId;      ///< learned from the handshake when empty
    std::string protocolVersion;  ///< as advertised by discovery; may be empty
    int from = config::SDCP_FROM_LAN_PC;
};

/**
 * @brief One live control connection to a printer.
 *
 * Lifecycle:
 * - `connect()` opens the transport, starts the read loop, then performs the
 *   handshake (attributes request, matching acknowledgement).
 * - The read loop routes acknowledgements to the correlator and every other
 *   frame to the frame handler, in arrival order, on its own thread.
 * - Loss (transport failure, idle timeout, too many undecodable messages) is
 *   reported once through the loss handler after the handshake succeeded.
 *   A local `close()` is not reported.
 *
 * Handlers run on the read-loop thread; they must not block on commands sent
 * through this session.
 */
class ControlSession : public std::enable_shared_from_this<ControlSession> {
    struct Token {
        explicit Token() = default;
    };

public:
    using FrameHandler = std::function<void(const protocol::Frame&)>;
    using LossHandler = std::function<void(error_code)>;

    struct Handlers {
        FrameHandler onFrame;
        LossHandler onLoss;
        std::function<void()> onTransportUp;  ///< between transport connect and handshake
    };

    [[nodiscard]] static expected<std::shared_ptr<ControlSession>>
    connect(std::shared_ptr<MessageTransport> transport,
            const Endpoint& endpoint,
            std::shared_ptr<CommandCorrelator> correlator,
            SessionOptions options,
            Handlers handlers = {});

    /// Use connect(); the token keeps construction private to it.
    ControlSession(Token,
                   std::shared_ptr<MessageTransport> transport,
                   std::shared_ptr<CommandCorrelator> correlator,
                   SessionOptions options,
                   Handlers handlers);
    ~ControlSession();

    ControlSession(const ControlSession&) = delete;
    ControlSession& operator=(const ControlSession&) = delete;

    /// Send a request and wait for its acknowledgement. A missing RequestID is generated.
    CommandResult send(protocol::Frame request, std::chrono::milliseconds timeout);

    /// Send a request and return without waiting; the ticket resolves later.
    [[nodiscard]] expected<CommandCorrelator::Ticket> sendAsync(protocol::Frame request,
                                                                std::chrono::milliseconds timeout);

    /// Fire-and-forget: the acknowledgement, if any, is consumed silently.
    error_code post(protocol::Frame request);

    void setFrameHandler(FrameHandler handler);
    void setLossHandler(LossHandler handler);

    /// Stop the session and join the read loop (unless called from it).
    void close();

    /// Stop the session without waiting for the read loop to exit.
    void abort();

    bool isOpen() const { return !stopping_.load() && !lost_.load(); }
    const std::string& mainboardId() const { return options_.mainboardId; }
    const SessionOptions& options() const { return options_; }
    std::shared_ptr<CommandCorrelator> correlator() const { return correlator_; }

    /// True on the session's own read-loop thread.
    bool onReaderThread() const { return std::this_thread::get_id() == readerId_.load(); }

private:
    error_code handshake();
    void readLoop();
    /// Decode and route one message; false if it could not be decoded.
    bool dispatch(const std::string& text);
    bool reportLoss(error_code ec);
    error_code transmit(const protocol::Frame& frame, std::chrono::milliseconds timeout);
    void prepare(protocol::Frame& request) const;

    std::shared_ptr<MessageTransport> transport_;
    std::shared_ptr<CommandCorrelator> correlator_;
    SessionOptions options_;

    std::mutex handlerMutex_;
    Handlers handlers_;

    std::mutex postedMutex_;
    std::unordered_set<std::string> posted_;

    std::mutex versionMutex_;
    std::string advertisedVersion_;

    std::string handshakeId_;
    std::mutex closeMutex_;
    std::thread reader_;
    std::atomic<std::thread::id> readerId_{};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> lost_{false};
    std::atomic<bool> established_{false};
    std::atomic<bool> lossReported_{false};
};

} // namespace sdcp::session
