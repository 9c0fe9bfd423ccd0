#pragma once

#include "sdcp/core/Expected.hpp"
#include "sdcp/discovery/Discovery.hpp"
#include "sdcp/net/NetService.hpp"
#include "sdcp/printer/CommandError.hpp"
#include "sdcp/printer/FeatureCatalog.hpp"
#include "sdcp/printer/StatusSubscription.hpp"
#include "sdcp/protocol/DeviceDescriptor.hpp"
#include "sdcp/protocol/Frame.hpp"
#include "sdcp/session/SessionSupervisor.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdcp::printer {

using protocol::DeviceDescriptor;
using protocol::Frame;
using protocol::Json;
using session::SessionState;

struct PrinterConfig {
    session::SessionConfig session;
    session::BackoffConfig backoff;
    std::chrono::milliseconds readyWait = config::SDCP_CONNECT_TIMEOUT + config::SDCP_HANDSHAKE_TIMEOUT;
    std::chrono::milliseconds probeTimeout = config::SDCP_PROBE_TIMEOUT;
    int from = config::SDCP_FROM_LAN_PC;
    std::size_t subscriptionDepth = config::SDCP_SUBSCRIPTION_DEPTH;
    unsigned short controlPort = config::SDCP_CONTROL_PORT;
    discovery::DiscoveryConfig discovery;
};

/**
 * @brief Long-lived handle to one printer.
 *
 * Wraps a SessionSupervisor, so the handle stays usable across reconnects:
 * commands fail fast with errc::not_ready while the link is down, and the
 * last-known status and attributes stay readable.
 *
 * Threading:
 * - Every public method is thread-safe.
 * - Status callbacks run on the session's read thread. They may call close()
 *   and commandAsync(), but a blocking command() from a callback waits for an
 *   acknowledgement that thread would have to deliver, so it times out.
 * - Destroying the Printer joins its threads; do not destroy it from a callback.
 */
class Printer {
public:
    using StatusCallback = std::function<void(const Frame&)>;

    explicit Printer(DeviceDescriptor descriptor,
                     PrinterConfig config = {},
                     std::shared_ptr<const FeatureCatalog> catalog = nullptr);

    /// Use @p factory for the control connection instead of WebSocket.
    Printer(DeviceDescriptor descriptor,
            session::TransportFactory factory,
            PrinterConfig config = {},
            std::shared_ptr<const FeatureCatalog> catalog = nullptr);

    ~Printer();

    Printer(const Printer&) = delete;
    Printer& operator=(const Printer&) = delete;

    /// Probe @p address, build a Printer from the reply and open it.
    static expected<std::unique_ptr<Printer>> connect(const std::string& address,
                                                      PrinterConfig config = {},
                                                      std::shared_ptr<const FeatureCatalog> catalog = nullptr);

    /// Start connecting and wait up to @p waitForReady for the Ready state.
    /// `net::timed_out()` means still trying in the background.
    std::error_code open(std::chrono::milliseconds waitForReady);
    std::error_code open() { return open(config_.readyWait); }

    CommandOutcome command(std::string_view name,
                           Json arguments = Json::object(),
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    CommandOutcome command(int code,
                           Json arguments = Json::object(),
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    PendingCommandHandle commandAsync(std::string_view name,
                                      Json arguments = Json::object(),
                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    PendingCommandHandle commandAsync(int code,
                                      Json arguments = Json::object(),
                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    CommandOutcome refreshStatus();
    CommandOutcome requestAttributes();
    CommandOutcome startPrint(const std::string& filename, int startLayer = 0);
    CommandOutcome pausePrint();
    CommandOutcome resumePrint();
    CommandOutcome stopPrint();
    /// Enable (or disable) the camera stream; returns its URL when enabling.
    expected<std::string, CommandError> openVideoStream(bool enable = true);

    StatusSubscription subscribeStatus();
    std::size_t addStatusCallback(StatusCallback callback);
    bool removeStatusCallback(std::size_t id);

    std::optional<Frame> currentStatus() const;
    std::optional<Frame> attributes() const;

    SessionState state() const { return supervisor_->state(); }
    const DeviceDescriptor& descriptor() const { return descriptor_; }
    std::error_code lastError() const { return supervisor_->lastError(); }

    /// Idempotent. Cancels outstanding commands and ends every subscription.
    void close();

private:
    void init(session::TransportFactory factory);
    expected<session::CommandCorrelator::Ticket, CommandError>
    issue(int code, Json arguments, std::chrono::milliseconds timeout);
    void onReady(session::ControlSession& session);
    void onFrame(const Frame& frame);
    void onStateChange(SessionState from, SessionState to, std::error_code error);
    void finishSubscriptions(std::error_code reason);

    DeviceDescriptor descriptor_;
    PrinterConfig config_;
    std::shared_ptr<const FeatureCatalog> catalog_;

    std::unique_ptr<net::NetService> net_;
    std::shared_ptr<session::CommandCorrelator> correlator_;
    std::unique_ptr<session::SessionSupervisor> supervisor_;

    mutable std::mutex mutex_;
    std::optional<Frame> status_;
    std::optional<Frame> attributes_;
    std::vector<std::weak_ptr<detail::StatusQueue>> subscriptions_;
    std::map<std::size_t, StatusCallback> callbacks_;
    std::size_t nextCallbackId_ = 1;
    bool ended_ = false;
    std::error_code endReason_;
    std::atomic<bool> closed_{false};
};

} // namespace sdcp::printer
