#include "sdcp/printer/Printer.hpp"

#include "sdcp/core/Error.hpp"
#include "sdcp/log/Log.hpp"
#include "sdcp/protocol/Commands.hpp"
#include "sdcp/protocol/WireCodec.hpp"
#include "sdcp/session/WebSocketTransport.hpp"

namespace sdcp::printer {

using protocol::Command;
using protocol::toCode;

namespace {

CommandError makeError(errc code, std::string detail) {
    return CommandError{make_error_code(code), std::nullopt, std::move(detail)};
}

} // namespace

Printer::Printer(DeviceDescriptor descriptor,
                 PrinterConfig config,
                 std::shared_ptr<const FeatureCatalog> catalog)
: descriptor_(std::move(descriptor))
, config_(std::move(config))
, catalog_(std::move(catalog))
, net_(std::make_unique<net::NetService>())
{
    init(session::webSocketTransportFactory(net_->context()));
}

Printer::Printer(DeviceDescriptor descriptor,
                 session::TransportFactory factory,
                 PrinterConfig config,
                 std::shared_ptr<const FeatureCatalog> catalog)
: descriptor_(std::move(descriptor))
, config_(std::move(config))
, catalog_(std::move(catalog))
{
    init(std::move(factory));
}

Printer::~Printer() {
    close();
    // Joins the worker, which in turn joins the session's read loop; both
    // must be gone before the I/O thread stops.
    supervisor_.reset();
}

void Printer::init(session::TransportFactory factory) {
    correlator_ = std::make_shared<session::CommandCorrelator>();

    session::SessionOptions options;
    options.config = config_.session;
    options.deviceId = descriptor_.id;
    options.mainboardId = descriptor_.mainboardId;
    options.protocolVersion = descriptor_.protocolVersion;
    options.from = config_.from;

    session::Endpoint endpoint;
    endpoint.host = descriptor_.address;
    endpoint.port = config_.controlPort;

    session::SessionSupervisor::Hooks hooks;
    hooks.onReady = [this](session::ControlSession& live){ onReady(live); };
    hooks.onFrame = [this](const Frame& frame){ onFrame(frame); };

    supervisor_ = std::make_unique<session::SessionSupervisor>(
        std::move(factory), std::move(endpoint), correlator_, std::move(options),
        config_.backoff, std::move(hooks));
    supervisor_->addStateObserver([this](SessionState from, SessionState to, std::error_code error){
        onStateChange(from, to, error);
    });
}

expected<std::unique_ptr<Printer>> Printer::connect(const std::string& address,
                                                    PrinterConfig config,
                                                    std::shared_ptr<const FeatureCatalog> catalog) {
    auto descriptor = discovery::probe(address, config.probeTimeout, config.discovery);
    if (!descriptor) {
        logError("[Printer] no SDCP device answered at ", address, ": ",
                 descriptor.error().message(), "\n");
        return unexpected(descriptor.error());
    }

    const auto readyWait = config.readyWait;
    auto printer = std::make_unique<Printer>(std::move(*descriptor), std::move(config), std::move(catalog));
    if (auto ec = printer->open(readyWait); ec && printer->state() == SessionState::Closed) {
        return unexpected(ec);
    }
    return std::move(printer);
}

std::error_code Printer::open(std::chrono::milliseconds waitForReady) {
    if (closed_) {
        return make_error_code(errc::session_closed);
    }
    supervisor_->start();
    if (supervisor_->waitForState(SessionState::Ready, waitForReady)) {
        return {};
    }
    if (supervisor_->state() == SessionState::Closed) {
        const auto ec = supervisor_->lastError();
        return ec ? ec : make_error_code(errc::session_closed);
    }
    return net::timed_out();
}

expected<session::CommandCorrelator::Ticket, CommandError>
Printer::issue(int code, Json arguments, std::chrono::milliseconds timeout) {
    const std::string name(protocol::commandName(code));
    if (closed_ || supervisor_->state() == SessionState::Closed) {
        const auto last = supervisor_->lastError();
        if (last == errc::retries_exhausted) {
            return unexpected(CommandError{last, std::nullopt, name});
        }
        return unexpected(makeError(errc::session_closed, name));
    }
    if (catalog_ && !catalog_->supports(descriptor_, code)) {
        return unexpected(makeError(errc::command_unsupported, name));
    }

    auto live = supervisor_->readySession();
    if (!live) {
        return unexpected(makeError(errc::not_ready, name));
    }

    auto request = protocol::makeRequest(code,
                                         std::move(arguments),
                                         correlator_->nextRequestId(),
                                         live->mainboardId(),
                                         config_.from,
                                         protocol::unixTimestamp());
    auto ticket = live->sendAsync(std::move(request), timeout);
    if (!ticket) {
        return unexpected(CommandError{ticket.error(), std::nullopt, name});
    }
    return std::move(*ticket);
}

CommandOutcome Printer::command(int code, Json arguments,
                                std::optional<std::chrono::milliseconds> timeout) {
    auto ticket = issue(code, std::move(arguments), timeout.value_or(config_.session.commandTimeout));
    if (!ticket) {
        return unexpected(ticket.error());
    }
    return toOutcome(correlator_->wait(*ticket), code);
}

CommandOutcome Printer::command(std::string_view name, Json arguments,
                                std::optional<std::chrono::milliseconds> timeout) {
    const auto code = protocol::lookupCommand(name);
    if (!code) {
        return unexpected(makeError(errc::command_unsupported,
                                    "unknown command '" + std::string(name) + "'"));
    }
    return command(*code, std::move(arguments), timeout);
}

PendingCommandHandle Printer::commandAsync(int code, Json arguments,
                                           std::optional<std::chrono::milliseconds> timeout) {
    auto ticket = issue(code, std::move(arguments), timeout.value_or(config_.session.commandTimeout));
    if (!ticket) {
        return PendingCommandHandle(std::move(ticket.error()));
    }
    return PendingCommandHandle(correlator_, std::move(*ticket), code);
}

PendingCommandHandle Printer::commandAsync(std::string_view name, Json arguments,
                                           std::optional<std::chrono::milliseconds> timeout) {
    const auto code = protocol::lookupCommand(name);
    if (!code) {
        return PendingCommandHandle(makeError(errc::command_unsupported,
                                              "unknown command '" + std::string(name) + "'"));
    }
    return commandAsync(*code, std::move(arguments), timeout);
}

CommandOutcome Printer::refreshStatus() {
    return command(toCode(Command::Status));
}

CommandOutcome Printer::requestAttributes() {
    return command(toCode(Command::Attributes));
}

CommandOutcome Printer::startPrint(const std::string& filename, int startLayer) {
    return command(toCode(Command::StartPrint),
                   Json{{"Filename", filename}, {"StartLayer", startLayer}});
}

CommandOutcome Printer::pausePrint() {
    return command(toCode(Command::PausePrint));
}

CommandOutcome Printer::resumePrint() {
    return command(toCode(Command::ContinuePrint));
}

CommandOutcome Printer::stopPrint() {
    return command(toCode(Command::StopPrint));
}

expected<std::string, CommandError> Printer::openVideoStream(bool enable) {
    auto ack = command(toCode(Command::VideoStream), Json{{"Enable", enable ? 1 : 0}});
    if (!ack) {
        return unexpected(ack.error());
    }
    if (!enable) {
        return std::string{};
    }
    auto url = ack->payload.find("VideoUrl");
    if (url == ack->payload.end() || !url->is_string()) {
        return unexpected(makeError(errc::decode_error, "acknowledgement carries no VideoUrl"));
    }
    return url->get<std::string>();
}

StatusSubscription Printer::subscribeStatus() {
    auto queue = std::make_shared<detail::StatusQueue>(config_.subscriptionDepth);
    std::lock_guard lock(mutex_);
    if (status_) {
        queue->push(*status_);
    }
    if (ended_) {
        queue->finish(endReason_);
    } else {
        subscriptions_.push_back(queue);
    }
    return StatusSubscription(std::move(queue));
}

std::size_t Printer::addStatusCallback(StatusCallback callback) {
    std::lock_guard lock(mutex_);
    const auto id = nextCallbackId_++;
    callbacks_.emplace(id, std::move(callback));
    return id;
}

bool Printer::removeStatusCallback(std::size_t id) {
    std::lock_guard lock(mutex_);
    return callbacks_.erase(id) > 0;
}

std::optional<Frame> Printer::currentStatus() const {
    std::lock_guard lock(mutex_);
    return status_;
}

std::optional<Frame> Printer::attributes() const {
    std::lock_guard lock(mutex_);
    return attributes_;
}

void Printer::close() {
    if (closed_.exchange(true)) {
        return;
    }
    logInfo("[Printer] closing ", descriptor_.address, "\n");
    supervisor_->close();
    finishSubscriptions(make_error_code(errc::session_closed));
}

void Printer::onReady(session::ControlSession& live) {
    auto request = protocol::makeRequest(toCode(Command::Status),
                                         Json::object(),
                                         correlator_->nextRequestId(),
                                         live.mainboardId(),
                                         config_.from,
                                         protocol::unixTimestamp());
    if (auto ec = live.post(std::move(request)); ec) {
        logError("[Printer] status request after reconnect failed: ", ec.message(), "\n");
    }
}

void Printer::onFrame(const Frame& frame) {
    if (frame.topic == "attributes") {
        std::lock_guard lock(mutex_);
        attributes_ = frame;
        return;
    }
    if (frame.kind == protocol::FrameKind::Error) {
        logError("[Printer] device error: ", frame.payload.dump(), "\n");
        return;
    }
    if (frame.kind != protocol::FrameKind::Status) {
        logInfo("[Printer] ", frame.topic, " event: ", frame.payload.dump(), "\n");
        return;
    }

    std::vector<std::shared_ptr<detail::StatusQueue>> queues;
    std::vector<StatusCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        status_ = frame;
        auto it = subscriptions_.begin();
        while (it != subscriptions_.end()) {
            auto queue = it->lock();
            if (!queue || queue->closed()) {
                it = subscriptions_.erase(it);
                continue;
            }
            queues.push_back(std::move(queue));
            ++it;
        }
        callbacks.reserve(callbacks_.size());
        for (const auto& [id, callback] : callbacks_) {
            callbacks.push_back(callback);
        }
    }

    for (const auto& queue : queues) {
        queue->push(frame);
    }
    for (const auto& callback : callbacks) {
        callback(frame);
    }
}

void Printer::onStateChange(SessionState /*from*/, SessionState to, std::error_code error) {
    if (to == SessionState::Closed) {
        finishSubscriptions(error ? error : make_error_code(errc::session_closed));
    }
}

void Printer::finishSubscriptions(std::error_code reason) {
    std::vector<std::weak_ptr<detail::StatusQueue>> subscriptions;
    {
        std::lock_guard lock(mutex_);
        if (!ended_) {
            ended_ = true;
            endReason_ = reason;
        }
        subscriptions.swap(subscriptions_);
    }
    for (const auto& weak : subscriptions) {
        if (auto queue = weak.lock()) {
            queue->finish(reason);
        }
    }
}

} // namespace sdcp::printer
