#include "sdcp/session/ControlSession.hpp"

#include "sdcp/core/Error.hpp"
#include "sdcp/log/Log.hpp"
#include "sdcp/protocol/Commands.hpp"
#include "sdcp/protocol/DeviceDescriptor.hpp"
#include "sdcp/protocol/WireCodec.hpp"

#include <algorithm>
#include <deque>

namespace sdcp::session {

using Clock = std::chrono::steady_clock;
using protocol::Frame;

namespace {

bool unsupportedVersion(const std::string& version) {
    if (version.empty()) {
        return false;
    }
    const auto major = protocol::protocolMajor(version);
    return !major || *major != config::SDCP_PROTOCOL_MAJOR;
}

// Outcomes of the most recent messages, oldest first.
class FailureWindow {
public:
    explicit FailureWindow(std::size_t size) : size_(std::max<std::size_t>(size, 1)) {}

    void record(bool failed) {
        outcomes_.push_back(failed);
        if (failed) {
            ++failures_;
        }
        if (outcomes_.size() > size_) {
            if (outcomes_.front()) {
                --failures_;
            }
            outcomes_.pop_front();
        }
    }

    std::size_t failures() const { return failures_; }
    std::size_t size() const { return outcomes_.size(); }

private:
    std::size_t size_;
    std::deque<bool> outcomes_;
    std::size_t failures_ = 0;
};

} // namespace

ControlSession::ControlSession(Token,
                               std::shared_ptr<MessageTransport> transport,
                               std::shared_ptr<CommandCorrelator> correlator,
                               SessionOptions options,
                               Handlers handlers)
: transport_(std::move(transport))
, correlator_(std::move(correlator))
, options_(std::move(options))
, handlers_(std::move(handlers))
{}

expected<std::shared_ptr<ControlSession>>
ControlSession::connect(std::shared_ptr<MessageTransport> transport,
                        const Endpoint& endpoint,
                        std::shared_ptr<CommandCorrelator> correlator,
                        SessionOptions options,
                        Handlers handlers) {
    if (unsupportedVersion(options.protocolVersion)) {
        logError("[ControlSession] ", endpoint.host, " advertises protocol ",
                 options.protocolVersion, ", expected major ", config::SDCP_PROTOCOL_MAJOR, "\n");
        return unexpected(make_error_code(errc::protocol_mismatch));
    }

    auto session = std::make_shared<ControlSession>(Token{}, std::move(transport), std::move(correlator),
                                                    std::move(options), std::move(handlers));

    const auto& cfg = session->options_.config;
    if (auto ec = session->transport_->connect(endpoint, cfg.connectTimeout); ec) {
        return unexpected(ec);
    }

    session->handshakeId_ = session->correlator_->nextRequestId();
    session->reader_ = std::thread([self = session]{
        self->readerId_ = std::this_thread::get_id();
        self->readLoop();
    });
    session->readerId_ = session->reader_.get_id();

    std::function<void()> transportUp;
    {
        std::lock_guard lock(session->handlerMutex_);
        transportUp = session->handlers_.onTransportUp;
    }
    if (transportUp) {
        transportUp();
    }

    if (auto ec = session->handshake(); ec) {
        logError("[ControlSession] handshake with ", endpoint.host, " failed: ", ec.message(), "\n");
        session->close();
        return unexpected(ec);
    }

    session->established_ = true;
    if (session->lost_) {
        session->close();
        return unexpected(make_error_code(errc::connection_lost));
    }

    logInfo("[ControlSession] ready: ", endpoint.host, " mainboard ",
            session->options_.mainboardId, "\n");
    return session;
}

ControlSession::~ControlSession() {
    stopping_ = true;
    transport_->close();
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
}

error_code ControlSession::handshake() {
    const auto& cfg = options_.config;
    auto request = protocol::makeRequest(protocol::toCode(protocol::Command::Attributes),
                                         protocol::Json::object(),
                                         handshakeId_,
                                         options_.mainboardId,
                                         options_.from,
                                         protocol::unixTimestamp());
    prepare(request);

    auto ticket = correlator_->open(handshakeId_, cfg.handshakeTimeout);
    if (!ticket) {
        return ticket.error();
    }
    if (lost_) {
        correlator_->cancel(handshakeId_, make_error_code(errc::connection_lost));
    } else if (auto ec = transmit(request, cfg.handshakeTimeout); ec) {
        correlator_->cancel(handshakeId_, ec);
    }

    auto result = correlator_->wait(*ticket);
    if (!result) {
        if (result.error() == errc::command_timeout) {
            return make_error_code(errc::handshake_timeout);
        }
        return result.error();
    }

    if (const auto ack = result->ackCode(); ack && *ack != config::SDCP_ACK_SUCCESS) {
        logError("[ControlSession] handshake rejected with Ack ", *ack, "\n");
        return make_error_code(errc::protocol_mismatch);
    }
    if (options_.mainboardId.empty()) {
        options_.mainboardId = result->mainboardId;
    }

    std::lock_guard lock(versionMutex_);
    if (unsupportedVersion(advertisedVersion_)) {
        logError("[ControlSession] device reports protocol ", advertisedVersion_, "\n");
        return make_error_code(errc::protocol_mismatch);
    }
    return {};
}

void ControlSession::prepare(Frame& request) const {
    if (request.mainboardId.empty()) {
        request.mainboardId = options_.mainboardId;
    }
    if (!request.from) {
        request.from = options_.from;
    }
    if (request.timestamp == 0) {
        request.timestamp = protocol::unixTimestamp();
    }
    if (!request.correlationId || request.correlationId->empty()) {
        request.correlationId = correlator_->nextRequestId();
    }
    if (!request.sourceId) {
        request.sourceId = options_.deviceId.empty() ? *request.correlationId : options_.deviceId;
    }
}

error_code ControlSession::transmit(const Frame& frame, std::chrono::milliseconds timeout) {
    return transport_->send(protocol::encode(frame), timeout);
}

CommandResult ControlSession::send(Frame request, std::chrono::milliseconds timeout) {
    auto ticket = sendAsync(std::move(request), timeout);
    if (!ticket) {
        return unexpected(ticket.error());
    }
    return correlator_->wait(*ticket);
}

expected<CommandCorrelator::Ticket> ControlSession::sendAsync(Frame request,
                                                              std::chrono::milliseconds timeout) {
    if (stopping_) {
        return unexpected(make_error_code(errc::session_closed));
    }
    prepare(request);
    auto ticket = correlator_->open(*request.correlationId, timeout);
    if (!ticket) {
        return ticket;
    }
    // Checked after open() so a concurrent loss either sees the ticket in
    // cancelAll() or we see the flag here.
    if (lost_) {
        correlator_->cancel(ticket->id, make_error_code(errc::connection_lost));
    } else if (stopping_) {
        correlator_->cancel(ticket->id, make_error_code(errc::session_closed));
    } else if (auto ec = transmit(request, timeout); ec) {
        logError("[ControlSession] send of Cmd ", request.command.value_or(-1),
                 " failed: ", ec.message(), "\n");
        correlator_->cancel(ticket->id, ec);
    }
    return ticket;
}

error_code ControlSession::post(Frame request) {
    if (!isOpen()) {
        return make_error_code(stopping_ ? errc::session_closed : errc::connection_lost);
    }
    prepare(request);
    const auto id = *request.correlationId;
    {
        std::lock_guard lock(postedMutex_);
        posted_.insert(id);
    }
    auto ec = transmit(request, options_.config.commandTimeout);
    if (ec) {
        std::lock_guard lock(postedMutex_);
        posted_.erase(id);
    }
    return ec;
}

void ControlSession::setFrameHandler(FrameHandler handler) {
    std::lock_guard lock(handlerMutex_);
    handlers_.onFrame = std::move(handler);
}

void ControlSession::setLossHandler(LossHandler handler) {
    std::lock_guard lock(handlerMutex_);
    handlers_.onLoss = std::move(handler);
}

void ControlSession::abort() {
    const bool wasOpen = !stopping_.exchange(true);
    transport_->close();
    if (wasOpen && !lost_) {
        correlator_->cancelAll(make_error_code(errc::session_closed));
    }
}

void ControlSession::close() {
    abort();
    if (onReaderThread()) {
        return;
    }
    std::lock_guard lock(closeMutex_);
    if (reader_.joinable()) {
        reader_.join();
    }
}

void ControlSession::readLoop() {
    const auto& cfg = options_.config;
    auto lastTraffic = Clock::now();
    auto lastPing = lastTraffic;
    FailureWindow decodeFailures(cfg.decodeFailureWindow);

    while (!stopping_) {
        const auto now = Clock::now();
        if (cfg.idleTimeout.count() > 0 && now - lastTraffic >= cfg.idleTimeout) {
            logError("[ControlSession] no traffic for ", cfg.idleTimeout.count(), " ms\n");
            reportLoss(make_error_code(errc::liveness_timeout));
            break;
        }
        if (cfg.keepaliveInterval.count() > 0 && now - lastPing >= cfg.keepaliveInterval) {
            lastPing = now;
            if (auto ec = transport_->send(config::SDCP_KEEPALIVE_REQUEST, cfg.commandTimeout); ec) {
                reportLoss(ec);
                break;
            }
        }

        auto message = transport_->receive(cfg.readPollSlice);
        if (!message) {
            if (net::is_timeout(message.error())) {
                continue;
            }
            reportLoss(message.error());
            break;
        }

        lastTraffic = Clock::now();
        if (protocol::isKeepalive(*message)) {
            continue;
        }
        decodeFailures.record(!dispatch(*message));
        if (decodeFailures.failures() > cfg.decodeFailureTolerance) {
            logError("[ControlSession] ", decodeFailures.failures(), " of the last ",
                     decodeFailures.size(), " messages were undecodable\n");
            reportLoss(make_error_code(errc::decode_error));
            break;
        }
    }
}

bool ControlSession::dispatch(const std::string& text) {
    auto frame = protocol::decode(text);
    if (!frame) {
        logError("[ControlSession] dropping undecodable message: ", frame.error(), "\n");
        return false;
    }

    if (frame->topic == "attributes") {
        auto version = frame->payload.find("ProtocolVersion");
        if (version != frame->payload.end() && version->is_string()) {
            std::lock_guard lock(versionMutex_);
            advertisedVersion_ = version->get<std::string>();
        }
    }

    if (frame->isAcknowledgement()) {
        const auto id = *frame->correlationId;
        {
            std::lock_guard lock(postedMutex_);
            if (posted_.erase(id) > 0) {
                if (const auto ack = frame->ackCode(); ack && *ack != config::SDCP_ACK_SUCCESS) {
                    logError("[ControlSession] Cmd ", frame->command.value_or(-1),
                             " rejected with Ack ", *ack, "\n");
                }
                return true;
            }
        }
        correlator_->resolve(id, std::move(*frame));
        return true;
    }

    FrameHandler handler;
    {
        std::lock_guard lock(handlerMutex_);
        handler = handlers_.onFrame;
    }
    if (handler) {
        handler(*frame);
    }
    return true;
}

bool ControlSession::reportLoss(error_code ec) {
    if (stopping_) {
        return false;
    }
    lost_ = true;
    transport_->close();
    if (!established_) {
        correlator_->cancel(handshakeId_, ec);
        return false;
    }
    if (lossReported_.exchange(true)) {
        return false;
    }
    logError("[ControlSession] session lost: ", ec.message(), "\n");

    LossHandler handler;
    {
        std::lock_guard lock(handlerMutex_);
        handler = handlers_.onLoss;
    }
    if (handler) {
        handler(ec);
    }
    return true;
}

} // namespace sdcp::session
