#include "sdcp/printer/CommandError.hpp"

#include "sdcp/core/Error.hpp"
#include "sdcp/protocol/Commands.hpp"
#include "sdcp/protocol/SdcpConfig.hpp"

namespace sdcp::printer {

std::ostream& operator<<(std::ostream& os, const CommandError& error) {
    os << error.code.message();
    if (error.deviceAck) {
        os << " (Ack " << *error.deviceAck << ")";
    }
    if (!error.detail.empty()) {
        os << ": " << error.detail;
    }
    return os;
}

CommandOutcome toOutcome(session::CommandResult result, int command) {
    if (!result) {
        return unexpected(CommandError{result.error(), std::nullopt,
                                       std::string(protocol::commandName(command))});
    }
    if (const auto ack = result->ackCode(); ack && *ack != config::SDCP_ACK_SUCCESS) {
        return unexpected(CommandError{make_error_code(errc::command_rejected), ack,
                                       std::string(protocol::commandName(command))});
    }
    return std::move(*result);
}

PendingCommandHandle::PendingCommandHandle(std::shared_ptr<session::CommandCorrelator> correlator,
                                           session::CommandCorrelator::Ticket ticket,
                                           int command)
: correlator_(std::move(correlator))
, ticket_(std::move(ticket))
, command_(command)
{}

PendingCommandHandle::PendingCommandHandle(CommandError immediate)
: immediate_(std::move(immediate))
{}

PendingCommandHandle::~PendingCommandHandle() {
    if (!waited_) {
        cancel();
    }
}

PendingCommandHandle::PendingCommandHandle(PendingCommandHandle&& other) noexcept
: correlator_(std::move(other.correlator_))
, ticket_(std::move(other.ticket_))
, command_(other.command_)
, immediate_(std::move(other.immediate_))
, waited_(other.waited_)
{
    other.correlator_.reset();
    other.immediate_.reset();
}

PendingCommandHandle& PendingCommandHandle::operator=(PendingCommandHandle&& other) noexcept {
    if (this != &other) {
        if (!waited_) {
            cancel();
        }
        correlator_ = std::move(other.correlator_);
        ticket_ = std::move(other.ticket_);
        command_ = other.command_;
        immediate_ = std::move(other.immediate_);
        waited_ = other.waited_;
        other.correlator_.reset();
        other.immediate_.reset();
    }
    return *this;
}

CommandOutcome PendingCommandHandle::wait() {
    if (immediate_) {
        return unexpected(*immediate_);
    }
    if (!correlator_) {
        return unexpected(CommandError{make_error_code(errc::cancelled), std::nullopt,
                                       "empty handle"});
    }
    waited_ = true;
    return toOutcome(correlator_->wait(ticket_), command_);
}

bool PendingCommandHandle::cancel() {
    if (!correlator_) {
        return false;
    }
    return correlator_->cancel(ticket_.id, ticket_.serial, make_error_code(errc::cancelled));
}

} // namespace sdcp::printer
