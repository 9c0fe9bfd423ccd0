#pragma once

#include "sdcp/core/Expected.hpp"
#include "sdcp/protocol/Frame.hpp"
#include "sdcp/session/CommandCorrelator.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>

namespace sdcp::printer {

/// Why a command produced no usable acknowledgement.
struct CommandError {
    std::error_code code;
    std::optional<int> deviceAck;  ///< set for errc::command_rejected
    std::string detail;
};

std::ostream& operator<<(std::ostream& os, const CommandError& error);

using CommandOutcome = expected<protocol::Frame, CommandError>;

/// Map a correlator result to a façade outcome; non-zero Ack becomes command_rejected.
CommandOutcome toOutcome(session::CommandResult result, int command);

/**
 * @brief A command in flight, returned by Printer::commandAsync().
 *
 * `wait()` may be called more than once and returns the same outcome.
 * Destroying a handle that was never waited on cancels the command.
 */
class PendingCommandHandle {
public:
    PendingCommandHandle() = default;
    PendingCommandHandle(std::shared_ptr<session::CommandCorrelator> correlator,
                         session::CommandCorrelator::Ticket ticket,
                         int command);
    explicit PendingCommandHandle(CommandError immediate);
    ~PendingCommandHandle();

    PendingCommandHandle(PendingCommandHandle&& other) noexcept;
    PendingCommandHandle& operator=(PendingCommandHandle&& other) noexcept;
    PendingCommandHandle(const PendingCommandHandle&) = delete;
    PendingCommandHandle& operator=(const PendingCommandHandle&) = delete;

    CommandOutcome wait();

    /// Remove the pending command; a later wait() reports errc::cancelled.
    bool cancel();

    const std::string& requestId() const { return ticket_.id; }
    bool valid() const { return correlator_ != nullptr || immediate_.has_value(); }

private:
    std::shared_ptr<session::CommandCorrelator> correlator_;
    session::CommandCorrelator::Ticket ticket_;
    int command_ = -1;
    std::optional<CommandError> immediate_;
    bool waited_ = false;
};

} // namespace sdcp::printer
