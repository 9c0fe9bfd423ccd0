#include "sdcp/session/CommandCorrelator.hpp"

#include "sdcp/core/Error.hpp"
#include "sdcp/log/Log.hpp"

#include <vector>

namespace sdcp::session {

namespace {
constexpr std::uint64_t ANY_SERIAL = 0;
}

CommandCorrelator::CommandCorrelator()
: CommandCorrelator((static_cast<std::uint64_t>(std::random_device{}()) << 32) ^ std::random_device{}())
{}

CommandCorrelator::CommandCorrelator(std::uint64_t seed)
: engine_(seed)
{}

std::string CommandCorrelator::nextRequestId() {
    static const char* digits = "0123456789abcdef";
    std::lock_guard lock(mutex_);
    while (true) {
        auto bits = engine_();
        std::string id(16, '0');
        for (auto it = id.rbegin(); it != id.rend(); ++it) {
            *it = digits[bits & 0xFu];
            bits >>= 4;
        }
        if (pending_.find(id) == pending_.end()) {
            return id;
        }
    }
}

expected<CommandCorrelator::Ticket> CommandCorrelator::open(const std::string& id,
                                                            std::chrono::milliseconds timeout) {
    std::lock_guard lock(mutex_);
    if (pending_.find(id) != pending_.end()) {
        logError("[Correlator] request id ", id, " is already outstanding\n");
        return unexpected(make_error_code(errc::duplicate_request_id));
    }

    PendingCommand entry;
    entry.serial = nextSerial_++;
    entry.issued = Clock::now();
    entry.deadline = entry.issued + (timeout.count() < 0 ? std::chrono::milliseconds::zero() : timeout);

    Ticket ticket;
    ticket.id = id;
    ticket.serial = entry.serial;
    ticket.deadline = entry.deadline;
    ticket.result = entry.slot.get_future().share();

    pending_.emplace(id, std::move(entry));
    return ticket;
}

CommandResult CommandCorrelator::wait(const Ticket& ticket) {
    if (!ticket.result.valid()) {
        return unexpected(make_error_code(errc::cancelled));
    }
    if (ticket.result.wait_until(ticket.deadline) != std::future_status::ready) {
        if (complete(ticket.id, ticket.serial, unexpected(make_error_code(errc::command_timeout)))) {
            logInfo("[Correlator] request ", ticket.id, " timed out\n");
        }
    }
    // Either we expired it above or another thread claimed it and is about
    // to fulfil the slot.
    return ticket.result.get();
}

CommandResult CommandCorrelator::submit(const std::string& id,
                                        std::chrono::milliseconds timeout,
                                        const std::function<std::error_code()>& send) {
    auto ticket = open(id, timeout);
    if (!ticket) {
        return unexpected(ticket.error());
    }
    if (auto ec = send(); ec) {
        complete(ticket->id, ticket->serial, unexpected(ec));
    }
    return wait(*ticket);
}

bool CommandCorrelator::resolve(const std::string& id, protocol::Frame frame) {
    if (!complete(id, ANY_SERIAL, std::move(frame))) {
        logInfo("[Correlator] dropping acknowledgement for unknown request ", id, "\n");
        return false;
    }
    return true;
}

bool CommandCorrelator::cancel(const std::string& id, std::error_code reason) {
    return complete(id, ANY_SERIAL, unexpected(reason));
}

bool CommandCorrelator::cancel(const std::string& id, std::uint64_t serial, std::error_code reason) {
    if (serial == ANY_SERIAL) {
        return false;
    }
    return complete(id, serial, unexpected(reason));
}

std::size_t CommandCorrelator::cancelAll(std::error_code reason) {
    std::unordered_map<std::string, PendingCommand> drained;
    {
        std::lock_guard lock(mutex_);
        drained.swap(pending_);
    }
    for (auto& [id, entry] : drained) {
        entry.slot.set_value(unexpected(reason));
    }
    if (!drained.empty()) {
        logInfo("[Correlator] cancelled ", drained.size(), " pending command(s): ",
                reason.message(), "\n");
    }
    return drained.size();
}

std::size_t CommandCorrelator::pendingCount() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

bool CommandCorrelator::complete(const std::string& id, std::uint64_t serial, CommandResult result) {
    std::promise<CommandResult> slot;
    {
        std::lock_guard lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        if (serial != ANY_SERIAL && it->second.serial != serial) {
            return false;
        }
        slot = std::move(it->second.slot);
        pending_.erase(it);
    }
    slot.set_value(std::move(result));
    return true;
}

} // namespace sdcp::session
