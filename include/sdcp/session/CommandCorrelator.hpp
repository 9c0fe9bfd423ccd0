#pragma once

#include "sdcp/core/Expected.hpp"
#include "sdcp/protocol/Frame.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <random>
#include <string>
#include <system_error>
#include <unordered_map>

namespace sdcp::session {

/// Acknowledgement frame or the reason none will arrive.
using CommandResult = expected<protocol::Frame>;

/**
 * @brief RequestID -> pending command table.
 *
 * - Each pending command holds a single-assignment slot (`std::promise`);
 *   whichever of resolve / cancel / deadline expiry claims the entry first
 *   decides the result, the rest find nothing and are dropped.
 * - Deadlines are enforced by the waiter: `wait()` gives up at the ticket's
 *   deadline and removes the entry.
 * - All methods are thread-safe. `resolve` is called from the session read
 *   loop, `open`/`wait` from caller threads.
 */
class CommandCorrelator {
public:
    using Clock = std::chrono::steady_clock;

    struct Ticket {
        std::string id;
        std::uint64_t serial = 0;
        std::shared_future<CommandResult> result;
        Clock::time_point deadline;
    };

    CommandCorrelator();
    explicit CommandCorrelator(std::uint64_t seed);

    CommandCorrelator(const CommandCorrelator&) = delete;
    CommandCorrelator& operator=(const CommandCorrelator&) = delete;

    /// 16 lowercase hex characters, never one that is currently outstanding.
    std::string nextRequestId();

    /// Register @p id; `errc::duplicate_request_id` if it is already outstanding.
    [[nodiscard]] expected<Ticket> open(const std::string& id, std::chrono::milliseconds timeout);

    /// Block until the ticket is resolved, cancelled or past its deadline.
    CommandResult wait(const Ticket& ticket);

    /// open + send + wait. A send failure cancels the entry with that error.
    CommandResult submit(const std::string& id,
                         std::chrono::milliseconds timeout,
                         const std::function<std::error_code()>& send);

    bool resolve(const std::string& id, protocol::Frame frame);
    bool cancel(const std::string& id, std::error_code reason);
    /// Cancel only the registration @p serial; a newer command reusing @p id is left alone.
    bool cancel(const std::string& id, std::uint64_t serial, std::error_code reason);
    std::size_t cancelAll(std::error_code reason);

    std::size_t pendingCount() const;

private:
    struct PendingCommand {
        std::uint64_t serial = 0;
        Clock::time_point issued;
        Clock::time_point deadline;
        std::promise<CommandResult> slot;
    };

    bool complete(const std::string& id, std::uint64_t serial, CommandResult result);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PendingCommand> pending_;
    std::uint64_t nextSerial_ = 1;
    std::mt19937_64 engine_;
};

} // namespace sdcp::session
