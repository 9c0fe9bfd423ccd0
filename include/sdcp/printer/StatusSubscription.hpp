#pragma once

#include "sdcp/protocol/Frame.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>

namespace sdcp::printer {

namespace detail {

// Bounded FIFO shared between a Printer (producer) and one subscription.
class StatusQueue {
public:
    explicit StatusQueue(std::size_t depth);

    void push(const protocol::Frame& frame);
    void finish(std::error_code reason);

    /// nullopt on timeout or once finished and drained. No timeout blocks until either.
    std::optional<protocol::Frame> pop(std::optional<std::chrono::milliseconds> timeout);

    bool closed() const;
    bool drained() const;
    std::error_code reason() const;
    std::size_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<protocol::Frame> frames_;
    std::size_t depth_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
    std::error_code reason_;
};

} // namespace detail

/**
 * @brief Independent, lazy sequence of status frames from one Printer.
 *
 * Starts with the printer's last-known status (if any) and then receives every
 * status frame as it arrives. When the consumer falls behind by more than the
 * configured depth the oldest frames are dropped. The sequence ends only when
 * the printer is closed (or the subscription is cancelled).
 */
class StatusSubscription {
public:
    StatusSubscription() = default;
    explicit StatusSubscription(std::shared_ptr<detail::StatusQueue> queue);
    ~StatusSubscription();

    StatusSubscription(StatusSubscription&&) noexcept = default;
    StatusSubscription& operator=(StatusSubscription&&) noexcept = default;
    StatusSubscription(const StatusSubscription&) = delete;
    StatusSubscription& operator=(const StatusSubscription&) = delete;

    std::optional<protocol::Frame> next(std::chrono::milliseconds timeout);
    std::optional<protocol::Frame> next();

    /// True once the printer closed and every queued frame was consumed.
    bool finished() const;
    std::error_code error() const;
    std::size_t dropped() const;

    void cancel();

private:
    std::shared_ptr<detail::StatusQueue> queue_;
};

} // namespace sdcp::printer
