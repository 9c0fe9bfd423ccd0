#include "sdcp/printer/StatusSubscription.hpp"

#include "sdcp/core/Error.hpp"

namespace sdcp::printer {

namespace detail {

StatusQueue::StatusQueue(std::size_t depth)
: depth_(depth == 0 ? 1 : depth)
{}

void StatusQueue::push(const protocol::Frame& frame) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        if (frames_.size() >= depth_) {
            frames_.pop_front();
            ++dropped_;
        }
        frames_.push_back(frame);
    }
    cv_.notify_one();
}

void StatusQueue::finish(std::error_code reason) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        reason_ = reason;
    }
    cv_.notify_all();
}

std::optional<protocol::Frame> StatusQueue::pop(std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock lock(mutex_);
    auto ready = [this]{ return !frames_.empty() || closed_; };
    if (timeout) {
        if (!cv_.wait_for(lock, *timeout, ready)) {
            return std::nullopt;
        }
    } else {
        cv_.wait(lock, ready);
    }
    if (frames_.empty()) {
        return std::nullopt;
    }
    auto frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

bool StatusQueue::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

bool StatusQueue::drained() const {
    std::lock_guard lock(mutex_);
    return closed_ && frames_.empty();
}

std::error_code StatusQueue::reason() const {
    std::lock_guard lock(mutex_);
    return reason_;
}

std::size_t StatusQueue::dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

} // namespace detail

StatusSubscription::StatusSubscription(std::shared_ptr<detail::StatusQueue> queue)
: queue_(std::move(queue))
{}

StatusSubscription::~StatusSubscription() {
    cancel();
}

std::optional<protocol::Frame> StatusSubscription::next(std::chrono::milliseconds timeout) {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->pop(timeout);
}

std::optional<protocol::Frame> StatusSubscription::next() {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->pop(std::nullopt);
}

bool StatusSubscription::finished() const {
    return !queue_ || queue_->drained();
}

std::error_code StatusSubscription::error() const {
    return queue_ ? queue_->reason() : std::error_code{};
}

std::size_t StatusSubscription::dropped() const {
    return queue_ ? queue_->dropped() : 0;
}

void StatusSubscription::cancel() {
    if (queue_) {
        queue_->finish(make_error_code(errc::cancelled));
    }
}

} // namespace sdcp::printer
