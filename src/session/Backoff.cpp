#include "sdcp/session/Backoff.hpp"

#include <algorithm>

namespace sdcp::session {

Backoff::Backoff(BackoffConfig config)
: Backoff(config, std::random_device{}())
{}

Backoff::Backoff(BackoffConfig config, std::uint64_t seed)
: config_(config)
, engine_(seed)
{
    if (config_.base.count() < 0) config_.base = milliseconds::zero();
    if (config_.cap < config_.base) config_.cap = config_.base;
}

milliseconds Backoff::ceiling(std::size_t attempt) const {
    auto value = config_.base;
    for (std::size_t i = 0; i < attempt && value < config_.cap; ++i) {
        if (value.count() == 0) {
            break;
        }
        value *= 2;
    }
    return std::min(value, config_.cap);
}

milliseconds Backoff::delay(std::size_t attempt) {
    const auto top = ceiling(attempt);
    if (!config_.jitter || top.count() == 0) {
        return top;
    }
    std::uniform_int_distribution<milliseconds::rep> pick(0, top.count());
    return milliseconds(pick(engine_));
}

} // namespace sdcp::session
