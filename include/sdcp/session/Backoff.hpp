#pragma once

#include "sdcp/session/SessionConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <random>

namespace sdcp::session {

/**
 * @brief Exponential reconnect delay with optional full jitter.
 *
 * ceiling(n) = min(cap, base * 2^n); delay(n) is uniform in [0, ceiling(n)]
 * with jitter, or ceiling(n) without. Each instance owns its engine.
 */
class Backoff {
public:
    explicit Backoff(BackoffConfig config);
    Backoff(BackoffConfig config, std::uint64_t seed);

    milliseconds ceiling(std::size_t attempt) const;
    milliseconds delay(std::size_t attempt);

    const BackoffConfig& config() const { return config_; }

private:
    BackoffConfig config_;
    std::mt19937_64 engine_;
};

} // namespace sdcp::session
