/**
 * @file reconnect_backoff.h
 * @brief Exponential reconnect delay with jitter, and the fixed rate-limit cool-off
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace dhanstream::stream {

struct BackoffConfig {
    double base_seconds = 2.0;
    double multiplier = 2.0;
    double cap_seconds = 90.0;
    double jitter_ratio = 0.2;                   // uniform jitter in [0, ratio * delay]
    std::chrono::milliseconds cooloff{60000};    // applied on a "429" close, independent of backoff
};

/**
 * @class ReconnectBackoff
 * @brief Delay arithmetic for the session reconnect loop. Not thread-safe; owned by the I/O thread.
 *
 * The n-th consecutive abnormal close waits min(base * multiplier^(n-1), cap) plus jitter.
 */
class ReconnectBackoff {
public:
    explicit ReconnectBackoff(BackoffConfig config = {});
    ReconnectBackoff(BackoffConfig config, uint64_t seed);

    /// Delay to wait after an abnormal close; advances the exponent for the next one.
    std::chrono::milliseconds next_delay();

    /// Back to base after a clean close.
    void reset();

    /// Cool-off window for rate-limit rejections; leaves the exponent untouched.
    std::chrono::milliseconds cooloff() const { return config_.cooloff; }

    /// Un-jittered delay the next abnormal close would use.
    double current_seconds() const { return current_seconds_; }

    uint32_t consecutive_failures() const { return failures_; }
    const BackoffConfig& config() const { return config_; }

private:
    BackoffConfig config_;
    double current_seconds_;
    uint32_t failures_ = 0;
    std::mt19937_64 rng_;
};

} // namespace dhanstream::stream
