/**
 * @file reconnect_backoff.cpp
 */

#include "stream/reconnect_backoff.h"

#include <algorithm>

namespace dhanstream::stream {

ReconnectBackoff::ReconnectBackoff(BackoffConfig config)
    : ReconnectBackoff(config, std::random_device{}()) {}

ReconnectBackoff::ReconnectBackoff(BackoffConfig config, uint64_t seed)
    : config_(config),
      current_seconds_(std::min(config.base_seconds, config.cap_seconds)),
      rng_(seed) {}

std::chrono::milliseconds ReconnectBackoff::next_delay() {
    const double delay = current_seconds_;
    double jitter = 0.0;
    if (config_.jitter_ratio > 0.0 && delay > 0.0) {
        std::uniform_real_distribution<double> dist(0.0, config_.jitter_ratio * delay);
        jitter = dist(rng_);
    }
    ++failures_;
    current_seconds_ = std::min(current_seconds_ * config_.multiplier, config_.cap_seconds);
    return std::chrono::milliseconds(static_cast<int64_t>((delay + jitter) * 1000.0));
}

void ReconnectBackoff::reset() {
    current_seconds_ = std::min(config_.base_seconds, config_.cap_seconds);
    failures_ = 0;
}

} // namespace dhanstream::stream
