/**
 * @file rate_limiter.cpp
 */

#include "throttle/rate_limiter.h"

#include <spdlog/spdlog.h>

namespace dhanstream::throttle {

using namespace std::chrono_literals;

std::string to_string(RateTier tier) {
    switch (tier) {
        case RateTier::ORDER: return "order";
        case RateTier::DATA: return "data";
        case RateTier::QUOTE: return "quote";
        case RateTier::OPTION_CHAIN: return "option_chain";
        case RateTier::NON_TRADING: return "non_trading";
        default: return "unknown";
    }
}

TierLimits RateLimiter::default_limits() {
    constexpr std::chrono::milliseconds second = 1s;
    constexpr std::chrono::milliseconds minute = 1min;
    constexpr std::chrono::milliseconds hour = 1h;
    constexpr std::chrono::milliseconds day = 24h;

    TierLimits limits;
    limits[RateTier::ORDER] = {{second, 25}, {minute, 250}, {hour, 1000}, {day, 7000}};
    limits[RateTier::DATA] = {{second, 5}, {day, 100000}};
    limits[RateTier::QUOTE] = {{second, 1}};
    limits[RateTier::OPTION_CHAIN] = {{3 * second, 1}, {minute, 20}, {hour, 600}, {day, 4800}};
    limits[RateTier::NON_TRADING] = {{second, 20}};
    return limits;
}

RateLimiter::RateLimiter() : RateLimiter(default_limits()) {}

RateLimiter::RateLimiter(const TierLimits& limits) {
    const auto now = Clock::now();
    for (const auto& [tier, windows] : limits) {
        auto state = std::make_unique<TierState>();
        for (const auto& w : windows) {
            if (w.window.count() <= 0 || w.capacity == 0) {
                spdlog::warn("[RateLimiter] ignoring invalid window for tier {} (window_ms={} capacity={})",
                             to_string(tier), w.window.count(), w.capacity);
                continue;
            }
            RateBucket b;
            b.window = w.window;
            b.capacity = w.capacity;
            b.window_start = now;
            state->buckets.push_back(b);
        }
        tiers_[tier] = std::move(state);
    }
}

RateLimiter::TierState* RateLimiter::find_tier(RateTier tier) const {
    auto it = tiers_.find(tier);
    return it == tiers_.end() ? nullptr : it->second.get();
}

void RateLimiter::roll_locked(TierState& state, Clock::time_point now) {
    for (auto& b : state.buckets) {
        if (now - b.window_start >= b.window) {
            const auto elapsed_windows = (now - b.window_start) / b.window;
            b.window_start += b.window * elapsed_windows;
            b.count = 0;
        }
    }
}

bool RateLimiter::has_room_locked(const TierState& state) {
    for (const auto& b : state.buckets) {
        if (b.count >= b.capacity) return false;
    }
    return true;
}

RateLimiter::Clock::time_point RateLimiter::next_opening_locked(const TierState& state) {
    // Latest boundary among exhausted buckets: nothing can pass before all of them reopen
    Clock::time_point until = Clock::time_point::min();
    for (const auto& b : state.buckets) {
        if (b.count >= b.capacity) {
            const auto boundary = b.window_start + b.window;
            if (boundary > until) until = boundary;
        }
    }
    return until;
}

void RateLimiter::throttle(RateTier tier) {
    TierState* state = find_tier(tier);
    if (!state) return;

    std::unique_lock lock(state->mutex);
    bool waited = false;
    while (true) {
        roll_locked(*state, Clock::now());
        if (has_room_locked(*state)) break;
        if (!waited) {
            waited = true;
            ++state->waits;
            spdlog::debug("[RateLimiter] tier {} exhausted, waiting for next window", to_string(tier));
        }
        state->cv.wait_until(lock, next_opening_locked(*state));
    }
    for (auto& b : state->buckets) {
        ++b.count;
    }
}

bool RateLimiter::try_acquire(RateTier tier) {
    TierState* state = find_tier(tier);
    if (!state) return true;

    std::unique_lock lock(state->mutex);
    roll_locked(*state, Clock::now());
    if (!has_room_locked(*state)) return false;
    for (auto& b : state->buckets) {
        ++b.count;
    }
    return true;
}

std::vector<RateBucket> RateLimiter::snapshot(RateTier tier) const {
    TierState* state = find_tier(tier);
    if (!state) return {};
    std::unique_lock lock(state->mutex);
    roll_locked(*state, Clock::now());
    return state->buckets;
}

uint64_t RateLimiter::wait_count(RateTier tier) const {
    TierState* state = find_tier(tier);
    if (!state) return 0;
    std::unique_lock lock(state->mutex);
    return state->waits;
}

} // namespace dhanstream::throttle
