/**
 * @file rate_limiter.h
 * @brief Multi-window quota enforcement shared by every outbound REST call
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dhanstream::throttle {

/**
 * @enum RateTier
 * @brief Quota family an endpoint belongs to
 */
enum class RateTier {
    ORDER,
    DATA,
    QUOTE,
    OPTION_CHAIN,
    NON_TRADING
};

std::string to_string(RateTier tier);

struct WindowLimit {
    std::chrono::milliseconds window;
    uint32_t capacity;
};

/**
 * @brief Fixed-window counter. 0 <= count <= capacity; count drops to 0 at each boundary.
 */
struct RateBucket {
    std::chrono::milliseconds window{0};
    uint32_t capacity = 0;
    uint32_t count = 0;
    std::chrono::steady_clock::time_point window_start{};
};

using TierLimits = std::map<RateTier, std::vector<WindowLimit>>;

/**
 * @class RateLimiter
 * @brief Blocking limiter: throttle() waits until every window of the tier has room.
 *
 * Each tier owns one mutex and condition variable guarding both the check-and-consume
 * step and the window rollover. Windows are aligned to construction time and roll
 * lazily on access, so no timer threads are needed. Never rejects a call.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter();
    explicit RateLimiter(const TierLimits& limits);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Broker's published quotas.
    static TierLimits default_limits();

    /// Block until one token is available in every bucket of @p tier, then consume it.
    void throttle(RateTier tier);

    /// Non-blocking variant; consumes and returns true only if every bucket has room.
    bool try_acquire(RateTier tier);

    /// Current bucket state for @p tier (copies, after rollover).
    std::vector<RateBucket> snapshot(RateTier tier) const;

    /// Number of throttle() calls on @p tier that had to wait.
    uint64_t wait_count(RateTier tier) const;

private:
    struct TierState {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::vector<RateBucket> buckets;
        uint64_t waits = 0;
    };

    TierState* find_tier(RateTier tier) const;
    static void roll_locked(TierState& state, Clock::time_point now);
    static bool has_room_locked(const TierState& state);
    static Clock::time_point next_opening_locked(const TierState& state);

    std::map<RateTier, std::unique_ptr<TierState>> tiers_;
};

} // namespace dhanstream::throttle
