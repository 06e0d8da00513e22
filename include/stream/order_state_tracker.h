/**
 * @file order_state_tracker.h
 * @brief Bounded last-known-state map for orders seen on the order update channel
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "stream/events.h"

namespace dhanstream::stream {

/**
 * @brief Last known state of one order. Replaced wholesale on every update.
 */
struct TrackedOrder {
    std::string order_id;
    std::string status;
    int64_t traded_qty = 0;
    std::string symbol;

    // Extra context carried from the order alert
    std::string exchange_segment;
    std::string security_id;
    std::string txn_type;
    int64_t quantity = 0;
    double avg_traded_price = 0.0;
    int leg_no = 0;

    std::chrono::steady_clock::time_point last_seen_at{};
};

struct TrackerConfig {
    std::size_t max_orders = 10000;
    std::chrono::seconds max_age{3600};
    std::chrono::milliseconds sweep_interval{60000};
};

/**
 * @class OrderStateTracker
 * @brief Upsert-only order map with age and capacity eviction.
 *
 * A sweep first drops entries last seen max_age or more ago, then evicts oldest-by-last-seen
 * (ties broken by order id) until size <= max_orders. The sweep runs on a fixed
 * interval once start() is called, and immediately whenever an insert takes the
 * map past max_orders.
 */
class OrderStateTracker {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit OrderStateTracker(TrackerConfig config = {}, TimeSource now = {});
    ~OrderStateTracker();

    OrderStateTracker(const OrderStateTracker&) = delete;
    OrderStateTracker& operator=(const OrderStateTracker&) = delete;

    // ========================================================================
    // STATE
    // ========================================================================

    /**
     * @brief Idempotent upsert; stamps last_seen_at with the current time.
     */
    void record(const std::string& order_id, TrackedOrder state);

    std::optional<TrackedOrder> get(const std::string& order_id) const;

    std::size_t size() const;

    /**
     * @brief Adapt a decoded order alert into a record() call. Alerts without OrderNo are ignored.
     */
    void consume(const OrderAlertEvent& alert);

    // ========================================================================
    // EVICTION
    // ========================================================================

    /// Run one sweep at the tracker's current time. Returns removed entry count.
    std::size_t sweep();

    /// Run one sweep as of @p now.
    std::size_t sweep(Clock::time_point now);

    /// Start the periodic sweep thread (no-op if already running).
    void start();

    /// Stop and join the sweep thread. Idempotent.
    void stop();

    bool running() const { return running_.load(std::memory_order_acquire); }
    const TrackerConfig& config() const { return config_; }

private:
    Clock::time_point now() const;
    void sweep_loop();

    TrackerConfig config_;
    TimeSource now_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TrackedOrder> orders_;

    std::atomic<bool> running_{false};
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool stop_requested_ = false;
    std::thread sweep_thread_;
};

} // namespace dhanstream::stream
