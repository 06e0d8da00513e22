/**
 * @file stream_service.h
 * @brief Assembles the streaming sessions, resolver, tracker and REST path from a StreamConfig
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "core/net/ws_transport.h"
#include "engine/stream_config.h"
#include "stream/instrument_directory.h"
#include "stream/order_state_tracker.h"
#include "stream/order_update_hub.h"
#include "stream/session_manager.h"
#include "stream/subscription_resolver.h"
#include "throttle/rate_limiter.h"

namespace dhanstream {

namespace nethttp { class RestExecutor; }

/**
 * @class StreamService
 * @brief Daemon-level owner of every channel.
 *
 * Each enabled channel gets a SessionManager registered with the process-wide
 * SessionRegistry. Entry fills reported by the order hub are subscribed on the
 * market feed. A stats thread logs event counters every 30 seconds.
 */
class StreamService {
public:
    struct Stats {
        uint64_t ticks{0};          // ticker / quote / full
        uint64_t depth_updates{0};  // binary deltas and JSON books
        uint64_t order_alerts{0};
        uint64_t other{0};
    };

    /// Defaults: Beast transport, instruments downloaded through the REST executor.
    explicit StreamService(StreamConfig config,
                           netws::WsTransportFactory transport_factory = {},
                           std::shared_ptr<stream::IInstrumentDirectory> directory = nullptr);
    ~StreamService();

    StreamService(const StreamService&) = delete;
    StreamService& operator=(const StreamService&) = delete;

    /// Build components; false (with an error logged) if the config cannot be realized.
    bool initialize();

    /// Start every session, queue configured subscriptions and start the stats thread.
    void start();

    /// Stop every session and the stats thread. Idempotent.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    Stats stats() const;

    std::shared_ptr<stream::SessionManager> feed_session() const { return feed_session_; }
    std::shared_ptr<stream::SessionManager> depth_session() const { return depth_session_; }
    std::shared_ptr<stream::SessionManager> order_session() const { return order_session_; }
    std::shared_ptr<stream::OrderStateTracker> tracker() const { return tracker_; }
    std::shared_ptr<throttle::RateLimiter> rate_limiter() const { return limiter_; }

private:
    stream::SessionConfig base_session_config(const std::string& channel_id) const;
    void count(const stream::DecodedEvent& event);
    void stats_monitoring_thread();

    StreamConfig config_;
    netws::WsTransportFactory transport_factory_;
    std::shared_ptr<stream::IInstrumentDirectory> directory_;

    std::shared_ptr<throttle::RateLimiter> limiter_;
    std::shared_ptr<nethttp::RestExecutor> rest_;
    std::shared_ptr<stream::SubscriptionResolver> resolver_;
    std::shared_ptr<stream::OrderStateTracker> tracker_;
    std::shared_ptr<stream::SessionManager> feed_session_;
    std::shared_ptr<stream::SessionManager> depth_session_;
    std::shared_ptr<stream::SessionManager> order_session_;
    std::unique_ptr<stream::OrderUpdateHub> order_hub_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> depth_updates_{0};
    std::atomic<uint64_t> order_alerts_{0};
    std::atomic<uint64_t> other_{0};

    std::mutex stats_mutex_;
    std::condition_variable stats_cv_;
    std::thread stats_thread_;
};

} // namespace dhanstream
