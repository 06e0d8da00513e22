/**
 * @file session_manager.h
 * @brief One persistent streaming connection: login, dispatch, subscriptions and reconnects
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/net/ws_transport.h"
#include "stream/events.h"
#include "stream/instrument.h"
#include "stream/reconnect_backoff.h"
#include "stream/subscription_resolver.h"
#include "stream/wire_commands.h"

namespace dhanstream::stream {

/**
 * @enum ChannelKind
 * @brief Which push endpoint a session talks to
 */
enum class ChannelKind {
    MARKET_FEED,     // binary packets, subscribe by feed mode
    ORDER_UPDATES,   // JSON order_alert envelopes, login required
    MARKET_DEPTH     // JSON depth_update / depth_snapshot envelopes
};

enum class SessionState {
    IDLE,
    CONNECTING,
    OPEN,
    COOLING_OFF,
    STOPPED
};

std::string to_string(ChannelKind kind);
std::string to_string(SessionState state);

struct SessionConfig {
    std::string channel_id;
    ChannelKind kind = ChannelKind::MARKET_FEED;
    std::string url;
    FeedMode mode = FeedMode::TICKER;
    std::optional<LoginCredentials> login;
    BackoffConfig backoff;
    std::chrono::milliseconds connect_timeout{10000};
    uint32_t max_auth_failures = 0;           // 0 = retry forever
    std::optional<uint64_t> jitter_seed;
};

/**
 * @brief Outcome of a subscribe() batch
 */
struct SubscribeReport {
    std::vector<InstrumentRef> added;
    std::vector<std::string> already_active;                     // labels
    std::vector<std::pair<std::string, std::string>> failed;     // label, reason
};

using EventListener = std::function<void(const DecodedEvent&)>;
using StateListener = std::function<void(SessionState from, SessionState to)>;

/**
 * @class SessionManager
 * @brief Owns one channel's transport on a dedicated I/O thread.
 *
 * State machine: IDLE -> CONNECTING -> OPEN; OPEN -> IDLE on abnormal close (retry
 * after backoff); any -> COOLING_OFF on a close whose reason carries "429" (fixed
 * cool-off, backoff untouched); any -> STOPPED on stop(), which is terminal.
 * A clean close (code 1000) resets the backoff. On every (re)connect the login
 * payload is sent first where required, then the subscription set is replayed
 * from a snapshot before any inbound traffic is processed.
 *
 * Listener callbacks run on the I/O thread; a throwing listener is logged and skipped.
 * A listener may call stop(), but must not release the last owner of the session:
 * destroying a SessionManager on its own I/O thread terminates the process.
 */
class SessionManager {
public:
    using Clock = std::chrono::steady_clock;

    SessionManager(SessionConfig config,
                   netws::WsTransportFactory transport_factory,
                   std::shared_ptr<SubscriptionResolver> resolver = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    /// Spawn the I/O thread. No-op if already running or stopped.
    void start();

    /// Tear down transport and reconnect loop. Idempotent; safe from a listener.
    void stop();

    /// Market feed: send the feed disconnect command, then stop. Other channels: stop.
    void disconnect();

    // ========================================================================
    // LISTENERS
    // ========================================================================

    void on(EventKind kind, EventListener listener);
    void on_state(StateListener listener);

    // ========================================================================
    // SUBSCRIPTIONS
    // ========================================================================

    /**
     * @brief Resolve and add @p refs; sends subscribe commands immediately when OPEN.
     *
     * Entries that fail to resolve are reported and skipped. Labels (or instruments)
     * already subscribed produce no wire traffic.
     */
    SubscribeReport subscribe(const std::vector<SymbolRef>& refs);

    /// Remove active entries and send unsubscribe commands; unknown labels are ignored.
    std::size_t unsubscribe(const std::vector<SymbolRef>& refs);

    std::vector<InstrumentRef> subscriptions() const;

    // ========================================================================
    // STATUS
    // ========================================================================

    SessionState state() const;
    /// Un-jittered delay the next abnormal close would wait.
    double backoff_seconds() const { return backoff_seconds_.load(std::memory_order_acquire); }
    std::optional<Clock::time_point> cooloff_until() const;
    std::optional<std::string> last_error() const;
    const std::string& channel_id() const { return config_.channel_id; }
    const SessionConfig& config() const { return config_; }
    uint64_t messages_received() const { return messages_received_.load(std::memory_order_relaxed); }
    uint64_t decode_errors() const { return decode_errors_.load(std::memory_order_relaxed); }
    uint32_t connect_attempts() const { return connect_attempts_.load(std::memory_order_relaxed); }

private:
    enum class CloseKind { CLEAN, RATE_LIMITED, AUTH_REJECTED, ABNORMAL, STOPPED };

    struct CloseOutcome {
        CloseKind kind = CloseKind::ABNORMAL;
        uint16_t code = 0;
        std::string reason;
    };

    void run();
    CloseOutcome read_loop(const std::shared_ptr<netws::WsTransport>& transport);
    static CloseOutcome classify_close(uint16_t code, const std::string& reason);
    void dispatch(const netws::ReadResult& message);
    void emit(const DecodedEvent& event);

    bool open_locked(const std::shared_ptr<netws::WsTransport>& transport);
    bool send_locked(const std::string& payload);
    int subscribe_request_code() const;
    int unsubscribe_request_code() const;

    void set_state(SessionState next);
    void set_error(std::string message);
    bool wait_for(std::chrono::milliseconds delay);
    bool stop_requested() const;

    std::string tag() const { return "[Session:" + config_.channel_id + "]"; }

    SessionConfig config_;
    netws::WsTransportFactory transport_factory_;
    std::shared_ptr<SubscriptionResolver> resolver_;
    ReconnectBackoff backoff_;

    // state + wakeups
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    SessionState state_ = SessionState::IDLE;
    bool stop_requested_ = false;
    bool started_ = false;
    std::optional<Clock::time_point> cooloff_until_;
    std::optional<std::string> last_error_;
    std::thread io_thread_;

    // current transport (replaced on reconnect)
    mutable std::mutex transport_mutex_;
    std::shared_ptr<netws::WsTransport> transport_;

    // subscriptions; held across replay so subscribe() cannot interleave with it
    mutable std::mutex sub_mutex_;
    std::map<std::string, InstrumentRef> subscriptions_;
    bool open_ = false;

    mutable std::mutex listener_mutex_;
    std::vector<std::pair<EventKind, EventListener>> listeners_;
    std::vector<StateListener> state_listeners_;

    std::atomic<double> backoff_seconds_{0.0};
    std::atomic<uint64_t> messages_received_{0};
    std::atomic<uint64_t> decode_errors_{0};
    std::atomic<uint32_t> connect_attempts_{0};
    uint32_t auth_failures_ = 0;   // I/O thread only
};

} // namespace dhanstream::stream
