/**
 * @file session_manager.cpp
 */

#include "stream/session_manager.h"

#include <span>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "stream/frame_decoder.h"
#include "stream/segments.h"
#include "utils/string_utils.h"

namespace dhanstream::stream {

std::string to_string(ChannelKind kind) {
    switch (kind) {
        case ChannelKind::MARKET_FEED: return "market_feed";
        case ChannelKind::ORDER_UPDATES: return "order_updates";
        case ChannelKind::MARKET_DEPTH: return "market_depth";
        default: return "unknown";
    }
}

std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "IDLE";
        case SessionState::CONNECTING: return "CONNECTING";
        case SessionState::OPEN: return "OPEN";
        case SessionState::COOLING_OFF: return "COOLING_OFF";
        case SessionState::STOPPED: return "STOPPED";
        default: return "UNKNOWN";
    }
}

SessionManager::SessionManager(SessionConfig config,
                               netws::WsTransportFactory transport_factory,
                               std::shared_ptr<SubscriptionResolver> resolver)
    : config_(std::move(config)),
      transport_factory_(std::move(transport_factory)),
      resolver_(std::move(resolver)),
      backoff_(config_.jitter_seed ? ReconnectBackoff(config_.backoff, *config_.jitter_seed)
                                   : ReconnectBackoff(config_.backoff)) {
    if (!transport_factory_) {
        throw std::invalid_argument("SessionManager requires a transport factory");
    }
    if (config_.channel_id.empty()) {
        config_.channel_id = to_string(config_.kind);
    }
    backoff_seconds_.store(backoff_.current_seconds(), std::memory_order_release);
}

SessionManager::~SessionManager() {
    stop();
    if (io_thread_.joinable()) {
        // Only reachable from our own I/O thread. The read loop would resume on a
        // destroyed object, so the joinable std::thread is left to terminate.
        spdlog::critical("{} destroyed on its own I/O thread", tag());
    }
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void SessionManager::start() {
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        if (started_ || stop_requested_) {
            return;
        }
        started_ = true;
    }
    spdlog::info("{} starting kind={} url={}", tag(), to_string(config_.kind), utils::redact_url(config_.url));
    io_thread_ = std::thread(&SessionManager::run, this);
}

void SessionManager::stop() {
    bool was_started = false;
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        if (!stop_requested_) {
            spdlog::info("{} stop requested", tag());
        }
        stop_requested_ = true;
        was_started = started_;
    }
    state_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lk(transport_mutex_);
        if (transport_) {
            transport_->abort();
        }
    }
    if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id()) {
        io_thread_.join();
    }
    if (!was_started) {
        set_state(SessionState::STOPPED);
    }
}

void SessionManager::disconnect() {
    if (config_.kind == ChannelKind::MARKET_FEED) {
        std::lock_guard<std::mutex> lk(sub_mutex_);
        if (open_) {
            send_locked(build_disconnect_command());
            spdlog::info("{} feed disconnect sent", tag());
        }
    }
    stop();
}

// ============================================================================
// LISTENERS
// ============================================================================

void SessionManager::on(EventKind kind, EventListener listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lk(listener_mutex_);
    listeners_.emplace_back(kind, std::move(listener));
}

void SessionManager::on_state(StateListener listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lk(listener_mutex_);
    state_listeners_.push_back(std::move(listener));
}

// ============================================================================
// SUBSCRIPTIONS
// ============================================================================

int SessionManager::subscribe_request_code() const {
    return config_.kind == ChannelKind::MARKET_DEPTH ? request_code::DEPTH_SUBSCRIBE
                                                     : subscribe_code(config_.mode);
}

int SessionManager::unsubscribe_request_code() const {
    return config_.kind == ChannelKind::MARKET_DEPTH ? request_code::DEPTH_UNSUBSCRIBE
                                                     : unsubscribe_code(config_.mode);
}

SubscribeReport SessionManager::subscribe(const std::vector<SymbolRef>& refs) {
    SubscribeReport report;
    if (config_.kind == ChannelKind::ORDER_UPDATES || !resolver_) {
        const char* why = resolver_ ? "order update channel has no subscriptions" : "session has no resolver";
        for (const auto& ref : refs) {
            report.failed.emplace_back(SubscriptionResolver::label_for(ref), why);
        }
        spdlog::warn("{} subscribe rejected: {}", tag(), why);
        return report;
    }

    // Resolution may download instrument lists; keep it outside the lock
    std::vector<InstrumentRef> resolved;
    resolved.reserve(refs.size());
    for (const auto& ref : refs) {
        const std::string label = SubscriptionResolver::label_for(ref);
        try {
            resolved.push_back(resolver_->resolve(ref));
        } catch (const ResolutionError& e) {
            spdlog::warn("{} skipping {}: {}", tag(), label, e.what());
            report.failed.emplace_back(label, e.what());
        }
    }

    std::lock_guard<std::mutex> lk(sub_mutex_);
    std::vector<InstrumentRef> to_send;
    for (auto& inst : resolved) {
        bool active = subscriptions_.count(inst.display_label) > 0;
        if (!active) {
            for (const auto& [label, existing] : subscriptions_) {
                if (existing.same_instrument(inst)) { active = true; break; }
            }
        }
        if (active) {
            report.already_active.push_back(inst.display_label);
            continue;
        }
        subscriptions_.emplace(inst.display_label, inst);
        report.added.push_back(inst);
        to_send.push_back(std::move(inst));
    }

    if (open_ && !to_send.empty()) {
        for (const auto& cmd : build_instrument_commands(subscribe_request_code(), to_send)) {
            send_locked(cmd);
        }
    }
    if (!report.added.empty()) {
        spdlog::info("{} subscribed {} instrument(s) (total={}, sent_now={})",
                     tag(), report.added.size(), subscriptions_.size(), open_);
    }
    return report;
}

std::size_t SessionManager::unsubscribe(const std::vector<SymbolRef>& refs) {
    std::lock_guard<std::mutex> lk(sub_mutex_);
    std::vector<InstrumentRef> removed;
    for (const auto& ref : refs) {
        auto it = subscriptions_.find(SubscriptionResolver::label_for(ref));
        if (it == subscriptions_.end()) {
            continue;
        }
        removed.push_back(it->second);
        subscriptions_.erase(it);
    }
    if (open_ && !removed.empty()) {
        for (const auto& cmd : build_instrument_commands(unsubscribe_request_code(), removed)) {
            send_locked(cmd);
        }
    }
    if (!removed.empty()) {
        spdlog::info("{} unsubscribed {} instrument(s) (total={})", tag(), removed.size(), subscriptions_.size());
    }
    return removed.size();
}

std::vector<InstrumentRef> SessionManager::subscriptions() const {
    std::lock_guard<std::mutex> lk(sub_mutex_);
    std::vector<InstrumentRef> out;
    out.reserve(subscriptions_.size());
    for (const auto& [label, ref] : subscriptions_) {
        out.push_back(ref);
    }
    return out;
}

bool SessionManager::send_locked(const std::string& payload) {
    std::shared_ptr<netws::WsTransport> transport;
    {
        std::lock_guard<std::mutex> lk(transport_mutex_);
        transport = transport_;
    }
    if (!transport || !transport->send_text(payload)) {
        spdlog::warn("{} send failed ({} bytes); will be replayed on reconnect", tag(), payload.size());
        return false;
    }
    return true;
}

// ============================================================================
// STATUS
// ============================================================================

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return state_;
}

std::optional<SessionManager::Clock::time_point> SessionManager::cooloff_until() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return cooloff_until_;
}

std::optional<std::string> SessionManager::last_error() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return last_error_;
}

void SessionManager::set_error(std::string message) {
    std::lock_guard<std::mutex> lk(state_mutex_);
    last_error_ = std::move(message);
}

bool SessionManager::stop_requested() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return stop_requested_;
}

bool SessionManager::wait_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lk(state_mutex_);
    return !state_cv_.wait_for(lk, delay, [this] { return stop_requested_; });
}

void SessionManager::set_state(SessionState next) {
    SessionState prev;
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        if (state_ == SessionState::STOPPED || state_ == next) {
            return;
        }
        prev = state_;
        state_ = next;
    }
    state_cv_.notify_all();
    spdlog::debug("{} state {} -> {}", tag(), to_string(prev), to_string(next));

    std::vector<StateListener> targets;
    {
        std::lock_guard<std::mutex> lk(listener_mutex_);
        targets = state_listeners_;
    }
    for (const auto& listener : targets) {
        try {
            listener(prev, next);
        } catch (const std::exception& e) {
            spdlog::error("{} state listener threw: {}", tag(), e.what());
        }
    }
}

// ============================================================================
// I/O THREAD
// ============================================================================

bool SessionManager::open_locked(const std::shared_ptr<netws::WsTransport>& transport) {
    if (config_.login) {
        if (!transport->send_text(build_login_payload(*config_.login))) {
            spdlog::warn("{} login send failed", tag());
            return false;
        }
        spdlog::info("{} LOGIN -> ({})", tag(),
                     config_.login->user_type == LoginCredentials::UserType::PARTNER ? "PARTNER" : "SELF");
    }

    if (!subscriptions_.empty()) {
        std::vector<InstrumentRef> snapshot;
        snapshot.reserve(subscriptions_.size());
        for (const auto& [label, ref] : subscriptions_) {
            snapshot.push_back(ref);
        }
        for (const auto& cmd : build_instrument_commands(subscribe_request_code(), snapshot)) {
            if (!transport->send_text(cmd)) {
                spdlog::warn("{} subscription replay failed", tag());
                return false;
            }
        }
        spdlog::info("{} replayed {} subscription(s)", tag(), snapshot.size());
    }
    open_ = true;
    return true;
}

SessionManager::CloseOutcome SessionManager::classify_close(uint16_t code, const std::string& reason) {
    CloseOutcome out;
    out.code = code;
    out.reason = reason;
    const std::string lower = utils::to_lower_ascii(reason);
    if (reason.find("429") != std::string::npos) {
        out.kind = CloseKind::RATE_LIMITED;
    } else if (code == 1008 || reason.find("401") != std::string::npos ||
               lower.find("auth") != std::string::npos) {
        out.kind = CloseKind::AUTH_REJECTED;
    } else if (code == 1000) {
        out.kind = CloseKind::CLEAN;
    } else {
        out.kind = CloseKind::ABNORMAL;
    }
    return out;
}

SessionManager::CloseOutcome SessionManager::read_loop(const std::shared_ptr<netws::WsTransport>& transport) {
    while (true) {
        netws::ReadResult r = transport->read();
        if (stop_requested()) {
            return CloseOutcome{CloseKind::STOPPED, 0, "stopped"};
        }
        switch (r.status) {
            case netws::ReadStatus::MESSAGE:
                messages_received_.fetch_add(1, std::memory_order_relaxed);
                auth_failures_ = 0;
                dispatch(r);
                break;
            case netws::ReadStatus::CLOSED:
                return classify_close(r.close.code, r.close.reason);
            case netws::ReadStatus::FAILED:
            default:
                return CloseOutcome{CloseKind::ABNORMAL, 1006, r.error};
        }
    }
}

void SessionManager::dispatch(const netws::ReadResult& message) {
    DecodeResult result = message.binary
        ? FrameDecoder::decode(std::span<const uint8_t>(
              reinterpret_cast<const uint8_t*>(message.payload.data()), message.payload.size()))
        : FrameDecoder::decode_json(message.payload);

    if (!result.ok()) {
        decode_errors_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("{} dropped malformed frame ({} bytes, {}): {}", tag(), message.payload.size(),
                     to_string(result.error->kind), result.error->message);
        return;
    }

    const DecodedEvent& event = *result.event;
    switch (config_.kind) {
        case ChannelKind::ORDER_UPDATES:
            if (!std::holds_alternative<OrderAlertEvent>(event)) {
                spdlog::debug("{} ignoring non order_alert message", tag());
                return;
            }
            break;
        case ChannelKind::MARKET_DEPTH:
            if (!std::holds_alternative<DepthBookEvent>(event)) {
                spdlog::debug("{} ignoring non depth message", tag());
                return;
            }
            break;
        case ChannelKind::MARKET_FEED:
        default:
            if (const auto* d = std::get_if<DisconnectEvent>(&event)) {
                spdlog::warn("{} disconnect packet code={} seg={} sid={}", tag(), d->reason_code,
                             segment_name_from_code(d->header.exchange_segment), d->header.security_id);
            }
            break;
    }
    emit(event);
}

void SessionManager::emit(const DecodedEvent& event) {
    const EventKind kind = kind_of(event);
    std::vector<EventListener> targets;
    {
        std::lock_guard<std::mutex> lk(listener_mutex_);
        for (const auto& [k, listener] : listeners_) {
            if (k == EventKind::ANY || k == kind) {
                targets.push_back(listener);
            }
        }
    }
    for (const auto& listener : targets) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::error("{} listener for {} threw: {}", tag(), to_string(kind), e.what());
        }
    }
}

void SessionManager::run() {
    while (!stop_requested()) {
        set_state(SessionState::CONNECTING);
        connect_attempts_.fetch_add(1, std::memory_order_relaxed);

        std::shared_ptr<netws::WsTransport> transport(transport_factory_());
        if (!transport) {
            set_error("transport factory returned no transport");
            spdlog::error("{} transport factory returned no transport; stopping", tag());
            break;
        }
        {
            std::lock_guard<std::mutex> lk(transport_mutex_);
            transport_ = transport;
        }
        if (stop_requested()) {
            break;
        }

        CloseOutcome outcome;
        const netws::ConnectResult connected = transport->connect(config_.url, config_.connect_timeout);
        if (stop_requested()) {
            transport->abort();
            break;
        }
        if (!connected) {
            // A declined upgrade ("HTTP 429 ...") is classified like a close reason
            if (connected.http_status != 0) {
                outcome = classify_close(0, connected.error);
            } else {
                outcome = CloseOutcome{CloseKind::ABNORMAL, 0,
                                       connected.error.empty() ? "connect failed" : connected.error};
            }
        } else {
            bool opened = false;
            {
                std::lock_guard<std::mutex> lk(sub_mutex_);
                opened = open_locked(transport);
            }
            if (opened) {
                set_state(SessionState::OPEN);
                spdlog::info("{} open", tag());
                outcome = read_loop(transport);
            } else {
                outcome = CloseOutcome{CloseKind::ABNORMAL, 0, "handshake traffic could not be sent"};
            }
            {
                std::lock_guard<std::mutex> lk(sub_mutex_);
                open_ = false;
            }
            transport->abort();
        }

        if (outcome.kind == CloseKind::STOPPED || stop_requested()) {
            break;
        }

        if (outcome.kind == CloseKind::RATE_LIMITED) {
            const auto cooloff = backoff_.cooloff();
            {
                std::lock_guard<std::mutex> lk(state_mutex_);
                cooloff_until_ = Clock::now() + cooloff;
                last_error_ = "rate limited: " + outcome.reason;
            }
            spdlog::warn("{} rate limited (code={} reason='{}'); cooling off {} ms",
                         tag(), outcome.code, outcome.reason, cooloff.count());
            set_state(SessionState::COOLING_OFF);
            if (!wait_for(cooloff)) break;
            std::lock_guard<std::mutex> lk(state_mutex_);
            cooloff_until_.reset();
            continue;
        }

        if (outcome.kind == CloseKind::CLEAN) {
            backoff_.reset();
            auth_failures_ = 0;
            backoff_seconds_.store(backoff_.current_seconds(), std::memory_order_release);
            set_state(SessionState::IDLE);
            const auto delay = std::chrono::milliseconds(
                static_cast<int64_t>(backoff_.current_seconds() * 1000.0));
            spdlog::info("{} closed cleanly; reconnecting in {} ms", tag(), delay.count());
            if (!wait_for(delay)) break;
            continue;
        }

        if (outcome.kind == CloseKind::AUTH_REJECTED) {
            ++auth_failures_;
            set_error("login rejected (code=" + std::to_string(outcome.code) + " reason='" + outcome.reason + "')");
            if (config_.max_auth_failures > 0 && auth_failures_ >= config_.max_auth_failures) {
                spdlog::error("{} login rejected {} time(s) in a row; giving up", tag(), auth_failures_);
                std::lock_guard<std::mutex> lk(state_mutex_);
                stop_requested_ = true;
                break;
            }
        } else {
            set_error(outcome.reason.empty() ? "closed with code " + std::to_string(outcome.code) : outcome.reason);
        }

        const auto delay = backoff_.next_delay();
        backoff_seconds_.store(backoff_.current_seconds(), std::memory_order_release);
        set_state(SessionState::IDLE);
        spdlog::warn("{} connection lost (code={} reason='{}'); retry #{} in {} ms",
                     tag(), outcome.code, outcome.reason, backoff_.consecutive_failures(), delay.count());
        if (!wait_for(delay)) break;
    }

    {
        std::lock_guard<std::mutex> lk(transport_mutex_);
        transport_.reset();
    }
    set_state(SessionState::STOPPED);
    spdlog::info("{} stopped", tag());
}

} // namespace dhanstream::stream
