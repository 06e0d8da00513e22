/**
 * @file stream_service.cpp
 * @brief StreamService: builds and runs the feed, depth and order channels
 */

#include "engine/stream_service.h"

#include <chrono>
#include <exception>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/net/beast_ws_transport.h"
#include "core/net/http_client.h"
#include "core/net/rest_executor.h"
#include "stream/endpoints.h"
#include "stream/session_registry.h"
#include "stream/wire_commands.h"

namespace dhanstream {

namespace {

constexpr auto STATS_INTERVAL = std::chrono::seconds(30);

std::vector<stream::SymbolRef> to_refs(const std::vector<std::string>& labels) {
    std::vector<stream::SymbolRef> refs;
    refs.reserve(labels.size());
    for (const auto& label : labels) {
        refs.emplace_back(label);
    }
    return refs;
}

void log_report(const std::string& channel, const stream::SubscribeReport& report) {
    spdlog::info("[StreamService] {} subscribe: added={} already_active={} failed={}",
                 channel, report.added.size(), report.already_active.size(), report.failed.size());
    for (const auto& [label, reason] : report.failed) {
        spdlog::warn("[StreamService] {} could not subscribe {}: {}", channel, label, reason);
    }
}

} // namespace

StreamService::StreamService(StreamConfig config,
                             netws::WsTransportFactory transport_factory,
                             std::shared_ptr<stream::IInstrumentDirectory> directory)
    : config_(std::move(config)),
      transport_factory_(std::move(transport_factory)),
      directory_(std::move(directory)) {
    if (!transport_factory_) {
        transport_factory_ = [] { return std::make_unique<netws::BeastWsTransport>(); };
    }
}

StreamService::~StreamService() {
    stop();
}

stream::SessionConfig StreamService::base_session_config(const std::string& channel_id) const {
    stream::SessionConfig sc;
    sc.channel_id = channel_id;
    sc.connect_timeout = std::chrono::milliseconds(config_.session.connect_timeout_ms);
    sc.max_auth_failures = config_.session.max_auth_failures;
    return sc;
}

bool StreamService::initialize() {
    try {
        const auto& creds = config_.auth;

        limiter_ = std::make_shared<throttle::RateLimiter>();
        rest_ = std::make_shared<nethttp::RestExecutor>(
            std::make_shared<nethttp::HttpClient>(),
            limiter_,
            nethttp::RestCredentials{creds.client_id, creds.access_token},
            config_.rest.base_url);
        if (!directory_) {
            directory_ = std::make_shared<stream::RestInstrumentDirectory>(rest_);
        }
        resolver_ = std::make_shared<stream::SubscriptionResolver>(directory_);

        auto& registry = stream::SessionRegistry::instance();

        if (config_.feed.enabled) {
            auto sc = base_session_config("feed");
            sc.kind = stream::ChannelKind::MARKET_FEED;
            sc.url = config_.feed.url.empty()
                         ? stream::build_feed_url(creds.access_token, creds.client_id)
                         : config_.feed.url;
            if (!stream::parse_feed_mode(config_.feed.mode, sc.mode)) {
                spdlog::error("[StreamService] Unknown feed mode: {}", config_.feed.mode);
                return false;
            }
            feed_session_ = std::make_shared<stream::SessionManager>(sc, transport_factory_, resolver_);
            feed_session_->on(stream::EventKind::ANY,
                              [this](const stream::DecodedEvent& ev) { count(ev); });
            registry.add(feed_session_);
        }

        if (config_.depth.enabled) {
            auto sc = base_session_config("depth" + std::to_string(config_.depth.level));
            sc.kind = stream::ChannelKind::MARKET_DEPTH;
            sc.url = config_.depth.url.empty()
                         ? stream::build_depth_url(config_.depth.level, creds.access_token, creds.client_id)
                         : config_.depth.url;
            depth_session_ = std::make_shared<stream::SessionManager>(sc, transport_factory_, resolver_);
            depth_session_->on(stream::EventKind::ANY,
                               [this](const stream::DecodedEvent& ev) { count(ev); });
            registry.add(depth_session_);
        }

        if (config_.orders.enabled) {
            auto sc = base_session_config("orders");
            sc.kind = stream::ChannelKind::ORDER_UPDATES;
            sc.url = config_.orders.url.empty() ? std::string(stream::ORDER_UPDATE_URL)
                                                : config_.orders.url;
            stream::LoginCredentials login;
            login.user_type = creds.is_partner() ? stream::LoginCredentials::UserType::PARTNER
                                                 : stream::LoginCredentials::UserType::SELF;
            login.client_id = creds.client_id;
            login.access_token = creds.access_token;
            login.partner_id = creds.partner_id;
            login.partner_secret = creds.partner_secret;
            sc.login = std::move(login);
            order_session_ = std::make_shared<stream::SessionManager>(sc, transport_factory_);
            order_session_->on(stream::EventKind::ANY,
                               [this](const stream::DecodedEvent& ev) { count(ev); });
            registry.add(order_session_);

            stream::TrackerConfig tc;
            tc.max_orders = config_.tracker.max_orders;
            tc.max_age = std::chrono::seconds(config_.tracker.max_age_s);
            tc.sweep_interval = std::chrono::seconds(config_.tracker.sweep_interval_s);
            tracker_ = std::make_shared<stream::OrderStateTracker>(tc);
            order_hub_ = std::make_unique<stream::OrderUpdateHub>(order_session_, tracker_);

            if (feed_session_) {
                std::weak_ptr<stream::SessionManager> feed = feed_session_;
                order_hub_->on_entry_fill(
                    [feed](const stream::OrderAlertEvent& alert, const stream::InstrumentRef& ref) {
                        auto session = feed.lock();
                        if (!session) {
                            return;
                        }
                        stream::InstrumentDescriptor desc;
                        desc.exchange_segment = ref.exchange_segment;
                        desc.security_id = ref.security_id;
                        spdlog::info("[StreamService] Entry fill on order {} -> streaming {}:{}",
                                     alert.order_no, ref.exchange_segment, ref.security_id);
                        log_report("feed", session->subscribe({desc}));
                    });
            }
        }

        spdlog::info("[StreamService] Initialized (feed={}, depth={}, orders={})",
                     feed_session_ != nullptr, depth_session_ != nullptr, order_session_ != nullptr);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("[StreamService] Initialization failed: {}", e.what());
        return false;
    }
}

void StreamService::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // Queue subscriptions first so the initial connect replays them.
    if (feed_session_) {
        if (!config_.feed.instruments.empty()) {
            log_report("feed", feed_session_->subscribe(to_refs(config_.feed.instruments)));
        }
        feed_session_->start();
    }
    if (depth_session_) {
        if (!config_.depth.symbols.empty()) {
            log_report("depth", depth_session_->subscribe(to_refs(config_.depth.symbols)));
        }
        depth_session_->start();
    }
    if (order_hub_) {
        order_hub_->start();
    }

    stats_thread_ = std::thread(&StreamService::stats_monitoring_thread, this);
    spdlog::info("[StreamService] Started");
}

void StreamService::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    stats_cv_.notify_all();
    if (stats_thread_.joinable()) {
        stats_thread_.join();
    }

    auto& registry = stream::SessionRegistry::instance();
    if (order_hub_) {
        order_hub_->stop();
    }
    for (const auto& session : {feed_session_, depth_session_, order_session_}) {
        if (session) {
            session->stop();
            registry.remove(session.get());
        }
    }

    const auto s = stats();
    spdlog::info("[StreamService] Stopped. ticks={} depth={} order_alerts={} other={}",
                 s.ticks, s.depth_updates, s.order_alerts, s.other);
}

StreamService::Stats StreamService::stats() const {
    Stats s;
    s.ticks = ticks_.load(std::memory_order_relaxed);
    s.depth_updates = depth_updates_.load(std::memory_order_relaxed);
    s.order_alerts = order_alerts_.load(std::memory_order_relaxed);
    s.other = other_.load(std::memory_order_relaxed);
    return s;
}

void StreamService::count(const stream::DecodedEvent& event) {
    switch (stream::kind_of(event)) {
        case stream::EventKind::TICKER:
        case stream::EventKind::QUOTE:
        case stream::EventKind::FULL:
            ticks_.fetch_add(1, std::memory_order_relaxed);
            break;
        case stream::EventKind::DEPTH_DELTA:
        case stream::EventKind::DEPTH_BOOK:
            depth_updates_.fetch_add(1, std::memory_order_relaxed);
            break;
        case stream::EventKind::ORDER_ALERT:
            order_alerts_.fetch_add(1, std::memory_order_relaxed);
            break;
        default:
            other_.fetch_add(1, std::memory_order_relaxed);
            break;
    }
}

void StreamService::stats_monitoring_thread() {
    spdlog::info("[StreamService] Stats monitoring thread started");

    uint64_t last_ticks = 0;
    auto last_time = std::chrono::steady_clock::now();

    std::unique_lock lock(stats_mutex_);
    while (running_.load(std::memory_order_acquire)) {
        stats_cv_.wait_for(lock, STATS_INTERVAL,
                           [this] { return !running_.load(std::memory_order_acquire); });
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - last_time).count();
        const auto s = stats();
        const uint64_t ticks_per_second =
            elapsed_ms > 0 ? ((s.ticks - last_ticks) * 1000) / static_cast<uint64_t>(elapsed_ms) : 0;

        spdlog::info("[Stats] Ticks/sec: {}, Ticks: {}, Depth: {}, Orders: {}, Other: {}",
                     ticks_per_second, s.ticks, s.depth_updates, s.order_alerts, s.other);
        for (const auto& session : {feed_session_, depth_session_, order_session_}) {
            if (!session) {
                continue;
            }
            spdlog::info("[Stats] {} state={} subs={} msgs={} decode_errors={} backoff={:.0f}s",
                         session->channel_id(), stream::to_string(session->state()),
                         session->subscriptions().size(), session->messages_received(),
                         session->decode_errors(), session->backoff_seconds());
        }
        if (tracker_) {
            spdlog::info("[Stats] tracked_orders={}", tracker_->size());
        }

        last_ticks = s.ticks;
        last_time = now;
    }

    spdlog::info("[StreamService] Stats monitoring thread stopped");
}

} // namespace dhanstream
