/**
 * @file order_state_tracker.cpp
 */

#include "stream/order_state_tracker.h"

#include <algorithm>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "stream/segments.h"

namespace dhanstream::stream {

OrderStateTracker::OrderStateTracker(TrackerConfig config, TimeSource now)
    : config_(config), now_(std::move(now)) {}

OrderStateTracker::~OrderStateTracker() {
    stop();
}

OrderStateTracker::Clock::time_point OrderStateTracker::now() const {
    return now_ ? now_() : Clock::now();
}

void OrderStateTracker::record(const std::string& order_id, TrackedOrder state) {
    state.order_id = order_id;
    state.last_seen_at = now();

    bool over_cap = false;
    {
        std::unique_lock lock(mutex_);
        orders_.insert_or_assign(order_id, std::move(state));
        over_cap = orders_.size() > config_.max_orders;
    }
    if (over_cap) {
        sweep();
    }
}

std::optional<TrackedOrder> OrderStateTracker::get(const std::string& order_id) const {
    std::shared_lock lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t OrderStateTracker::size() const {
    std::shared_lock lock(mutex_);
    return orders_.size();
}

void OrderStateTracker::consume(const OrderAlertEvent& alert) {
    if (alert.order_no.empty()) {
        spdlog::debug("[OrderTracker] ignoring order alert without OrderNo (status={})", alert.status);
        return;
    }
    TrackedOrder state;
    state.status = alert.status;
    state.traded_qty = alert.traded_qty;
    state.symbol = alert.symbol;
    state.exchange_segment = segment_from_exchange_letters(alert.exchange, alert.segment);
    state.security_id = alert.security_id;
    state.txn_type = alert.txn_type;
    state.quantity = alert.quantity;
    state.avg_traded_price = alert.avg_traded_price;
    state.leg_no = alert.leg_no;

    spdlog::debug("[OrderTracker] order {} status={} traded_qty={}",
                  alert.order_no, alert.status, alert.traded_qty);
    record(alert.order_no, std::move(state));
}

std::size_t OrderStateTracker::sweep() {
    return sweep(now());
}

std::size_t OrderStateTracker::sweep(Clock::time_point at) {
    std::unique_lock lock(mutex_);
    const std::size_t before = orders_.size();

    for (auto it = orders_.begin(); it != orders_.end();) {
        if (at - it->second.last_seen_at >= config_.max_age) {
            it = orders_.erase(it);
        } else {
            ++it;
        }
    }
    const std::size_t expired = before - orders_.size();

    std::size_t evicted = 0;
    if (orders_.size() > config_.max_orders) {
        std::vector<std::pair<Clock::time_point, std::string>> by_age;
        by_age.reserve(orders_.size());
        for (const auto& [id, order] : orders_) {
            by_age.emplace_back(order.last_seen_at, id);
        }
        const std::size_t excess = orders_.size() - config_.max_orders;
        std::partial_sort(by_age.begin(), by_age.begin() + static_cast<std::ptrdiff_t>(excess), by_age.end());
        for (std::size_t i = 0; i < excess; ++i) {
            orders_.erase(by_age[i].second);
        }
        evicted = excess;
    }
    lock.unlock();

    if (expired + evicted > 0) {
        spdlog::debug("[OrderTracker] sweep removed {} expired and {} over-capacity entries",
                      expired, evicted);
    }
    return expired + evicted;
}

void OrderStateTracker::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(sweep_mutex_);
        stop_requested_ = false;
    }
    sweep_thread_ = std::thread(&OrderStateTracker::sweep_loop, this);
    spdlog::info("[OrderTracker] sweep thread started (interval_ms={} max_orders={} max_age_s={})",
                 config_.sweep_interval.count(), config_.max_orders, config_.max_age.count());
}

void OrderStateTracker::stop() {
    {
        std::lock_guard<std::mutex> lk(sweep_mutex_);
        stop_requested_ = true;
    }
    sweep_cv_.notify_all();
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
    running_.store(false, std::memory_order_release);
}

void OrderStateTracker::sweep_loop() {
    std::unique_lock<std::mutex> lk(sweep_mutex_);
    while (!stop_requested_) {
        if (sweep_cv_.wait_for(lk, config_.sweep_interval, [this] { return stop_requested_; })) {
            break;
        }
        lk.unlock();
        sweep();
        lk.lock();
    }
}

} // namespace dhanstream::stream
