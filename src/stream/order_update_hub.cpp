/**
 * @file order_update_hub.cpp
 */

#include "stream/order_update_hub.h"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "stream/segments.h"
#include "utils/string_utils.h"

namespace dhanstream::stream {

OrderUpdateHub::OrderUpdateHub(std::shared_ptr<SessionManager> session,
                               std::shared_ptr<OrderStateTracker> tracker)
    : session_(std::move(session)), tracker_(std::move(tracker)) {
    if (!session_ || !tracker_) {
        throw std::invalid_argument("OrderUpdateHub requires a session and a tracker");
    }
    if (session_->config().kind != ChannelKind::ORDER_UPDATES) {
        throw std::invalid_argument("OrderUpdateHub session must be an order update channel");
    }
    session_->on(EventKind::ORDER_ALERT, [this](const DecodedEvent& ev) {
        if (const auto* alert = std::get_if<OrderAlertEvent>(&ev)) {
            handle(*alert);
        }
    });
}

OrderUpdateHub::~OrderUpdateHub() {
    stop();
}

void OrderUpdateHub::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    tracker_->start();
    session_->start();
    spdlog::info("[OrderHub] started");
}

void OrderUpdateHub::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    session_->stop();
    tracker_->stop();
    spdlog::info("[OrderHub] stopped (tracked_orders={})", tracker_->size());
}

void OrderUpdateHub::on_update(UpdateListener listener) {
    std::lock_guard<std::mutex> lk(listener_mutex_);
    update_listeners_.push_back(std::move(listener));
}

void OrderUpdateHub::on_entry_fill(EntryFillListener listener) {
    std::lock_guard<std::mutex> lk(listener_mutex_);
    entry_listeners_.push_back(std::move(listener));
}

bool OrderUpdateHub::is_entry_fill(const OrderAlertEvent& alert) {
    return alert.leg_no == 1 &&
           utils::to_upper_ascii(alert.status) == "TRADED" &&
           alert.traded_qty > 0;
}

void OrderUpdateHub::handle(const OrderAlertEvent& alert) {
    tracker_->consume(alert);

    std::vector<UpdateListener> updates;
    std::vector<EntryFillListener> entries;
    {
        std::lock_guard<std::mutex> lk(listener_mutex_);
        updates = update_listeners_;
        entries = entry_listeners_;
    }
    // Exceptions propagate to the session's dispatch boundary, which logs them
    for (const auto& l : updates) {
        l(alert);
    }

    if (!entries.empty() && is_entry_fill(alert)) {
        InstrumentRef ref;
        ref.exchange_segment = segment_from_exchange_letters(alert.exchange, alert.segment);
        ref.security_id = alert.security_id;
        ref.display_label = ref.exchange_segment + ":" + ref.security_id;
        ref.original_input = alert.order_no;
        spdlog::info("[OrderHub] entry fill order={} {} qty={}", alert.order_no, ref.display_label, alert.traded_qty);
        for (const auto& l : entries) {
            l(alert, ref);
        }
    }
}

} // namespace dhanstream::stream
