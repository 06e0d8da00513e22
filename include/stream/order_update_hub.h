/**
 * @file order_update_hub.h
 * @brief Wires the order update session into the order state tracker
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "stream/events.h"
#include "stream/instrument.h"
#include "stream/order_state_tracker.h"
#include "stream/session_manager.h"

namespace dhanstream::stream {

/**
 * @class OrderUpdateHub
 * @brief Feeds every order_alert into the tracker and fans it out to subscribers.
 *
 * An alert for leg 1 with status TRADED and a positive traded quantity is also
 * reported as an entry fill, carrying the instrument so callers can start
 * streaming it (e.g. subscribe it on the market feed).
 */
class OrderUpdateHub {
public:
    using UpdateListener = std::function<void(const OrderAlertEvent&)>;
    using EntryFillListener = std::function<void(const OrderAlertEvent&, const InstrumentRef&)>;

    OrderUpdateHub(std::shared_ptr<SessionManager> session,
                   std::shared_ptr<OrderStateTracker> tracker);
    ~OrderUpdateHub();

    OrderUpdateHub(const OrderUpdateHub&) = delete;
    OrderUpdateHub& operator=(const OrderUpdateHub&) = delete;

    void start();
    void stop();
    bool running() const { return running_.load(std::memory_order_acquire); }

    void on_update(UpdateListener listener);
    void on_entry_fill(EntryFillListener listener);

    static bool is_entry_fill(const OrderAlertEvent& alert);

    OrderStateTracker& tracker() { return *tracker_; }
    SessionManager& session() { return *session_; }

private:
    void handle(const OrderAlertEvent& alert);

    std::shared_ptr<SessionManager> session_;
    std::shared_ptr<OrderStateTracker> tracker_;
    std::atomic<bool> running_{false};

    std::mutex listener_mutex_;
    std::vector<UpdateListener> update_listeners_;
    std::vector<EntryFillListener> entry_listeners_;
};

} // namespace dhanstream::stream
