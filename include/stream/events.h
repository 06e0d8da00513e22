/**
 * @file events.h
 * @brief Typed events produced by the frame decoder (one variant per packet kind)
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dhanstream::stream {

/**
 * @brief Fields common to every binary feed packet (from the 8 byte header)
 */
struct PacketHeader {
    uint8_t response_code = 0;
    uint16_t declared_length = 0;
    uint8_t exchange_segment = 0;
    int32_t security_id = 0;
};

/**
 * @brief One level of the 5-deep book carried by Full and depth delta packets
 */
struct DepthLevel {
    uint32_t bid_quantity = 0;
    uint32_t ask_quantity = 0;
    uint16_t bid_orders = 0;
    uint16_t ask_orders = 0;
    float bid_price = 0.0f;
    float ask_price = 0.0f;
};

struct TickerEvent {
    PacketHeader header;
    float ltp = 0.0f;
    int32_t ltt = 0;           // last trade time, epoch seconds
};

struct QuoteEvent {
    PacketHeader header;
    float ltp = 0.0f;
    uint16_t last_trade_qty = 0;
    uint32_t ltt = 0;
    float atp = 0.0f;
    uint32_t volume = 0;
    int32_t total_sell_qty = 0;
    int32_t total_buy_qty = 0;
    float day_open = 0.0f;
    float day_close = 0.0f;
    float day_high = 0.0f;
    float day_low = 0.0f;
};

struct FullEvent {
    PacketHeader header;
    float ltp = 0.0f;
    uint16_t last_trade_qty = 0;
    uint32_t ltt = 0;
    float atp = 0.0f;
    uint32_t volume = 0;
    int32_t total_sell_qty = 0;
    int32_t total_buy_qty = 0;
    int32_t open_interest = 0;
    int32_t highest_oi = 0;
    int32_t lowest_oi = 0;
    float day_open = 0.0f;
    float day_close = 0.0f;
    float day_high = 0.0f;
    float day_low = 0.0f;
    std::array<DepthLevel, 5> depth{};
};

enum class DepthSide { BID, ASK };

/**
 * @brief Incremental single-level depth packet (response codes 41 / 51)
 */
struct DepthDeltaEvent {
    PacketHeader header;
    DepthSide side = DepthSide::BID;
    DepthLevel level;
};

/**
 * @brief One price level of the JSON full-depth book
 */
struct BookLevel {
    double price = 0.0;
    int64_t quantity = 0;
    int64_t orders = 1;
};

/**
 * @brief Full market depth update or snapshot from the JSON depth channel
 */
struct DepthBookEvent {
    bool snapshot = false;
    std::string symbol;
    std::string exchange_segment;
    std::string security_id;
    int64_t timestamp = 0;
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;
    double best_bid = 0.0;
    double best_ask = 0.0;
    double spread = 0.0;       // best_ask - best_bid, 0 when either side is empty
    int64_t total_bid_qty = 0;
    int64_t total_ask_qty = 0;
};

struct OpenInterestEvent {
    PacketHeader header;
    int32_t open_interest = 0;
};

struct PrevCloseEvent {
    PacketHeader header;
    float prev_close = 0.0f;
    int32_t oi_prev = 0;
};

struct DisconnectEvent {
    PacketHeader header;
    uint16_t reason_code = 0;
};

/**
 * @brief Order update pushed on the order channel (Type == "order_alert")
 */
struct OrderAlertEvent {
    std::string order_no;
    std::string exch_order_no;
    std::string status;
    std::string symbol;
    std::string display_name;
    std::string exchange;
    std::string segment;
    std::string security_id;
    std::string txn_type;
    std::string order_type;
    std::string product;
    int64_t quantity = 0;
    int64_t traded_qty = 0;
    int64_t remaining_quantity = 0;
    double price = 0.0;
    double trigger_price = 0.0;
    double traded_price = 0.0;
    double avg_traded_price = 0.0;
    int leg_no = 0;
    std::string remarks;
    std::string last_updated_time;
    std::string correlation_id;
};

/**
 * @brief Forward-compatible fallthrough for response codes / envelope types we do not model
 */
struct UnrecognizedEvent {
    std::optional<PacketHeader> header;
    std::string type;          // JSON "Type" when the message was an envelope
    std::vector<uint8_t> raw;
};

using DecodedEvent = std::variant<
    TickerEvent,
    QuoteEvent,
    FullEvent,
    DepthDeltaEvent,
    DepthBookEvent,
    OpenInterestEvent,
    PrevCloseEvent,
    DisconnectEvent,
    OrderAlertEvent,
    UnrecognizedEvent>;

/**
 * @enum EventKind
 * @brief Listener filter; ANY receives every decoded event
 */
enum class EventKind {
    TICKER,
    QUOTE,
    FULL,
    DEPTH_DELTA,
    DEPTH_BOOK,
    OPEN_INTEREST,
    PREV_CLOSE,
    DISCONNECT,
    ORDER_ALERT,
    UNRECOGNIZED,
    ANY
};

/**
 * @brief Kind of the alternative held by a decoded event
 */
inline EventKind kind_of(const DecodedEvent& event) {
    return static_cast<EventKind>(event.index());
}

inline std::string to_string(EventKind kind) {
    switch (kind) {
        case EventKind::TICKER: return "TICKER";
        case EventKind::QUOTE: return "QUOTE";
        case EventKind::FULL: return "FULL";
        case EventKind::DEPTH_DELTA: return "DEPTH_DELTA";
        case EventKind::DEPTH_BOOK: return "DEPTH_BOOK";
        case EventKind::OPEN_INTEREST: return "OPEN_INTEREST";
        case EventKind::PREV_CLOSE: return "PREV_CLOSE";
        case EventKind::DISCONNECT: return "DISCONNECT";
        case EventKind::ORDER_ALERT: return "ORDER_ALERT";
        case EventKind::UNRECOGNIZED: return "UNRECOGNIZED";
        case EventKind::ANY: return "ANY";
        default: return "UNKNOWN";
    }
}

} // namespace dhanstream::stream
