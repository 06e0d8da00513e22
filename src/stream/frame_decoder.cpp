/**
 * @file frame_decoder.cpp
 */

#include "stream/frame_decoder.h"

#include <bit>
#include <cmath>
#include <limits>
#include <cstdlib>
#include <utility>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <spdlog/spdlog.h>

namespace dhanstream::stream {

namespace {

uint16_t read_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint16_t read_u16_be(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

int32_t read_i32_le(const uint8_t* p) {
    return std::bit_cast<int32_t>(read_u32_le(p));
}

float read_f32_le(const uint8_t* p) {
    return std::bit_cast<float>(read_u32_le(p));
}

/// Cursor over a payload; every read is bounds-checked by the caller up front.
class PayloadReader {
public:
    explicit PayloadReader(std::span<const uint8_t> payload) : data_(payload) {}

    float f32() { auto v = read_f32_le(data_.data() + pos_); pos_ += 4; return v; }
    int32_t i32() { auto v = read_i32_le(data_.data() + pos_); pos_ += 4; return v; }
    uint32_t u32() { auto v = read_u32_le(data_.data() + pos_); pos_ += 4; return v; }
    uint16_t u16() { auto v = read_u16_le(data_.data() + pos_); pos_ += 2; return v; }
    std::span<const uint8_t> take(std::size_t n) { auto s = data_.subspan(pos_, n); pos_ += n; return s; }

private:
    std::span<const uint8_t> data_;
    std::size_t pos_ = 0;
};

DecodeResult truncated(const PacketHeader& header, std::size_t have, std::size_t need) {
    return DecodeResult::failure(
        DecodeErrorKind::TRUNCATED,
        "response code " + std::to_string(header.response_code) + " needs " +
        std::to_string(need) + " payload bytes, got " + std::to_string(have));
}

// JSON values arrive as numbers or numeric strings depending on the field
double json_double(const rapidjson::Value& obj, const char* key, double fallback = 0.0) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return fallback;
    const auto& v = it->value;
    if (v.IsNumber()) return v.GetDouble();
    if (v.IsString()) {
        char* end = nullptr;
        double d = std::strtod(v.GetString(), &end);
        return (end != v.GetString()) ? d : fallback;
    }
    return fallback;
}

int64_t json_int(const rapidjson::Value& obj, const char* key, int64_t fallback = 0) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return fallback;
    const auto& v = it->value;
    if (v.IsInt64()) return v.GetInt64();
    if (v.IsNumber()) {
        // [-2^63, 2^63) is the range a double converts to int64_t without UB
        constexpr double lo = static_cast<double>(std::numeric_limits<int64_t>::min());
        const double d = v.GetDouble();
        return (std::isfinite(d) && d >= lo && d < -lo) ? static_cast<int64_t>(d) : fallback;
    }
    if (v.IsString()) {
        char* end = nullptr;
        long long n = std::strtoll(v.GetString(), &end, 10);
        return (end != v.GetString()) ? static_cast<int64_t>(n) : fallback;
    }
    return fallback;
}

std::string json_string(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return {};
    const auto& v = it->value;
    if (v.IsString()) return std::string(v.GetString(), v.GetStringLength());
    if (v.IsInt64()) return std::to_string(v.GetInt64());
    if (v.IsUint64()) return std::to_string(v.GetUint64());
    if (v.IsNumber()) return std::to_string(v.GetDouble());
    return {};
}

std::vector<BookLevel> parse_levels(const rapidjson::Value& data, const char* key) {
    std::vector<BookLevel> out;
    auto it = data.FindMember(key);
    if (it == data.MemberEnd() || !it->value.IsArray()) return out;
    out.reserve(it->value.Size());
    for (const auto& lvl : it->value.GetArray()) {
        if (!lvl.IsObject()) continue;
        BookLevel b;
        b.price = json_double(lvl, "Price");
        b.quantity = json_int(lvl, "Quantity");
        b.orders = json_int(lvl, "Orders", 1);
        out.push_back(b);
    }
    return out;
}

DepthBookEvent parse_depth_book(const rapidjson::Value& data, bool snapshot) {
    DepthBookEvent ev;
    ev.snapshot = snapshot;
    ev.symbol = json_string(data, "Symbol");
    ev.exchange_segment = json_string(data, "ExchangeSegment");
    ev.security_id = json_string(data, "SecurityId");
    ev.timestamp = json_int(data, "Timestamp");
    ev.bids = parse_levels(data, "Bids");
    ev.asks = parse_levels(data, "Asks");
    ev.best_bid = json_double(data, "BestBid");
    ev.best_ask = json_double(data, "BestAsk");
    ev.spread = (ev.best_bid == 0.0 || ev.best_ask == 0.0) ? 0.0 : ev.best_ask - ev.best_bid;
    ev.total_bid_qty = json_int(data, "TotalBidQty");
    ev.total_ask_qty = json_int(data, "TotalAskQty");
    return ev;
}

OrderAlertEvent parse_order_alert(const rapidjson::Value& data) {
    OrderAlertEvent ev;
    ev.order_no = json_string(data, "OrderNo");
    ev.exch_order_no = json_string(data, "ExchOrderNo");
    ev.status = json_string(data, "Status");
    ev.symbol = json_string(data, "Symbol");
    ev.display_name = json_string(data, "DisplayName");
    if (ev.symbol.empty()) ev.symbol = ev.display_name;
    ev.exchange = json_string(data, "Exchange");
    ev.segment = json_string(data, "Segment");
    ev.security_id = json_string(data, "SecurityId");
    ev.txn_type = json_string(data, "TxnType");
    ev.order_type = json_string(data, "OrderType");
    ev.product = json_string(data, "Product");
    ev.quantity = json_int(data, "Quantity");
    ev.traded_qty = json_int(data, "TradedQty");
    ev.remaining_quantity = json_int(data, "RemainingQuantity");
    ev.price = json_double(data, "Price");
    ev.trigger_price = json_double(data, "TriggerPrice");
    ev.traded_price = json_double(data, "TradedPrice");
    ev.avg_traded_price = json_double(data, "AvgTradedPrice");
    ev.leg_no = static_cast<int>(json_int(data, "LegNo"));
    ev.remarks = json_string(data, "Remarks");
    ev.last_updated_time = json_string(data, "LastUpdatedTime");
    ev.correlation_id = json_string(data, "CorrelationId");
    return ev;
}

} // namespace

std::string to_string(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::EMPTY: return "EMPTY";
        case DecodeErrorKind::TRUNCATED: return "TRUNCATED";
        case DecodeErrorKind::MALFORMED_JSON: return "MALFORMED_JSON";
        case DecodeErrorKind::MISSING_FIELD: return "MISSING_FIELD";
        default: return "UNKNOWN";
    }
}

std::optional<PacketHeader> FrameDecoder::parse_header(std::span<const uint8_t> bytes) {
    if (bytes.size() < HEADER_SIZE) {
        return std::nullopt;
    }
    PacketHeader h;
    h.response_code = bytes[0];
    h.declared_length = read_u16_be(bytes.data() + 1);
    h.exchange_segment = bytes[3];
    h.security_id = read_i32_le(bytes.data() + 4);
    return h;
}

DepthLevel FrameDecoder::read_depth_level(std::span<const uint8_t> bytes) {
    PayloadReader r(bytes);
    DepthLevel lvl;
    lvl.bid_quantity = r.u32();
    lvl.ask_quantity = r.u32();
    lvl.bid_orders = r.u16();
    lvl.ask_orders = r.u16();
    lvl.bid_price = r.f32();
    lvl.ask_price = r.f32();
    return lvl;
}

DecodeResult FrameDecoder::decode(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return DecodeResult::failure(DecodeErrorKind::EMPTY, "empty frame");
    }
    auto header_opt = parse_header(bytes);
    if (!header_opt) {
        return DecodeResult::failure(DecodeErrorKind::TRUNCATED,
                                     "frame of " + std::to_string(bytes.size()) + " bytes is shorter than header");
    }
    const PacketHeader header = *header_opt;
    auto payload = bytes.subspan(HEADER_SIZE);

    if (header.declared_length != bytes.size()) {
        spdlog::debug("[FrameDecoder] declared_length={} received={} code={} sid={}",
                      header.declared_length, bytes.size(), header.response_code, header.security_id);
    }

    auto need = [&](std::size_t n) { return payload.size() >= n; };

    switch (header.response_code) {
        case CODE_TICKER: {
            if (!need(TICKER_PAYLOAD)) return truncated(header, payload.size(), TICKER_PAYLOAD);
            PayloadReader r(payload);
            TickerEvent ev;
            ev.header = header;
            ev.ltp = r.f32();
            ev.ltt = r.i32();
            return DecodeResult::success(ev);
        }
        case CODE_QUOTE: {
            if (!need(QUOTE_PAYLOAD)) return truncated(header, payload.size(), QUOTE_PAYLOAD);
            PayloadReader r(payload);
            QuoteEvent ev;
            ev.header = header;
            ev.ltp = r.f32();
            ev.last_trade_qty = r.u16();
            ev.ltt = r.u32();
            ev.atp = r.f32();
            ev.volume = r.u32();
            ev.total_sell_qty = r.i32();
            ev.total_buy_qty = r.i32();
            ev.day_open = r.f32();
            ev.day_close = r.f32();
            ev.day_high = r.f32();
            ev.day_low = r.f32();
            return DecodeResult::success(ev);
        }
        case CODE_FULL: {
            if (!need(FULL_PAYLOAD)) return truncated(header, payload.size(), FULL_PAYLOAD);
            PayloadReader r(payload);
            FullEvent ev;
            ev.header = header;
            ev.ltp = r.f32();
            ev.last_trade_qty = r.u16();
            ev.ltt = r.u32();
            ev.atp = r.f32();
            ev.volume = r.u32();
            ev.total_sell_qty = r.i32();
            ev.total_buy_qty = r.i32();
            ev.open_interest = r.i32();
            ev.highest_oi = r.i32();
            ev.lowest_oi = r.i32();
            ev.day_open = r.f32();
            ev.day_close = r.f32();
            ev.day_high = r.f32();
            ev.day_low = r.f32();
            for (auto& lvl : ev.depth) {
                lvl = read_depth_level(r.take(DEPTH_LEVEL_SIZE));
            }
            return DecodeResult::success(ev);
        }
        case CODE_OI: {
            if (!need(OI_PAYLOAD)) return truncated(header, payload.size(), OI_PAYLOAD);
            PayloadReader r(payload);
            OpenInterestEvent ev;
            ev.header = header;
            ev.open_interest = r.i32();
            return DecodeResult::success(ev);
        }
        case CODE_PREV_CLOSE: {
            if (!need(PREV_CLOSE_PAYLOAD)) return truncated(header, payload.size(), PREV_CLOSE_PAYLOAD);
            PayloadReader r(payload);
            PrevCloseEvent ev;
            ev.header = header;
            ev.prev_close = r.f32();
            ev.oi_prev = r.i32();
            return DecodeResult::success(ev);
        }
        case CODE_DEPTH_BID:
        case CODE_DEPTH_ASK: {
            if (!need(DEPTH_LEVEL_SIZE)) return truncated(header, payload.size(), DEPTH_LEVEL_SIZE);
            DepthDeltaEvent ev;
            ev.header = header;
            ev.side = (header.response_code == CODE_DEPTH_BID) ? DepthSide::BID : DepthSide::ASK;
            ev.level = read_depth_level(payload.first(DEPTH_LEVEL_SIZE));
            return DecodeResult::success(ev);
        }
        case CODE_DISCONNECT: {
            if (!need(DISCONNECT_PAYLOAD)) return truncated(header, payload.size(), DISCONNECT_PAYLOAD);
            DisconnectEvent ev;
            ev.header = header;
            ev.reason_code = read_u16_be(payload.data());
            return DecodeResult::success(ev);
        }
        default: {
            // index (1), market status (7) and anything newer
            UnrecognizedEvent ev;
            ev.header = header;
            ev.raw.assign(bytes.begin(), bytes.end());
            return DecodeResult::success(ev);
        }
    }
}

DecodeResult FrameDecoder::decode_json(std::string_view text) {
    if (text.empty()) {
        return DecodeResult::failure(DecodeErrorKind::EMPTY, "empty message");
    }
    rapidjson::Document d;
    d.Parse(text.data(), text.size());
    if (d.HasParseError()) {
        return DecodeResult::failure(DecodeErrorKind::MALFORMED_JSON,
                                     std::string(rapidjson::GetParseError_En(d.GetParseError())) +
                                     " at offset " + std::to_string(d.GetErrorOffset()));
    }
    if (!d.IsObject()) {
        return DecodeResult::failure(DecodeErrorKind::MALFORMED_JSON, "envelope is not an object");
    }
    auto type_it = d.FindMember("Type");
    if (type_it == d.MemberEnd() || !type_it->value.IsString()) {
        return DecodeResult::failure(DecodeErrorKind::MISSING_FIELD, "envelope has no Type");
    }
    const std::string type(type_it->value.GetString(), type_it->value.GetStringLength());

    const bool is_depth = (type == "depth_update" || type == "depth_snapshot");
    if (!is_depth && type != "order_alert") {
        UnrecognizedEvent ev;
        ev.type = type;
        ev.raw.assign(text.begin(), text.end());
        return DecodeResult::success(ev);
    }

    auto data_it = d.FindMember("Data");
    if (data_it == d.MemberEnd() || !data_it->value.IsObject()) {
        return DecodeResult::failure(DecodeErrorKind::MISSING_FIELD, type + " envelope has no Data object");
    }
    if (is_depth) {
        return DecodeResult::success(parse_depth_book(data_it->value, type == "depth_snapshot"));
    }
    return DecodeResult::success(parse_order_alert(data_it->value));
}

} // namespace dhanstream::stream
