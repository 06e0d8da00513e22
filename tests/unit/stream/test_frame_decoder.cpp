/**
 * @file test_frame_decoder.cpp
 * @brief Unit tests for binary and JSON frame decoding
 */

#include <gtest/gtest.h>
#include "stream/frame_decoder.h"
#include "support/frame_builder.h"

#include <cmath>
#include <string>
#include <vector>

using namespace dhanstream::stream;
using dhanstream::testing::FrameBuilder;
using dhanstream::testing::ticker_frame;

namespace {

DecodeResult decode_bytes(const std::vector<uint8_t>& bytes) {
    return FrameDecoder::decode(std::span<const uint8_t>(bytes.data(), bytes.size()));
}

DepthLevel sample_level(int i) {
    DepthLevel lvl;
    lvl.bid_quantity = 100u + i;
    lvl.ask_quantity = 200u + i;
    lvl.bid_orders = static_cast<uint16_t>(3 + i);
    lvl.ask_orders = static_cast<uint16_t>(7 + i);
    lvl.bid_price = 1500.25f - i * 0.05f;
    lvl.ask_price = 1500.35f + i * 0.05f;
    return lvl;
}

} // namespace

// ============================================================================
// TESTS: MALFORMED INPUT
// ============================================================================

TEST(FrameDecoder, EmptyInputIsError) {
    auto r = decode_bytes({});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, DecodeErrorKind::EMPTY);
}

TEST(FrameDecoder, EveryPrefixShorterThanHeaderIsTruncated) {
    const auto frame = ticker_frame(1, 1333, 100.0f, 0);
    for (std::size_t n = 1; n < FrameDecoder::HEADER_SIZE; ++n) {
        std::vector<uint8_t> prefix(frame.begin(), frame.begin() + n);
        auto r = decode_bytes(prefix);
        ASSERT_FALSE(r.ok()) << "prefix length " << n;
        EXPECT_EQ(r.error->kind, DecodeErrorKind::TRUNCATED);
    }
}

TEST(FrameDecoder, ShortPayloadForKnownCodeIsTruncated) {
    const std::vector<uint8_t> codes = {2, 4, 5, 6, 8, 41, 50, 51};
    for (uint8_t code : codes) {
        auto frame = FrameBuilder(code, 1, 42).zeros(1).build();
        auto r = decode_bytes(frame);
        ASSERT_FALSE(r.ok()) << "code " << int(code);
        EXPECT_EQ(r.error->kind, DecodeErrorKind::TRUNCATED);
        EXPECT_FALSE(r.error->message.empty());
    }
}

TEST(FrameDecoder, DeclaredLengthMismatchIsTolerated) {
    auto frame = ticker_frame(1, 1333, 10.5f, 5);
    frame[1] = 0xFF;
    frame[2] = 0xFF;
    auto r = decode_bytes(frame);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(std::holds_alternative<TickerEvent>(*r.event));
}

// ============================================================================
// TESTS: PACKET KINDS
// ============================================================================

TEST(FrameDecoder, Header) {
    auto frame = ticker_frame(2, 49081, 1.0f, 0);
    auto h = FrameDecoder::parse_header(std::span<const uint8_t>(frame.data(), frame.size()));
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->response_code, 2);
    EXPECT_EQ(h->declared_length, 16);
    EXPECT_EQ(h->exchange_segment, 2);
    EXPECT_EQ(h->security_id, 49081);
}

TEST(FrameDecoder, Ticker) {
    auto r = decode_bytes(ticker_frame(1, 1333, 2450.5f, 1700000000));
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(kind_of(*r.event), EventKind::TICKER);
    const auto& t = std::get<TickerEvent>(*r.event);
    EXPECT_EQ(t.header.security_id, 1333);
    EXPECT_EQ(t.header.exchange_segment, 1);
    EXPECT_FLOAT_EQ(t.ltp, 2450.5f);
    EXPECT_EQ(t.ltt, 1700000000);
}

TEST(FrameDecoder, Quote) {
    auto frame = FrameBuilder(4, 1, 11536)
        .f32(3500.0f).u16(25).u32(1700000100).f32(3498.5f).u32(123456)
        .i32(1000).i32(2000)
        .f32(3450.0f).f32(3440.0f).f32(3510.0f).f32(3430.0f)
        .build();
    auto r = decode_bytes(frame);
    ASSERT_TRUE(r.ok());
    const auto& q = std::get<QuoteEvent>(*r.event);
    EXPECT_FLOAT_EQ(q.ltp, 3500.0f);
    EXPECT_EQ(q.last_trade_qty, 25);
    EXPECT_EQ(q.ltt, 1700000100u);
    EXPECT_FLOAT_EQ(q.atp, 3498.5f);
    EXPECT_EQ(q.volume, 123456u);
    EXPECT_EQ(q.total_sell_qty, 1000);
    EXPECT_EQ(q.total_buy_qty, 2000);
    EXPECT_FLOAT_EQ(q.day_open, 3450.0f);
    EXPECT_FLOAT_EQ(q.day_close, 3440.0f);
    EXPECT_FLOAT_EQ(q.day_high, 3510.0f);
    EXPECT_FLOAT_EQ(q.day_low, 3430.0f);
}

TEST(FrameDecoder, FullWithFiveDepthLevels) {
    FrameBuilder b(8, 2, 35001);
    b.f32(210.5f).u16(50).u32(1700000200).f32(209.75f).u32(987654)
     .i32(300).i32(400)
     .i32(555000).i32(600000).i32(500000)
     .f32(205.0f).f32(204.0f).f32(212.0f).f32(203.5f);
    for (int i = 0; i < 5; ++i) {
        b.level(sample_level(i));
    }
    auto r = decode_bytes(b.build());
    ASSERT_TRUE(r.ok());
    const auto& f = std::get<FullEvent>(*r.event);
    EXPECT_EQ(f.header.exchange_segment, 2);
    EXPECT_EQ(f.open_interest, 555000);
    EXPECT_EQ(f.highest_oi, 600000);
    EXPECT_EQ(f.lowest_oi, 500000);
    EXPECT_FLOAT_EQ(f.day_high, 212.0f);
    EXPECT_FLOAT_EQ(f.day_low, 203.5f);
    for (int i = 0; i < 5; ++i) {
        const auto expected = sample_level(i);
        EXPECT_EQ(f.depth[i].bid_quantity, expected.bid_quantity);
        EXPECT_EQ(f.depth[i].ask_quantity, expected.ask_quantity);
        EXPECT_EQ(f.depth[i].bid_orders, expected.bid_orders);
        EXPECT_EQ(f.depth[i].ask_orders, expected.ask_orders);
        EXPECT_NEAR(f.depth[i].bid_price, expected.bid_price, 1e-5);
        EXPECT_NEAR(f.depth[i].ask_price, expected.ask_price, 1e-5);
    }
}

TEST(FrameDecoder, DepthLevelRoundTrip) {
    const DepthLevel lvl = sample_level(2);
    auto frame = FrameBuilder(41, 1, 1).level(lvl).build();
    auto payload = std::span<const uint8_t>(frame.data() + FrameDecoder::HEADER_SIZE,
                                            FrameDecoder::DEPTH_LEVEL_SIZE);
    const auto out = FrameDecoder::read_depth_level(payload);
    EXPECT_EQ(out.bid_quantity, lvl.bid_quantity);
    EXPECT_EQ(out.ask_quantity, lvl.ask_quantity);
    EXPECT_EQ(out.bid_orders, lvl.bid_orders);
    EXPECT_EQ(out.ask_orders, lvl.ask_orders);
    EXPECT_NEAR(out.bid_price, lvl.bid_price, 1e-5);
    EXPECT_NEAR(out.ask_price, lvl.ask_price, 1e-5);
}

TEST(FrameDecoder, DepthDeltaSides) {
    auto bid = decode_bytes(FrameBuilder(41, 1, 7).level(sample_level(0)).build());
    auto ask = decode_bytes(FrameBuilder(51, 1, 7).level(sample_level(1)).build());
    ASSERT_TRUE(bid.ok());
    ASSERT_TRUE(ask.ok());
    EXPECT_EQ(std::get<DepthDeltaEvent>(*bid.event).side, DepthSide::BID);
    EXPECT_EQ(std::get<DepthDeltaEvent>(*ask.event).side, DepthSide::ASK);
    EXPECT_EQ(std::get<DepthDeltaEvent>(*ask.event).level.ask_quantity, 201u);
}

TEST(FrameDecoder, OpenInterestAndPrevClose) {
    auto oi = decode_bytes(FrameBuilder(5, 2, 9).i32(123456).build());
    ASSERT_TRUE(oi.ok());
    EXPECT_EQ(std::get<OpenInterestEvent>(*oi.event).open_interest, 123456);

    auto pc = decode_bytes(FrameBuilder(6, 2, 9).f32(99.5f).i32(777).build());
    ASSERT_TRUE(pc.ok());
    const auto& p = std::get<PrevCloseEvent>(*pc.event);
    EXPECT_FLOAT_EQ(p.prev_close, 99.5f);
    EXPECT_EQ(p.oi_prev, 777);
}

TEST(FrameDecoder, DisconnectReasonIsBigEndian) {
    auto r = decode_bytes(FrameBuilder(50, 0, 0).u16_be(805).build());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(std::get<DisconnectEvent>(*r.event).reason_code, 805);
}

TEST(FrameDecoder, IndexAndMarketStatusAreUnrecognized) {
    for (uint8_t code : {uint8_t{1}, uint8_t{7}, uint8_t{99}}) {
        auto frame = FrameBuilder(code, 0, 13).zeros(8).build();
        auto r = decode_bytes(frame);
        ASSERT_TRUE(r.ok());
        ASSERT_EQ(kind_of(*r.event), EventKind::UNRECOGNIZED);
        const auto& u = std::get<UnrecognizedEvent>(*r.event);
        ASSERT_TRUE(u.header.has_value());
        EXPECT_EQ(u.header->response_code, code);
        EXPECT_EQ(u.raw, frame);
    }
}

// ============================================================================
// TESTS: JSON ENVELOPES
// ============================================================================

TEST(FrameDecoderJson, DepthUpdate) {
    const std::string msg = R"({"Type":"depth_update","Data":{
        "Symbol":"RELIANCE","ExchangeSegment":"NSE_EQ","SecurityId":"2885","Timestamp":1700000000,
        "Bids":[{"Price":2450.5,"Quantity":100,"Orders":3},{"Price":"2450.0","Quantity":"50"}],
        "Asks":[{"Price":2451.0,"Quantity":75,"Orders":2}],
        "BestBid":2450.5,"BestAsk":2451.0,"TotalBidQty":150,"TotalAskQty":75}})";
    auto r = FrameDecoder::decode_json(msg);
    ASSERT_TRUE(r.ok());
    const auto& d = std::get<DepthBookEvent>(*r.event);
    EXPECT_FALSE(d.snapshot);
    EXPECT_EQ(d.symbol, "RELIANCE");
    EXPECT_EQ(d.security_id, "2885");
    ASSERT_EQ(d.bids.size(), 2u);
    EXPECT_DOUBLE_EQ(d.bids[1].price, 2450.0);
    EXPECT_EQ(d.bids[1].quantity, 50);
    EXPECT_EQ(d.bids[1].orders, 1);
    EXPECT_DOUBLE_EQ(d.spread, 0.5);
    EXPECT_EQ(d.total_bid_qty, 150);
}

TEST(FrameDecoderJson, SpreadIsZeroWhenOneSideEmpty) {
    auto r = FrameDecoder::decode_json(
        R"({"Type":"depth_snapshot","Data":{"BestBid":0,"BestAsk":101.5,"Bids":[],"Asks":[]}})");
    ASSERT_TRUE(r.ok());
    const auto& d = std::get<DepthBookEvent>(*r.event);
    EXPECT_TRUE(d.snapshot);
    EXPECT_DOUBLE_EQ(d.spread, 0.0);
}

TEST(FrameDecoderJson, OrderAlert) {
    auto r = FrameDecoder::decode_json(R"({"Type":"order_alert","Data":{
        "OrderNo":"1124091136546","Status":"TRADED","Symbol":"SBIN","Exchange":"NSE","Segment":"E",
        "SecurityId":"3045","TxnType":"B","Quantity":10,"TradedQty":10,"AvgTradedPrice":812.4,"LegNo":1}})");
    ASSERT_TRUE(r.ok());
    const auto& a = std::get<OrderAlertEvent>(*r.event);
    EXPECT_EQ(a.order_no, "1124091136546");
    EXPECT_EQ(a.status, "TRADED");
    EXPECT_EQ(a.security_id, "3045");
    EXPECT_EQ(a.traded_qty, 10);
    EXPECT_EQ(a.leg_no, 1);
    EXPECT_DOUBLE_EQ(a.avg_traded_price, 812.4);
}

TEST(FrameDecoderJson, OutOfRangeNumbersFallBack) {
    auto depth = FrameDecoder::decode_json(R"({"Type":"depth_update","Data":{
        "Bids":[{"Price":10.5,"Quantity":1e30,"Orders":18446744073709551615}],
        "Asks":[{"Price":11.0,"Quantity":-1e300,"Orders":2.5}]}})");
    ASSERT_TRUE(depth.ok());
    const auto& d = std::get<DepthBookEvent>(*depth.event);
    ASSERT_EQ(d.bids.size(), 1u);
    EXPECT_EQ(d.bids[0].quantity, 0);
    EXPECT_EQ(d.bids[0].orders, 1);
    ASSERT_EQ(d.asks.size(), 1u);
    EXPECT_EQ(d.asks[0].quantity, 0);
    EXPECT_EQ(d.asks[0].orders, 2);

    auto alert = FrameDecoder::decode_json(R"({"Type":"order_alert","Data":{
        "OrderNo":"42","Status":"TRADED","TradedQty":-1e300,"Quantity":9.3e18,"LegNo":1e19}})");
    ASSERT_TRUE(alert.ok());
    const auto& a = std::get<OrderAlertEvent>(*alert.event);
    EXPECT_EQ(a.order_no, "42");
    EXPECT_EQ(a.traded_qty, 0);
    EXPECT_EQ(a.quantity, 0);
    EXPECT_EQ(a.leg_no, 0);
}

TEST(FrameDecoderJson, Errors) {
    EXPECT_EQ(FrameDecoder::decode_json("").error->kind, DecodeErrorKind::EMPTY);
    EXPECT_EQ(FrameDecoder::decode_json("{not json").error->kind, DecodeErrorKind::MALFORMED_JSON);
    EXPECT_EQ(FrameDecoder::decode_json("[1,2]").error->kind, DecodeErrorKind::MALFORMED_JSON);
    EXPECT_EQ(FrameDecoder::decode_json(R"({"Data":{}})").error->kind, DecodeErrorKind::MISSING_FIELD);
    EXPECT_EQ(FrameDecoder::decode_json(R"({"Type":"order_alert"})").error->kind,
              DecodeErrorKind::MISSING_FIELD);
}

TEST(FrameDecoderJson, UnknownTypeIsUnrecognized) {
    auto r = FrameDecoder::decode_json(R"({"Type":"heartbeat","Data":{}})");
    ASSERT_TRUE(r.ok());
    const auto& u = std::get<UnrecognizedEvent>(*r.event);
    EXPECT_EQ(u.type, "heartbeat");
    EXPECT_FALSE(u.header.has_value());
}
