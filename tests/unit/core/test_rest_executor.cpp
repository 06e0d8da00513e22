/**
 * @file test_rest_executor.cpp
 * @brief Throttled REST path and the instrument directory built on it
 */

#include <gtest/gtest.h>
#include "core/net/rest_executor.h"
#include "stream/instrument_directory.h"
#include "support/fake_directory.h"

using namespace dhanstream::nethttp;
using dhanstream::throttle::RateLimiter;
using dhanstream::throttle::RateTier;
using dhanstream::testing::FakeHttpClient;
using namespace std::chrono_literals;

namespace {

RestCredentials creds() {
    return RestCredentials{"1000000001", "tok-123"};
}

} // namespace

// ============================================================================
// TESTS: REST EXECUTOR
// ============================================================================

TEST(RestExecutor, SplitsBaseUrl) {
    auto http = std::make_shared<FakeHttpClient>();
    RestExecutor rest(http, std::make_shared<RateLimiter>(), creds(), "http://localhost:8080/api/");
    rest.get("/v2/orders", RateTier::NON_TRADING);

    const auto reqs = http->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "GET");
    EXPECT_EQ(reqs[0].scheme, "http");
    EXPECT_EQ(reqs[0].host, "localhost");
    EXPECT_EQ(reqs[0].port, "8080");
    EXPECT_EQ(reqs[0].target, "/api/v2/orders");
    EXPECT_EQ(rest.host(), "localhost");
}

TEST(RestExecutor, DefaultBaseUrl) {
    auto http = std::make_shared<FakeHttpClient>();
    RestExecutor rest(http, std::make_shared<RateLimiter>(), creds());
    rest.get("/v2/fundlimit", RateTier::NON_TRADING);
    const auto reqs = http->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].scheme, "https");
    EXPECT_EQ(reqs[0].host, "api.dhan.co");
    EXPECT_EQ(reqs[0].port, "443");
}

TEST(RestExecutor, HeadersPerTier) {
    auto http = std::make_shared<FakeHttpClient>();
    RestExecutor rest(http, std::make_shared<RateLimiter>(), creds());

    rest.post("/v2/orders", R"({"qty":1})", RateTier::ORDER);
    rest.get("/v2/instrument/NSE_EQ", RateTier::DATA);

    const auto reqs = http->requests();
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[0].method, "POST");
    EXPECT_EQ(reqs[0].body, R"({"qty":1})");
    EXPECT_EQ(reqs[0].header("access-token"), "tok-123");
    EXPECT_EQ(reqs[0].header("Content-Type"), "application/json");
    EXPECT_FALSE(reqs[0].has_header("client-id"));

    EXPECT_EQ(reqs[1].header("client-id"), "1000000001");
    EXPECT_EQ(reqs[1].header("Accept"), "application/json");
    EXPECT_FALSE(reqs[1].has_header("Content-Type"));
}

TEST(RestExecutor, ThrottlesBeforeDispatch) {
    auto http = std::make_shared<FakeHttpClient>();
    auto limiter = std::make_shared<RateLimiter>(
        dhanstream::throttle::TierLimits{{RateTier::QUOTE, {{1h, 1}}}});
    RestExecutor rest(http, limiter, creds());

    rest.post("/v2/marketfeed/ltp", "{}", RateTier::QUOTE);
    EXPECT_FALSE(limiter->try_acquire(RateTier::QUOTE));
    EXPECT_EQ(http->requests().size(), 1u);
}

TEST(RestExecutor, TransportErrorsPropagate) {
    auto http = std::make_shared<FakeHttpClient>();
    http->set_failing(true);
    RestExecutor rest(http, std::make_shared<RateLimiter>(), creds());
    EXPECT_THROW(rest.del("/v2/orders/1", RateTier::ORDER), std::runtime_error);
    EXPECT_EQ(http->requests().size(), 1u);
    EXPECT_EQ(http->requests()[0].method, "DELETE");
}

TEST(RestExecutor, RejectsMissingCollaborators) {
    EXPECT_THROW(RestExecutor(nullptr, std::make_shared<RateLimiter>(), creds()), std::invalid_argument);
    EXPECT_THROW(RestExecutor(std::make_shared<FakeHttpClient>(), nullptr, creds()), std::invalid_argument);
}

// ============================================================================
// TESTS: INSTRUMENT DIRECTORY
// ============================================================================

TEST(InstrumentCsv, ParsesHeaderColumns) {
    const std::string csv =
        "EXCH_ID,SEGMENT,SECURITY_ID,ISIN,INSTRUMENT,SERIES,SYMBOL_NAME,DISPLAY_NAME\r\n"
        "NSE,E,2885,INE002A01018,EQUITY,EQ,RELIANCE,\"Reliance Industries, Ltd\"\r\n"
        "NSE,D,35001,NA,OPTIDX,NA,NIFTY-Nov2024-24000-CE,NIFTY 28 NOV 24000 CALL\n"
        ",,,,,,,\n"
        "\n";
    auto records = dhanstream::stream::parse_instrument_csv(csv, "NSE_EQ");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].security_id, "2885");
    EXPECT_EQ(records[0].symbol_name, "RELIANCE");
    EXPECT_EQ(records[0].display_name, "Reliance Industries, Ltd");
    EXPECT_EQ(records[0].series, "EQ");
    EXPECT_EQ(records[0].exchange_segment, "NSE_EQ");
    EXPECT_EQ(records[1].exchange_segment, "NSE_FNO");
}

TEST(InstrumentCsv, FallbackSegmentWithoutExchangeColumns) {
    const std::string csv = "SECURITY_ID,SYMBOL_NAME\n13,NIFTY\n";
    auto records = dhanstream::stream::parse_instrument_csv(csv, "IDX_I");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].exchange_segment, "IDX_I");
}

TEST(InstrumentCsv, UnknownExchangeLettersKeepDownloadSegment) {
    const std::string csv =
        "EXCH_ID,SEGMENT,SECURITY_ID,SYMBOL_NAME\n"
        "MCX,X,445001,GOLDPETAL\n"
        "BSE,E,500325,RELIANCE\n";
    auto records = dhanstream::stream::parse_instrument_csv(csv, "MCX_COMM");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].exchange_segment, "MCX_COMM");
    EXPECT_EQ(records[1].exchange_segment, "BSE_EQ");
}

TEST(RestInstrumentDirectory, DownloadsOnDataTier) {
    auto http = std::make_shared<FakeHttpClient>("SECURITY_ID,SYMBOL_NAME\n3045,SBIN\n");
    auto rest = std::make_shared<RestExecutor>(http, std::make_shared<RateLimiter>(), creds());
    dhanstream::stream::RestInstrumentDirectory directory(rest);

    auto records = directory.by_segment("NSE_EQ");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].symbol_name, "SBIN");
    EXPECT_EQ(records[0].exchange_segment, "NSE_EQ");

    const auto reqs = http->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].target, "/v2/instrument/NSE_EQ");
    EXPECT_EQ(reqs[0].header("client-id"), "1000000001");
}
