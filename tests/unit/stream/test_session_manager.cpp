/**
 * @file test_session_manager.cpp
 * @brief SessionManager tests against the scripted in-memory transport
 */

#include <gtest/gtest.h>
#include "stream/session_manager.h"
#include "support/eventually.h"
#include "support/fake_directory.h"
#include "support/frame_builder.h"
#include "support/mock_ws_transport.h"

#include <rapidjson/document.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace dhanstream::stream;
using dhanstream::testing::FakeDirectory;
using dhanstream::testing::MockConnection;
using dhanstream::testing::MockWsServer;
using dhanstream::testing::eventually;
using dhanstream::testing::ticker_frame;
using namespace std::chrono_literals;

namespace {

constexpr auto WAIT = 3000ms;

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<MockWsServer>();
        directory_ = std::make_shared<FakeDirectory>();
        directory_->add("NSE_EQ", "RELIANCE", "2885");
        directory_->add("NSE_EQ", "SBIN", "3045");
        directory_->add("NSE_EQ", "INFY", "1594");
        resolver_ = std::make_shared<SubscriptionResolver>(directory_);
    }

    SessionConfig config(ChannelKind kind = ChannelKind::MARKET_FEED) {
        SessionConfig cfg;
        cfg.channel_id = "test";
        cfg.kind = kind;
        cfg.url = "wss://mock.invalid/feed";
        cfg.backoff.base_seconds = 0.05;
        cfg.backoff.cap_seconds = 0.4;
        cfg.backoff.jitter_ratio = 0.0;
        cfg.backoff.cooloff = 300ms;
        cfg.connect_timeout = 500ms;
        return cfg;
    }

    std::shared_ptr<SessionManager> make_session(SessionConfig cfg) {
        return std::make_shared<SessionManager>(std::move(cfg), server_->factory(), resolver_);
    }

    static int request_code(const std::string& json) {
        rapidjson::Document d;
        d.Parse(json.c_str());
        if (d.HasParseError() || !d.IsObject() || !d.HasMember("RequestCode")) return -1;
        return d["RequestCode"].GetInt();
    }

    static std::set<std::string> security_ids(const std::string& json) {
        std::set<std::string> ids;
        rapidjson::Document d;
        d.Parse(json.c_str());
        if (d.HasParseError() || !d.HasMember("InstrumentList")) return ids;
        for (const auto& item : d["InstrumentList"].GetArray()) {
            ids.insert(item["SecurityId"].GetString());
        }
        return ids;
    }

    std::shared_ptr<MockWsServer> server_;
    std::shared_ptr<FakeDirectory> directory_;
    std::shared_ptr<SubscriptionResolver> resolver_;
};

} // namespace

// ============================================================================
// TESTS: LIFECYCLE
// ============================================================================

TEST_F(SessionManagerTest, ConnectsAndReportsOpen) {
    auto session = make_session(config());
    std::vector<std::pair<SessionState, SessionState>> transitions;
    std::mutex m;
    session->on_state([&](SessionState from, SessionState to) {
        std::lock_guard<std::mutex> lk(m);
        transitions.emplace_back(from, to);
    });

    session->start();
    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));
    EXPECT_EQ(server_->urls().front(), "wss://mock.invalid/feed");
    EXPECT_EQ(session->connect_attempts(), 1u);

    session->stop();
    EXPECT_EQ(session->state(), SessionState::STOPPED);

    std::lock_guard<std::mutex> lk(m);
    ASSERT_GE(transitions.size(), 3u);
    EXPECT_EQ(transitions[0].second, SessionState::CONNECTING);
    EXPECT_EQ(transitions[1].second, SessionState::OPEN);
    EXPECT_EQ(transitions.back().second, SessionState::STOPPED);
}

TEST_F(SessionManagerTest, StopIsIdempotentAndTerminal) {
    auto session = make_session(config());
    session->start();
    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));

    session->stop();
    session->stop();
    EXPECT_EQ(session->state(), SessionState::STOPPED);

    session->start();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(session->state(), SessionState::STOPPED);
    EXPECT_EQ(server_->connection_count(), 1u);
}

TEST_F(SessionManagerTest, StopBeforeStart) {
    auto session = make_session(config());
    session->stop();
    EXPECT_EQ(session->state(), SessionState::STOPPED);
    EXPECT_EQ(server_->connection_count(), 0u);
}

TEST_F(SessionManagerTest, ConnectFailuresAreRetried) {
    server_->fail_next_connects(2);
    auto session = make_session(config());
    session->start();

    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));
    EXPECT_EQ(session->connect_attempts(), 3u);
    EXPECT_EQ(server_->urls().size(), 3u);
    session->stop();
}

// ============================================================================
// TESTS: SUBSCRIPTIONS
// ============================================================================

TEST_F(SessionManagerTest, DuplicateSubscribeSendsOnce) {
    auto session = make_session(config());
    session->start();
    auto conn = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn, nullptr);
    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));

    auto first = session->subscribe({std::string("NSE_EQ:SBIN")});
    EXPECT_EQ(first.added.size(), 1u);
    auto second = session->subscribe({std::string("nse_eq:sbin")});
    EXPECT_TRUE(second.added.empty());
    ASSERT_EQ(second.already_active.size(), 1u);

    // Same instrument under a different label is also already active
    InstrumentDescriptor desc;
    desc.exchange_segment = "NSE_EQ";
    desc.security_id = "3045";
    auto third = session->subscribe({desc});
    EXPECT_TRUE(third.added.empty());

    std::this_thread::sleep_for(50ms);
    const auto sent = conn->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(request_code(sent[0]), 15);
    EXPECT_EQ(security_ids(sent[0]), (std::set<std::string>{"3045"}));
    EXPECT_EQ(session->subscriptions().size(), 1u);
    session->stop();
}

TEST_F(SessionManagerTest, UnresolvableEntriesAreReported) {
    auto session = make_session(config());
    auto report = session->subscribe({std::string("NSE_EQ:SBIN"), std::string("NOPE")});
    EXPECT_EQ(report.added.size(), 1u);
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].first, "NOPE");
}

TEST_F(SessionManagerTest, SubscriptionsReplayFirstOnEveryConnect) {
    auto session = make_session(config());
    session->subscribe({std::string("NSE_EQ:SBIN"), std::string("NSE_EQ:RELIANCE")});
    session->start();

    auto conn0 = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn0, nullptr);
    ASSERT_TRUE(conn0->wait_for_sent(1, WAIT));
    EXPECT_EQ(security_ids(conn0->sent()[0]), (std::set<std::string>{"3045", "2885"}));

    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));
    session->subscribe({std::string("NSE_EQ:INFY")});
    ASSERT_TRUE(conn0->wait_for_sent(2, WAIT));

    conn0->push_close(1006, "going away");
    auto conn1 = server_->wait_for_connection(1, WAIT);
    ASSERT_NE(conn1, nullptr);
    ASSERT_TRUE(conn1->wait_for_sent(1, WAIT));
    const auto replay = conn1->sent();
    EXPECT_EQ(request_code(replay[0]), 15);
    EXPECT_EQ(security_ids(replay[0]), (std::set<std::string>{"3045", "2885", "1594"}));
    session->stop();
}

TEST_F(SessionManagerTest, UnsubscribeSendsUnsubscribeCode) {
    auto cfg = config();
    cfg.mode = FeedMode::QUOTE;
    auto session = make_session(cfg);
    session->subscribe({std::string("NSE_EQ:SBIN")});
    session->start();
    auto conn = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn, nullptr);
    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));

    EXPECT_EQ(session->unsubscribe({std::string("NSE_EQ:SBIN"), std::string("UNKNOWN")}), 1u);
    ASSERT_TRUE(conn->wait_for_sent(2, WAIT));
    const auto sent = conn->sent();
    EXPECT_EQ(request_code(sent[0]), 17);
    EXPECT_EQ(request_code(sent[1]), 18);
    EXPECT_TRUE(session->subscriptions().empty());
    session->stop();
}

TEST_F(SessionManagerTest, DepthChannelUsesDepthCodes) {
    auto session = make_session(config(ChannelKind::MARKET_DEPTH));
    session->subscribe({std::string("NSE_EQ:RELIANCE")});
    session->start();
    auto conn = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn, nullptr);
    ASSERT_TRUE(conn->wait_for_sent(1, WAIT));
    EXPECT_EQ(request_code(conn->sent()[0]), 23);
    session->stop();
}

TEST_F(SessionManagerTest, OrderChannelRejectsSubscribe) {
    auto session = make_session(config(ChannelKind::ORDER_UPDATES));
    auto report = session->subscribe({std::string("NSE_EQ:SBIN")});
    EXPECT_TRUE(report.added.empty());
    EXPECT_EQ(report.failed.size(), 1u);
}

TEST_F(SessionManagerTest, FeedDisconnectCommand) {
    auto session = make_session(config());
    session->start();
    auto conn = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn, nullptr);
    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));

    session->disconnect();
    const auto sent = conn->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0], R"({"RequestCode":12})");
    EXPECT_EQ(session->state(), SessionState::STOPPED);
}

// ============================================================================
// TESTS: DISPATCH
// ============================================================================

TEST_F(SessionManagerTest, MalformedFrameDoesNotKillSession) {
    auto session = make_session(config());
    std::atomic<int> ticks{0};
    session->on(EventKind::TICKER, [&](const DecodedEvent& ev) {
        EXPECT_FLOAT_EQ(std::get<TickerEvent>(ev).ltp, 812.5f);
        ticks.fetch_add(1);
    });
    session->start();
    auto conn = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn, nullptr);

    conn->push_binary({0x02, 0x00});
    conn->push_binary(ticker_frame(1, 3045, 812.5f, 1700000000));

    ASSERT_TRUE(eventually([&] { return ticks.load() == 1; }, WAIT));
    EXPECT_EQ(session->decode_errors(), 1u);
    EXPECT_EQ(session->messages_received(), 2u);
    EXPECT_EQ(session->state(), SessionState::OPEN);
    EXPECT_EQ(server_->connection_count(), 1u);
    session->stop();
}

TEST_F(SessionManagerTest, ThrowingListenerIsSurvived) {
    auto session = make_session(config());
    std::atomic<int> seen{0};
    session->on(EventKind::ANY, [](const DecodedEvent&) { throw std::runtime_error("listener bug"); });
    session->on(EventKind::TICKER, [&](const DecodedEvent&) { seen.fetch_add(1); });
    session->start();
    auto conn = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn, nullptr);

    conn->push_binary(ticker_frame(1, 1, 1.0f, 1));
    conn->push_binary(ticker_frame(1, 1, 2.0f, 2));

    ASSERT_TRUE(eventually([&] { return seen.load() == 2; }, WAIT));
    EXPECT_EQ(session->state(), SessionState::OPEN);
    session->stop();
}

TEST_F(SessionManagerTest, ListenersFilterByKind) {
    auto session = make_session(config());
    std::atomic<int> oi{0};
    std::atomic<int> any{0};
    session->on(EventKind::OPEN_INTEREST, [&](const DecodedEvent&) { oi.fetch_add(1); });
    session->on(EventKind::ANY, [&](const DecodedEvent&) { any.fetch_add(1); });
    session->start();
    auto conn = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn, nullptr);

    conn->push_binary(ticker_frame(1, 1, 1.0f, 1));
    conn->push_binary(dhanstream::testing::FrameBuilder(5, 2, 9).i32(100).build());

    ASSERT_TRUE(eventually([&] { return any.load() == 2; }, WAIT));
    EXPECT_EQ(oi.load(), 1);
    session->stop();
}

TEST_F(SessionManagerTest, OrderChannelSendsLoginAndDeliversAlerts) {
    auto cfg = config(ChannelKind::ORDER_UPDATES);
    LoginCredentials login;
    login.client_id = "1000000001";
    login.access_token = "tok";
    cfg.login = login;
    auto session = make_session(cfg);

    std::atomic<int> alerts{0};
    std::atomic<int> others{0};
    session->on(EventKind::ORDER_ALERT, [&](const DecodedEvent& ev) {
        EXPECT_EQ(std::get<OrderAlertEvent>(ev).order_no, "77");
        alerts.fetch_add(1);
    });
    session->on(EventKind::DEPTH_BOOK, [&](const DecodedEvent&) { others.fetch_add(1); });
    session->start();

    auto conn = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn, nullptr);
    ASSERT_TRUE(conn->wait_for_sent(1, WAIT));
    const auto sent = conn->sent();
    rapidjson::Document d;
    d.Parse(sent[0].c_str());
    ASSERT_FALSE(d.HasParseError());
    EXPECT_EQ(d["LoginReq"]["MsgCode"].GetInt(), 42);
    EXPECT_STREQ(d["UserType"].GetString(), "SELF");

    conn->push_text(R"({"Type":"depth_update","Data":{"BestBid":1,"BestAsk":2}})");
    conn->push_text(R"({"Type":"order_alert","Data":{"OrderNo":"77","Status":"PENDING"}})");

    ASSERT_TRUE(eventually([&] { return alerts.load() == 1; }, WAIT));
    EXPECT_EQ(others.load(), 0);
    session->stop();
}

// ============================================================================
// TESTS: CLOSE HANDLING
// ============================================================================

TEST_F(SessionManagerTest, AbnormalCloseAdvancesBackoff) {
    auto session = make_session(config());
    session->start();
    auto conn0 = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn0, nullptr);
    EXPECT_DOUBLE_EQ(session->backoff_seconds(), 0.05);

    conn0->push_failure("connection reset");
    ASSERT_NE(server_->wait_for_connection(1, WAIT), nullptr);
    EXPECT_DOUBLE_EQ(session->backoff_seconds(), 0.1);
    ASSERT_TRUE(session->last_error().has_value());
    EXPECT_EQ(*session->last_error(), "connection reset");
    session->stop();
}

TEST_F(SessionManagerTest, CleanCloseResetsBackoff) {
    auto session = make_session(config());
    session->start();
    auto conn0 = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn0, nullptr);

    conn0->push_close(1006, "");
    auto conn1 = server_->wait_for_connection(1, WAIT);
    ASSERT_NE(conn1, nullptr);
    EXPECT_DOUBLE_EQ(session->backoff_seconds(), 0.1);

    conn1->push_close(1000, "normal");
    ASSERT_NE(server_->wait_for_connection(2, WAIT), nullptr);
    EXPECT_DOUBLE_EQ(session->backoff_seconds(), 0.05);
    session->stop();
}

TEST_F(SessionManagerTest, RateLimitCoolsOffWithoutTouchingBackoff) {
    auto session = make_session(config());
    session->start();
    auto conn0 = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn0, nullptr);
    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));

    const double before = session->backoff_seconds();
    conn0->push_close(4000, "HTTP 429 Too Many Requests");

    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::COOLING_OFF; }, WAIT));
    EXPECT_TRUE(session->cooloff_until().has_value());
    EXPECT_DOUBLE_EQ(session->backoff_seconds(), before);
    EXPECT_EQ(server_->connection_count(), 1u);

    ASSERT_NE(server_->wait_for_connection(1, WAIT), nullptr);
    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));
    EXPECT_FALSE(session->cooloff_until().has_value());
    EXPECT_DOUBLE_EQ(session->backoff_seconds(), before);
    session->stop();
}

TEST_F(SessionManagerTest, DeclinedUpgradeWith429CoolsOff) {
    server_->decline_next_connect(429, "Too Many Requests");
    auto session = make_session(config());
    const double before = session->backoff_seconds();
    session->start();

    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::COOLING_OFF; }, WAIT));
    EXPECT_TRUE(session->cooloff_until().has_value());
    EXPECT_DOUBLE_EQ(session->backoff_seconds(), before);
    ASSERT_TRUE(session->last_error().has_value());
    EXPECT_NE(session->last_error()->find("429"), std::string::npos);

    ASSERT_NE(server_->wait_for_connection(0, WAIT), nullptr);
    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));
    EXPECT_EQ(session->connect_attempts(), 2u);
    EXPECT_DOUBLE_EQ(session->backoff_seconds(), before);
    session->stop();
}

TEST_F(SessionManagerTest, DeclinedUpgradeWithOtherStatusBacksOff) {
    server_->decline_next_connect(503, "Service Unavailable");
    auto session = make_session(config());
    session->start();

    ASSERT_NE(server_->wait_for_connection(0, WAIT), nullptr);
    EXPECT_DOUBLE_EQ(session->backoff_seconds(), 0.1);
    EXPECT_FALSE(session->cooloff_until().has_value());
    ASSERT_TRUE(session->last_error().has_value());
    EXPECT_EQ(*session->last_error(), "HTTP 503 Service Unavailable");
    session->stop();
}

TEST_F(SessionManagerTest, HungConnectIsBoundedByTimeout) {
    server_->hang_next_connects(1);
    auto cfg = config();
    cfg.connect_timeout = 150ms;
    auto session = make_session(cfg);

    std::vector<SessionState> states;
    std::mutex m;
    session->on_state([&](SessionState, SessionState to) {
        std::lock_guard<std::mutex> lk(m);
        states.push_back(to);
    });

    const auto started = std::chrono::steady_clock::now();
    session->start();
    ASSERT_NE(server_->wait_for_connection(0, WAIT), nullptr);
    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::OPEN; }, WAIT));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2000ms);

    const auto timeouts = server_->connect_timeouts();
    ASSERT_EQ(timeouts.size(), 2u);
    EXPECT_EQ(timeouts[0], 150ms);
    EXPECT_EQ(session->connect_attempts(), 2u);
    session->stop();

    std::lock_guard<std::mutex> lk(m);
    const std::vector<SessionState> expected_prefix{
        SessionState::CONNECTING, SessionState::IDLE, SessionState::CONNECTING, SessionState::OPEN};
    ASSERT_GE(states.size(), expected_prefix.size());
    EXPECT_TRUE(std::equal(expected_prefix.begin(), expected_prefix.end(), states.begin()));
}

TEST_F(SessionManagerTest, StopInterruptsHungConnect) {
    server_->hang_next_connects(1);
    auto cfg = config();
    cfg.connect_timeout = 10s;
    auto session = make_session(cfg);
    session->start();
    ASSERT_TRUE(eventually([&] { return server_->urls().size() == 1u; }, WAIT));

    const auto begin = std::chrono::steady_clock::now();
    session->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2000ms);
    EXPECT_EQ(session->state(), SessionState::STOPPED);
    EXPECT_EQ(server_->connection_count(), 0u);
}

TEST_F(SessionManagerTest, RepeatedAuthRejectionStopsSession) {
    auto cfg = config(ChannelKind::ORDER_UPDATES);
    cfg.login = LoginCredentials{};
    cfg.max_auth_failures = 2;
    auto session = make_session(cfg);
    session->start();

    auto conn0 = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn0, nullptr);
    conn0->push_close(1008, "invalid token");
    auto conn1 = server_->wait_for_connection(1, WAIT);
    ASSERT_NE(conn1, nullptr);
    conn1->push_close(4001, "401 Unauthorized");

    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::STOPPED; }, WAIT));
    EXPECT_EQ(server_->connection_count(), 2u);
    ASSERT_TRUE(session->last_error().has_value());
    EXPECT_NE(session->last_error()->find("login rejected"), std::string::npos);
    session->stop();
}

TEST_F(SessionManagerTest, StopFromListenerDoesNotDeadlock) {
    auto session = make_session(config());
    session->on(EventKind::TICKER, [&](const DecodedEvent&) { session->stop(); });
    session->start();
    auto conn = server_->wait_for_connection(0, WAIT);
    ASSERT_NE(conn, nullptr);

    conn->push_binary(ticker_frame(1, 1, 1.0f, 1));
    ASSERT_TRUE(eventually([&] { return session->state() == SessionState::STOPPED; }, WAIT));
    session->stop();
}

using SessionManagerDeathTest = SessionManagerTest;

TEST_F(SessionManagerDeathTest, DestroyingFromOwnListenerTerminates) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_DEATH(
        {
            auto holder = std::make_shared<std::shared_ptr<SessionManager>>(make_session(config()));
            auto& session = **holder;
            session.on(EventKind::TICKER, [holder](const DecodedEvent&) { holder->reset(); });
            session.start();
            auto conn = server_->wait_for_connection(0, WAIT);
            if (conn) conn->push_binary(ticker_frame(1, 1, 1.0f, 1));
            std::this_thread::sleep_for(WAIT);
        },
        "");
}
