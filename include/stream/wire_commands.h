/**
 * @file wire_commands.h
 * @brief JSON command builders for the streaming endpoints
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "stream/instrument.h"

namespace dhanstream::stream {

/**
 * @enum FeedMode
 * @brief Market feed granularity; decides the subscribe / unsubscribe request codes
 */
enum class FeedMode {
    TICKER,
    QUOTE,
    FULL
};

std::string to_string(FeedMode mode);
bool parse_feed_mode(const std::string& text, FeedMode& out);

namespace request_code {
constexpr int TICKER_SUBSCRIBE = 15;
constexpr int TICKER_UNSUBSCRIBE = 16;
constexpr int QUOTE_SUBSCRIBE = 17;
constexpr int QUOTE_UNSUBSCRIBE = 18;
constexpr int FULL_SUBSCRIBE = 21;
constexpr int FULL_UNSUBSCRIBE = 22;
constexpr int DEPTH_SUBSCRIBE = 23;
constexpr int DEPTH_UNSUBSCRIBE = 12;
constexpr int FEED_DISCONNECT = 12;
constexpr int LOGIN_MSG_CODE = 42;
} // namespace request_code

constexpr std::size_t MAX_INSTRUMENTS_PER_COMMAND = 100;

int subscribe_code(FeedMode mode);
int unsubscribe_code(FeedMode mode);

/**
 * @brief Credentials for the order-update login message
 */
struct LoginCredentials {
    enum class UserType { SELF, PARTNER };

    UserType user_type = UserType::SELF;
    std::string client_id;
    std::string access_token;
    std::string partner_id;
    std::string partner_secret;
};

/**
 * @brief {"RequestCode":..,"InstrumentCount":..,"InstrumentList":[..]} commands.
 *
 * Duplicate (segment, security id) pairs collapse to their first occurrence, and the
 * batch is split into commands of at most MAX_INSTRUMENTS_PER_COMMAND entries.
 * An empty batch yields no commands.
 */
std::vector<std::string> build_instrument_commands(int code, const std::vector<InstrumentRef>& instruments);

/// {"LoginReq":{"MsgCode":42,...},"UserType":"SELF"|"PARTNER"[, "Secret":..]}
std::string build_login_payload(const LoginCredentials& creds);

/// {"RequestCode":12}
std::string build_disconnect_command();

} // namespace dhanstream::stream
