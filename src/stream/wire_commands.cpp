/**
 * @file wire_commands.cpp
 */

#include "stream/wire_commands.h"

#include <algorithm>
#include <set>
#include <utility>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "utils/string_utils.h"

namespace dhanstream::stream {

std::string to_string(FeedMode mode) {
    switch (mode) {
        case FeedMode::TICKER: return "ticker";
        case FeedMode::QUOTE: return "quote";
        case FeedMode::FULL: return "full";
        default: return "unknown";
    }
}

bool parse_feed_mode(const std::string& text, FeedMode& out) {
    const std::string m = utils::to_lower_ascii(utils::trim(text));
    if (m == "ticker") { out = FeedMode::TICKER; return true; }
    if (m == "quote") { out = FeedMode::QUOTE; return true; }
    if (m == "full") { out = FeedMode::FULL; return true; }
    return false;
}

int subscribe_code(FeedMode mode) {
    switch (mode) {
        case FeedMode::QUOTE: return request_code::QUOTE_SUBSCRIBE;
        case FeedMode::FULL: return request_code::FULL_SUBSCRIBE;
        case FeedMode::TICKER:
        default: return request_code::TICKER_SUBSCRIBE;
    }
}

int unsubscribe_code(FeedMode mode) {
    switch (mode) {
        case FeedMode::QUOTE: return request_code::QUOTE_UNSUBSCRIBE;
        case FeedMode::FULL: return request_code::FULL_UNSUBSCRIBE;
        case FeedMode::TICKER:
        default: return request_code::TICKER_UNSUBSCRIBE;
    }
}

std::vector<std::string> build_instrument_commands(int code, const std::vector<InstrumentRef>& instruments) {
    std::vector<const InstrumentRef*> unique;
    unique.reserve(instruments.size());
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& inst : instruments) {
        if (seen.emplace(inst.exchange_segment, inst.security_id).second) {
            unique.push_back(&inst);
        }
    }

    std::vector<std::string> commands;
    for (std::size_t offset = 0; offset < unique.size(); offset += MAX_INSTRUMENTS_PER_COMMAND) {
        const std::size_t end = std::min(unique.size(), offset + MAX_INSTRUMENTS_PER_COMMAND);

        rapidjson::StringBuffer sb;
        rapidjson::Writer<rapidjson::StringBuffer> w(sb);
        w.StartObject();
        w.Key("RequestCode"); w.Int(code);
        w.Key("InstrumentCount"); w.Uint(static_cast<unsigned>(end - offset));
        w.Key("InstrumentList");
        w.StartArray();
        for (std::size_t i = offset; i < end; ++i) {
            w.StartObject();
            w.Key("ExchangeSegment"); w.String(unique[i]->exchange_segment.c_str());
            w.Key("SecurityId"); w.String(unique[i]->security_id.c_str());
            w.EndObject();
        }
        w.EndArray();
        w.EndObject();
        commands.emplace_back(sb.GetString(), sb.GetSize());
    }
    return commands;
}

std::string build_login_payload(const LoginCredentials& creds) {
    const bool partner = creds.user_type == LoginCredentials::UserType::PARTNER;

    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    w.StartObject();
    w.Key("LoginReq");
    w.StartObject();
    w.Key("MsgCode"); w.Int(request_code::LOGIN_MSG_CODE);
    if (partner) {
        w.Key("ClientId"); w.String(creds.partner_id.c_str());
    } else {
        w.Key("ClientId"); w.String(creds.client_id.c_str());
        w.Key("Token"); w.String(creds.access_token.c_str());
    }
    w.EndObject();
    w.Key("UserType"); w.String(partner ? "PARTNER" : "SELF");
    if (partner) {
        w.Key("Secret"); w.String(creds.partner_secret.c_str());
    }
    w.EndObject();
    return std::string(sb.GetString(), sb.GetSize());
}

std::string build_disconnect_command() {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    w.StartObject();
    w.Key("RequestCode"); w.Int(request_code::FEED_DISCONNECT);
    w.EndObject();
    return std::string(sb.GetString(), sb.GetSize());
}

} // namespace dhanstream::stream
