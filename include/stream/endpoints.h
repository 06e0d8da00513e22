/**
 * @file endpoints.h
 * @brief Streaming endpoint URLs
 */

#pragma once

#include <string>

namespace dhanstream::stream {

constexpr const char* ORDER_UPDATE_URL = "wss://api-order-update.dhan.co";

/// wss://api-feed.dhan.co?version=2&token=..&clientId=..&authType=2
std::string build_feed_url(const std::string& access_token, const std::string& client_id);

/// 20-level or 200-level full depth endpoint; any level other than 200 selects the 20-level feed.
std::string build_depth_url(int levels, const std::string& access_token, const std::string& client_id);

} // namespace dhanstream::stream
