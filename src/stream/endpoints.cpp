/**
 * @file endpoints.cpp
 */

#include "stream/endpoints.h"

namespace dhanstream::stream {

std::string build_feed_url(const std::string& access_token, const std::string& client_id) {
    return "wss://api-feed.dhan.co?version=2&token=" + access_token +
           "&clientId=" + client_id + "&authType=2";
}

std::string build_depth_url(int levels, const std::string& access_token, const std::string& client_id) {
    const std::string query = "?token=" + access_token + "&clientId=" + client_id + "&authType=2";
    if (levels == 200) {
        return "wss://full-depth-api.dhan.co/twohundreddepth" + query;
    }
    return "wss://depth-api-feed.dhan.co/twentydepth" + query;
}

} // namespace dhanstream::stream
