/**
 * @file rest_executor.h
 * @brief Authenticated, quota-throttled REST call path to the broker API.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/net/http_client.h"
#include "throttle/rate_limiter.h"

namespace dhanstream::nethttp {

struct RestCredentials {
    std::string client_id;
    std::string access_token;
};

/**
 * @class RestExecutor
 * @brief Every request passes RateLimiter::throttle(tier) before it is dispatched.
 *
 * Paths are absolute ("/v2/instrument/NSE_EQ"). Requests carry the access-token header;
 * data-tier requests (DATA, QUOTE, OPTION_CHAIN) also carry client-id.
 */
class RestExecutor {
public:
    static constexpr const char* DEFAULT_BASE_URL = "https://api.dhan.co";

    RestExecutor(std::shared_ptr<IHttpClient> http,
                 std::shared_ptr<throttle::RateLimiter> limiter,
                 RestCredentials credentials,
                 const std::string& base_url = DEFAULT_BASE_URL);

    std::string get(const std::string& path, throttle::RateTier tier);
    std::string post(const std::string& path, const std::string& json_body, throttle::RateTier tier);
    std::string put(const std::string& path, const std::string& json_body, throttle::RateTier tier);
    std::string del(const std::string& path, throttle::RateTier tier);

    /// Throws std::runtime_error from the HTTP layer unchanged.
    std::string execute(const std::string& method,
                        const std::string& path,
                        const std::string& body,
                        throttle::RateTier tier);

    const std::string& host() const { return host_; }
    throttle::RateLimiter& limiter() { return *limiter_; }

private:
    std::vector<Header> headers_for(throttle::RateTier tier, bool has_body) const;

    std::shared_ptr<IHttpClient> http_;
    std::shared_ptr<throttle::RateLimiter> limiter_;
    RestCredentials credentials_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string base_path_;
};

} // namespace dhanstream::nethttp
