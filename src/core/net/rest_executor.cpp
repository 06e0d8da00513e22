/**
 * @file rest_executor.cpp
 */

#include "core/net/rest_executor.h"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace dhanstream::nethttp {

namespace {

void split_base_url(const std::string& url, std::string& scheme, std::string& host,
                    std::string& port, std::string& base_path) {
    scheme = "https";
    std::string rest = url;
    auto pos = url.find("://");
    if (pos != std::string::npos) { scheme = url.substr(0, pos); rest = url.substr(pos + 3); }
    auto slash = rest.find('/');
    std::string hostport = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    base_path = (slash == std::string::npos) ? "" : rest.substr(slash);
    while (!base_path.empty() && base_path.back() == '/') base_path.pop_back();
    auto colon = hostport.find(':');
    if (colon == std::string::npos) {
        host = hostport;
        port = (scheme == "http") ? "80" : "443";
    } else {
        host = hostport.substr(0, colon);
        port = hostport.substr(colon + 1);
    }
}

bool carries_client_id(throttle::RateTier tier) {
    return tier == throttle::RateTier::DATA ||
           tier == throttle::RateTier::QUOTE ||
           tier == throttle::RateTier::OPTION_CHAIN;
}

} // namespace

RestExecutor::RestExecutor(std::shared_ptr<IHttpClient> http,
                           std::shared_ptr<throttle::RateLimiter> limiter,
                           RestCredentials credentials,
                           const std::string& base_url)
    : http_(std::move(http)),
      limiter_(std::move(limiter)),
      credentials_(std::move(credentials)) {
    if (!http_) throw std::invalid_argument("RestExecutor requires an HTTP client");
    if (!limiter_) throw std::invalid_argument("RestExecutor requires a rate limiter");
    split_base_url(base_url, scheme_, host_, port_, base_path_);
    if (host_.empty()) throw std::invalid_argument("RestExecutor base url has no host: " + base_url);
}

std::vector<Header> RestExecutor::headers_for(throttle::RateTier tier, bool has_body) const {
    std::vector<Header> headers;
    headers.push_back({"Accept", "application/json"});
    if (has_body) headers.push_back({"Content-Type", "application/json"});
    headers.push_back({"access-token", credentials_.access_token});
    if (carries_client_id(tier)) headers.push_back({"client-id", credentials_.client_id});
    return headers;
}

std::string RestExecutor::execute(const std::string& method,
                                  const std::string& path,
                                  const std::string& body,
                                  throttle::RateTier tier) {
    limiter_->throttle(tier);

    const std::string target = base_path_ + path;
    const auto start = std::chrono::steady_clock::now();
    try {
        std::string response = http_->request(method, scheme_, host_, port_, target,
                                              headers_for(tier, !body.empty()), body);
        spdlog::debug("[REST] {} {} tier={} bytes={} elapsed_ms={}", method, target,
                      throttle::to_string(tier), response.size(),
                      std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - start).count());
        return response;
    } catch (const std::exception& e) {
        spdlog::error("[REST] {} {} failed: {}", method, target, e.what());
        throw;
    }
}

std::string RestExecutor::get(const std::string& path, throttle::RateTier tier) {
    return execute("GET", path, "", tier);
}

std::string RestExecutor::post(const std::string& path, const std::string& json_body, throttle::RateTier tier) {
    return execute("POST", path, json_body, tier);
}

std::string RestExecutor::put(const std::string& path, const std::string& json_body, throttle::RateTier tier) {
    return execute("PUT", path, json_body, tier);
}

std::string RestExecutor::del(const std::string& path, throttle::RateTier tier) {
    return execute("DELETE", path, "", tier);
}

} // namespace dhanstream::nethttp
