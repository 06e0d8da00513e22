/**
 * @file http_client.h
 * @brief HTTP client wrapper using libcurl for the broker's REST endpoints.
 */

#pragma once

#include <string>
#include <vector>
#include <utility>

namespace dhanstream::nethttp {

struct Header { std::string name; std::string value; };

/**
 * @brief Seam for REST transport; tests substitute a scripted implementation.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Perform an HTTP request and return the body. Throws std::runtime_error on
    // transport failure or a status >= 400.
    virtual std::string request(const std::string& method,
                                const std::string& scheme,     // "https" or "http"
                                const std::string& host,
                                const std::string& port,       // e.g., "443"
                                const std::string& target,     // path + optional query
                                const std::vector<Header>& headers,
                                const std::string& body) const = 0;
};

class HttpClient : public IHttpClient {
public:
    // Timeouts default to 1.5s connect / 10s total and can be raised through
    // DHANSTREAM_HTTP_CONNECT_TIMEOUT_MS and DHANSTREAM_HTTP_TIMEOUT_MS.
    HttpClient();
    HttpClient(long connect_timeout_ms, long total_timeout_ms);
    ~HttpClient() override;

    std::string request(const std::string& method,
                        const std::string& scheme,
                        const std::string& host,
                        const std::string& port,
                        const std::string& target,
                        const std::vector<Header>& headers,
                        const std::string& body) const override;

    long connect_timeout_ms() const { return connect_timeout_ms_; }
    long total_timeout_ms() const { return total_timeout_ms_; }

private:
    long connect_timeout_ms_;
    long total_timeout_ms_;
};

} // namespace dhanstream::nethttp
