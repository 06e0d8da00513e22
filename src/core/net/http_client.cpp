/**
 * @file http_client.cpp
 */

#include "core/net/http_client.h"
#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>

namespace dhanstream::nethttp {

static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

static long env_timeout_ms(const char* name, long fallback, long minimum) {
    if (const char* v = std::getenv(name)) {
        char* endp = nullptr; long t = std::strtol(v, &endp, 10);
        if (endp && *endp == '\0' && t >= minimum) return t;
    }
    return fallback;
}

HttpClient::HttpClient()
    : HttpClient(env_timeout_ms("DHANSTREAM_HTTP_CONNECT_TIMEOUT_MS", 1500, 100),
                 env_timeout_ms("DHANSTREAM_HTTP_TIMEOUT_MS", 10000, 200)) {}

HttpClient::HttpClient(long connect_timeout_ms, long total_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms), total_timeout_ms_(total_timeout_ms) {}

HttpClient::~HttpClient() {}

std::string HttpClient::request(const std::string& method,
                                const std::string& scheme,
                                const std::string& host,
                                const std::string& port,
                                const std::string& target,
                                const std::vector<Header>& headers,
                                const std::string& body) const {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) throw std::runtime_error("curl_easy_init failed");
    CURL* curl = handle.get();

    std::string url = scheme + "://" + host;
    if (!port.empty() && port != "80" && port != "443") {
        url += ":" + port;
    }
    url += target; // target includes query string if provided

    std::string response;
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> hdrs(nullptr, &curl_slist_free_all);
    for (const auto& h : headers) {
        std::string line = h.name + ": " + h.value;
        curl_slist* appended = curl_slist_append(hdrs.get(), line.c_str());
        if (!appended) throw std::runtime_error("curl_slist_append failed");
        (void)hdrs.release();
        hdrs.reset(appended);
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, ""); // allow compressed
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "dhanstream/1.0");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    // Instrument downloads answer with a redirect to the CSV location
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
    // No signals in multithreaded use
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, total_timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_DNS_CACHE_TIMEOUT, 60L);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else if (method == "PUT" || method == "DELETE") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        if (!body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        }
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (rc != CURLE_OK) {
        throw std::runtime_error(fmt::format("curl error on {} {}: {}", method, target, curl_easy_strerror(rc)));
    }
    spdlog::debug("[HTTP] {} {} -> {} ({} bytes)", method, target, status, response.size());
    if (status >= 400) {
        throw std::runtime_error(fmt::format("HTTP status {}: {}", status, response.substr(0, 512)));
    }
    return response;
}

} // namespace dhanstream::nethttp
