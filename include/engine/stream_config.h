/**
 * @file stream_config.h
 * @brief Daemon configuration: YAML file, CLI overrides and environment fallbacks
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/auth/credentials_resolver.h"

namespace YAML { class Node; }

namespace dhanstream {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct FeedSettings {
    bool enabled{true};
    std::string url;                 // empty: derived from credentials
    std::string mode{"ticker"};      // ticker | quote | full
    std::vector<std::string> instruments;
};

struct DepthSettings {
    bool enabled{false};
    std::string url;                 // empty: derived from level + credentials
    int level{20};                   // 20 or 200
    std::vector<std::string> symbols;
};

struct OrderSettings {
    bool enabled{true};
    std::string url;                 // empty: default order update endpoint
};

struct TrackerSettings {
    std::size_t max_orders{10000};
    int64_t max_age_s{3600};
    int64_t sweep_interval_s{60};
};

struct SessionSettings {
    int64_t connect_timeout_ms{10000};
    uint32_t max_auth_failures{0};
};

struct RestSettings {
    std::string base_url{"https://api.dhan.co"};
};

struct LogSettings {
    std::string level{"info"};
    std::string file{"logs/dhanstream.log"};
};

struct StreamConfig {
    std::string config_path;
    auth::ResolvedCredentials auth;
    FeedSettings feed;
    DepthSettings depth;
    OrderSettings orders;
    TrackerSettings tracker;
    SessionSettings session;
    RestSettings rest;
    LogSettings log;
};

/// Build a config from a parsed YAML document. Throws ConfigError on ill-typed keys.
StreamConfig load_stream_config(const YAML::Node& root);

/// Parse and load @p path. Throws ConfigError if the file is unreadable or invalid.
StreamConfig load_stream_config_file(const std::string& path);

/// Every problem found, in one list (empty when the config is usable).
std::vector<std::string> validate_stream_config(const StreamConfig& config);

} // namespace dhanstream
