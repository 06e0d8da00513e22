/**
 * @file stream_config.cpp
 */

#include "engine/stream_config.h"

#include <yaml-cpp/yaml.h>

#include "stream/wire_commands.h"
#include "utils/string_utils.h"

namespace dhanstream {

namespace {

template <typename T>
T read_value(const YAML::Node& section, const char* section_name, const char* key, const T& fallback) {
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) return fallback;
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string(section_name) + "." + key + ": " + e.what());
    }
}

std::vector<std::string> read_list(const YAML::Node& section, const char* section_name, const char* key) {
    std::vector<std::string> out;
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) return out;
    if (!node.IsSequence()) {
        throw ConfigError(std::string(section_name) + "." + key + ": expected a list");
    }
    for (const auto& item : node) {
        try {
            out.push_back(item.as<std::string>());
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string(section_name) + "." + key + ": " + e.what());
        }
    }
    return out;
}

} // namespace

StreamConfig load_stream_config(const YAML::Node& root) {
    StreamConfig cfg;
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw ConfigError("top level of the config must be a mapping");
    }

    if (const YAML::Node a = root["auth"]) {
        cfg.auth.client_id = read_value<std::string>(a, "auth", "client_id", "");
        cfg.auth.access_token = read_value<std::string>(a, "auth", "access_token", "");
        cfg.auth.partner_id = read_value<std::string>(a, "auth", "partner_id", "");
        cfg.auth.partner_secret = read_value<std::string>(a, "auth", "partner_secret", "");
        cfg.auth.user_type = utils::to_upper_ascii(read_value<std::string>(a, "auth", "user_type", "SELF"));
    }
    if (const YAML::Node f = root["feed"]) {
        cfg.feed.enabled = read_value<bool>(f, "feed", "enabled", cfg.feed.enabled);
        cfg.feed.url = read_value<std::string>(f, "feed", "url", "");
        cfg.feed.mode = utils::to_lower_ascii(read_value<std::string>(f, "feed", "mode", cfg.feed.mode));
        cfg.feed.instruments = read_list(f, "feed", "instruments");
    }
    if (const YAML::Node d = root["depth"]) {
        cfg.depth.enabled = read_value<bool>(d, "depth", "enabled", true);
        cfg.depth.url = read_value<std::string>(d, "depth", "url", "");
        cfg.depth.level = read_value<int>(d, "depth", "level", cfg.depth.level);
        cfg.depth.symbols = read_list(d, "depth", "symbols");
    }
    if (const YAML::Node o = root["orders"]) {
        cfg.orders.enabled = read_value<bool>(o, "orders", "enabled", cfg.orders.enabled);
        cfg.orders.url = read_value<std::string>(o, "orders", "url", "");
    }
    if (const YAML::Node t = root["tracker"]) {
        cfg.tracker.max_orders = read_value<std::size_t>(t, "tracker", "max_orders", cfg.tracker.max_orders);
        cfg.tracker.max_age_s = read_value<int64_t>(t, "tracker", "max_age_s", cfg.tracker.max_age_s);
        cfg.tracker.sweep_interval_s = read_value<int64_t>(t, "tracker", "sweep_interval_s", cfg.tracker.sweep_interval_s);
    }
    if (const YAML::Node s = root["session"]) {
        cfg.session.connect_timeout_ms = read_value<int64_t>(s, "session", "connect_timeout_ms", cfg.session.connect_timeout_ms);
        cfg.session.max_auth_failures = read_value<uint32_t>(s, "session", "max_auth_failures", cfg.session.max_auth_failures);
    }
    if (const YAML::Node r = root["rest"]) {
        cfg.rest.base_url = read_value<std::string>(r, "rest", "base_url", cfg.rest.base_url);
    }
    if (const YAML::Node l = root["log"]) {
        cfg.log.level = utils::to_lower_ascii(read_value<std::string>(l, "log", "level", cfg.log.level));
        cfg.log.file = read_value<std::string>(l, "log", "file", cfg.log.file);
    }
    return cfg;
}

StreamConfig load_stream_config_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot load " + path + ": " + e.what());
    }
    StreamConfig cfg = load_stream_config(root);
    cfg.config_path = path;
    return cfg;
}

std::vector<std::string> validate_stream_config(const StreamConfig& config) {
    std::vector<std::string> errors;

    const bool needs_token = config.feed.enabled || config.depth.enabled ||
                             (config.orders.enabled && !config.auth.is_partner());
    if (needs_token && (config.auth.client_id.empty() || config.auth.access_token.empty())) {
        errors.push_back("missing credentials: set --client-id/--access-token, auth.client_id/auth.access_token, "
                         "or env DHANSTREAM_CLIENT_ID / DHANSTREAM_ACCESS_TOKEN");
    }
    if (config.orders.enabled && config.auth.is_partner()) {
        const std::string missing = auth::missing_credentials(config.auth);
        if (!missing.empty()) errors.push_back(missing);
    }
    if (!config.feed.enabled && !config.depth.enabled && !config.orders.enabled) {
        errors.push_back("nothing to stream: enable at least one of feed, depth, orders");
    }

    stream::FeedMode mode;
    if (!stream::parse_feed_mode(config.feed.mode, mode)) {
        errors.push_back("feed.mode must be ticker, quote or full (got '" + config.feed.mode + "')");
    }
    if (config.depth.level != 20 && config.depth.level != 200) {
        errors.push_back("depth.level must be 20 or 200 (got " + std::to_string(config.depth.level) + ")");
    }
    if (config.tracker.max_orders == 0) {
        errors.push_back("tracker.max_orders must be positive");
    }
    if (config.tracker.max_age_s <= 0) {
        errors.push_back("tracker.max_age_s must be positive");
    }
    if (config.tracker.sweep_interval_s <= 0) {
        errors.push_back("tracker.sweep_interval_s must be positive");
    }
    if (config.session.connect_timeout_ms < 100) {
        errors.push_back("session.connect_timeout_ms must be at least 100");
    }
    static const std::vector<std::string> levels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    bool level_ok = false;
    for (const auto& l : levels) level_ok = level_ok || (l == config.log.level);
    if (!level_ok) {
        errors.push_back("log.level '" + config.log.level + "' is not a spdlog level");
    }
    return errors;
}

} // namespace dhanstream
