/**
 * @file credentials_resolver.cpp
 */

#include "core/auth/credentials_resolver.h"
#include <cctype>
#include <cstdlib>

#include "utils/string_utils.h"

namespace dhanstream::auth {

namespace {
inline std::string getenv_string(const char* key) {
    if (const char* v = std::getenv(key)) return std::string(v);
    return {};
}

inline void fill_from_env(std::string& field, const char* key) {
    if (field.empty()) field = utils::trim(getenv_string(key));
}
} // namespace

bool parse_bool_env(const char* key, bool def_value) {
    const char* v = std::getenv(key);
    if (!v) return def_value;
    const std::string s = utils::to_lower_ascii(utils::trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return def_value;
}

ResolvedCredentials resolve_credentials(const ResolvedCredentials& explicit_values) {
    ResolvedCredentials out = explicit_values;

    fill_from_env(out.client_id, "DHANSTREAM_CLIENT_ID");
    fill_from_env(out.access_token, "DHANSTREAM_ACCESS_TOKEN");
    fill_from_env(out.partner_id, "DHANSTREAM_PARTNER_ID");
    fill_from_env(out.partner_secret, "DHANSTREAM_PARTNER_SECRET");

    // Explicit user type wins unless it is the default
    std::string type = utils::to_upper_ascii(utils::trim(explicit_values.user_type));
    if (type.empty() || type == "SELF") {
        const std::string env_type = utils::to_upper_ascii(utils::trim(getenv_string("DHANSTREAM_USER_TYPE")));
        if (!env_type.empty()) type = env_type;
    }
    out.user_type = (type == "PARTNER") ? "PARTNER" : "SELF";
    return out;
}

std::string missing_credentials(const ResolvedCredentials& creds) {
    if (creds.is_partner()) {
        if (creds.partner_id.empty() || creds.partner_secret.empty()) {
            return "partner login needs partner_id and partner_secret (or env DHANSTREAM_PARTNER_ID / DHANSTREAM_PARTNER_SECRET)";
        }
        return {};
    }
    if (creds.client_id.empty() || creds.access_token.empty()) {
        return "missing credentials: set --client-id/--access-token, auth.client_id/auth.access_token, or env DHANSTREAM_CLIENT_ID / DHANSTREAM_ACCESS_TOKEN";
    }
    return {};
}

} // namespace dhanstream::auth
