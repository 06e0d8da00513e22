/**
 * @file credentials_resolver.h
 * @brief Central resolver for broker credentials (explicit values, then environment).
 */

#pragma once

#include <string>

namespace dhanstream::auth {

struct ResolvedCredentials {
    std::string client_id;       // SELF login and REST client-id header
    std::string access_token;    // SELF login, feed/depth url token, REST access-token header
    std::string partner_id;      // PARTNER login
    std::string partner_secret;  // PARTNER login
    std::string user_type{"SELF"};

    bool is_partner() const { return user_type == "PARTNER"; }
};

// Parse common truthy/falsey strings from env.
bool parse_bool_env(const char* key, bool def_value);

// Fill every empty field of @p explicit_values from DHANSTREAM_CLIENT_ID,
// DHANSTREAM_ACCESS_TOKEN, DHANSTREAM_PARTNER_ID, DHANSTREAM_PARTNER_SECRET and
// DHANSTREAM_USER_TYPE. user_type is normalized to "SELF" or "PARTNER".
ResolvedCredentials resolve_credentials(const ResolvedCredentials& explicit_values);

// Empty when usable; otherwise a message naming what is missing.
std::string missing_credentials(const ResolvedCredentials& creds);

} // namespace dhanstream::auth
