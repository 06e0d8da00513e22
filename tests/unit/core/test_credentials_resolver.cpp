/**
 * @file test_credentials_resolver.cpp
 * @brief Credential resolution from explicit values and environment
 */

#include <gtest/gtest.h>
#include "core/auth/credentials_resolver.h"

#include <cstdlib>

using namespace dhanstream::auth;

namespace {

class CredentialsEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* key : {"DHANSTREAM_CLIENT_ID", "DHANSTREAM_ACCESS_TOKEN", "DHANSTREAM_PARTNER_ID",
                                "DHANSTREAM_PARTNER_SECRET", "DHANSTREAM_USER_TYPE", "DHANSTREAM_TEST_BOOL"}) {
            ::unsetenv(key);
        }
    }
};

} // namespace

TEST_F(CredentialsEnvTest, EnvironmentFillsEmptyFields) {
    ::setenv("DHANSTREAM_CLIENT_ID", " 1000000001 ", 1);
    ::setenv("DHANSTREAM_ACCESS_TOKEN", "env-token", 1);

    auto creds = resolve_credentials({});
    EXPECT_EQ(creds.client_id, "1000000001");
    EXPECT_EQ(creds.access_token, "env-token");
    EXPECT_EQ(creds.user_type, "SELF");
    EXPECT_TRUE(missing_credentials(creds).empty());
}

TEST_F(CredentialsEnvTest, ExplicitValuesWin) {
    ::setenv("DHANSTREAM_ACCESS_TOKEN", "env-token", 1);
    ResolvedCredentials explicit_values;
    explicit_values.client_id = "42";
    explicit_values.access_token = "cli-token";

    auto creds = resolve_credentials(explicit_values);
    EXPECT_EQ(creds.access_token, "cli-token");
    EXPECT_EQ(creds.client_id, "42");
}

TEST_F(CredentialsEnvTest, PartnerUserType) {
    ::setenv("DHANSTREAM_USER_TYPE", "partner", 1);
    ::setenv("DHANSTREAM_PARTNER_ID", "p-1", 1);

    auto creds = resolve_credentials({});
    EXPECT_TRUE(creds.is_partner());
    EXPECT_FALSE(missing_credentials(creds).empty());

    ::setenv("DHANSTREAM_PARTNER_SECRET", "secret", 1);
    creds = resolve_credentials({});
    EXPECT_TRUE(missing_credentials(creds).empty());
}

TEST_F(CredentialsEnvTest, UnknownUserTypeFallsBackToSelf) {
    ResolvedCredentials explicit_values;
    explicit_values.user_type = "robot";
    EXPECT_EQ(resolve_credentials(explicit_values).user_type, "SELF");
}

TEST_F(CredentialsEnvTest, MissingSelfCredentials) {
    ResolvedCredentials creds;
    creds.client_id = "1";
    EXPECT_NE(missing_credentials(creds).find("missing credentials"), std::string::npos);
}

TEST_F(CredentialsEnvTest, ParseBoolEnv) {
    EXPECT_TRUE(parse_bool_env("DHANSTREAM_TEST_BOOL", true));
    ::setenv("DHANSTREAM_TEST_BOOL", "off", 1);
    EXPECT_FALSE(parse_bool_env("DHANSTREAM_TEST_BOOL", true));
    ::setenv("DHANSTREAM_TEST_BOOL", "YES", 1);
    EXPECT_TRUE(parse_bool_env("DHANSTREAM_TEST_BOOL", false));
    ::setenv("DHANSTREAM_TEST_BOOL", "maybe", 1);
    EXPECT_FALSE(parse_bool_env("DHANSTREAM_TEST_BOOL", false));
}
