#include "credentials.h"
#include "usage_common.h"

#include <gtest/gtest.h>

#include <cstdio>

class CredentialsTest : public ::testing::Test {
protected:
    void SetUp() override {
        app_log_set_file("");
        char tmpl[] = "/tmp/pinch_credentials_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir_ = tmpl;
        path_ = dir_ + "/.credentials.json";
    }

    void TearDown() override {
        std::remove(path_.c_str());
        rmdir(dir_.c_str());
    }

    void write_file(const std::string& content) {
        std::ofstream f(path_, std::ios::trunc);
        f << content;
    }

    std::string dir_;
    std::string path_;
};

static constexpr time_t kNow = 1767225600;

TEST_F(CredentialsTest, MissingFile) {
    Credential c = read_credential(path_, kNow);
    EXPECT_EQ(c.status, CredentialStatus::Missing);
    EXPECT_TRUE(c.access_token.empty());
    EXPECT_FALSE(credential_usable(c));
}

TEST_F(CredentialsTest, MalformedFile) {
    write_file("{ not json");
    Credential c = read_credential(path_, kNow);
    EXPECT_EQ(c.status, CredentialStatus::Malformed);
    EXPECT_FALSE(credential_usable(c));
}

TEST_F(CredentialsTest, NoAccessToken) {
    write_file(R"({"claudeAiOauth": {"refreshToken": "r"}})");
    EXPECT_EQ(read_credential(path_, kNow).status, CredentialStatus::Missing);

    write_file(R"({"other": {}})");
    EXPECT_EQ(read_credential(path_, kNow).status, CredentialStatus::Missing);
}

TEST_F(CredentialsTest, ValidTokenWithoutExpiry) {
    write_file(R"({"claudeAiOauth": {"accessToken": "tok-123"}})");
    Credential c = read_credential(path_, kNow);
    EXPECT_EQ(c.status, CredentialStatus::Ok);
    EXPECT_EQ(c.access_token, "tok-123");
    EXPECT_FALSE(c.expires_at.has_value());
    EXPECT_TRUE(credential_usable(c));
}

TEST_F(CredentialsTest, ExpiryClassification) {
    const long long hour_ahead_ms = static_cast<long long>(kNow + 3600) * 1000;
    write_file(R"({"claudeAiOauth": {"accessToken": "a", "expiresAt": )" + std::to_string(hour_ahead_ms) + "}}");
    Credential c = read_credential(path_, kNow);
    EXPECT_EQ(c.status, CredentialStatus::Ok);
    ASSERT_TRUE(c.expires_at.has_value());
    EXPECT_EQ(*c.expires_at, kNow + 3600);

    const long long soon_ms = static_cast<long long>(kNow + 60) * 1000;
    write_file(R"({"claudeAiOauth": {"accessToken": "a", "expiresAt": )" + std::to_string(soon_ms) + "}}");
    EXPECT_EQ(read_credential(path_, kNow).status, CredentialStatus::Expiring);

    const long long past_ms = static_cast<long long>(kNow - 60) * 1000;
    write_file(R"({"claudeAiOauth": {"accessToken": "a", "expiresAt": )" + std::to_string(past_ms) + "}}");
    c = read_credential(path_, kNow);
    EXPECT_EQ(c.status, CredentialStatus::Expired);
    // The CLI may have refreshed the token server-side; still worth a try.
    EXPECT_TRUE(credential_usable(c));
}

TEST_F(CredentialsTest, OutOfRangeExpiryIsIgnored) {
    write_file(R"({"claudeAiOauth": {"accessToken": "a", "expiresAt": 1e300}})");
    Credential c = read_credential(path_, kNow);
    EXPECT_EQ(c.status, CredentialStatus::Ok);
    EXPECT_FALSE(c.expires_at.has_value());
    EXPECT_TRUE(credential_usable(c));

    write_file(R"({"claudeAiOauth": {"accessToken": "a", "expiresAt": -5}})");
    c = read_credential(path_, kNow);
    EXPECT_EQ(c.status, CredentialStatus::Ok);
    EXPECT_FALSE(c.expires_at.has_value());
}

TEST_F(CredentialsTest, EnvironmentOverridesDefaultPath) {
    setenv("PINCH_CREDENTIALS", path_.c_str(), 1);
    EXPECT_EQ(default_credentials_path(), path_);
    unsetenv("PINCH_CREDENTIALS");
    EXPECT_NE(default_credentials_path(), path_);
}
