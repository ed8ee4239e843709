//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_oauth_metadata.cpp
// Purpose: GoogleTests for the OAuth authorization server discovery document
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "storemcp/auth/OAuthMetadata.hpp"

using namespace storemcp;

namespace {

class OAuthMetadataTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }
    static void clear() {
        for (const char* v : {"OAUTH_ISSUER", "OAUTH_AUTHORIZATION_ENDPOINT", "OAUTH_TOKEN_ENDPOINT",
                              "OAUTH_JWKS_URI", "OAUTH_SCOPES"}) {
            ::unsetenv(v);
        }
    }
};

std::vector<std::string> strings(const JSONValue& v) {
    std::vector<std::string> out;
    for (const auto& item : std::get<JSONValue::Array>(v.value)) {
        out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

} // namespace

TEST_F(OAuthMetadataTest, UnsetEnvironment) {
    auto md = auth::LoadAuthorizationServerMetadataFromEnv();
    EXPECT_TRUE(md.issuer.empty());
    EXPECT_TRUE(md.authorizationEndpoint.empty());
    EXPECT_TRUE(md.tokenEndpoint.empty());
    EXPECT_TRUE(md.jwksUri.empty());
    EXPECT_EQ(md.scopesSupported, (std::vector<std::string>{"openid", "profile", "email"}));
}

TEST_F(OAuthMetadataTest, ReadsEnvironment) {
    ::setenv("OAUTH_ISSUER", "https://auth.example.com", 1);
    ::setenv("OAUTH_AUTHORIZATION_ENDPOINT", "https://auth.example.com/authorize", 1);
    ::setenv("OAUTH_TOKEN_ENDPOINT", "https://auth.example.com/token", 1);
    ::setenv("OAUTH_JWKS_URI", "https://auth.example.com/jwks.json", 1);
    ::setenv("OAUTH_SCOPES", "  stores:read \t offline_access  ", 1);

    auto md = auth::LoadAuthorizationServerMetadataFromEnv();
    EXPECT_EQ(md.issuer, "https://auth.example.com");
    EXPECT_EQ(md.authorizationEndpoint, "https://auth.example.com/authorize");
    EXPECT_EQ(md.tokenEndpoint, "https://auth.example.com/token");
    EXPECT_EQ(md.jwksUri, "https://auth.example.com/jwks.json");
    EXPECT_EQ(md.scopesSupported, (std::vector<std::string>{"stores:read", "offline_access"}));
}

TEST_F(OAuthMetadataTest, EmptyScopesUseDefault) {
    ::setenv("OAUTH_SCOPES", "", 1);
    auto md = auth::LoadAuthorizationServerMetadataFromEnv();
    EXPECT_EQ(md.scopesSupported.size(), static_cast<size_t>(3));
}

TEST_F(OAuthMetadataTest, JsonDocument) {
    ::setenv("OAUTH_ISSUER", "https://issuer", 1);
    JSONValue doc = auth::ToJSON(auth::LoadAuthorizationServerMetadataFromEnv());
    const auto& obj = std::get<JSONValue::Object>(doc.value);
    EXPECT_EQ(obj.size(), static_cast<size_t>(7));
    EXPECT_EQ(std::get<std::string>(obj.at("issuer")->value), "https://issuer");
    EXPECT_EQ(std::get<std::string>(obj.at("token_endpoint")->value), "");
    EXPECT_EQ(strings(*obj.at("response_types_supported")), (std::vector<std::string>{"code"}));
    EXPECT_EQ(strings(*obj.at("grant_types_supported")), (std::vector<std::string>{"authorization_code"}));
    EXPECT_EQ(strings(*obj.at("scopes_supported")), (std::vector<std::string>{"openid", "profile", "email"}));

    // Round-trips through the serializer as a valid document
    JSONValue reparsed = ParseJSON(SerializeJSON(doc));
    EXPECT_EQ(std::get<JSONValue::Object>(reparsed.value).size(), static_cast<size_t>(7));
}
