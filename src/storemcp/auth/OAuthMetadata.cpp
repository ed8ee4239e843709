//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/storemcp/auth/OAuthMetadata.cpp
// Purpose: Environment-driven OAuth authorization server metadata
//==========================================================================================================

#include "env/EnvVars.h"
#include "storemcp/auth/OAuthMetadata.hpp"

namespace storemcp::auth {

namespace {

JSONValue stringArray(const std::vector<std::string>& values) {
    JSONValue::Array arr;
    for (const auto& v : values) arr.push_back(std::make_shared<JSONValue>(v));
    return JSONValue{arr};
}

} // namespace

AuthorizationServerMetadata LoadAuthorizationServerMetadataFromEnv() {
    AuthorizationServerMetadata md;
    md.issuer = GetEnvOrDefault("OAUTH_ISSUER", "");
    md.authorizationEndpoint = GetEnvOrDefault("OAUTH_AUTHORIZATION_ENDPOINT", "");
    md.tokenEndpoint = GetEnvOrDefault("OAUTH_TOKEN_ENDPOINT", "");
    md.jwksUri = GetEnvOrDefault("OAUTH_JWKS_URI", "");
    md.scopesSupported = SplitWhitespace(GetEnvOrDefault("OAUTH_SCOPES", kDefaultOAuthScopes));
    return md;
}

JSONValue ToJSON(const AuthorizationServerMetadata& metadata) {
    JSONValue::Object obj;
    obj["issuer"] = std::make_shared<JSONValue>(metadata.issuer);
    obj["authorization_endpoint"] = std::make_shared<JSONValue>(metadata.authorizationEndpoint);
    obj["token_endpoint"] = std::make_shared<JSONValue>(metadata.tokenEndpoint);
    obj["jwks_uri"] = std::make_shared<JSONValue>(metadata.jwksUri);
    obj["response_types_supported"] = std::make_shared<JSONValue>(stringArray(metadata.responseTypesSupported));
    obj["grant_types_supported"] = std::make_shared<JSONValue>(stringArray(metadata.grantTypesSupported));
    obj["scopes_supported"] = std::make_shared<JSONValue>(stringArray(metadata.scopesSupported));
    return JSONValue{obj};
}

} // namespace storemcp::auth
