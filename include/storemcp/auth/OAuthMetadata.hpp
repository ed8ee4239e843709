//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuthMetadata.hpp
// Purpose: Static OAuth 2.0 authorization server metadata served for discovery
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "storemcp/JSONRPCTypes.h"

namespace storemcp::auth {

// Scopes advertised when OAUTH_SCOPES is unset or empty.
constexpr const char* kDefaultOAuthScopes = "openid profile email";

//==========================================================================================================
// AuthorizationServerMetadata
// Purpose: Discovery document for /.well-known/oauth-authorization-server. Advertised only; the server
// never validates tokens against it.
// Fields:
//   issuer/authorizationEndpoint/tokenEndpoint/jwksUri: Copied verbatim, empty when not configured.
//   scopesSupported: Whitespace-separated scopes, empty tokens dropped.
//   responseTypesSupported/grantTypesSupported: Fixed to the authorization code flow.
//==========================================================================================================
struct AuthorizationServerMetadata {
    std::string issuer;
    std::string authorizationEndpoint;
    std::string tokenEndpoint;
    std::string jwksUri;
    std::vector<std::string> scopesSupported;
    std::vector<std::string> responseTypesSupported{"code"};
    std::vector<std::string> grantTypesSupported{"authorization_code"};
};

//==========================================================================================================
// LoadAuthorizationServerMetadataFromEnv
// Purpose: Reads OAUTH_ISSUER, OAUTH_AUTHORIZATION_ENDPOINT, OAUTH_TOKEN_ENDPOINT, OAUTH_JWKS_URI and
// OAUTH_SCOPES.
//==========================================================================================================
AuthorizationServerMetadata LoadAuthorizationServerMetadataFromEnv();

// JSON object with RFC 8414 member names.
JSONValue ToJSON(const AuthorizationServerMetadata& metadata);

} // namespace storemcp::auth
