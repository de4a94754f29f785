//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Request.hpp
// Purpose: Transport-neutral request model and endpoint request parsers
//==========================================================================================================
#pragma once

#include <map>
#include <optional>
#include <string>

#include "oauth2/Scope.hpp"

namespace oauth2 {

//==========================================================================================================
// Request
// Purpose: The fields of an inbound HTTP request the engine needs, supplied by a transport adapter.
// Fields:
//   method: Upper-case HTTP method ("GET", "POST", ...).
//   query: Decoded URL query parameters.
//   form: Decoded application/x-www-form-urlencoded body parameters (POST only).
//   headers: Header fields; lookups through Header() are case-insensitive.
//==========================================================================================================
struct Request {
    std::string method;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> form;
    std::map<std::string, std::string> headers;

    std::string Header(const std::string& name) const;

    // Form value when present, otherwise the query value, otherwise empty.
    std::string Param(const std::string& name) const;
};

// HTTP Basic credentials decoded from an Authorization header.
struct BasicCredentials {
    std::string username;
    std::string password;
};

//==========================================================================================================
// ParseBasicAuth
// Purpose: Decode "Basic base64(user:pass)".
// Returns:
//   std::nullopt when the header is absent, uses another scheme, or is malformed.
//==========================================================================================================
std::optional<BasicCredentials> ParseBasicAuth(const std::string& authorizationHeader);

struct TokenRequest {
    std::string grantType;
    ScopeSet scope;
    bool scopeGiven{false};
    std::string clientID;
    std::string clientSecret;
    std::string username;
    std::string password;
    std::string refreshToken;
    std::string redirectURI;
    std::string code;
};

struct AuthorizationRequest {
    std::string method;
    std::string responseType;
    ScopeSet scope;
    std::string clientID;
    std::string redirectURI;
    std::string state;
    std::string username;
    std::string password;
};

// Shared shape of revocation (RFC 7009) and introspection (RFC 7662) requests.
struct RevocationRequest {
    std::string token;
    std::string tokenTypeHint;
    std::string clientID;
    std::string clientSecret;
};
using IntrospectionRequest = RevocationRequest;

//----------------------------------------------------------------------------------------------------------
// Parsers. All throw errors::OAuthError(invalid_request) on a wrong method or a missing required field.
// Client credentials come from HTTP Basic when present, otherwise from client_id/client_secret fields.
//----------------------------------------------------------------------------------------------------------
TokenRequest ParseTokenRequest(const Request& req);
AuthorizationRequest ParseAuthorizationRequest(const Request& req);
RevocationRequest ParseRevocationRequest(const Request& req);
IntrospectionRequest ParseIntrospectionRequest(const Request& req);

} // namespace oauth2
