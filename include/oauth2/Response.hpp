//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Response.hpp
// Purpose: Transport-neutral response model and protocol response writers
//==========================================================================================================
#pragma once

#include <cstdint>
#include <exception>
#include <map>
#include <string>

#include "oauth2/JSON.h"
#include "oauth2/Scope.hpp"

namespace oauth2 {

//==========================================================================================================
// Response
// Purpose: Status, headers and body produced by an endpoint; a transport adapter writes it out verbatim.
//==========================================================================================================
struct Response {
    int status{200};
    std::map<std::string, std::string> headers;
    std::string body;

    std::string Header(const std::string& name) const;
};

//==========================================================================================================
// WriteJSON
// Purpose: Set a JSON body with the no-store caching headers required for credential responses.
//==========================================================================================================
void WriteJSON(Response& res, const JSONValue& doc, int status);

//==========================================================================================================
// WriteRedirect
// Purpose: 302 redirect to uri carrying params.
// Args:
//   uri: Target; an existing query is kept.
//   params: Appended to the query (useFragment=false) or written as the fragment (useFragment=true).
//           Keys are emitted in sorted order.
// Throws:
//   std::invalid_argument when uri is empty.
//==========================================================================================================
void WriteRedirect(Response& res, const std::string& uri, const std::map<std::string, std::string>& params,
                   bool useFragment);

//==========================================================================================================
// WriteError
// Purpose: Render a failure. An errors::OAuthError is written as JSON with its status and headers, or
//          as a redirect when it carries a redirect target. Any other exception becomes a bare
//          server_error (500) so internal text never reaches the client.
//==========================================================================================================
void WriteError(Response& res, const std::exception& err);

// Same as WriteError but forces redirect delivery to uri (state echoed) for any error.
void RedirectError(Response& res, const std::string& uri, const std::string& state, bool useFragment,
                   const std::exception& err);

//==========================================================================================================
// TokenResponse
// Purpose: Successful token issuance. Delivered as JSON, or by redirect when redirectURI is set
//          (implicit grant, always in the fragment).
//==========================================================================================================
struct TokenResponse {
    std::string tokenType{"bearer"};
    std::string accessToken;
    int64_t expiresIn{0};
    std::string refreshToken;
    ScopeSet scope;
    std::string state;

    std::string redirectURI;
    bool useFragment{false};

    // String form of every present field, for redirect delivery.
    std::map<std::string, std::string> Map() const;
    JSONValue ToJSON() const;
};

void WriteTokenResponse(Response& res, const TokenResponse& tr);

// Authorization code issued by the authorization endpoint; always delivered in the redirect query.
struct CodeResponse {
    std::string code;
    std::string state;
    std::string redirectURI;

    std::map<std::string, std::string> Map() const;
};

void WriteCodeResponse(Response& res, const CodeResponse& cr);

//==========================================================================================================
// IntrospectionResponse
// Purpose: RFC 7662 body; an inactive token renders as {"active":false} only.
//==========================================================================================================
struct IntrospectionResponse {
    bool active{false};
    std::string scope;
    std::string clientID;
    std::string username;
    std::string tokenType;
    int64_t expiresAt{0};

    JSONValue ToJSON() const;
};

void WriteIntrospectionResponse(Response& res, const IntrospectionResponse& ir);

} // namespace oauth2
