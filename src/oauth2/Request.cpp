//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/Request.cpp
// Purpose: Endpoint request parsing
//==========================================================================================================

#include "oauth2/Request.hpp"

#include <cctype>

#include "oauth2/Encoding.hpp"
#include "oauth2/errors/Errors.h"

namespace oauth2 {

namespace {
    static bool icaseEqual(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    static std::string lookup(const std::map<std::string, std::string>& m, const std::string& key) {
        auto it = m.find(key);
        return (it == m.end()) ? std::string() : it->second;
    }

    static void requirePost(const Request& req) {
        if (req.method != "POST") {
            throw errors::InvalidRequest("invalid HTTP method");
        }
    }

    struct ClientAuth {
        std::string id;
        std::string secret;
    };

    static ClientAuth readClientAuth(const Request& req) {
        ClientAuth ca;
        const std::string header = req.Header("Authorization");
        if (!header.empty()) {
            auto basic = ParseBasicAuth(header);
            if (!basic.has_value()) {
                throw errors::InvalidRequest("malformed basic authorization header");
            }
            ca.id = basic->username;
            ca.secret = basic->password;
        } else {
            ca.id = lookup(req.form, "client_id");
            ca.secret = lookup(req.form, "client_secret");
        }
        if (ca.id.empty()) {
            throw errors::InvalidRequest("missing client id");
        }
        return ca;
    }
}

std::string Request::Header(const std::string& name) const {
    for (const auto& [key, val] : headers) {
        if (icaseEqual(key, name)) {
            return val;
        }
    }
    return std::string();
}

std::string Request::Param(const std::string& name) const {
    auto it = form.find(name);
    if (it != form.end()) {
        return it->second;
    }
    return lookup(query, name);
}

std::optional<BasicCredentials> ParseBasicAuth(const std::string& authorizationHeader) {
    const std::string pfx = "Basic ";
    if (authorizationHeader.size() <= pfx.size() ||
        !icaseEqual(authorizationHeader.substr(0, pfx.size()), pfx)) {
        return std::nullopt;
    }
    std::string encoded = authorizationHeader.substr(pfx.size());
    while (!encoded.empty() && encoded.front() == ' ') {
        encoded.erase(encoded.begin());
    }
    auto decoded = Base64Decode(encoded);
    if (!decoded.has_value()) {
        return std::nullopt;
    }
    auto colon = decoded->find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    BasicCredentials bc;
    bc.username = decoded->substr(0, colon);
    bc.password = decoded->substr(colon + 1);
    return bc;
}

TokenRequest ParseTokenRequest(const Request& req) {
    requirePost(req);

    TokenRequest tr;
    tr.grantType = lookup(req.form, "grant_type");
    if (tr.grantType.empty()) {
        throw errors::InvalidRequest("missing grant type");
    }

    auto scopeIt = req.form.find("scope");
    if (scopeIt != req.form.end()) {
        tr.scope = ScopeSet::Parse(scopeIt->second);
        tr.scopeGiven = !tr.scope.Empty();
    }

    ClientAuth ca = readClientAuth(req);
    tr.clientID = ca.id;
    tr.clientSecret = ca.secret;

    tr.username = lookup(req.form, "username");
    tr.password = lookup(req.form, "password");
    tr.refreshToken = lookup(req.form, "refresh_token");
    tr.redirectURI = lookup(req.form, "redirect_uri");
    tr.code = lookup(req.form, "code");
    return tr;
}

AuthorizationRequest ParseAuthorizationRequest(const Request& req) {
    if (req.method != "GET" && req.method != "POST") {
        throw errors::InvalidRequest("invalid HTTP method");
    }

    AuthorizationRequest ar;
    ar.method = req.method;
    ar.responseType = req.Param("response_type");
    ar.scope = ScopeSet::Parse(req.Param("scope"));
    ar.clientID = req.Param("client_id");
    ar.redirectURI = req.Param("redirect_uri");
    ar.state = req.Param("state");

    if (ar.clientID.empty()) {
        throw errors::InvalidRequest("missing client id");
    }
    if (ar.redirectURI.empty()) {
        throw errors::InvalidRequest("missing redirect uri");
    }

    if (req.method == "POST") {
        ar.username = lookup(req.form, "username");
        ar.password = lookup(req.form, "password");
    }
    return ar;
}

RevocationRequest ParseRevocationRequest(const Request& req) {
    requirePost(req);

    RevocationRequest rr;
    rr.token = lookup(req.form, "token");
    if (rr.token.empty()) {
        throw errors::InvalidRequest("missing token");
    }
    rr.tokenTypeHint = lookup(req.form, "token_type_hint");

    ClientAuth ca = readClientAuth(req);
    rr.clientID = ca.id;
    rr.clientSecret = ca.secret;
    return rr;
}

IntrospectionRequest ParseIntrospectionRequest(const Request& req) {
    return ParseRevocationRequest(req);
}

} // namespace oauth2
