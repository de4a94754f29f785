//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/auth/BearerValidator.cpp
// Purpose: Bearer token extraction, validation and challenge rendering
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "oauth2/auth/BearerValidator.hpp"

namespace oauth2::auth {

namespace {
    // Thread-local storage for the per-request credential.
    thread_local const store::Credential* gCurrentCredential = nullptr;

    static bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    static bool startsWithBearer(const std::string& s) {
        const std::string pfx = "Bearer";
        if (s.size() < pfx.size()) {
            return false;
        }
        for (size_t i = 0; i < pfx.size(); ++i) {
            if (!icaseEqual(s[i], pfx[i])) {
                return false;
            }
        }
        return s.size() == pfx.size() || s[pfx.size()] == ' ';
    }

    static BearerCheckResult fail(BearerError err) {
        BearerCheckResult r;
        r.ok = false;
        r.error = std::move(err);
        return r;
    }
}

std::map<std::string, std::string> BearerError::Map() const {
    std::map<std::string, std::string> m;
    if (!name.empty()) m["error"] = name;
    if (!description.empty()) m["error_description"] = description;
    if (!uri.empty()) m["error_uri"] = uri;
    if (!realm.empty()) m["realm"] = realm;
    if (!scope.empty()) m["scope"] = scope;
    return m;
}

std::string BearerError::Params() const {
    std::vector<std::string> params;
    for (const auto& [key, val] : Map()) {
        params.push_back(key + "=\"" + val + "\"");
    }
    std::sort(params.begin(), params.end());
    std::string out;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) out += ", ";
        out += params[i];
    }
    return out;
}

BearerError InvalidRequest(const std::string& description) {
    BearerError e;
    e.name = "invalid_request";
    e.description = description;
    e.status = 400;
    return e;
}

BearerError InvalidToken(const std::string& description) {
    BearerError e;
    e.name = "invalid_token";
    e.description = description;
    e.status = 401;
    return e;
}

BearerError InsufficientScope(const std::string& necessaryScope) {
    BearerError e;
    e.name = "insufficient_scope";
    e.scope = necessaryScope;
    e.status = 403;
    return e;
}

BearerError ProtectedResource() {
    BearerError e;
    e.status = 401;
    return e;
}

BearerError ServerError() {
    BearerError e;
    e.status = 500;
    return e;
}

void WriteBearerError(Response& res, const std::optional<BearerError>& err) {
    res.body.clear();
    if (!err.has_value() || err->status == 500) {
        res.status = 500;
        return;
    }
    std::string params = err->Params();
    if (params.empty()) {
        params = "realm=\"OAuth2\"";
    }
    res.status = err->status;
    res.headers["WWW-Authenticate"] = "Bearer " + params;
}

std::optional<std::string> ExtractBearerToken(const Request& req, BearerError& outError) {
    std::vector<std::string> found;

    const std::string header = req.Header("Authorization");
    if (!header.empty() && startsWithBearer(header)) {
        std::string token = header.substr(6);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())) != 0) {
            token.erase(token.begin());
        }
        if (token.empty()) {
            outError = InvalidRequest("malformed authorization header");
            return std::nullopt;
        }
        found.push_back(token);
    }

    if (req.method == "POST") {
        auto it = req.form.find("access_token");
        if (it != req.form.end()) {
            found.push_back(it->second);
        }
    }

    auto q = req.query.find("access_token");
    if (q != req.query.end()) {
        found.push_back(q->second);
    }

    if (found.size() > 1) {
        outError = InvalidRequest("multiple token sources");
        return std::nullopt;
    }
    if (found.empty() || found.front().empty()) {
        outError = ProtectedResource();
        return std::nullopt;
    }
    return found.front();
}

BearerValidator::BearerValidator(TokenCodec c, std::shared_ptr<store::ICredentialStore> st)
    : codec(std::move(c)), credentialStore(std::move(st)) {
    if (!credentialStore) {
        throw std::invalid_argument("BearerValidator requires a credential store");
    }
}

BearerCheckResult BearerValidator::Validate(const std::string& token, const ScopeSet& requiredScope) const {
    auto parsed = codec.Parse(token);
    if (!parsed.has_value()) {
        return fail(InvalidToken("malformed token"));
    }

    auto stored = credentialStore->Get(store::CredentialKind::AccessToken, parsed->SignatureString());
    if (!stored.has_value()) {
        return fail(InvalidToken("unknown token"));
    }
    if (stored->Expired(store::Clock::now())) {
        return fail(InvalidToken("expired token"));
    }
    if (!stored->scope.Includes(requiredScope)) {
        return fail(InsufficientScope(requiredScope.String()));
    }

    BearerCheckResult r;
    r.ok = true;
    r.credential = std::move(stored);
    return r;
}

BearerCheckResult BearerValidator::Check(const Request& req, const ScopeSet& requiredScope) const {
    BearerError err;
    auto token = ExtractBearerToken(req, err);
    if (!token.has_value()) {
        return fail(err);
    }
    try {
        return Validate(token.value(), requiredScope);
    } catch (const std::exception& e) {
        LOG_ERROR("Bearer validation failed: {}", e.what());
        return fail(ServerError());
    }
}

const store::Credential* CurrentCredential() {
    return gCurrentCredential;
}

CredentialScope::CredentialScope(const store::Credential* credential) : prev(gCurrentCredential) {
    gCurrentCredential = credential;
}

CredentialScope::~CredentialScope() {
    gCurrentCredential = prev;
}

} // namespace oauth2::auth
