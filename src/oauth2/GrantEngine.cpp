//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/GrantEngine.cpp
// Purpose: Grant flow state machines and token issuance
//==========================================================================================================

#include "oauth2/GrantEngine.hpp"

#include <initializer_list>
#include <optional>
#include <stdexcept>

#include "logging/Logger.h"
#include "oauth2/errors/Errors.h"

namespace oauth2 {

using store::Clock;
using store::Credential;
using store::CredentialKind;

namespace {
    const char* kAuthorizationNotice =
        "This authentication server does not provide an authorization form.\n"
        "Please submit the resource owners username and password in a POST request.";

    static ServerOptions validated(ServerOptions opts) {
        ValidateOptions(opts);
        return opts;
    }

    static bool knownTokenTypeHint(const std::string& hint) {
        return hint.empty() || hint == "access_token" || hint == "refresh_token";
    }

    static void logRejected(const char* endpoint, const std::exception& e) {
        if (dynamic_cast<const errors::OAuthError*>(&e) != nullptr) {
            LOG_INFO("{} request rejected: {}", endpoint, e.what());
        }
    }
}

GrantEngine::GrantEngine(ServerOptions opts,
                         std::shared_ptr<store::ICredentialStore> st,
                         std::shared_ptr<IDirectory> dir,
                         std::shared_ptr<ISecretVerifier> ver)
    : options(validated(std::move(opts))),
      codec(options.secret),
      credentialStore(std::move(st)),
      directory(std::move(dir)),
      verifier(std::move(ver)) {
    if (!credentialStore || !directory || !verifier) {
        throw std::invalid_argument("GrantEngine requires a store, a directory and a secret verifier");
    }
}

//----------------------------------------------------------------------------------------------------------
// Authorization endpoint
//----------------------------------------------------------------------------------------------------------
Response GrantEngine::HandleAuthorization(const Request& req) {
    Response res;
    AuthorizationRequest ar;
    try {
        ar = ParseAuthorizationRequest(req);
        if (ar.responseType != "token" && ar.responseType != "code") {
            throw errors::UnsupportedResponseType("unknown response type");
        }
        auto client = directory->LookupClient(ar.clientID);
        if (!client.has_value()) {
            throw errors::InvalidClient("unknown client");
        }
        if (client->redirectURI != ar.redirectURI) {
            throw errors::InvalidRequest("invalid redirect uri");
        }
    } catch (const EntropyError&) {
        throw;
    } catch (const std::exception& e) {
        logRejected("Authorization", e);
        WriteError(res, e);
        return res;
    }

    if (ar.method == "GET") {
        res.status = 200;
        res.headers["Content-Type"] = "text/plain; charset=utf-8";
        res.body = kAuthorizationNotice;
        return res;
    }

    const bool implicit = (ar.responseType == "token");
    try {
        if (implicit) {
            handleImplicitAuthorization(ar, res);
        } else {
            handleCodeAuthorization(ar, res);
        }
    } catch (const EntropyError&) {
        throw;
    } catch (const std::exception& e) {
        logRejected("Authorization", e);
        RedirectError(res, ar.redirectURI, ar.state, implicit, e);
    }
    return res;
}

void GrantEngine::handleImplicitAuthorization(const AuthorizationRequest& ar, Response& res) {
    if (!options.allowedScope.Includes(ar.scope)) {
        throw errors::InvalidScope("");
    }
    if (!authenticateOwner(ar.username, ar.password)) {
        throw errors::AccessDenied("");
    }

    // the implicit grant never yields a refresh token
    TokenResponse tr = issueTokens(false, ar.scope, ar.clientID, ar.username, std::string());
    tr.state = ar.state;
    tr.redirectURI = ar.redirectURI;
    tr.useFragment = true;
    WriteTokenResponse(res, tr);
}

void GrantEngine::handleCodeAuthorization(const AuthorizationRequest& ar, Response& res) {
    if (!options.allowedScope.Includes(ar.scope)) {
        throw errors::InvalidScope("");
    }
    if (!authenticateOwner(ar.username, ar.password)) {
        throw errors::AccessDenied("");
    }

    OpaqueToken code = codec.Generate(options.keyLength);

    Credential c;
    c.clientID = ar.clientID;
    c.resourceOwnerID = ar.username;
    c.scope = ar.scope;
    c.expiresAt = Clock::now() + options.authorizationCodeLifespan;
    c.redirectURI = ar.redirectURI;
    c.used = false;
    credentialStore->Put(CredentialKind::AuthorizationCode, code.SignatureString(), c);
    LOG_DEBUG("Issued authorization code for client '{}'", ar.clientID);

    CodeResponse cr;
    cr.code = code.String();
    cr.state = ar.state;
    cr.redirectURI = ar.redirectURI;
    WriteCodeResponse(res, cr);
}

//----------------------------------------------------------------------------------------------------------
// Token endpoint
//----------------------------------------------------------------------------------------------------------
Response GrantEngine::HandleToken(const Request& req) {
    Response res;
    try {
        TokenRequest tr = ParseTokenRequest(req);

        const std::string& gt = tr.grantType;
        if (gt != "password" && gt != "client_credentials" && gt != "authorization_code" && gt != "refresh_token") {
            throw errors::UnsupportedGrantType("unknown grant type");
        }
        if (gt == "refresh_token" && !options.refreshTokensEnabled) {
            throw errors::UnsupportedGrantType("refresh tokens are not enabled");
        }

        Client client = authenticateClient(tr.clientID, tr.clientSecret);

        TokenResponse out;
        if (gt == "password") {
            handlePasswordGrant(tr, out);
        } else if (gt == "client_credentials") {
            handleClientCredentialsGrant(client, tr, out);
        } else if (gt == "authorization_code") {
            handleAuthorizationCodeGrant(tr, out);
        } else {
            handleRefreshTokenGrant(tr, out);
        }
        WriteTokenResponse(res, out);
    } catch (const EntropyError&) {
        throw;
    } catch (const std::exception& e) {
        logRejected("Token", e);
        WriteError(res, e);
    }
    return res;
}

void GrantEngine::handlePasswordGrant(const TokenRequest& tr, TokenResponse& out) {
    if (!authenticateOwner(tr.username, tr.password)) {
        throw errors::AccessDenied("");
    }
    if (!options.allowedScope.Includes(tr.scope)) {
        throw errors::InvalidScope("");
    }
    out = issueTokens(true, tr.scope, tr.clientID, tr.username, std::string());
}

void GrantEngine::handleClientCredentialsGrant(const Client& client, const TokenRequest& tr, TokenResponse& out) {
    if (!client.Confidential()) {
        throw errors::InvalidClient("client credentials grant requires a confidential client");
    }
    if (!options.allowedScope.Includes(tr.scope)) {
        throw errors::InvalidScope("");
    }
    out = issueTokens(true, tr.scope, tr.clientID, std::string(), std::string());
}

void GrantEngine::handleAuthorizationCodeGrant(const TokenRequest& tr, TokenResponse& out) {
    OpaqueToken code = parseToken(tr.code);
    const std::string sig = code.SignatureString();

    std::lock_guard<std::mutex> lock(grantMutex);

    auto stored = credentialStore->Get(CredentialKind::AuthorizationCode, sig);
    if (!stored.has_value()) {
        throw errors::InvalidGrant("unknown authorization code");
    }
    if (stored->used) {
        // replay: everything previously derived from this code is revoked
        (void)credentialStore->MarkUsed(sig);
        throw errors::InvalidGrant("authorization code already used");
    }
    if (stored->Expired(Clock::now())) {
        throw errors::InvalidGrant("expired authorization code");
    }
    if (stored->clientID != tr.clientID) {
        throw errors::InvalidGrant("invalid authorization code ownership");
    }
    if (stored->redirectURI != tr.redirectURI) {
        throw errors::InvalidGrant("changed redirect uri");
    }
    if (tr.scopeGiven && !stored->scope.Includes(tr.scope)) {
        throw errors::InvalidScope("scope exceeds the originally granted scope");
    }
    const ScopeSet& granted = tr.scopeGiven ? tr.scope : stored->scope;

    out = issueTokens(true, granted, tr.clientID, stored->resourceOwnerID, sig);

    if (credentialStore->MarkUsed(sig) != store::MarkUsedResult::Marked) {
        // redeemed concurrently through another engine sharing the store
        (void)credentialStore->RevokeByParentCode(sig);
        throw errors::InvalidGrant("authorization code already used");
    }
}

void GrantEngine::handleRefreshTokenGrant(const TokenRequest& tr, TokenResponse& out) {
    OpaqueToken rt = parseToken(tr.refreshToken);
    const std::string sig = rt.SignatureString();

    std::lock_guard<std::mutex> lock(grantMutex);

    auto stored = credentialStore->Get(CredentialKind::RefreshToken, sig);
    if (!stored.has_value()) {
        throw errors::InvalidGrant("unknown refresh token");
    }
    if (stored->Expired(Clock::now())) {
        throw errors::InvalidGrant("expired refresh token");
    }
    if (stored->clientID != tr.clientID) {
        throw errors::InvalidGrant("invalid refresh token ownership");
    }
    if (tr.scopeGiven && !stored->scope.Includes(tr.scope)) {
        throw errors::InvalidScope("scope exceeds the originally granted scope");
    }
    const ScopeSet& granted = tr.scopeGiven ? tr.scope : stored->scope;

    // rotate: the presented token is consumed before its successor exists
    if (!credentialStore->Delete(CredentialKind::RefreshToken, sig)) {
        throw errors::InvalidGrant("unknown refresh token");
    }
    try {
        out = issueTokens(true, granted, tr.clientID, stored->resourceOwnerID, stored->parentCode);
    } catch (const std::exception&) {
        credentialStore->Put(CredentialKind::RefreshToken, sig, stored.value());
        throw;
    }
}

//----------------------------------------------------------------------------------------------------------
// Revocation and introspection
//----------------------------------------------------------------------------------------------------------
Response GrantEngine::HandleRevocation(const Request& req) {
    Response res;
    try {
        RevocationRequest rr = ParseRevocationRequest(req);
        if (!knownTokenTypeHint(rr.tokenTypeHint)) {
            throw errors::UnsupportedTokenType("");
        }
        (void)authenticateClient(rr.clientID, rr.clientSecret);
        const std::string sig = parseToken(rr.token).SignatureString();

        std::lock_guard<std::mutex> lock(grantMutex);
        for (CredentialKind kind : {CredentialKind::AccessToken, CredentialKind::RefreshToken}) {
            auto c = credentialStore->Get(kind, sig);
            if (!c.has_value()) {
                continue;
            }
            if (c->clientID != rr.clientID) {
                throw errors::InvalidClient("wrong client");
            }
            (void)credentialStore->Delete(kind, sig);
            LOG_DEBUG("Revoked {} of client '{}'", store::CredentialKindName(kind), rr.clientID);
        }
        res.status = 200;
    } catch (const EntropyError&) {
        throw;
    } catch (const std::exception& e) {
        logRejected("Revocation", e);
        WriteError(res, e);
    }
    return res;
}

Response GrantEngine::HandleIntrospection(const Request& req) {
    Response res;
    try {
        IntrospectionRequest ir = ParseIntrospectionRequest(req);
        if (!knownTokenTypeHint(ir.tokenTypeHint)) {
            throw errors::UnsupportedTokenType("");
        }
        (void)authenticateClient(ir.clientID, ir.clientSecret);
        const std::string sig = parseToken(ir.token).SignatureString();

        IntrospectionResponse out;
        const auto now = Clock::now();
        for (CredentialKind kind : {CredentialKind::AccessToken, CredentialKind::RefreshToken}) {
            auto c = credentialStore->Get(kind, sig);
            if (!c.has_value()) {
                continue;
            }
            if (c->clientID != ir.clientID) {
                throw errors::InvalidClient("wrong client");
            }
            if (c->Expired(now)) {
                continue;
            }
            out.active = true;
            out.scope = c->scope.String();
            out.clientID = c->clientID;
            out.username = c->resourceOwnerID;
            out.tokenType = store::CredentialKindName(kind);
            out.expiresAt = std::chrono::duration_cast<std::chrono::seconds>(c->expiresAt.time_since_epoch()).count();
        }
        WriteIntrospectionResponse(res, out);
    } catch (const EntropyError&) {
        throw;
    } catch (const std::exception& e) {
        logRejected("Introspection", e);
        WriteError(res, e);
    }
    return res;
}

std::size_t GrantEngine::SweepExpired() {
    return credentialStore->Sweep(Clock::now());
}

//----------------------------------------------------------------------------------------------------------
// Helpers
//----------------------------------------------------------------------------------------------------------
Client GrantEngine::authenticateClient(const std::string& clientID, const std::string& clientSecret) {
    auto client = directory->LookupClient(clientID);
    if (!client.has_value()) {
        throw errors::InvalidClient("unknown client");
    }
    if (client->Confidential() && !verifier->VerifySecret(client->secret.value(), clientSecret)) {
        throw errors::InvalidClient("unknown client");
    }
    return client.value();
}

bool GrantEngine::authenticateOwner(const std::string& username, const std::string& password) {
    if (username.empty()) {
        return false;
    }
    auto owner = directory->LookupResourceOwner(username);
    return owner.has_value() && verifier->VerifySecret(owner->secret, password);
}

OpaqueToken GrantEngine::parseToken(const std::string& text) const {
    std::string err;
    auto token = codec.Parse(text, &err);
    if (!token.has_value()) {
        throw errors::InvalidRequest(err);
    }
    return token.value();
}

TokenResponse GrantEngine::issueTokens(bool withRefreshToken, const ScopeSet& scope, const std::string& clientID,
                                       const std::string& resourceOwnerID, const std::string& parentCode) {
    const bool refresh = withRefreshToken && options.refreshTokensEnabled;

    OpaqueToken accessToken = codec.Generate(options.keyLength);
    std::optional<OpaqueToken> refreshToken;
    if (refresh) {
        refreshToken = codec.Generate(options.keyLength);
    }

    const auto now = Clock::now();

    Credential ac;
    ac.clientID = clientID;
    ac.resourceOwnerID = resourceOwnerID;
    ac.scope = scope;
    ac.expiresAt = now + options.accessTokenLifespan;
    ac.parentCode = parentCode;
    credentialStore->Put(CredentialKind::AccessToken, accessToken.SignatureString(), ac);

    if (refreshToken.has_value()) {
        Credential rc = ac;
        rc.expiresAt = now + options.refreshTokenLifespan;
        try {
            credentialStore->Put(CredentialKind::RefreshToken, refreshToken->SignatureString(), rc);
        } catch (const std::exception&) {
            (void)credentialStore->Delete(CredentialKind::AccessToken, accessToken.SignatureString());
            throw;
        }
    }

    TokenResponse tr;
    tr.tokenType = "bearer";
    tr.accessToken = accessToken.String();
    tr.expiresIn = static_cast<int64_t>(options.accessTokenLifespan.count());
    if (refreshToken.has_value()) {
        tr.refreshToken = refreshToken->String();
    }
    tr.scope = scope;

    LOG_DEBUG("Issued access token{} for client '{}'", refreshToken.has_value() ? " and refresh token" : "", clientID);
    return tr;
}

} // namespace oauth2
