//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GrantEngine.hpp
// Purpose: OAuth2 authorization, token, revocation and introspection endpoints
//==========================================================================================================
#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "oauth2/Config.hpp"
#include "oauth2/Directory.hpp"
#include "oauth2/Request.hpp"
#include "oauth2/Response.hpp"
#include "oauth2/Token.hpp"
#include "oauth2/store/CredentialStore.hpp"

namespace oauth2 {

//==========================================================================================================
// GrantEngine
// Purpose: Runs the five grant flows against caller-supplied collaborators and the credential store.
// Notes:
//   - Handle* never throw protocol errors: every failure is rendered into the returned Response.
//   - EntropyError from token generation is not a protocol error and propagates to the caller.
//   - Code redemption and refresh rotation run under one engine-wide lock so a code or refresh
//     token cannot be consumed twice by concurrent requests.
//==========================================================================================================
class GrantEngine {
public:
    // Throws std::invalid_argument when options fail ValidateOptions or a collaborator is null.
    GrantEngine(ServerOptions options,
                std::shared_ptr<store::ICredentialStore> store,
                std::shared_ptr<IDirectory> directory,
                std::shared_ptr<ISecretVerifier> verifier);

    //==========================================================================================================
    // HandleAuthorization
    // Purpose: Authorization endpoint for response_type=code and response_type=token.
    // Notes:
    //   Errors before the redirect URI is verified are answered directly; later errors are redirected
    //   (query for code, fragment for token). A GET answers with an informational text only.
    //==========================================================================================================
    Response HandleAuthorization(const Request& req);

    //==========================================================================================================
    // HandleToken
    // Purpose: Token endpoint for the password, client_credentials, authorization_code and
    //          refresh_token grants. Errors are always answered directly as JSON.
    //==========================================================================================================
    Response HandleToken(const Request& req);

    // RFC 7009 token revocation.
    Response HandleRevocation(const Request& req);

    // RFC 7662 token introspection.
    Response HandleIntrospection(const Request& req);

    // Drops expired credentials from the store. Returns the number removed.
    std::size_t SweepExpired();

    const ServerOptions& Options() const { return options; }
    const TokenCodec& Codec() const { return codec; }
    std::shared_ptr<store::ICredentialStore> Store() const { return credentialStore; }

private:
    Client authenticateClient(const std::string& clientID, const std::string& clientSecret);
    bool authenticateOwner(const std::string& username, const std::string& password);

    void handlePasswordGrant(const TokenRequest& tr, TokenResponse& out);
    void handleClientCredentialsGrant(const Client& client, const TokenRequest& tr, TokenResponse& out);
    void handleAuthorizationCodeGrant(const TokenRequest& tr, TokenResponse& out);
    void handleRefreshTokenGrant(const TokenRequest& tr, TokenResponse& out);

    void handleImplicitAuthorization(const AuthorizationRequest& ar, Response& res);
    void handleCodeAuthorization(const AuthorizationRequest& ar, Response& res);

    TokenResponse issueTokens(bool withRefreshToken, const ScopeSet& scope, const std::string& clientID,
                              const std::string& resourceOwnerID, const std::string& parentCode);

    OpaqueToken parseToken(const std::string& text) const;

    ServerOptions options;
    TokenCodec codec;
    std::shared_ptr<store::ICredentialStore> credentialStore;
    std::shared_ptr<IDirectory> directory;
    std::shared_ptr<ISecretVerifier> verifier;
    std::mutex grantMutex;
};

} // namespace oauth2
