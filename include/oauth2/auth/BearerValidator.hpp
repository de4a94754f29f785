//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BearerValidator.hpp
// Purpose: Bearer token validation for protected resources (RFC 6750)
//==========================================================================================================

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "oauth2/Request.hpp"
#include "oauth2/Response.hpp"
#include "oauth2/Scope.hpp"
#include "oauth2/Token.hpp"
#include "oauth2/store/CredentialStore.hpp"

namespace oauth2::auth {

//==========================================================================================================
// BearerError
// Purpose: Resource-side error object rendered into a WWW-Authenticate challenge.
// Fields:
//   name: invalid_request, invalid_token, insufficient_scope, or empty for a bare challenge.
//   status: 400, 401, 403, or 500 (server error, rendered without a challenge).
//==========================================================================================================
struct BearerError {
    std::string name;
    std::string description;
    std::string uri;
    std::string realm;
    std::string scope;
    int status{401};

    // Present fields keyed by their challenge parameter name.
    std::map<std::string, std::string> Map() const;

    // key="value" pairs sorted and joined with ", ".
    std::string Params() const;
};

BearerError InvalidRequest(const std::string& description);
BearerError InvalidToken(const std::string& description);
BearerError InsufficientScope(const std::string& necessaryScope);
BearerError ProtectedResource();
BearerError ServerError();

//==========================================================================================================
// WriteBearerError
// Purpose: Status plus "WWW-Authenticate: Bearer <params>" (realm="OAuth2" when there are none).
//          A missing error object or a server error yields a bare 500 without a challenge.
//==========================================================================================================
void WriteBearerError(Response& res, const std::optional<BearerError>& err);

//==========================================================================================================
// BearerCheckResult
// Purpose: Result of validating a bearer token.
// Fields:
//   ok: True if the token is live and carries the required scope.
//   error: Set on failure.
//   credential: Set on success; the stored access token record.
//==========================================================================================================
struct BearerCheckResult {
    bool ok{false};
    std::optional<BearerError> error;
    std::optional<store::Credential> credential;
};

//==========================================================================================================
// ExtractBearerToken
// Purpose: Locate the token in the Authorization header, the access_token form field (POST) or the
//          access_token query parameter.
// Returns:
//   The token, or an error: invalid_request when more than one source is used or the header is
//   malformed, a bare challenge when no token is present.
//==========================================================================================================
std::optional<std::string> ExtractBearerToken(const Request& req, BearerError& outError);

//==========================================================================================================
// BearerValidator
// Purpose: Checks a token against the codec (signature) and the store (liveness and scope).
//==========================================================================================================
class BearerValidator {
public:
    BearerValidator(TokenCodec codec, std::shared_ptr<store::ICredentialStore> store);

    BearerCheckResult Validate(const std::string& token, const ScopeSet& requiredScope) const;

    // ExtractBearerToken followed by Validate.
    BearerCheckResult Check(const Request& req, const ScopeSet& requiredScope) const;

private:
    TokenCodec codec;
    std::shared_ptr<store::ICredentialStore> credentialStore;
};

//==========================================================================================================
// Per-request credential context accessors
// Purpose: Expose the validated credential to protected handlers running on the same thread.
//==========================================================================================================
const store::Credential* CurrentCredential();

// RAII helper: sets the current credential for the lifetime of this object, then restores the previous one.
class CredentialScope {
public:
    explicit CredentialScope(const store::Credential* credential);
    ~CredentialScope();
    CredentialScope(const CredentialScope&) = delete;
    CredentialScope& operator=(const CredentialScope&) = delete;
private:
    const store::Credential* prev{nullptr};
};

} // namespace oauth2::auth
