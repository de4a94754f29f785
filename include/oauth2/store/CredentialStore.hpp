//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialStore.hpp
// Purpose: Credential records and the storage contract for issued tokens and authorization codes
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "oauth2/Scope.hpp"

namespace oauth2::store {

using Clock = std::chrono::system_clock;

enum class CredentialKind {
    AccessToken,
    RefreshToken,
    AuthorizationCode
};

// "access_token", "refresh_token" or "authorization_code".
const char* CredentialKindName(CredentialKind kind);

//==========================================================================================================
// Credential
// Purpose: One issued access token, refresh token or authorization code, keyed by its token signature.
// Fields:
//   resourceOwnerID: Empty for client-credentials tokens.
//   redirectURI: Authorization codes only; must be presented again unchanged at redemption.
//   parentCode: Signature of the authorization code this credential was derived from, if any.
//   used: Authorization codes only; flips to true exactly once.
//==========================================================================================================
struct Credential {
    std::string signature;
    CredentialKind kind{CredentialKind::AccessToken};
    std::string clientID;
    std::string resourceOwnerID;
    ScopeSet scope;
    Clock::time_point expiresAt{};
    std::string redirectURI;
    std::string parentCode;
    bool used{false};

    bool Expired(Clock::time_point now) const { return now >= expiresAt; }
};

//==========================================================================================================
// MarkUsedResult
// Purpose: Outcome of MarkUsed on an authorization code.
//   Marked: the code was unused and is now used.
//   Replayed: the code was already used; every credential derived from it has been revoked.
//   NotFound: no such code.
//==========================================================================================================
enum class MarkUsedResult {
    Marked,
    Replayed,
    NotFound
};

//==========================================================================================================
// ICredentialStore
// Purpose: Keyed lifecycle store, one keyspace per credential kind. Every operation is atomic with
//          respect to the others; implementations must never leave a partial write behind.
// Notes:
//   - Get returns expired entries as stored; callers compare expiresAt against the current time.
//   - Sweep only reclaims memory and never changes what callers observe.
//==========================================================================================================
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    // Throws std::invalid_argument on an empty or already present signature.
    virtual void Put(CredentialKind kind, const std::string& signature, const Credential& credential) = 0;

    virtual std::optional<Credential> Get(CredentialKind kind, const std::string& signature) const = 0;

    // Returns true when an entry was removed.
    virtual bool Delete(CredentialKind kind, const std::string& signature) = 0;

    // Marks an authorization code used, or on replay cascades revocation to its derived credentials.
    virtual MarkUsedResult MarkUsed(const std::string& codeSignature) = 0;

    // Deletes every access and refresh token whose parentCode equals codeSignature. Returns the count.
    virtual std::size_t RevokeByParentCode(const std::string& codeSignature) = 0;

    // Removes entries with expiresAt <= now. Returns the count.
    virtual std::size_t Sweep(Clock::time_point now) = 0;

    virtual std::size_t Count(CredentialKind kind) const = 0;
};

} // namespace oauth2::store
