//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryCredentialStore.hpp
// Purpose: Mutex-guarded in-memory reference implementation of ICredentialStore
//==========================================================================================================
#pragma once

#include <mutex>
#include <unordered_map>

#include "oauth2/store/CredentialStore.hpp"

namespace oauth2::store {

class InMemoryCredentialStore : public ICredentialStore {
public:
    InMemoryCredentialStore() = default;
    InMemoryCredentialStore(const InMemoryCredentialStore&) = delete;
    InMemoryCredentialStore& operator=(const InMemoryCredentialStore&) = delete;

    void Put(CredentialKind kind, const std::string& signature, const Credential& credential) override;
    std::optional<Credential> Get(CredentialKind kind, const std::string& signature) const override;
    bool Delete(CredentialKind kind, const std::string& signature) override;
    MarkUsedResult MarkUsed(const std::string& codeSignature) override;
    std::size_t RevokeByParentCode(const std::string& codeSignature) override;
    std::size_t Sweep(Clock::time_point now) override;
    std::size_t Count(CredentialKind kind) const override;

private:
    using Map = std::unordered_map<std::string, Credential>;

    Map& mapFor(CredentialKind kind);
    const Map& mapFor(CredentialKind kind) const;
    std::size_t revokeByParentCodeLocked(const std::string& codeSignature);
    bool hasDerivedLocked(const std::string& codeSignature) const;

    mutable std::mutex mutex;
    Map accessTokens;
    Map refreshTokens;
    Map authorizationCodes;
};

} // namespace oauth2::store
