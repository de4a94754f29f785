//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/store/InMemoryCredentialStore.cpp
// Purpose: In-memory credential store
//==========================================================================================================

#include "oauth2/store/InMemoryCredentialStore.hpp"

#include <initializer_list>
#include <stdexcept>

#include "logging/Logger.h"

namespace oauth2::store {

namespace {
    static std::size_t eraseIf(std::unordered_map<std::string, Credential>& m, Clock::time_point now) {
        std::size_t n = 0;
        for (auto it = m.begin(); it != m.end();) {
            if (it->second.Expired(now)) {
                it = m.erase(it);
                ++n;
            } else {
                ++it;
            }
        }
        return n;
    }
}

const char* CredentialKindName(CredentialKind kind) {
    switch (kind) {
        case CredentialKind::AccessToken: return "access_token";
        case CredentialKind::RefreshToken: return "refresh_token";
        case CredentialKind::AuthorizationCode: return "authorization_code";
    }
    return "unknown";
}

InMemoryCredentialStore::Map& InMemoryCredentialStore::mapFor(CredentialKind kind) {
    switch (kind) {
        case CredentialKind::AccessToken: return accessTokens;
        case CredentialKind::RefreshToken: return refreshTokens;
        case CredentialKind::AuthorizationCode: return authorizationCodes;
    }
    throw std::invalid_argument("unknown credential kind");
}

const InMemoryCredentialStore::Map& InMemoryCredentialStore::mapFor(CredentialKind kind) const {
    return const_cast<InMemoryCredentialStore*>(this)->mapFor(kind);
}

void InMemoryCredentialStore::Put(CredentialKind kind, const std::string& signature, const Credential& credential) {
    if (signature.empty()) {
        throw std::invalid_argument("credential signature must not be empty");
    }
    Credential c = credential;
    c.signature = signature;
    c.kind = kind;

    std::lock_guard<std::mutex> lock(mutex);
    auto [it, inserted] = mapFor(kind).emplace(signature, std::move(c));
    if (!inserted) {
        throw std::invalid_argument("duplicate credential signature");
    }
}

std::optional<Credential> InMemoryCredentialStore::Get(CredentialKind kind, const std::string& signature) const {
    std::lock_guard<std::mutex> lock(mutex);
    const Map& m = mapFor(kind);
    auto it = m.find(signature);
    if (it == m.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryCredentialStore::Delete(CredentialKind kind, const std::string& signature) {
    std::lock_guard<std::mutex> lock(mutex);
    return mapFor(kind).erase(signature) > 0;
}

MarkUsedResult InMemoryCredentialStore::MarkUsed(const std::string& codeSignature) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = authorizationCodes.find(codeSignature);
    if (it == authorizationCodes.end()) {
        return MarkUsedResult::NotFound;
    }
    if (!it->second.used) {
        it->second.used = true;
        return MarkUsedResult::Marked;
    }
    std::size_t n = revokeByParentCodeLocked(codeSignature);
    LOG_WARN("Authorization code replay detected; revoked {} derived credential(s)", n);
    return MarkUsedResult::Replayed;
}

std::size_t InMemoryCredentialStore::RevokeByParentCode(const std::string& codeSignature) {
    std::lock_guard<std::mutex> lock(mutex);
    return revokeByParentCodeLocked(codeSignature);
}

std::size_t InMemoryCredentialStore::revokeByParentCodeLocked(const std::string& codeSignature) {
    if (codeSignature.empty()) {
        return 0;
    }
    std::size_t n = 0;
    for (Map* m : {&accessTokens, &refreshTokens}) {
        for (auto it = m->begin(); it != m->end();) {
            if (it->second.parentCode == codeSignature) {
                it = m->erase(it);
                ++n;
            } else {
                ++it;
            }
        }
    }
    return n;
}

bool InMemoryCredentialStore::hasDerivedLocked(const std::string& codeSignature) const {
    for (const Map* m : {&accessTokens, &refreshTokens}) {
        for (const auto& [sig, c] : *m) {
            if (c.parentCode == codeSignature) {
                return true;
            }
        }
    }
    return false;
}

std::size_t InMemoryCredentialStore::Sweep(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t n = eraseIf(accessTokens, now) + eraseIf(refreshTokens, now);
    // a used code is kept while anything derived from it is alive so a late replay still cascades
    for (auto it = authorizationCodes.begin(); it != authorizationCodes.end();) {
        if (it->second.Expired(now) && (!it->second.used || !hasDerivedLocked(it->first))) {
            it = authorizationCodes.erase(it);
            ++n;
        } else {
            ++it;
        }
    }
    if (n > 0) {
        LOG_DEBUG("Credential sweep removed {} expired entries", n);
    }
    return n;
}

std::size_t InMemoryCredentialStore::Count(CredentialKind kind) const {
    std::lock_guard<std::mutex> lock(mutex);
    return mapFor(kind).size();
}

} // namespace oauth2::store
