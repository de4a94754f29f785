//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/Directory.cpp
// Purpose: In-memory directory and secret verifier
//==========================================================================================================

#include "oauth2/Directory.hpp"

#include <openssl/crypto.h>

namespace oauth2 {

void InMemoryDirectory::AddClient(const Client& client) {
    std::lock_guard<std::mutex> lock(mutex);
    clients[client.id] = client;
}

void InMemoryDirectory::AddResourceOwner(const ResourceOwner& owner) {
    std::lock_guard<std::mutex> lock(mutex);
    owners[owner.username] = owner;
}

std::optional<Client> InMemoryDirectory::LookupClient(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = clients.find(id);
    if (it == clients.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ResourceOwner> InMemoryDirectory::LookupResourceOwner(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = owners.find(username);
    if (it == owners.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ConstantTimeSecretVerifier::VerifySecret(const std::string& stored, const std::string& presented) {
    if (stored.size() != presented.size()) {
        return false;
    }
    if (stored.empty()) {
        return true;
    }
    return ::CRYPTO_memcmp(stored.data(), presented.data(), stored.size()) == 0;
}

} // namespace oauth2
