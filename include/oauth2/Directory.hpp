//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Directory.hpp
// Purpose: Client and resource owner lookup contracts with in-memory reference implementations
//==========================================================================================================
#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace oauth2 {

//==========================================================================================================
// Client
// Purpose: A registered OAuth2 client.
// Fields:
//   secret: Absent for public clients; confidential clients must authenticate with it.
//   redirectURI: Registered redirect target, compared by exact string match.
//==========================================================================================================
struct Client {
    std::string id;
    std::optional<std::string> secret;
    std::string redirectURI;

    bool Confidential() const { return secret.has_value(); }
};

struct ResourceOwner {
    std::string username;
    std::string secret;
};

//==========================================================================================================
// IDirectory
// Purpose: Caller-supplied lookup of clients and resource owners. Implementations may throw
//          std::exception on backend failure; the engine reports that as server_error.
//==========================================================================================================
class IDirectory {
public:
    virtual ~IDirectory() = default;
    virtual std::optional<Client> LookupClient(const std::string& id) = 0;
    virtual std::optional<ResourceOwner> LookupResourceOwner(const std::string& username) = 0;
};

//==========================================================================================================
// ISecretVerifier
// Purpose: Compares a stored secret (or hash) with a presented one. Used for client and owner auth.
//==========================================================================================================
class ISecretVerifier {
public:
    virtual ~ISecretVerifier() = default;
    virtual bool VerifySecret(const std::string& stored, const std::string& presented) = 0;
};

// Thread-safe map-backed directory.
class InMemoryDirectory : public IDirectory {
public:
    void AddClient(const Client& client);
    void AddResourceOwner(const ResourceOwner& owner);

    std::optional<Client> LookupClient(const std::string& id) override;
    std::optional<ResourceOwner> LookupResourceOwner(const std::string& username) override;

private:
    std::mutex mutex;
    std::unordered_map<std::string, Client> clients;
    std::unordered_map<std::string, ResourceOwner> owners;
};

// Plain-text secrets compared with OpenSSL CRYPTO_memcmp (length is not hidden).
class ConstantTimeSecretVerifier : public ISecretVerifier {
public:
    bool VerifySecret(const std::string& stored, const std::string& presented) override;
};

} // namespace oauth2
