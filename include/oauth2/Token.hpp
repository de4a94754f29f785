//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Token.hpp
// Purpose: HMAC-SHA256 signed opaque tokens
//==========================================================================================================
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace oauth2 {

//==========================================================================================================
// EntropyError
// Purpose: The secure random source could not produce key material. This is an operational fault of the
//          host, not a per-request protocol error.
//==========================================================================================================
class EntropyError : public std::runtime_error {
public:
    explicit EntropyError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// OpaqueToken
// Purpose: A random key and its HMAC-SHA256 signature (both raw bytes).
// Notes:
//   - String() is "base64url(key).base64url(signature)", URL safe and free of whitespace.
//   - SignatureString() is the server-side lookup key; the raw key is never persisted.
//==========================================================================================================
struct OpaqueToken {
    std::string key;
    std::string signature;

    std::string String() const;
    std::string SignatureString() const;
};

//==========================================================================================================
// TokenCodec
// Purpose: Mints and verifies opaque tokens with a process-wide secret fixed at construction.
//==========================================================================================================
class TokenCodec {
public:
    // Throws std::invalid_argument when secret is empty.
    explicit TokenCodec(std::string secret);

    //==========================================================================================================
    // Generate
    // Purpose: Draw keyLength bytes from the OpenSSL CSPRNG and sign them.
    // Throws:
    //   EntropyError when the random source fails; std::invalid_argument when keyLength is zero.
    //==========================================================================================================
    OpaqueToken Generate(std::size_t keyLength) const;

    //==========================================================================================================
    // Parse
    // Purpose: Decode a token string and verify its signature in constant time.
    // Args:
    //   text: Token string as presented by a client.
    //   errorMessage: Optional sink for a short reason on failure.
    // Returns:
    //   The token on success; std::nullopt when the string is structurally invalid or forged.
    //==========================================================================================================
    std::optional<OpaqueToken> Parse(const std::string& text, std::string* errorMessage = nullptr) const;

    // Canonical lookup key for a token (same as token.SignatureString()).
    static std::string SignatureOf(const OpaqueToken& token);

private:
    std::string sign(const std::string& key) const;

    std::string secret;
};

} // namespace oauth2
