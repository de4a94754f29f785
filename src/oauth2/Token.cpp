//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/Token.cpp
// Purpose: Opaque token generation and verification (OpenSSL HMAC-SHA256, RAND_bytes, CRYPTO_memcmp)
//==========================================================================================================

#include "oauth2/Token.hpp"

#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include "logging/Logger.h"
#include "oauth2/Encoding.hpp"

namespace oauth2 {

namespace {
    constexpr std::size_t kSignatureLength = 32; // SHA-256 digest size

    static void setError(std::string* sink, const char* msg) {
        if (sink != nullptr) {
            *sink = msg;
        }
    }
}

std::string OpaqueToken::String() const {
    return Base64UrlEncode(key) + "." + Base64UrlEncode(signature);
}

std::string OpaqueToken::SignatureString() const {
    return Base64UrlEncode(signature);
}

TokenCodec::TokenCodec(std::string s) : secret(std::move(s)) {
    if (secret.empty()) {
        throw std::invalid_argument("token secret must not be empty");
    }
}

std::string TokenCodec::sign(const std::string& key) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    unsigned char* r = ::HMAC(::EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
                              reinterpret_cast<const unsigned char*>(key.data()), key.size(), digest, &len);
    if (r == nullptr || len != kSignatureLength) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), len);
}

OpaqueToken TokenCodec::Generate(std::size_t keyLength) const {
    if (keyLength == 0) {
        throw std::invalid_argument("token key length must be positive");
    }
    std::vector<unsigned char> buf(keyLength);
    if (::RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        LOG_ERROR("TokenCodec: RAND_bytes failed for {} bytes", keyLength);
        throw EntropyError("secure random source exhausted");
    }
    OpaqueToken t;
    t.key.assign(reinterpret_cast<const char*>(buf.data()), buf.size());
    ::OPENSSL_cleanse(buf.data(), buf.size());
    t.signature = sign(t.key);
    return t;
}

std::optional<OpaqueToken> TokenCodec::Parse(const std::string& text, std::string* errorMessage) const {
    auto dot = text.find('.');
    if (text.empty() || dot == std::string::npos || text.find('.', dot + 1) != std::string::npos) {
        setError(errorMessage, "invalid token format");
        return std::nullopt;
    }

    auto key = Base64UrlDecode(text.substr(0, dot));
    auto signature = Base64UrlDecode(text.substr(dot + 1));
    if (!key.has_value() || !signature.has_value() || key->empty()) {
        setError(errorMessage, "invalid token encoding");
        return std::nullopt;
    }
    if (signature->size() != kSignatureLength) {
        setError(errorMessage, "invalid token signature");
        return std::nullopt;
    }

    const std::string expected = sign(key.value());
    if (::CRYPTO_memcmp(expected.data(), signature->data(), kSignatureLength) != 0) {
        setError(errorMessage, "invalid token signature");
        return std::nullopt;
    }

    OpaqueToken t;
    t.key = std::move(key.value());
    t.signature = std::move(signature.value());
    return t;
}

std::string TokenCodec::SignatureOf(const OpaqueToken& token) {
    return token.SignatureString();
}

} // namespace oauth2
