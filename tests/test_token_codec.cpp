//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_token_codec.cpp
// Purpose: GoogleTests for opaque token generation and signature verification
//==========================================================================================================

#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <string>

#include "oauth2/Encoding.hpp"
#include "oauth2/Token.hpp"

using namespace oauth2;

TEST(TokenCodec, GeneratedTokenParsesBack) {
    TokenCodec codec("secret-one");
    OpaqueToken t = codec.Generate(16);
    EXPECT_EQ(t.key.size(), 16u);
    EXPECT_EQ(t.signature.size(), 32u);

    std::string err;
    auto parsed = codec.Parse(t.String(), &err);
    ASSERT_TRUE(parsed.has_value()) << err;
    EXPECT_EQ(parsed->key, t.key);
    EXPECT_EQ(parsed->SignatureString(), t.SignatureString());
    EXPECT_EQ(TokenCodec::SignatureOf(*parsed), t.SignatureString());
}

TEST(TokenCodec, WireFormatIsTwoUnpaddedSegments) {
    TokenCodec codec("secret-one");
    const std::string s = codec.Generate(16).String();
    auto dot = s.find('.');
    ASSERT_NE(dot, std::string::npos);
    EXPECT_EQ(s.find('.', dot + 1), std::string::npos);
    EXPECT_EQ(s.find('='), std::string::npos);
    EXPECT_EQ(s.find('+'), std::string::npos);
    EXPECT_EQ(s.find('/'), std::string::npos);
}

TEST(TokenCodec, TokensAreUnique) {
    TokenCodec codec("secret-one");
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        EXPECT_TRUE(seen.insert(codec.Generate(16).String()).second);
    }
}

TEST(TokenCodec, TokenFromAnotherSecretIsRejected) {
    TokenCodec a("secret-one");
    TokenCodec b("secret-two");
    std::string err;
    EXPECT_FALSE(b.Parse(a.Generate(16).String(), &err).has_value());
    EXPECT_EQ(err, "invalid token signature");
}

TEST(TokenCodec, TamperedKeyIsRejected) {
    TokenCodec codec("secret-one");
    OpaqueToken t = codec.Generate(16);
    t.key[0] = static_cast<char>(t.key[0] ^ 0x01);
    std::string err;
    EXPECT_FALSE(codec.Parse(t.String(), &err).has_value());
    EXPECT_EQ(err, "invalid token signature");
}

TEST(TokenCodec, EverySingleCharacterMutationIsRejected) {
    TokenCodec codec("secret-one");
    const std::string token = codec.Generate(16).String();
    const std::string alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_.";
    for (std::size_t i = 0; i < token.size(); ++i) {
        for (char c : alphabet) {
            if (c == token[i]) {
                continue;
            }
            std::string mutated = token;
            mutated[i] = c;
            EXPECT_FALSE(codec.Parse(mutated).has_value()) << "position " << i << " -> " << c;
        }
    }
}

TEST(TokenCodec, StructurallyInvalidInputs) {
    TokenCodec codec("secret-one");
    std::string err;
    EXPECT_FALSE(codec.Parse("", &err).has_value());
    EXPECT_EQ(err, "invalid token format");
    EXPECT_FALSE(codec.Parse("nodot", &err).has_value());
    EXPECT_EQ(err, "invalid token format");
    EXPECT_FALSE(codec.Parse("a.b.c", &err).has_value());
    EXPECT_EQ(err, "invalid token format");
    EXPECT_FALSE(codec.Parse("!!!.???", &err).has_value());
    EXPECT_EQ(err, "invalid token encoding");
    EXPECT_FALSE(codec.Parse(".AAAA", &err).has_value());
    EXPECT_EQ(err, "invalid token encoding");
    // well-formed key but a signature of the wrong length
    EXPECT_FALSE(codec.Parse(Base64UrlEncode("key") + "." + Base64UrlEncode("short"), &err).has_value());
    EXPECT_EQ(err, "invalid token signature");
}

TEST(TokenCodec, PaddedEncodingIsRejected) {
    TokenCodec codec("secret-one");
    OpaqueToken t = codec.Generate(16);
    // 16 bytes encode to 22 characters; the padded form must not be accepted
    const std::string padded = Base64UrlEncode(t.key) + "==." + Base64UrlEncode(t.signature);
    EXPECT_FALSE(codec.Parse(padded).has_value());
}

TEST(TokenCodec, InvalidConstruction) {
    EXPECT_THROW(TokenCodec(""), std::invalid_argument);
    TokenCodec codec("secret-one");
    EXPECT_THROW((void)codec.Generate(0), std::invalid_argument);
}
