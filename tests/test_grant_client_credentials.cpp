//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_grant_client_credentials.cpp
// Purpose: GoogleTests for the client credentials grant
//==========================================================================================================

#include <gtest/gtest.h>

#include "TestSupport.hpp"

using namespace oauth2;
using namespace testsupport;
using store::CredentialKind;

TEST(ClientCredentialsGrant, ConfidentialClientGetsTokenWithoutOwner) {
    auto e = MakeEngine();
    Response res = e.engine->HandleToken(PostForm({{"grant_type", "client_credentials"}, {"scope", "foo"}}));
    ASSERT_EQ(res.status, 200) << res.body;
    EXPECT_EQ(Field(res, "scope"), "foo");
    EXPECT_FALSE(Field(res, "access_token").empty());

    auto stored = e.store->Get(CredentialKind::AccessToken, SignatureOf(*e.engine, Field(res, "access_token")));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->clientID, kClientID);
    EXPECT_TRUE(stored->resourceOwnerID.empty());
}

TEST(ClientCredentialsGrant, FormCredentialsAreAccepted) {
    auto e = MakeEngine();
    Response res = e.engine->HandleToken(PostForm({{"grant_type", "client_credentials"},
                                                   {"client_id", kClientID},
                                                   {"client_secret", kClientSecret}}, ""));
    EXPECT_EQ(res.status, 200) << res.body;
}

TEST(ClientCredentialsGrant, PublicClientIsRejected) {
    auto e = MakeEngine();
    Response res = e.engine->HandleToken(PostForm({{"grant_type", "client_credentials"},
                                                   {"client_id", kPublicClientID}}, ""));
    EXPECT_EQ(res.status, 401);
    EXPECT_EQ(Field(res, "error"), "invalid_client");
    EXPECT_EQ(e.store->Count(CredentialKind::AccessToken), 0u);
}

TEST(ClientCredentialsGrant, ScopeOutsideAllowedIsInvalidScope) {
    auto e = MakeEngine();
    Response res = e.engine->HandleToken(PostForm({{"grant_type", "client_credentials"}, {"scope", "baz"}}));
    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(Field(res, "error"), "invalid_scope");
    EXPECT_EQ(e.store->Count(CredentialKind::AccessToken), 0u);
}
