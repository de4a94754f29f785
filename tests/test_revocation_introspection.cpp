//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_revocation_introspection.cpp
// Purpose: GoogleTests for token revocation (RFC 7009) and introspection (RFC 7662)
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>

#include "TestSupport.hpp"

using namespace oauth2;
using namespace testsupport;
using store::CredentialKind;

namespace {

bool activeOf(const Response& res) {
    JSONValue doc = Body(res);
    const JSONValue* v = doc.Find("active");
    return v != nullptr && std::get<bool>(v->value);
}

} // namespace

TEST(Revocation, RevokesAccessAndRefreshTokens) {
    auto e = MakeEngine();
    Response issued = PasswordGrant(*e.engine);
    const std::string at = Field(issued, "access_token");
    const std::string rt = Field(issued, "refresh_token");

    Response res = e.engine->HandleRevocation(PostForm({{"token", at}}));
    EXPECT_EQ(res.status, 200);
    EXPECT_TRUE(res.body.empty());
    EXPECT_FALSE(e.store->Get(CredentialKind::AccessToken, SignatureOf(*e.engine, at)).has_value());

    res = e.engine->HandleRevocation(PostForm({{"token", rt}, {"token_type_hint", "refresh_token"}}));
    EXPECT_EQ(res.status, 200);
    EXPECT_FALSE(e.store->Get(CredentialKind::RefreshToken, SignatureOf(*e.engine, rt)).has_value());

    // revoking an unknown token is not an error
    res = e.engine->HandleRevocation(PostForm({{"token", at}}));
    EXPECT_EQ(res.status, 200);
}

TEST(Revocation, RejectsWrongClientBadHintAndMalformedToken) {
    auto e = MakeEngine();
    const std::string at = Field(PasswordGrant(*e.engine), "access_token");

    Response res = e.engine->HandleRevocation(PostForm({{"token", at}, {"client_id", kPublicClientID}}, ""));
    EXPECT_EQ(res.status, 401);
    EXPECT_EQ(Field(res, "error"), "invalid_client");
    EXPECT_TRUE(e.store->Get(CredentialKind::AccessToken, SignatureOf(*e.engine, at)).has_value());

    res = e.engine->HandleRevocation(PostForm({{"token", at}, {"token_type_hint", "id_token"}}));
    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(Field(res, "error"), "unsupported_token_type");

    res = e.engine->HandleRevocation(PostForm({{"token", "garbage"}}));
    EXPECT_EQ(Field(res, "error"), "invalid_request");

    res = e.engine->HandleRevocation(PostForm({{"token", at}}, BasicHeader(kClientID, "wrong")));
    EXPECT_EQ(Field(res, "error"), "invalid_client");
}

TEST(Introspection, LiveAccessTokenIsActive) {
    auto e = MakeEngine();
    Response issued = PasswordGrant(*e.engine, "foo bar");

    Response res = e.engine->HandleIntrospection(PostForm({{"token", Field(issued, "access_token")}}));
    ASSERT_EQ(res.status, 200) << res.body;
    EXPECT_TRUE(activeOf(res));
    EXPECT_EQ(Field(res, "scope"), "foo bar");
    EXPECT_EQ(Field(res, "client_id"), kClientID);
    EXPECT_EQ(Field(res, "username"), kUsername);
    EXPECT_EQ(Field(res, "token_type"), "access_token");
    JSONValue doc = Body(res);
    ASSERT_NE(doc.Find("exp"), nullptr);
    EXPECT_GT(std::get<int64_t>(doc.Find("exp")->value), 0);

    res = e.engine->HandleIntrospection(PostForm({{"token", Field(issued, "refresh_token")}}));
    EXPECT_TRUE(activeOf(res));
    EXPECT_EQ(Field(res, "token_type"), "refresh_token");
}

TEST(Introspection, UnknownExpiredAndRevokedTokensAreInactive) {
    auto e = MakeEngine();
    OpaqueToken unknown = e.engine->Codec().Generate(16);
    Response res = e.engine->HandleIntrospection(PostForm({{"token", unknown.String()}}));
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "{\"active\":false}");

    store::Credential c;
    c.clientID = kClientID;
    c.scope = ScopeSet{"foo"};
    c.expiresAt = store::Clock::now() - std::chrono::seconds(1);
    e.store->Put(CredentialKind::AccessToken, unknown.SignatureString(), c);
    res = e.engine->HandleIntrospection(PostForm({{"token", unknown.String()}}));
    EXPECT_FALSE(activeOf(res));

    const std::string at = Field(PasswordGrant(*e.engine), "access_token");
    (void)e.engine->HandleRevocation(PostForm({{"token", at}}));
    res = e.engine->HandleIntrospection(PostForm({{"token", at}}));
    EXPECT_FALSE(activeOf(res));
}

TEST(Introspection, OtherClientIsRejected) {
    auto e = MakeEngine();
    const std::string at = Field(PasswordGrant(*e.engine), "access_token");
    Response res = e.engine->HandleIntrospection(PostForm({{"token", at}, {"client_id", kPublicClientID}}, ""));
    EXPECT_EQ(res.status, 401);
    EXPECT_EQ(Field(res, "error_description"), "wrong client");
}
