//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_grant_refresh.cpp
// Purpose: GoogleTests for the refresh token grant: rotation, scope inheritance and rejection paths
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "TestSupport.hpp"

using namespace oauth2;
using namespace testsupport;
using store::CredentialKind;

namespace {

Response refresh(GrantEngine& engine, const std::string& token, const std::string& scope = std::string(),
                 const std::string& basic = BasicHeader(kClientID, kClientSecret)) {
    std::map<std::string, std::string> form{{"grant_type", "refresh_token"}, {"refresh_token", token}};
    if (!scope.empty()) {
        form["scope"] = scope;
    }
    return engine.HandleToken(PostForm(form, basic));
}

} // namespace

TEST(RefreshGrant, RotatesTokenAndInheritsScope) {
    auto e = MakeEngine();
    Response issued = PasswordGrant(*e.engine, "foo bar");
    ASSERT_EQ(issued.status, 200);
    const std::string oldRefresh = Field(issued, "refresh_token");

    Response res = refresh(*e.engine, oldRefresh);
    ASSERT_EQ(res.status, 200) << res.body;
    EXPECT_EQ(Field(res, "scope"), "foo bar");
    EXPECT_FALSE(Field(res, "access_token").empty());
    EXPECT_NE(Field(res, "access_token"), Field(issued, "access_token"));
    EXPECT_FALSE(Field(res, "refresh_token").empty());
    EXPECT_NE(Field(res, "refresh_token"), oldRefresh);

    EXPECT_FALSE(e.store->Get(CredentialKind::RefreshToken, SignatureOf(*e.engine, oldRefresh)).has_value());
    auto next = e.store->Get(CredentialKind::RefreshToken, SignatureOf(*e.engine, Field(res, "refresh_token")));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->resourceOwnerID, kUsername);

    // second use of the consumed token
    Response again = refresh(*e.engine, oldRefresh);
    EXPECT_EQ(again.status, 400);
    EXPECT_EQ(Field(again, "error"), "invalid_grant");
}

TEST(RefreshGrant, NarrowerScopeIsHonoredWiderIsRejected) {
    auto e = MakeEngine();
    Response issued = PasswordGrant(*e.engine, "foo");
    const std::string token = Field(issued, "refresh_token");

    Response wider = refresh(*e.engine, token, "foo bar");
    EXPECT_EQ(Field(wider, "error"), "invalid_scope");
    // a rejected request leaves the token usable
    EXPECT_TRUE(e.store->Get(CredentialKind::RefreshToken, SignatureOf(*e.engine, token)).has_value());

    Response same = refresh(*e.engine, token, "foo");
    ASSERT_EQ(same.status, 200) << same.body;
    EXPECT_EQ(Field(same, "scope"), "foo");
}

TEST(RefreshGrant, OtherClientCannotUseToken) {
    auto e = MakeEngine();
    const std::string token = Field(PasswordGrant(*e.engine), "refresh_token");

    Response res = e.engine->HandleToken(PostForm({{"grant_type", "refresh_token"},
                                                   {"refresh_token", token},
                                                   {"client_id", kPublicClientID}}, ""));
    EXPECT_EQ(Field(res, "error"), "invalid_grant");
    EXPECT_EQ(Field(res, "error_description"), "invalid refresh token ownership");
    EXPECT_TRUE(e.store->Get(CredentialKind::RefreshToken, SignatureOf(*e.engine, token)).has_value());
}

TEST(RefreshGrant, ExpiredAndUnknownTokensAreInvalidGrant) {
    auto e = MakeEngine();
    OpaqueToken token = e.engine->Codec().Generate(16);
    Response res = refresh(*e.engine, token.String());
    EXPECT_EQ(Field(res, "error_description"), "unknown refresh token");

    store::Credential c;
    c.clientID = kClientID;
    c.resourceOwnerID = kUsername;
    c.scope = ScopeSet{"foo"};
    c.expiresAt = store::Clock::now() - std::chrono::seconds(1);
    e.store->Put(CredentialKind::RefreshToken, token.SignatureString(), c);

    res = refresh(*e.engine, token.String());
    EXPECT_EQ(Field(res, "error"), "invalid_grant");
    EXPECT_EQ(Field(res, "error_description"), "expired refresh token");
    EXPECT_EQ(e.store->Count(CredentialKind::AccessToken), 0u);
}

TEST(RefreshGrant, ForgedTokenIsInvalidRequest) {
    auto e = MakeEngine();
    TokenCodec foreign("some-other-secret");
    Response res = refresh(*e.engine, foreign.Generate(16).String());
    EXPECT_EQ(Field(res, "error"), "invalid_request");
    EXPECT_EQ(Field(res, "error_description"), "invalid token signature");
}

//==========================================================================================================
// Concurrent presentations of one refresh token: exactly one rotation succeeds.
//==========================================================================================================
TEST(RefreshGrant, ConcurrentRotationHasSingleWinner) {
    auto e = MakeEngine();
    const std::string token = Field(PasswordGrant(*e.engine), "refresh_token");
    ASSERT_FALSE(token.empty());

    constexpr int kThreads = 16;
    std::atomic<int> ok{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            Response res = refresh(*e.engine, token);
            if (res.status == 200) {
                ok.fetch_add(1);
            } else if (Field(res, "error") == "invalid_grant") {
                rejected.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(ok.load(), 1);
    EXPECT_EQ(rejected.load(), kThreads - 1);
    EXPECT_EQ(e.store->Count(CredentialKind::RefreshToken), 1u);
}
