//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_grant_implicit.cpp
// Purpose: GoogleTests for the implicit grant (response_type=token)
//==========================================================================================================

#include <gtest/gtest.h>

#include "TestSupport.hpp"

using namespace oauth2;
using namespace testsupport;
using store::CredentialKind;

namespace {

Request implicitPost(const std::string& scope, const std::string& password) {
    Request req;
    req.method = "POST";
    req.form = {{"response_type", "token"},
                {"client_id", kClientID},
                {"redirect_uri", kRedirectURI},
                {"scope", scope},
                {"state", "foobar"},
                {"username", kUsername},
                {"password", password}};
    return req;
}

} // namespace

TEST(ImplicitGrant, TokenIsDeliveredInFragmentWithoutRefreshToken) {
    auto e = MakeEngine();
    Response res = e.engine->HandleAuthorization(implicitPost("foo", kPassword));
    ASSERT_EQ(res.status, 302) << res.body;

    const std::string location = res.Header("Location");
    EXPECT_EQ(location.rfind(std::string(kRedirectURI) + "#", 0), 0u) << location;

    auto params = RedirectParams(res, true);
    EXPECT_FALSE(params["access_token"].empty());
    EXPECT_EQ(params["token_type"], "bearer");
    EXPECT_EQ(params["expires_in"], "3600");
    EXPECT_EQ(params["scope"], "foo");
    EXPECT_EQ(params["state"], "foobar");
    EXPECT_EQ(params.count("refresh_token"), 0u);

    EXPECT_EQ(e.store->Count(CredentialKind::AccessToken), 1u);
    EXPECT_EQ(e.store->Count(CredentialKind::RefreshToken), 0u);
}

TEST(ImplicitGrant, InvalidScopeRedirectsInFragment) {
    auto e = MakeEngine();
    Response res = e.engine->HandleAuthorization(implicitPost("foo admin", kPassword));
    EXPECT_EQ(res.status, 302);
    EXPECT_EQ(res.Header("Location"), std::string(kRedirectURI) + "#error=invalid_scope&state=foobar");
    EXPECT_EQ(e.store->Count(CredentialKind::AccessToken), 0u);
}

TEST(ImplicitGrant, BadOwnerCredentialsRedirectAccessDenied) {
    auto e = MakeEngine();
    Response res = e.engine->HandleAuthorization(implicitPost("foo", "wrong"));
    EXPECT_EQ(res.status, 302);
    auto params = RedirectParams(res, true);
    EXPECT_EQ(params["error"], "access_denied");
    EXPECT_EQ(params["state"], "foobar");
}

TEST(ImplicitGrant, PublicClientMayUseImplicitFlow) {
    auto e = MakeEngine();
    Request req = implicitPost("foo", kPassword);
    req.form["client_id"] = kPublicClientID;
    Response res = e.engine->HandleAuthorization(req);
    ASSERT_EQ(res.status, 302);
    EXPECT_FALSE(RedirectParams(res, true)["access_token"].empty());
}
