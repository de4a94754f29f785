//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: GoogleTests for server options: defaults, environment loading and validation
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

#include "TestSupport.hpp"
#include "oauth2/Config.hpp"

using namespace oauth2;

namespace {

//==========================================================================================================
// ScopedEnv
// Purpose: Set an environment variable for the lifetime of the object and unset it afterwards.
//==========================================================================================================
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(name); }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    const char* name;
};

} // namespace

TEST(Config, Defaults) {
    ServerOptions opts = DefaultOptions("s", ScopeSet{"foo"});
    EXPECT_EQ(opts.secret, "s");
    EXPECT_EQ(opts.keyLength, 16u);
    EXPECT_EQ(opts.allowedScope, ScopeSet{"foo"});
    EXPECT_EQ(opts.accessTokenLifespan, std::chrono::hours(1));
    EXPECT_EQ(opts.refreshTokenLifespan, std::chrono::hours(24 * 7));
    EXPECT_EQ(opts.authorizationCodeLifespan, std::chrono::minutes(10));
    EXPECT_TRUE(opts.refreshTokensEnabled);
    EXPECT_NO_THROW(ValidateOptions(opts));
}

TEST(Config, LoadFromEnvironment) {
    ScopedEnv secret("OAUTH2_SECRET", "env-secret");
    ScopedEnv keyLength("OAUTH2_KEY_LENGTH", "32");
    ScopedEnv scope("OAUTH2_ALLOWED_SCOPE", "read write");
    ScopedEnv access("OAUTH2_ACCESS_TOKEN_TTL", "120");
    ScopedEnv code("OAUTH2_AUTHORIZATION_CODE_TTL", "30");
    ScopedEnv refresh("OAUTH2_REFRESH_TOKENS", "off");

    ServerOptions opts = LoadOptionsFromEnv();
    EXPECT_EQ(opts.secret, "env-secret");
    EXPECT_EQ(opts.keyLength, 32u);
    EXPECT_EQ(opts.allowedScope, ScopeSet({"read", "write"}));
    EXPECT_EQ(opts.accessTokenLifespan, std::chrono::seconds(120));
    EXPECT_EQ(opts.authorizationCodeLifespan, std::chrono::seconds(30));
    EXPECT_EQ(opts.refreshTokenLifespan, std::chrono::hours(24 * 7));
    EXPECT_FALSE(opts.refreshTokensEnabled);
}

TEST(Config, MalformedNumbersFallBackToDefaults) {
    ScopedEnv keyLength("OAUTH2_KEY_LENGTH", "sixteen");
    ScopedEnv access("OAUTH2_ACCESS_TOKEN_TTL", "-5");
    ScopedEnv refresh("OAUTH2_REFRESH_TOKENS", "maybe");
    ServerOptions opts = LoadOptionsFromEnv();
    EXPECT_EQ(opts.keyLength, 16u);
    EXPECT_EQ(opts.accessTokenLifespan, std::chrono::hours(1));
    EXPECT_TRUE(opts.refreshTokensEnabled);
}

TEST(Config, ValidationRejectsUnusableOptions) {
    ServerOptions opts = DefaultOptions("", ScopeSet());
    EXPECT_THROW(ValidateOptions(opts), std::invalid_argument);

    opts = DefaultOptions("s", ScopeSet());
    opts.keyLength = 0;
    EXPECT_THROW(ValidateOptions(opts), std::invalid_argument);

    opts = DefaultOptions("s", ScopeSet());
    opts.keyLength = kMaxKeyLength + 1;
    EXPECT_THROW(ValidateOptions(opts), std::invalid_argument);
    opts.keyLength = kMaxKeyLength;
    EXPECT_NO_THROW(ValidateOptions(opts));

    opts = DefaultOptions("s", ScopeSet());
    opts.accessTokenLifespan = std::chrono::seconds(0);
    EXPECT_THROW(ValidateOptions(opts), std::invalid_argument);

    opts = DefaultOptions("s", ScopeSet());
    opts.refreshTokenLifespan = std::chrono::seconds(0);
    EXPECT_THROW(ValidateOptions(opts), std::invalid_argument);
    opts.refreshTokensEnabled = false;
    EXPECT_NO_THROW(ValidateOptions(opts));
}

TEST(Config, EngineRejectsInvalidOptionsAndMissingCollaborators) {
    ServerOptions bad = DefaultOptions("", ScopeSet());
    EXPECT_THROW(testsupport::MakeEngine(bad), std::invalid_argument);

    EXPECT_THROW(GrantEngine(testsupport::DefaultTestOptions(), nullptr,
                             std::make_shared<InMemoryDirectory>(),
                             std::make_shared<ConstantTimeSecretVerifier>()),
                 std::invalid_argument);
}

TEST(SecretVerifier, ConstantTimeComparison) {
    ConstantTimeSecretVerifier v;
    EXPECT_TRUE(v.VerifySecret("secret", "secret"));
    EXPECT_FALSE(v.VerifySecret("secret", "Secret"));
    EXPECT_FALSE(v.VerifySecret("secret", "secret2"));
    EXPECT_FALSE(v.VerifySecret("secret", ""));
}
