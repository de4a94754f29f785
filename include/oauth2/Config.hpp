//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.hpp
// Purpose: Authorization server options and environment loading
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "oauth2/Scope.hpp"

namespace oauth2 {

//==========================================================================================================
// ServerOptions
// Purpose: Immutable engine configuration.
// Fields:
//   secret: HMAC key for token signing. Never sent to clients.
//   keyLength: Random bytes per token key, at most kMaxKeyLength.
//   allowedScope: Upper bound for any requested scope.
//   refreshTokensEnabled: When false no refresh tokens are issued and the refresh_token grant is
//                         reported as unsupported.
//==========================================================================================================
inline constexpr std::size_t kMaxKeyLength = 1024;

struct ServerOptions {
    std::string secret;
    std::size_t keyLength{16};
    ScopeSet allowedScope;
    std::chrono::seconds accessTokenLifespan{3600};
    std::chrono::seconds refreshTokenLifespan{7 * 24 * 3600};
    std::chrono::seconds authorizationCodeLifespan{600};
    bool refreshTokensEnabled{true};
};

ServerOptions DefaultOptions(const std::string& secret, const ScopeSet& allowedScope);

//==========================================================================================================
// LoadOptionsFromEnv
// Purpose: Build options from OAUTH2_* environment variables, falling back to the defaults.
// Env:
//   OAUTH2_SECRET, OAUTH2_KEY_LENGTH, OAUTH2_ALLOWED_SCOPE, OAUTH2_ACCESS_TOKEN_TTL,
//   OAUTH2_REFRESH_TOKEN_TTL, OAUTH2_AUTHORIZATION_CODE_TTL (seconds), OAUTH2_REFRESH_TOKENS (0|1|true|false)
// Notes:
//   The result is not validated; call ValidateOptions before use.
//==========================================================================================================
ServerOptions LoadOptionsFromEnv();

// Throws std::invalid_argument naming the first offending field.
void ValidateOptions(const ServerOptions& opts);

} // namespace oauth2
