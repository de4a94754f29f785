//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/Config.cpp
// Purpose: ServerOptions defaults, environment loading and validation
//==========================================================================================================

#include "oauth2/Config.hpp"

#include <cctype>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace oauth2 {

namespace {
    static bool parseFlag(const std::string& v, bool defaultValue) {
        std::string s;
        for (char c : v) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
        if (s == "0" || s == "false" || s == "no" || s == "off") return false;
        return defaultValue;
    }

    static std::chrono::seconds envSeconds(const char* name, std::chrono::seconds defaultValue) {
        auto v = GetEnvUnsignedOrDefault(name, static_cast<unsigned long long>(defaultValue.count()));
        return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(v));
    }
}

ServerOptions DefaultOptions(const std::string& secret, const ScopeSet& allowedScope) {
    ServerOptions opts;
    opts.secret = secret;
    opts.allowedScope = allowedScope;
    return opts;
}

ServerOptions LoadOptionsFromEnv() {
    ServerOptions opts = DefaultOptions(GetEnvOrDefault("OAUTH2_SECRET", std::string()),
                                        ScopeSet::Parse(GetEnvOrDefault("OAUTH2_ALLOWED_SCOPE", std::string())));
    opts.keyLength = static_cast<std::size_t>(GetEnvUnsignedOrDefault("OAUTH2_KEY_LENGTH", opts.keyLength));
    opts.accessTokenLifespan = envSeconds("OAUTH2_ACCESS_TOKEN_TTL", opts.accessTokenLifespan);
    opts.refreshTokenLifespan = envSeconds("OAUTH2_REFRESH_TOKEN_TTL", opts.refreshTokenLifespan);
    opts.authorizationCodeLifespan = envSeconds("OAUTH2_AUTHORIZATION_CODE_TTL", opts.authorizationCodeLifespan);
    opts.refreshTokensEnabled = parseFlag(GetEnvOrDefault("OAUTH2_REFRESH_TOKENS", std::string()), opts.refreshTokensEnabled);
    LOG_DEBUG("Options loaded: keyLength={} allowedScope='{}' refreshTokens={}",
              opts.keyLength, opts.allowedScope.String(), opts.refreshTokensEnabled);
    return opts;
}

void ValidateOptions(const ServerOptions& opts) {
    if (opts.secret.empty()) {
        throw std::invalid_argument("secret must not be empty");
    }
    if (opts.keyLength == 0) {
        throw std::invalid_argument("keyLength must be positive");
    }
    if (opts.keyLength > kMaxKeyLength) {
        throw std::invalid_argument("keyLength must not exceed " + std::to_string(kMaxKeyLength));
    }
    if (opts.accessTokenLifespan.count() <= 0) {
        throw std::invalid_argument("accessTokenLifespan must be positive");
    }
    if (opts.refreshTokensEnabled && opts.refreshTokenLifespan.count() <= 0) {
        throw std::invalid_argument("refreshTokenLifespan must be positive");
    }
    if (opts.authorizationCodeLifespan.count() <= 0) {
        throw std::invalid_argument("authorizationCodeLifespan must be positive");
    }
}

} // namespace oauth2
