//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/errors/Errors.cpp
// Purpose: OAuthError implementation and code tables
//==========================================================================================================

#include "oauth2/errors/Errors.h"

namespace oauth2 {
namespace errors {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidRequest: return "invalid_request";
        case ErrorCode::InvalidClient: return "invalid_client";
        case ErrorCode::InvalidGrant: return "invalid_grant";
        case ErrorCode::InvalidScope: return "invalid_scope";
        case ErrorCode::UnauthorizedClient: return "unauthorized_client";
        case ErrorCode::UnsupportedGrantType: return "unsupported_grant_type";
        case ErrorCode::UnsupportedResponseType: return "unsupported_response_type";
        case ErrorCode::AccessDenied: return "access_denied";
        case ErrorCode::ServerError: return "server_error";
        case ErrorCode::TemporarilyUnavailable: return "temporarily_unavailable";
        case ErrorCode::UnsupportedTokenType: return "unsupported_token_type";
    }
    return "server_error";
}

int ErrorCodeStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidClient: return 401;
        case ErrorCode::AccessDenied: return 403;
        case ErrorCode::ServerError: return 500;
        case ErrorCode::TemporarilyUnavailable: return 503;
        default: return 400;
    }
}

OAuthError::OAuthError(ErrorCode c, std::string desc)
    : description(std::move(desc)), code(c) {
    message = ErrorCodeName(code);
    if (!description.empty()) {
        message += ": " + description;
    }
}

OAuthError& OAuthError::SetRedirect(const std::string& u, const std::string& st, bool fragment) {
    redirectURI = u;
    state = st;
    useFragment = fragment;
    return *this;
}

OAuthError& OAuthError::SetState(const std::string& st) {
    state = st;
    return *this;
}

OAuthError& OAuthError::SetURI(const std::string& u) {
    uri = u;
    return *this;
}

std::map<std::string, std::string> OAuthError::Map() const {
    std::map<std::string, std::string> m;
    m["error"] = ErrorCodeName(code);
    if (!description.empty()) {
        m["error_description"] = description;
    }
    if (!uri.empty()) {
        m["error_uri"] = uri;
    }
    if (!state.empty()) {
        m["state"] = state;
    }
    return m;
}

OAuthError InvalidRequest(const std::string& description) {
    return OAuthError(ErrorCode::InvalidRequest, description);
}

OAuthError InvalidClient(const std::string& description) {
    OAuthError e(ErrorCode::InvalidClient, description);
    e.headers["WWW-Authenticate"] = "Basic realm=\"OAuth2\"";
    return e;
}

OAuthError InvalidGrant(const std::string& description) {
    return OAuthError(ErrorCode::InvalidGrant, description);
}

OAuthError InvalidScope(const std::string& description) {
    return OAuthError(ErrorCode::InvalidScope, description);
}

OAuthError UnauthorizedClient(const std::string& description) {
    return OAuthError(ErrorCode::UnauthorizedClient, description);
}

OAuthError UnsupportedGrantType(const std::string& description) {
    return OAuthError(ErrorCode::UnsupportedGrantType, description);
}

OAuthError UnsupportedResponseType(const std::string& description) {
    return OAuthError(ErrorCode::UnsupportedResponseType, description);
}

OAuthError AccessDenied(const std::string& description) {
    return OAuthError(ErrorCode::AccessDenied, description);
}

OAuthError ServerError(const std::string& description) {
    return OAuthError(ErrorCode::ServerError, description);
}

OAuthError TemporarilyUnavailable(const std::string& description) {
    return OAuthError(ErrorCode::TemporarilyUnavailable, description);
}

OAuthError UnsupportedTokenType(const std::string& description) {
    return OAuthError(ErrorCode::UnsupportedTokenType, description);
}

} // namespace errors
} // namespace oauth2
