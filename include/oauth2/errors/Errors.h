//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Authorization and token endpoint error taxonomy (RFC 6749 sections 4.1.2.1 and 5.2, RFC 7009)
//==========================================================================================================

#pragma once

#include <exception>
#include <map>
#include <string>

namespace oauth2 {
namespace errors {

// Closed set of protocol error codes.
enum class ErrorCode {
    InvalidRequest,
    InvalidClient,
    InvalidGrant,
    InvalidScope,
    UnauthorizedClient,
    UnsupportedGrantType,
    UnsupportedResponseType,
    AccessDenied,
    ServerError,
    TemporarilyUnavailable,
    UnsupportedTokenType
};

// Wire name of a code, e.g. "invalid_request".
const char* ErrorCodeName(ErrorCode code);

// Fixed HTTP status of a code.
int ErrorCodeStatus(ErrorCode code);

//==========================================================================================================
// OAuthError
// Purpose: A classified protocol failure. Thrown by the grant engine at the point of detection and
//          rendered by the endpoint entry points (directly or by redirect).
// Fields:
//   description/uri/state: Optional wire fields (omitted when empty).
//   headers: Extra response headers (invalid_client carries a Basic challenge).
//   redirectURI/useFragment: When set, the error is delivered by redirect instead of a JSON body.
//==========================================================================================================
class OAuthError : public std::exception {
public:
    explicit OAuthError(ErrorCode code, std::string description = std::string());

    ErrorCode Code() const { return code; }
    const char* Name() const { return ErrorCodeName(code); }
    int Status() const { return ErrorCodeStatus(code); }

    // Marks the error for redirect delivery; state is echoed back to the client.
    OAuthError& SetRedirect(const std::string& uri, const std::string& st, bool fragment);
    OAuthError& SetState(const std::string& st);
    OAuthError& SetURI(const std::string& u);

    bool IsRedirect() const { return !redirectURI.empty(); }

    // Wire fields: error, error_description?, error_uri?, state?
    std::map<std::string, std::string> Map() const;

    const char* what() const noexcept override { return message.c_str(); }

    std::string description;
    std::string uri;
    std::string state;
    std::string redirectURI;
    bool useFragment{false};
    std::map<std::string, std::string> headers;

private:
    ErrorCode code;
    std::string message;
};

//----------------------------------------------------------------------------------------------------------
// Factories. Descriptions are human readable and may be empty.
//----------------------------------------------------------------------------------------------------------
OAuthError InvalidRequest(const std::string& description);
OAuthError InvalidClient(const std::string& description);
OAuthError InvalidGrant(const std::string& description);
OAuthError InvalidScope(const std::string& description);
OAuthError UnauthorizedClient(const std::string& description);
OAuthError UnsupportedGrantType(const std::string& description);
OAuthError UnsupportedResponseType(const std::string& description);
OAuthError AccessDenied(const std::string& description);
OAuthError ServerError(const std::string& description);
OAuthError TemporarilyUnavailable(const std::string& description);
OAuthError UnsupportedTokenType(const std::string& description);

} // namespace errors
} // namespace oauth2
