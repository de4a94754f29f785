//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Encoding.hpp
// Purpose: Base64/base64url and application/x-www-form-urlencoded helpers
//==========================================================================================================
#pragma once

#include <map>
#include <optional>
#include <string>

namespace oauth2 {

//==========================================================================================================
// Base64Encode / Base64Decode
// Purpose: Standard (RFC 4648 section 4) alphabet with '=' padding. Decoding returns std::nullopt on any
//          character outside the alphabet or on a length that is not a multiple of four.
//==========================================================================================================
std::string Base64Encode(const std::string& bytes);
std::optional<std::string> Base64Decode(const std::string& text);

//==========================================================================================================
// Base64UrlEncode / Base64UrlDecode
// Purpose: URL-safe alphabet (RFC 4648 section 5) without padding.
// Notes:
//   - Decoding is canonical-only: an input whose unused trailing bits are not zero is rejected, so every
//     byte string has exactly one accepted textual form.
//==========================================================================================================
std::string Base64UrlEncode(const std::string& bytes);
std::optional<std::string> Base64UrlDecode(const std::string& text);

// Percent-encode for form bodies, query strings and fragments (space becomes '+').
std::string UrlEncode(const std::string& s);

// Inverse of UrlEncode. Malformed escapes are kept literally.
std::string UrlDecode(const std::string& s);

//==========================================================================================================
// ParseQueryString
// Purpose: Split "a=1&b=2" into a map. When a key repeats, the first occurrence wins.
//==========================================================================================================
std::map<std::string, std::string> ParseQueryString(const std::string& query);

// Encode a parameter map as "k1=v1&k2=v2" with keys in sorted order.
std::string EncodeQueryString(const std::map<std::string, std::string>& params);

} // namespace oauth2
