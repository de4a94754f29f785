//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/Encoding.cpp
// Purpose: Base64 (OpenSSL EVP block codec) and form encoding helpers
//==========================================================================================================

#include "oauth2/Encoding.hpp"

#include <sstream>
#include <vector>

#include <openssl/evp.h>

namespace oauth2 {

namespace {
    static bool isStdAlphabet(unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
    }

    static bool isUrlAlphabet(unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
    }

    static int hexValue(char h) {
        if (h >= '0' && h <= '9') return h - '0';
        if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
        if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
        return -1;
    }
}

std::string Base64Encode(const std::string& bytes) {
    if (bytes.empty()) {
        return std::string();
    }
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    int n = ::EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(bytes.data()),
                              static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n));
}

std::optional<std::string> Base64Decode(const std::string& text) {
    if (text.empty()) {
        return std::string();
    }
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }
    std::size_t padding = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '=') {
            // padding only in the last two positions
            if (i + 2 < text.size()) {
                return std::nullopt;
            }
            ++padding;
            continue;
        }
        if (padding > 0 || !isStdAlphabet(c)) {
            return std::nullopt;
        }
    }
    std::vector<unsigned char> out(3 * (text.size() / 4) + 1);
    int n = ::EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                              static_cast<int>(text.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the zero bytes produced by padding
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n) - padding);
}

std::string Base64UrlEncode(const std::string& bytes) {
    std::string s = Base64Encode(bytes);
    while (!s.empty() && s.back() == '=') {
        s.pop_back();
    }
    for (char& ch : s) {
        if (ch == '+') ch = '-';
        else if (ch == '/') ch = '_';
    }
    return s;
}

std::optional<std::string> Base64UrlDecode(const std::string& text) {
    if (text.size() % 4 == 1) {
        return std::nullopt;
    }
    std::string b64;
    b64.reserve(text.size() + 2);
    for (char ch : text) {
        if (!isUrlAlphabet(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        if (ch == '-') b64.push_back('+');
        else if (ch == '_') b64.push_back('/');
        else b64.push_back(ch);
    }
    while (b64.size() % 4 != 0) {
        b64.push_back('=');
    }
    auto decoded = Base64Decode(b64);
    if (!decoded.has_value()) {
        return std::nullopt;
    }
    // reject non-zero trailing bits
    if (Base64UrlEncode(decoded.value()) != text) {
        return std::nullopt;
    }
    return decoded;
}

std::string UrlEncode(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string UrlDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> ParseQueryString(const std::string& query) {
    std::map<std::string, std::string> out;
    std::stringstream ss(query);
    std::string kv;
    while (std::getline(ss, kv, '&')) {
        if (kv.empty()) {
            continue;
        }
        auto eq = kv.find('=');
        std::string key = UrlDecode((eq == std::string::npos) ? kv : kv.substr(0, eq));
        std::string val = (eq == std::string::npos) ? std::string() : UrlDecode(kv.substr(eq + 1));
        out.emplace(std::move(key), std::move(val));
    }
    return out;
}

std::string EncodeQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, val] : params) {
        if (!first) oss << '&';
        first = false;
        oss << UrlEncode(key) << '=' << UrlEncode(val);
    }
    return oss.str();
}

} // namespace oauth2
