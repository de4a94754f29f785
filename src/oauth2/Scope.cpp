//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/Scope.cpp
// Purpose: ScopeSet implementation
//==========================================================================================================

#include "oauth2/Scope.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace oauth2 {

ScopeSet::ScopeSet(std::initializer_list<std::string> list) {
    for (const auto& t : list) {
        (void)Add(t);
    }
}

ScopeSet ScopeSet::Parse(const std::string& text) {
    ScopeSet s;
    std::istringstream iss(text);
    std::string item;
    while (iss >> item) {
        (void)s.Add(item);
    }
    return s;
}

bool ScopeSet::Add(const std::string& token) {
    if (token.empty()) {
        return false;
    }
    bool hasSpace = std::any_of(token.begin(), token.end(), [](unsigned char c){ return std::isspace(c) != 0; });
    if (hasSpace || Contains(token)) {
        return false;
    }
    tokens.push_back(token);
    return true;
}

bool ScopeSet::Contains(const std::string& token) const {
    return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
}

bool ScopeSet::Includes(const ScopeSet& other) const {
    for (const auto& t : other.tokens) {
        if (!Contains(t)) {
            return false;
        }
    }
    return true;
}

std::string ScopeSet::String() const {
    std::string out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

bool ScopeSet::operator==(const ScopeSet& other) const {
    return tokens.size() == other.tokens.size() && Includes(other);
}

} // namespace oauth2
