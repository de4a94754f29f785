//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Scope.hpp
// Purpose: Permission scope set (RFC 6749 section 3.3)
//==========================================================================================================
#pragma once

#include <initializer_list>
#include <string>
#include <vector>

namespace oauth2 {

//==========================================================================================================
// ScopeSet
// Purpose: Ordered collection of distinct, non-empty scope tokens.
// Notes:
//   - Insertion order is kept for the textual form; equality and inclusion are set-based.
//   - The empty set is valid and means "no scope requested".
//==========================================================================================================
class ScopeSet {
public:
    ScopeSet() = default;
    ScopeSet(std::initializer_list<std::string> tokens);

    //==========================================================================================================
    // Parse
    // Purpose: Split on any whitespace, drop empty items and duplicates.
    //==========================================================================================================
    static ScopeSet Parse(const std::string& text);

    // Adds a token unless it is empty, contains whitespace or is already present. Returns true when added.
    bool Add(const std::string& token);

    bool Contains(const std::string& token) const;

    // True iff every token of other is present in this set. Any set includes the empty set.
    bool Includes(const ScopeSet& other) const;

    bool Empty() const { return tokens.empty(); }
    std::size_t Size() const { return tokens.size(); }

    // Space-separated canonical form; round-trips through Parse.
    std::string String() const;

    const std::vector<std::string>& Tokens() const { return tokens; }
    std::vector<std::string>::const_iterator begin() const { return tokens.begin(); }
    std::vector<std::string>::const_iterator end() const { return tokens.end(); }

    bool operator==(const ScopeSet& other) const;
    bool operator!=(const ScopeSet& other) const { return !(*this == other); }

private:
    std::vector<std::string> tokens;
};

} // namespace oauth2
