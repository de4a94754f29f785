//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <exception>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUnsignedOrDefault
// Purpose: Reads an unsigned decimal environment variable. Unset, empty or non-numeric values yield
//          defaultValue.
//==========================================================================================================
inline unsigned long long GetEnvUnsignedOrDefault(const char* name, unsigned long long defaultValue) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return defaultValue;
    }
    for (char c : v) {
        if (c < '0' || c > '9') {
            return defaultValue;
        }
    }
    try {
        return std::stoull(v);
    } catch (const std::exception&) {
        return defaultValue;
    }
}
