//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version and the product token advertised by the HTTP adapter.
//==========================================================================================================
#pragma once

#include <string>

namespace oauth2 {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

//==========================================================================================================
// getServerBanner
// Purpose: Product token used for the HTTP "Server" header, e.g. "oauth2cpp/0.3.0".
//==========================================================================================================
std::string getServerBanner();

} // namespace oauth2
