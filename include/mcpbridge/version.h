//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the MCP bridge (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpbridge {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Returns the bridge's semantic version components.
VersionInfo getVersion();

// Returns the semantic version as "MAJOR.MINOR.PATCH"; also sent as clientInfo.version in initialize.
std::string getVersionString();

} // namespace mcpbridge
