//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers backed by the project() version passed in from the build
//==========================================================================================================
#include "mcpbridge/version.h"

#include <fmt/format.h>

#ifndef MCPBRIDGE_VERSION_MAJOR
#error "MCPBRIDGE_VERSION_MAJOR/MINOR/PATCH must be defined by the build"
#endif

namespace mcpbridge {

VersionInfo getVersion() {
    return VersionInfo{MCPBRIDGE_VERSION_MAJOR, MCPBRIDGE_VERSION_MINOR, MCPBRIDGE_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcpbridge
