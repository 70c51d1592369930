//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

namespace {
bool colorFromEnvironment() {
    const std::string v = GetEnvOrDefault("MCPBRIDGE_LOG_COLOR", "0");
    return (v == "1" || v == "true" || v == "TRUE");
}
}

// Define static members
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("MCPBRIDGE_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
bool Logger::sColorEnabled = colorFromEnvironment();
