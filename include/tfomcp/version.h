//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: version.h
// Purpose: Public version API for the TelemetryFlow MCP server
//==========================================================================================================
#pragma once

#include <string>

namespace tfomcp {

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

//==========================================================================================================
// getVersionString
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getVersionString();

// Multi-line banner printed by "tfo-mcp version".
std::string getVersionBanner();

} // namespace tfomcp
