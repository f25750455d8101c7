//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: version.cpp
// Purpose: Version helpers
//==========================================================================================================
#include "tfomcp/version.h"

#include <sstream>

#include "tfomcp/Protocol.h"

namespace tfomcp {

VersionInfo getVersion() {
    return VersionInfo{1, 1, 2};
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

std::string getVersionBanner() {
    std::ostringstream oss;
    oss << "TelemetryFlow MCP Server v" << getVersionString() << "\n"
        << "MCP Protocol: " << PROTOCOL_VERSION << "\n"
        << "C++ standard: " << __cplusplus;
    return oss.str();
}

} // namespace tfomcp
