//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: EnvVars.h
// Purpose: Helpers to read environment variables used by configuration overrides.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
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
// GetEnvOptional
// Purpose: Returns the value of a set, non-empty environment variable.
// Args:
//   name: C-string name of the environment variable.
// Returns:
//   The value, or std::nullopt when the variable is unset or empty.
//==========================================================================================================
inline std::optional<std::string> GetEnvOptional(const char* name) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return std::nullopt;
    }
    return v;
}
