//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Config.h
// Purpose: Server configuration: sections, JSON file loading, environment overrides and validation
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tfomcp/JSONRPCTypes.h"
#include "tfomcp/Protocol.h"

namespace tfomcp {

struct ServerConfig {
    std::string name = "TelemetryFlow-MCP";
    std::string version = "1.1.2";
    std::string transport = "stdio";
    bool debug = false;
};

struct ClaudeConfig {
    std::string apiKey;
    std::string defaultModel = Model::Default;
    int64_t maxTokens = 4096;
    double temperature = 1.0;
    double timeout = 120.0;
    int64_t maxRetries = 3;
    std::optional<std::string> baseUrl;
};

struct McpConfig {
    std::string protocolVersion = PROTOCOL_VERSION;
    bool enableTools = true;
    bool enableResources = true;
    bool enablePrompts = true;
    bool enableLogging = true;
    bool enableSampling = false;
    double toolTimeout = 30.0;
    int64_t maxMessageSize = static_cast<int64_t>(DEFAULT_MAX_MESSAGE_SIZE);
    int64_t workerThreads = 4;
};

struct LoggingConfig {
    std::string level = "info";
    // stderr, stdout or a file path
    std::string output = "stderr";
};

struct TelemetryConfig {
    bool enabled = false;
    std::string serviceName = "telemetryflow-cpp-mcp";
    std::string environment = "production";
};

//==========================================================================================================
// Config
// Purpose: Aggregated configuration.
// Notes:
//   Priority: environment variables > config file > defaults. Unknown keys are ignored; a known key
//   with the wrong JSON type raises errors::ValidationError naming "<section>.<key>".
//==========================================================================================================
struct Config {
    ServerConfig server;
    ClaudeConfig claude;
    McpConfig mcp;
    LoggingConfig logging;
    TelemetryConfig telemetry;

    // Path the configuration was read from (empty for defaults).
    std::string sourcePath;

    //==========================================================================================================
    // Load
    // Purpose: Resolve the config file, parse it, then apply environment overrides.
    // Args:
    //   explicitPath: --config value. When set, the file must exist.
    // Returns:
    //   Loaded configuration (not validated). Throws errors::ValidationError on a missing explicit file,
    //   malformed JSON or mistyped values.
    //==========================================================================================================
    static Config Load(const std::optional<std::string>& explicitPath = std::nullopt);

    static Config LoadFromFile(const std::string& path);
    static Config FromJSON(const JSONValue& root);

    // First existing default location, if any.
    static std::optional<std::string> FindDefaultFile();
    static std::vector<std::string> DefaultSearchPaths();

    void ApplyEnvironment();

    // Range checks; throws errors::ValidationError.
    void Validate() const;

    // Effective configuration; the API key is masked.
    JSONValue ToJSON() const;

    // Contents written by init-config.
    static std::string DefaultFileContents();
};

} // namespace tfomcp
