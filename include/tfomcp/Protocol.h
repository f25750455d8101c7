//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Protocol.h
// Purpose: MCP protocol constants, method names and value vocabularies
//==========================================================================================================

#pragma once

#include "tfomcp/JSONRPCTypes.h"
#include <string>
#include <vector>

namespace tfomcp {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol vocabulary, implementation info, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version
constexpr const char* PROTOCOL_VERSION = "2024-11-05";
constexpr const char* JSONRPC_VERSION = "2.0";

// Default maximum accepted line length on the stdio transport (10 MiB)
constexpr std::size_t DEFAULT_MAX_MESSAGE_SIZE = 10u * 1024u * 1024u;

namespace ProtocolVersion {
    // Versions this server can negotiate.
    const std::vector<std::string>& Supported();
    bool IsSupported(const std::string& version);
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}

    JSONValue ToJSON() const;
    // Missing fields default to "unknown".
    static Implementation FromJSON(const JSONValue& v);
};

///////////////////////////////////////// Log levels ///////////////////////////////////////////
// MCP (syslog-style) log levels carried by logging/setLevel
enum class MCPLogLevel {
    Debug,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency
};

// Case-insensitive; unrecognised strings map to Info.
MCPLogLevel MCPLogLevelFromString(const std::string& s);
std::string ToString(MCPLogLevel level);

///////////////////////////////////////// Conversation vocabulary ///////////////////////////////////////////
enum class Role {
    User,
    Assistant,
    System
};

std::string ToString(Role role);
// Throws errors::ValidationError for unknown roles.
Role RoleFromString(const std::string& s);

enum class ContentType {
    Text,
    Image,
    ToolUse,
    ToolResult
};

std::string ToString(ContentType type);

///////////////////////////////////////// Models ///////////////////////////////////////////
namespace Model {
    constexpr const char* ClaudeOpus4 = "claude-opus-4-20250514";
    constexpr const char* ClaudeSonnet4 = "claude-sonnet-4-20250514";
    constexpr const char* Claude35Sonnet = "claude-3-5-sonnet-20241022";
    constexpr const char* Claude35Haiku = "claude-3-5-haiku-20241022";
    constexpr const char* Claude3Opus = "claude-3-opus-20240229";
    constexpr const char* Claude3Sonnet = "claude-3-sonnet-20240229";
    constexpr const char* Claude3Haiku = "claude-3-haiku-20240307";
    constexpr const char* Default = ClaudeSonnet4;

    const std::vector<std::string>& All();
    bool IsKnown(const std::string& model);
    // Returns the model name unchanged or throws errors::ValidationError.
    std::string Validate(const std::string& model);
}

///////////////////////////////////////// MIME types ///////////////////////////////////////////
namespace MimeType {
    constexpr const char* TextPlain = "text/plain";
    constexpr const char* TextMarkdown = "text/markdown";
    constexpr const char* ApplicationJson = "application/json";
    constexpr const char* OctetStream = "application/octet-stream";

    // Map a file extension (with or without the leading dot, any case) to a MIME type.
    std::string FromExtension(const std::string& extension);
    // Map a path's extension to a MIME type.
    std::string FromPath(const std::string& path);
    bool IsText(const std::string& mimeType);
}

///////////////////////////////////////// Method names ///////////////////////////////////////////
// MCP method names
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* Shutdown = "shutdown";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ListResourceTemplates = "resources/templates/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
    constexpr const char* SetLogLevel = "logging/setLevel";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace tfomcp
