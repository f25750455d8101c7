//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Protocol.cpp
// Purpose: Protocol vocabulary helpers (log levels, roles, models, MIME types)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "tfomcp/Protocol.h"
#include "tfomcp/errors/Errors.h"

namespace tfomcp {

namespace {
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

const std::vector<std::string>& ProtocolVersion::Supported() {
    static const std::vector<std::string> versions{PROTOCOL_VERSION};
    return versions;
}

bool ProtocolVersion::IsSupported(const std::string& version) {
    const auto& s = Supported();
    return std::find(s.begin(), s.end(), version) != s.end();
}

JSONValue Implementation::ToJSON() const {
    JSONValue::Object o;
    o["name"] = MakeString(name);
    o["version"] = MakeString(version);
    return JSONValue{o};
}

Implementation Implementation::FromJSON(const JSONValue& v) {
    return Implementation(GetStringMember(v, "name").value_or("unknown"),
                          GetStringMember(v, "version").value_or("unknown"));
}

MCPLogLevel MCPLogLevelFromString(const std::string& s) {
    static const std::unordered_map<std::string, MCPLogLevel> table{
        {"debug", MCPLogLevel::Debug},
        {"info", MCPLogLevel::Info},
        {"notice", MCPLogLevel::Notice},
        {"warning", MCPLogLevel::Warning},
        {"error", MCPLogLevel::Error},
        {"critical", MCPLogLevel::Critical},
        {"alert", MCPLogLevel::Alert},
        {"emergency", MCPLogLevel::Emergency},
    };
    auto it = table.find(toLower(s));
    return it == table.end() ? MCPLogLevel::Info : it->second;
}

std::string ToString(MCPLogLevel level) {
    switch (level) {
        case MCPLogLevel::Debug: return "debug";
        case MCPLogLevel::Info: return "info";
        case MCPLogLevel::Notice: return "notice";
        case MCPLogLevel::Warning: return "warning";
        case MCPLogLevel::Error: return "error";
        case MCPLogLevel::Critical: return "critical";
        case MCPLogLevel::Alert: return "alert";
        case MCPLogLevel::Emergency: return "emergency";
    }
    return "info";
}

std::string ToString(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::System: return "system";
    }
    return "user";
}

Role RoleFromString(const std::string& s) {
    const std::string v = toLower(s);
    if (v == "user") return Role::User;
    if (v == "assistant") return Role::Assistant;
    if (v == "system") return Role::System;
    throw errors::ValidationError("Invalid role: " + s);
}

std::string ToString(ContentType type) {
    switch (type) {
        case ContentType::Text: return "text";
        case ContentType::Image: return "image";
        case ContentType::ToolUse: return "tool_use";
        case ContentType::ToolResult: return "tool_result";
    }
    return "text";
}

const std::vector<std::string>& Model::All() {
    static const std::vector<std::string> models{
        ClaudeOpus4, ClaudeSonnet4, Claude35Sonnet, Claude35Haiku,
        Claude3Opus, Claude3Sonnet, Claude3Haiku
    };
    return models;
}

bool Model::IsKnown(const std::string& model) {
    const auto& all = All();
    return std::find(all.begin(), all.end(), model) != all.end();
}

std::string Model::Validate(const std::string& model) {
    if (!IsKnown(model)) {
        throw errors::ValidationError("Invalid model: " + model);
    }
    return model;
}

std::string MimeType::FromExtension(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> table{
        {"txt", "text/plain"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"js", "text/javascript"},
        {"mjs", "text/javascript"},
        {"md", "text/markdown"},
        {"markdown", "text/markdown"},
        {"csv", "text/csv"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"yaml", "application/x-yaml"},
        {"yml", "application/x-yaml"},
        {"pdf", "application/pdf"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
    };
    std::string ext = toLower(extension);
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    auto it = table.find(ext);
    return it == table.end() ? std::string(OctetStream) : it->second;
}

std::string MimeType::FromPath(const std::string& path) {
    const auto slash = path.find_last_of('/');
    const auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return OctetStream;
    }
    return FromExtension(path.substr(dot + 1));
}

bool MimeType::IsText(const std::string& mimeType) {
    return mimeType.rfind("text/", 0) == 0 ||
           mimeType == "application/json" ||
           mimeType == "application/xml" ||
           mimeType == "application/x-yaml" ||
           mimeType == "image/svg+xml";
}

} // namespace tfomcp
