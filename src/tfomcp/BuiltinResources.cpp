//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: BuiltinResources.cpp
// Purpose: Built-in resources: server configuration, health status and file template
//==========================================================================================================

#include <filesystem>
#include <fstream>
#include <sstream>

#include "env/EnvVars.h"
#include "tfomcp/Builtins.h"

namespace fs = std::filesystem;

namespace tfomcp {

namespace {

bool isValidUtf8(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        std::size_t extra;
        if (c < 0x80) {
            extra = 0;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= s.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

ResourceContent readConfig(const Config& config, const std::string& uri) {
    JSONValue::Object server;
    server["name"] = MakeString(config.server.name);
    server["version"] = MakeString(config.server.version);
    server["transport"] = MakeString(config.server.transport);
    JSONValue::Object mcp;
    mcp["protocolVersion"] = MakeString(config.mcp.protocolVersion);
    mcp["enableTools"] = MakeBool(config.mcp.enableTools);
    mcp["enableResources"] = MakeBool(config.mcp.enableResources);
    mcp["enablePrompts"] = MakeBool(config.mcp.enablePrompts);
    JSONValue::Object root;
    root["server"] = MakeObject(std::move(server));
    root["mcp"] = MakeObject(std::move(mcp));
    return ResourceContent::Text(uri, MimeType::ApplicationJson, serializeJSONValue(JSONValue{root}));
}

ResourceContent readHealth(const std::weak_ptr<Session>& weak, const std::string& uri) {
    JSONValue::Object root;
    auto session = weak.lock();
    if (!session) {
        root["status"] = MakeString("not_ready");
        return ResourceContent::Text(uri, MimeType::ApplicationJson, serializeJSONValue(JSONValue{root}));
    }
    root["status"] = MakeString(session->IsReady() ? "healthy" : "not_ready");
    JSONValue::Object s;
    s["id"] = MakeString(session->Id().Value());
    s["state"] = MakeString(ToString(session->GetState()));
    s["toolCount"] = MakeInt(static_cast<int64_t>(session->ToolCount()));
    s["resourceCount"] = MakeInt(static_cast<int64_t>(session->ResourceCount()));
    s["promptCount"] = MakeInt(static_cast<int64_t>(session->PromptCount()));
    root["session"] = MakeObject(std::move(s));
    return ResourceContent::Text(uri, MimeType::ApplicationJson, serializeJSONValue(JSONValue{root}));
}

//==========================================================================================================
// File template reader
// Notes:
//   file:///tmp/a.txt reads /tmp/a.txt; without a file:// prefix the "path" parameter is used. Failures are
//   reported as text content beginning with "Error:". Content that is not valid UTF-8 is returned as a
//   base64 blob.
//==========================================================================================================
ResourceContent readFile(const std::string& uri, const JSONValue& params) {
    static const std::string scheme = "file://";
    std::string path;
    if (uri.rfind(scheme, 0) == 0) {
        path = uri.substr(scheme.size());
    } else {
        path = GetStringMember(params, "path").value_or("");
    }
    if (path.empty()) {
        return ResourceContent::Text(uri, MimeType::TextPlain, "Error: No file path specified");
    }
    if (path[0] == '~') {
        path = GetEnvOrDefault("HOME", "") + path.substr(1);
    }
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return ResourceContent::Text(uri, MimeType::TextPlain, "Error: File not found: " + path);
    }
    if (!fs::is_regular_file(path, ec)) {
        return ResourceContent::Text(uri, MimeType::TextPlain, "Error: Not a file: " + path);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return ResourceContent::Text(uri, MimeType::TextPlain, "Error reading file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string data = ss.str();
    if (!isValidUtf8(data)) {
        return ResourceContent::Blob(uri, MimeType::OctetStream, std::move(data));
    }
    return ResourceContent::Text(uri, MimeType::FromPath(path), std::move(data));
}

} // namespace

std::vector<Resource> CreateBuiltinResources(const std::weak_ptr<Session>& session, const Config& config) {
    std::vector<Resource> resources;
    resources.push_back(Resource::Create(
        "config://server", "Server Configuration", "Current server configuration", MimeType::ApplicationJson,
        MakeResourceReader([config](const std::string& uri, const JSONValue&) { return readConfig(config, uri); })));
    resources.push_back(Resource::Create(
        "status://health", "Health Status", "Server health status", MimeType::ApplicationJson,
        MakeResourceReader([session](const std::string& uri, const JSONValue&) { return readHealth(session, uri); })));
    resources.push_back(Resource::Template("file:///{path}", "File", "Read a file from the filesystem",
                                           MimeType::TextPlain, MakeResourceReader(readFile)));
    return resources;
}

} // namespace tfomcp
