//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Config.cpp
// Purpose: Configuration loading and validation
//==========================================================================================================

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "tfomcp/Config.h"
#include "tfomcp/errors/Errors.h"

namespace tfomcp {

namespace {

using errors::ValidationError;

std::string typeError(const std::string& section, const std::string& key, const char* expected) {
    return "Invalid value for " + section + "." + key + ": expected " + expected;
}

void readString(const JSONValue& sec, const std::string& section, const std::string& key, std::string& out) {
    const JSONValue* v = FindMember(sec, key);
    if (!v) return;
    if (!v->IsString()) throw ValidationError(typeError(section, key, "string"));
    out = std::get<std::string>(v->value);
}

void readBool(const JSONValue& sec, const std::string& section, const std::string& key, bool& out) {
    const JSONValue* v = FindMember(sec, key);
    if (!v) return;
    if (!std::holds_alternative<bool>(v->value)) throw ValidationError(typeError(section, key, "boolean"));
    out = std::get<bool>(v->value);
}

void readInt(const JSONValue& sec, const std::string& section, const std::string& key, int64_t& out) {
    const JSONValue* v = FindMember(sec, key);
    if (!v) return;
    if (!std::holds_alternative<int64_t>(v->value)) throw ValidationError(typeError(section, key, "integer"));
    out = std::get<int64_t>(v->value);
}

void readNumber(const JSONValue& sec, const std::string& section, const std::string& key, double& out) {
    const JSONValue* v = FindMember(sec, key);
    if (!v) return;
    if (std::holds_alternative<int64_t>(v->value)) {
        out = static_cast<double>(std::get<int64_t>(v->value));
    } else if (std::holds_alternative<double>(v->value)) {
        out = std::get<double>(v->value);
    } else {
        throw ValidationError(typeError(section, key, "number"));
    }
}

const JSONValue* section(const JSONValue& root, const std::string& name) {
    const JSONValue* s = FindMember(root, name);
    if (s && !s->IsObject()) throw ValidationError("Invalid section " + name + ": expected object");
    return s;
}

bool parseBoolEnv(const char* name, const std::string& v) {
    std::string s;
    for (char c : v) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw ValidationError(std::string("Invalid boolean in ") + name + ": " + v);
}

double parseDoubleEnv(const char* name, const std::string& v) {
    try {
        std::size_t pos = 0;
        double d = std::stod(v, &pos);
        if (pos == v.size()) return d;
    } catch (const std::exception&) {
        // falls through to the error below
    }
    throw ValidationError(std::string("Invalid number in ") + name + ": " + v);
}

int64_t parseIntEnv(const char* name, const std::string& v) {
    try {
        std::size_t pos = 0;
        long long n = std::stoll(v, &pos);
        if (pos == v.size()) return static_cast<int64_t>(n);
    } catch (const std::exception&) {
        // falls through to the error below
    }
    throw ValidationError(std::string("Invalid integer in ") + name + ": " + v);
}

} // namespace

std::vector<std::string> Config::DefaultSearchPaths() {
    std::vector<std::string> paths = {"tfo-mcp.json", "configs/tfo-mcp.json"};
    if (auto home = GetEnvOptional("HOME")) {
        paths.push_back(home.value() + "/.config/tfo-mcp/config.json");
    }
    paths.push_back("/etc/tfo-mcp/config.json");
    return paths;
}

std::optional<std::string> Config::FindDefaultFile() {
    std::error_code ec;
    for (const auto& p : DefaultSearchPaths()) {
        if (std::filesystem::is_regular_file(p, ec)) {
            return p;
        }
    }
    return std::nullopt;
}

Config Config::Load(const std::optional<std::string>& explicitPath) {
    Config cfg;
    if (explicitPath.has_value()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(explicitPath.value(), ec)) {
            throw ValidationError("Config file not found: " + explicitPath.value());
        }
        cfg = LoadFromFile(explicitPath.value());
    } else if (auto found = FindDefaultFile()) {
        cfg = LoadFromFile(found.value());
    }
    cfg.ApplyEnvironment();
    return cfg;
}

Config Config::LoadFromFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw ValidationError("Cannot open config file: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    JSONValue root;
    try {
        root = parseJSONValue(buf.str());
    } catch (const JSONParseError& e) {
        throw ValidationError("Invalid config file " + path + ": " + e.what());
    }
    Config cfg = FromJSON(root);
    cfg.sourcePath = path;
    LOG_DEBUG("Loaded configuration from {}", path);
    return cfg;
}

Config Config::FromJSON(const JSONValue& root) {
    if (!root.IsObject()) {
        throw ValidationError("Configuration root must be an object");
    }
    Config cfg;
    if (const JSONValue* s = section(root, "server")) {
        readString(*s, "server", "name", cfg.server.name);
        readString(*s, "server", "version", cfg.server.version);
        readString(*s, "server", "transport", cfg.server.transport);
        readBool(*s, "server", "debug", cfg.server.debug);
    }
    if (const JSONValue* s = section(root, "claude")) {
        readString(*s, "claude", "api_key", cfg.claude.apiKey);
        readString(*s, "claude", "default_model", cfg.claude.defaultModel);
        readInt(*s, "claude", "max_tokens", cfg.claude.maxTokens);
        readNumber(*s, "claude", "temperature", cfg.claude.temperature);
        readNumber(*s, "claude", "timeout", cfg.claude.timeout);
        readInt(*s, "claude", "max_retries", cfg.claude.maxRetries);
        if (const JSONValue* b = FindMember(*s, "base_url")) {
            if (b->IsString()) {
                cfg.claude.baseUrl = std::get<std::string>(b->value);
            } else if (!b->IsNull()) {
                throw ValidationError(typeError("claude", "base_url", "string"));
            }
        }
    }
    if (const JSONValue* s = section(root, "mcp")) {
        readString(*s, "mcp", "protocol_version", cfg.mcp.protocolVersion);
        readBool(*s, "mcp", "enable_tools", cfg.mcp.enableTools);
        readBool(*s, "mcp", "enable_resources", cfg.mcp.enableResources);
        readBool(*s, "mcp", "enable_prompts", cfg.mcp.enablePrompts);
        readBool(*s, "mcp", "enable_logging", cfg.mcp.enableLogging);
        readBool(*s, "mcp", "enable_sampling", cfg.mcp.enableSampling);
        readNumber(*s, "mcp", "tool_timeout", cfg.mcp.toolTimeout);
        readInt(*s, "mcp", "max_message_size", cfg.mcp.maxMessageSize);
        readInt(*s, "mcp", "worker_threads", cfg.mcp.workerThreads);
    }
    if (const JSONValue* s = section(root, "logging")) {
        readString(*s, "logging", "level", cfg.logging.level);
        readString(*s, "logging", "output", cfg.logging.output);
    }
    if (const JSONValue* s = section(root, "telemetry")) {
        readBool(*s, "telemetry", "enabled", cfg.telemetry.enabled);
        readString(*s, "telemetry", "service_name", cfg.telemetry.serviceName);
        readString(*s, "telemetry", "environment", cfg.telemetry.environment);
    }
    return cfg;
}

void Config::ApplyEnvironment() {
    if (auto v = GetEnvOptional("TFOMCP_SERVER_NAME")) server.name = v.value();
    if (auto v = GetEnvOptional("TFOMCP_SERVER_VERSION")) server.version = v.value();
    if (auto v = GetEnvOptional("TFOMCP_DEBUG")) server.debug = parseBoolEnv("TFOMCP_DEBUG", v.value());
    if (auto v = GetEnvOptional("TFOMCP_LOG_LEVEL")) logging.level = v.value();
    if (auto v = GetEnvOptional("TFOMCP_LOG_OUTPUT")) logging.output = v.value();
    if (auto v = GetEnvOptional("TFOMCP_TOOL_TIMEOUT")) mcp.toolTimeout = parseDoubleEnv("TFOMCP_TOOL_TIMEOUT", v.value());
    if (auto v = GetEnvOptional("TFOMCP_MAX_MESSAGE_SIZE")) {
        mcp.maxMessageSize = parseIntEnv("TFOMCP_MAX_MESSAGE_SIZE", v.value());
    }
    if (auto v = GetEnvOptional("TFOMCP_WORKER_THREADS")) {
        mcp.workerThreads = parseIntEnv("TFOMCP_WORKER_THREADS", v.value());
    }
    if (auto v = GetEnvOptional("TFOMCP_CLAUDE_API_KEY")) {
        claude.apiKey = v.value();
    } else if (claude.apiKey.empty()) {
        claude.apiKey = GetEnvOrDefault("ANTHROPIC_API_KEY", "");
    }
    if (auto v = GetEnvOptional("TFOMCP_CLAUDE_MODEL")) claude.defaultModel = v.value();
    if (auto v = GetEnvOptional("TFOMCP_TELEMETRY_ENABLED")) {
        telemetry.enabled = parseBoolEnv("TFOMCP_TELEMETRY_ENABLED", v.value());
    }
}

void Config::Validate() const {
    if (server.name.empty()) throw ValidationError("server.name must not be empty");
    if (server.transport != "stdio") {
        throw ValidationError("server.transport must be stdio, got: " + server.transport);
    }
    Model::Validate(claude.defaultModel);
    if (claude.maxTokens <= 0) throw ValidationError("claude.max_tokens must be positive");
    if (claude.temperature < 0.0 || claude.temperature > 2.0) {
        throw ValidationError("claude.temperature must be between 0.0 and 2.0");
    }
    if (claude.timeout <= 0.0) throw ValidationError("claude.timeout must be positive");
    if (claude.maxRetries < 0 || claude.maxRetries > 10) {
        throw ValidationError("claude.max_retries must be between 0 and 10");
    }
    if (!ProtocolVersion::IsSupported(mcp.protocolVersion)) {
        throw ValidationError("Unsupported mcp.protocol_version: " + mcp.protocolVersion);
    }
    if (mcp.toolTimeout <= 0.0) throw ValidationError("mcp.tool_timeout must be positive");
    if (mcp.maxMessageSize <= 0) throw ValidationError("mcp.max_message_size must be positive");
    if (mcp.workerThreads < 1 || mcp.workerThreads > 64) {
        throw ValidationError("mcp.worker_threads must be between 1 and 64");
    }
    if (logging.output.empty()) throw ValidationError("logging.output must not be empty");
}

JSONValue Config::ToJSON() const {
    JSONValue::Object s;
    s["name"] = MakeString(server.name);
    s["version"] = MakeString(server.version);
    s["transport"] = MakeString(server.transport);
    s["debug"] = MakeBool(server.debug);

    JSONValue::Object c;
    c["api_key"] = MakeString(claude.apiKey.empty() ? "" : "***");
    c["default_model"] = MakeString(claude.defaultModel);
    c["max_tokens"] = MakeInt(claude.maxTokens);
    c["temperature"] = MakeDouble(claude.temperature);
    c["timeout"] = MakeDouble(claude.timeout);
    c["max_retries"] = MakeInt(claude.maxRetries);
    c["base_url"] = claude.baseUrl.has_value() ? MakeString(claude.baseUrl.value()) : std::make_shared<JSONValue>(nullptr);

    JSONValue::Object m;
    m["protocol_version"] = MakeString(mcp.protocolVersion);
    m["enable_tools"] = MakeBool(mcp.enableTools);
    m["enable_resources"] = MakeBool(mcp.enableResources);
    m["enable_prompts"] = MakeBool(mcp.enablePrompts);
    m["enable_logging"] = MakeBool(mcp.enableLogging);
    m["enable_sampling"] = MakeBool(mcp.enableSampling);
    m["tool_timeout"] = MakeDouble(mcp.toolTimeout);
    m["max_message_size"] = MakeInt(mcp.maxMessageSize);
    m["worker_threads"] = MakeInt(mcp.workerThreads);

    JSONValue::Object l;
    l["level"] = MakeString(logging.level);
    l["output"] = MakeString(logging.output);

    JSONValue::Object t;
    t["enabled"] = MakeBool(telemetry.enabled);
    t["service_name"] = MakeString(telemetry.serviceName);
    t["environment"] = MakeString(telemetry.environment);

    JSONValue::Object root;
    root["server"] = MakeObject(std::move(s));
    root["claude"] = MakeObject(std::move(c));
    root["mcp"] = MakeObject(std::move(m));
    root["logging"] = MakeObject(std::move(l));
    root["telemetry"] = MakeObject(std::move(t));
    return JSONValue{root};
}

std::string Config::DefaultFileContents() {
    return R"({
  "server": {
    "name": "TelemetryFlow-MCP",
    "version": "1.1.2",
    "transport": "stdio",
    "debug": false
  },
  "claude": {
    "api_key": "",
    "default_model": "claude-sonnet-4-20250514",
    "max_tokens": 4096,
    "temperature": 1.0,
    "timeout": 120,
    "max_retries": 3
  },
  "mcp": {
    "protocol_version": "2024-11-05",
    "enable_tools": true,
    "enable_resources": true,
    "enable_prompts": true,
    "enable_logging": true,
    "enable_sampling": false,
    "tool_timeout": 30,
    "max_message_size": 10485760,
    "worker_threads": 4
  },
  "logging": {
    "level": "info",
    "output": "stderr"
  },
  "telemetry": {
    "enabled": false,
    "service_name": "telemetryflow-cpp-mcp",
    "environment": "production"
  }
}
)";
}

} // namespace tfomcp
