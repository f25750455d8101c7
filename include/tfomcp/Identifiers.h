//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Identifiers.h
// Purpose: Validated value objects: entity identifiers, tool names/descriptions, resource URIs and
//          system prompts, plus timestamp helpers
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace tfomcp {

using Timestamp = std::chrono::system_clock::time_point;

// Current wall-clock time.
inline Timestamp Now() { return std::chrono::system_clock::now(); }

// ISO-8601 UTC rendering with millisecond precision, e.g. 2025-01-01T12:00:00.000Z
std::string FormatTimestamp(Timestamp t);

// Random RFC 4122 version-4 style token (lowercase hex, dashed).
std::string GenerateUuid();

//==========================================================================================================
// BasicId
// Purpose: Opaque, immutable, non-empty identifier. Tag distinguishes identifier kinds at compile time.
//==========================================================================================================
template <typename Tag>
class BasicId {
public:
    // Throws errors::ValidationError when value is empty.
    explicit BasicId(std::string value);

    static BasicId Generate() { return BasicId(GenerateUuid()); }

    const std::string& Value() const { return value_; }

    bool operator==(const BasicId& other) const { return value_ == other.value_; }
    bool operator!=(const BasicId& other) const { return value_ != other.value_; }
    bool operator<(const BasicId& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

struct SessionIdTag {};
struct ConversationIdTag {};
struct MessageIdTag {};

using SessionId = BasicId<SessionIdTag>;
using ConversationId = BasicId<ConversationIdTag>;
using MessageId = BasicId<MessageIdTag>;

extern template class BasicId<SessionIdTag>;
extern template class BasicId<ConversationIdTag>;
extern template class BasicId<MessageIdTag>;

//==========================================================================================================
// ToolName
// Purpose: Tool identifier matching ^[a-z][a-z0-9_]*$, at most 64 characters.
//==========================================================================================================
class ToolName {
public:
    static constexpr std::size_t MaxLength = 64;

    // Throws errors::ValidationError when the name violates the pattern or length.
    explicit ToolName(std::string value);

    static bool IsValid(const std::string& value);

    const std::string& Value() const { return value_; }
    bool operator==(const ToolName& other) const { return value_ == other.value_; }

private:
    std::string value_;
};

//==========================================================================================================
// ToolDescription
// Purpose: Non-empty tool description, at most 1024 characters.
//==========================================================================================================
class ToolDescription {
public:
    static constexpr std::size_t MaxLength = 1024;

    explicit ToolDescription(std::string value);

    const std::string& Value() const { return value_; }

private:
    std::string value_;
};

//==========================================================================================================
// ResourceURI
// Purpose: scheme://path URI with scheme in {file, config, status, http, https}.
// Notes:
//   IsTemplate() is a plain substring check: any '{' together with any '}' marks a template.
//==========================================================================================================
class ResourceURI {
public:
    explicit ResourceURI(std::string value);

    static bool IsValid(const std::string& value);

    const std::string& Value() const { return value_; }
    std::string Scheme() const;
    bool IsTemplate() const;
    // Portion of the URI before the first '{' (whole URI when no brace).
    std::string LiteralPrefix() const;

    bool operator==(const ResourceURI& other) const { return value_ == other.value_; }

private:
    std::string value_;
};

//==========================================================================================================
// SystemPrompt
// Purpose: Upstream system prompt, at most 100000 characters. Empty means blank after trimming.
//==========================================================================================================
class SystemPrompt {
public:
    static constexpr std::size_t MaxLength = 100000;

    SystemPrompt() = default;
    explicit SystemPrompt(std::string value);

    const std::string& Value() const { return value_; }
    bool IsEmpty() const;

private:
    std::string value_;
};

} // namespace tfomcp

namespace std {
template <typename Tag>
struct hash<tfomcp::BasicId<Tag>> {
    size_t operator()(const tfomcp::BasicId<Tag>& id) const noexcept {
        return hash<string>{}(id.Value());
    }
};
} // namespace std
