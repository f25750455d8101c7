//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Message.h
// Purpose: Conversation message entity and its content blocks
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "tfomcp/Identifiers.h"
#include "tfomcp/JSONRPCTypes.h"
#include "tfomcp/Protocol.h"

namespace tfomcp {

struct TextBlock {
    std::string text;
};

struct ToolUseBlock {
    std::string id;
    std::string name;
    JSONValue input{JSONValue::Object{}};
};

struct ToolResultBlock {
    std::string toolUseId;
    std::string content;
    bool isError = false;
};

using ContentBlock = std::variant<TextBlock, ToolUseBlock, ToolResultBlock>;

// Serializes one block ({type:"text",text} / {type:"tool_use",...} / {type:"tool_result",...}).
JSONValue ContentBlockToJSON(const ContentBlock& block);

//==========================================================================================================
// Message
// Purpose: One turn in a conversation.
//==========================================================================================================
class Message {
public:
    Message(Role role, std::vector<ContentBlock> content);

    static Message User(const std::string& text);
    static Message Assistant(const std::string& text);
    static Message System(const std::string& text);

    MessageId id;
    Role role;
    std::vector<ContentBlock> content;
    Timestamp createdAt;
    int64_t inputTokens = 0;
    int64_t outputTokens = 0;

    // Text blocks joined with "\n".
    std::string Text() const;
    std::vector<ToolUseBlock> ToolUses() const;
    bool HasToolUse() const;
    int64_t TotalTokens() const { return inputTokens + outputTokens; }

    // { role, content: [...] }; tool_result blocks always carry is_error.
    JSONValue ToApiFormat() const;
    // ToApiFormat plus id, createdAt and token counts.
    JSONValue ToJSON() const;
};

} // namespace tfomcp
