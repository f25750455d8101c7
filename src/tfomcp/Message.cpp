//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Message.cpp
// Purpose: Message entity implementation
//==========================================================================================================

#include "tfomcp/Message.h"

namespace tfomcp {

namespace {
JSONValue blockToJSON(const ContentBlock& block, bool alwaysIsError) {
    JSONValue::Object o;
    if (const auto* t = std::get_if<TextBlock>(&block)) {
        o["type"] = MakeString(ToString(ContentType::Text));
        o["text"] = MakeString(t->text);
    } else if (const auto* u = std::get_if<ToolUseBlock>(&block)) {
        o["type"] = MakeString(ToString(ContentType::ToolUse));
        o["id"] = MakeString(u->id);
        o["name"] = MakeString(u->name);
        o["input"] = std::make_shared<JSONValue>(u->input);
    } else if (const auto* r = std::get_if<ToolResultBlock>(&block)) {
        o["type"] = MakeString(ToString(ContentType::ToolResult));
        o["tool_use_id"] = MakeString(r->toolUseId);
        o["content"] = MakeString(r->content);
        if (alwaysIsError || r->isError) {
            o["is_error"] = MakeBool(r->isError);
        }
    }
    return JSONValue{o};
}
} // namespace

JSONValue ContentBlockToJSON(const ContentBlock& block) {
    return blockToJSON(block, false);
}

Message::Message(Role role, std::vector<ContentBlock> content)
    : id(MessageId::Generate()), role(role), content(std::move(content)), createdAt(Now()) {}

Message Message::User(const std::string& text) { return Message(Role::User, {TextBlock{text}}); }
Message Message::Assistant(const std::string& text) { return Message(Role::Assistant, {TextBlock{text}}); }
Message Message::System(const std::string& text) { return Message(Role::System, {TextBlock{text}}); }

std::string Message::Text() const {
    std::string out;
    bool first = true;
    for (const auto& block : content) {
        if (const auto* t = std::get_if<TextBlock>(&block)) {
            if (!first) out.push_back('\n');
            out += t->text;
            first = false;
        }
    }
    return out;
}

std::vector<ToolUseBlock> Message::ToolUses() const {
    std::vector<ToolUseBlock> out;
    for (const auto& block : content) {
        if (const auto* u = std::get_if<ToolUseBlock>(&block)) out.push_back(*u);
    }
    return out;
}

bool Message::HasToolUse() const {
    for (const auto& block : content) {
        if (std::holds_alternative<ToolUseBlock>(block)) return true;
    }
    return false;
}

JSONValue Message::ToApiFormat() const {
    JSONValue::Array blocks;
    for (const auto& block : content) {
        blocks.push_back(std::make_shared<JSONValue>(blockToJSON(block, true)));
    }
    JSONValue::Object o;
    o["role"] = MakeString(ToString(role));
    o["content"] = MakeArray(std::move(blocks));
    return JSONValue{o};
}

JSONValue Message::ToJSON() const {
    JSONValue v = ToApiFormat();
    auto& o = std::get<JSONValue::Object>(v.value);
    o["id"] = MakeString(id.Value());
    o["createdAt"] = MakeString(FormatTimestamp(createdAt));
    o["inputTokens"] = MakeInt(inputTokens);
    o["outputTokens"] = MakeInt(outputTokens);
    return v;
}

} // namespace tfomcp
