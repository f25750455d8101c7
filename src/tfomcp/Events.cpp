//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Events.cpp
// Purpose: Domain event serialization
//==========================================================================================================

#include "tfomcp/Events.h"

namespace tfomcp {

DomainEvent::DomainEvent() : eventId(GenerateUuid()), occurredAt(Now()) {}

JSONValue DomainEvent::ToJSON() const {
    JSONValue::Object o;
    o["eventId"] = MakeString(eventId);
    o["eventType"] = MakeString(EventType());
    o["occurredAt"] = MakeString(FormatTimestamp(occurredAt));
    o["metadata"] = MakeObject(metadata);
    AppendPayload(o);
    return JSONValue{o};
}

void SessionCreated::AppendPayload(JSONValue::Object& out) const {
    out["sessionId"] = MakeString(sessionId);
}

void SessionInitialized::AppendPayload(JSONValue::Object& out) const {
    out["sessionId"] = MakeString(sessionId);
    out["clientName"] = MakeString(clientName);
    out["clientVersion"] = MakeString(clientVersion);
    out["protocolVersion"] = MakeString(protocolVersion);
}

void SessionClosed::AppendPayload(JSONValue::Object& out) const {
    out["sessionId"] = MakeString(sessionId);
    out["reason"] = MakeString(reason);
}

void ConversationCreated::AppendPayload(JSONValue::Object& out) const {
    out["conversationId"] = MakeString(conversationId);
    out["sessionId"] = MakeString(sessionId);
    out["model"] = MakeString(model);
}

void MessageAdded::AppendPayload(JSONValue::Object& out) const {
    out["conversationId"] = MakeString(conversationId);
    out["messageId"] = MakeString(messageId);
    out["role"] = MakeString(role);
    out["tokenCount"] = MakeInt(tokenCount);
}

void ToolRegistered::AppendPayload(JSONValue::Object& out) const {
    out["sessionId"] = MakeString(sessionId);
    out["toolName"] = MakeString(toolName);
    out["category"] = MakeString(category);
}

void ToolExecuted::AppendPayload(JSONValue::Object& out) const {
    out["sessionId"] = MakeString(sessionId);
    out["toolName"] = MakeString(toolName);
    out["success"] = MakeBool(success);
    out["durationMs"] = MakeDouble(durationMs);
    if (!errorMessage.empty()) {
        out["errorMessage"] = MakeString(errorMessage);
    }
}

} // namespace tfomcp
