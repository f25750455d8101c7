//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Events.h
// Purpose: Domain events raised by sessions, conversations and the tool invocation pipeline
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tfomcp/Identifiers.h"
#include "tfomcp/JSONRPCTypes.h"

namespace tfomcp {

//==========================================================================================================
// DomainEvent
// Purpose: Immutable record of something that happened. Subclasses add their payload to ToJSON().
// Fields:
//   eventId: Random unique id.
//   occurredAt: Creation time.
//   metadata: Free-form annotations (empty by default).
//==========================================================================================================
class DomainEvent {
public:
    DomainEvent();
    virtual ~DomainEvent() = default;

    virtual std::string EventType() const = 0;

    // { eventId, eventType, occurredAt, metadata, ...payload }
    JSONValue ToJSON() const;

    std::string eventId;
    Timestamp occurredAt;
    JSONValue::Object metadata;

protected:
    virtual void AppendPayload(JSONValue::Object& out) const = 0;
};

using DomainEventPtr = std::shared_ptr<const DomainEvent>;
using DomainEventList = std::vector<DomainEventPtr>;

class SessionCreated : public DomainEvent {
public:
    explicit SessionCreated(std::string sessionId) : sessionId(std::move(sessionId)) {}
    std::string EventType() const override { return "SessionCreated"; }

    std::string sessionId;

protected:
    void AppendPayload(JSONValue::Object& out) const override;
};

class SessionInitialized : public DomainEvent {
public:
    SessionInitialized(std::string sessionId, std::string clientName, std::string clientVersion, std::string protocolVersion)
        : sessionId(std::move(sessionId)), clientName(std::move(clientName)),
          clientVersion(std::move(clientVersion)), protocolVersion(std::move(protocolVersion)) {}
    std::string EventType() const override { return "SessionInitialized"; }

    std::string sessionId;
    std::string clientName;
    std::string clientVersion;
    std::string protocolVersion;

protected:
    void AppendPayload(JSONValue::Object& out) const override;
};

class SessionClosed : public DomainEvent {
public:
    SessionClosed(std::string sessionId, std::string reason = "")
        : sessionId(std::move(sessionId)), reason(std::move(reason)) {}
    std::string EventType() const override { return "SessionClosed"; }

    std::string sessionId;
    std::string reason;

protected:
    void AppendPayload(JSONValue::Object& out) const override;
};

class ConversationCreated : public DomainEvent {
public:
    ConversationCreated(std::string conversationId, std::string sessionId, std::string model)
        : conversationId(std::move(conversationId)), sessionId(std::move(sessionId)), model(std::move(model)) {}
    std::string EventType() const override { return "ConversationCreated"; }

    std::string conversationId;
    std::string sessionId;
    std::string model;

protected:
    void AppendPayload(JSONValue::Object& out) const override;
};

class MessageAdded : public DomainEvent {
public:
    MessageAdded(std::string conversationId, std::string messageId, std::string role, int64_t tokenCount)
        : conversationId(std::move(conversationId)), messageId(std::move(messageId)),
          role(std::move(role)), tokenCount(tokenCount) {}
    std::string EventType() const override { return "MessageAdded"; }

    std::string conversationId;
    std::string messageId;
    std::string role;
    int64_t tokenCount{0};

protected:
    void AppendPayload(JSONValue::Object& out) const override;
};

class ToolRegistered : public DomainEvent {
public:
    ToolRegistered(std::string sessionId, std::string toolName, std::string category)
        : sessionId(std::move(sessionId)), toolName(std::move(toolName)), category(std::move(category)) {}
    std::string EventType() const override { return "ToolRegistered"; }

    std::string sessionId;
    std::string toolName;
    std::string category;

protected:
    void AppendPayload(JSONValue::Object& out) const override;
};

class ToolExecuted : public DomainEvent {
public:
    ToolExecuted(std::string sessionId, std::string toolName, bool success, double durationMs,
                 std::string errorMessage = "")
        : sessionId(std::move(sessionId)), toolName(std::move(toolName)), success(success),
          durationMs(durationMs), errorMessage(std::move(errorMessage)) {}
    std::string EventType() const override { return "ToolExecuted"; }

    std::string sessionId;
    std::string toolName;
    bool success{false};
    double durationMs{0.0};
    // Omitted from ToJSON() when empty.
    std::string errorMessage;

protected:
    void AppendPayload(JSONValue::Object& out) const override;
};

} // namespace tfomcp
