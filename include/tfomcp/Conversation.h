//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Conversation.h
// Purpose: Conversation aggregate used by the upstream chat tool
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tfomcp/Events.h"
#include "tfomcp/Identifiers.h"
#include "tfomcp/Message.h"

namespace tfomcp {

enum class ConversationStatus {
    Active,
    Paused,
    Completed,
    Error
};

std::string ToString(ConversationStatus status);

struct ConversationSettings {
    int64_t maxTokens = 4096;
    double temperature = 1.0;
    std::optional<double> topP;
    std::optional<int64_t> topK;
    std::vector<std::string> stopSequences;

    // { max_tokens, temperature, top_p?, top_k?, stop_sequences? }
    JSONValue ToJSON() const;
};

//==========================================================================================================
// Conversation
// Purpose: Ordered, append-only message log with running token totals.
// Notes:
//   Internally synchronized. Messages() returns a snapshot.
//==========================================================================================================
class Conversation {
public:
    // model is validated against the model catalogue; systemPrompt against SystemPrompt limits.
    static std::shared_ptr<Conversation> Create(const std::string& model = Model::Default,
                                                const std::string& systemPrompt = "",
                                                ConversationSettings settings = {},
                                                const std::string& sessionId = "");

    ~Conversation();
    Conversation(const Conversation&) = delete;
    Conversation& operator=(const Conversation&) = delete;

    const ConversationId& Id() const;
    const std::string& GetModel() const;
    const SystemPrompt& GetSystemPrompt() const;
    const std::string& SessionIdValue() const;
    ConversationSettings Settings() const;
    void SetSettings(ConversationSettings settings);
    ConversationStatus Status() const;
    void SetStatus(ConversationStatus status);

    // Appends, accumulates token totals and queues MessageAdded.
    void AddMessage(const Message& message);
    std::vector<Message> Messages() const;
    std::optional<Message> LastMessage() const;
    std::size_t MessageCount() const;
    // Messages in upstream API format.
    JSONValue MessagesForApi() const;

    int64_t TotalInputTokens() const;
    int64_t TotalOutputTokens() const;
    int64_t TotalTokens() const;
    Timestamp CreatedAt() const;
    Timestamp UpdatedAt() const;

    DomainEventList GetEvents();

    JSONValue ToJSON() const;

private:
    Conversation(std::string model, SystemPrompt systemPrompt, ConversationSettings settings, std::string sessionId);

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace tfomcp
