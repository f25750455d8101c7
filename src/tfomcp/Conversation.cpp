//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Conversation.cpp
// Purpose: Conversation aggregate implementation
//==========================================================================================================

#include <mutex>

#include "tfomcp/Conversation.h"

namespace tfomcp {

std::string ToString(ConversationStatus status) {
    switch (status) {
        case ConversationStatus::Active: return "active";
        case ConversationStatus::Paused: return "paused";
        case ConversationStatus::Completed: return "completed";
        case ConversationStatus::Error: return "error";
    }
    return "active";
}

JSONValue ConversationSettings::ToJSON() const {
    JSONValue::Object o;
    o["max_tokens"] = MakeInt(maxTokens);
    o["temperature"] = MakeDouble(temperature);
    if (topP.has_value()) o["top_p"] = MakeDouble(topP.value());
    if (topK.has_value()) o["top_k"] = MakeInt(topK.value());
    if (!stopSequences.empty()) {
        JSONValue::Array seqs;
        for (const auto& s : stopSequences) seqs.push_back(MakeString(s));
        o["stop_sequences"] = MakeArray(std::move(seqs));
    }
    return JSONValue{o};
}

class Conversation::Impl {
public:
    Impl(std::string model, SystemPrompt systemPrompt, ConversationSettings settings, std::string sessionId)
        : id(ConversationId::Generate()), model(std::move(model)), systemPrompt(std::move(systemPrompt)),
          sessionId(std::move(sessionId)), settings(std::move(settings)), createdAt(Now()), updatedAt(createdAt) {}

    const ConversationId id;
    const std::string model;
    const SystemPrompt systemPrompt;
    const std::string sessionId;

    mutable std::mutex mutex;
    ConversationSettings settings;
    ConversationStatus status{ConversationStatus::Active};
    std::vector<Message> messages;
    int64_t totalInputTokens{0};
    int64_t totalOutputTokens{0};
    Timestamp createdAt;
    Timestamp updatedAt;
    DomainEventList events;
};

Conversation::Conversation(std::string model, SystemPrompt systemPrompt, ConversationSettings settings, std::string sessionId)
    : pImpl(std::make_unique<Impl>(std::move(model), std::move(systemPrompt), std::move(settings), std::move(sessionId))) {}

Conversation::~Conversation() = default;

std::shared_ptr<Conversation> Conversation::Create(const std::string& model, const std::string& systemPrompt,
                                                   ConversationSettings settings, const std::string& sessionId) {
    std::shared_ptr<Conversation> c(new Conversation(Model::Validate(model), SystemPrompt(systemPrompt),
                                                     std::move(settings), sessionId));
    std::lock_guard<std::mutex> lock(c->pImpl->mutex);
    c->pImpl->events.push_back(std::make_shared<ConversationCreated>(c->pImpl->id.Value(), sessionId, model));
    return c;
}

const ConversationId& Conversation::Id() const { return pImpl->id; }
const std::string& Conversation::GetModel() const { return pImpl->model; }
const SystemPrompt& Conversation::GetSystemPrompt() const { return pImpl->systemPrompt; }
const std::string& Conversation::SessionIdValue() const { return pImpl->sessionId; }

ConversationSettings Conversation::Settings() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->settings;
}

void Conversation::SetSettings(ConversationSettings settings) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->settings = std::move(settings);
    pImpl->updatedAt = Now();
}

ConversationStatus Conversation::Status() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->status;
}

void Conversation::SetStatus(ConversationStatus status) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->status = status;
    pImpl->updatedAt = Now();
}

void Conversation::AddMessage(const Message& message) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->messages.push_back(message);
    pImpl->totalInputTokens += message.inputTokens;
    pImpl->totalOutputTokens += message.outputTokens;
    pImpl->updatedAt = Now();
    pImpl->events.push_back(std::make_shared<MessageAdded>(
        pImpl->id.Value(), message.id.Value(), ToString(message.role), message.TotalTokens()));
}

std::vector<Message> Conversation::Messages() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->messages;
}

std::optional<Message> Conversation::LastMessage() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->messages.empty()) return std::nullopt;
    return pImpl->messages.back();
}

std::size_t Conversation::MessageCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->messages.size();
}

JSONValue Conversation::MessagesForApi() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    JSONValue::Array arr;
    for (const auto& m : pImpl->messages) arr.push_back(std::make_shared<JSONValue>(m.ToApiFormat()));
    return JSONValue{arr};
}

int64_t Conversation::TotalInputTokens() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->totalInputTokens;
}

int64_t Conversation::TotalOutputTokens() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->totalOutputTokens;
}

int64_t Conversation::TotalTokens() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->totalInputTokens + pImpl->totalOutputTokens;
}

Timestamp Conversation::CreatedAt() const { return pImpl->createdAt; }

Timestamp Conversation::UpdatedAt() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->updatedAt;
}

DomainEventList Conversation::GetEvents() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    DomainEventList out;
    out.swap(pImpl->events);
    return out;
}

JSONValue Conversation::ToJSON() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    JSONValue::Object o;
    o["id"] = MakeString(pImpl->id.Value());
    o["model"] = MakeString(pImpl->model);
    o["systemPrompt"] = MakeString(pImpl->systemPrompt.Value());
    o["messageCount"] = MakeInt(static_cast<int64_t>(pImpl->messages.size()));
    o["status"] = MakeString(ToString(pImpl->status));
    o["settings"] = std::make_shared<JSONValue>(pImpl->settings.ToJSON());
    o["totalInputTokens"] = MakeInt(pImpl->totalInputTokens);
    o["totalOutputTokens"] = MakeInt(pImpl->totalOutputTokens);
    o["createdAt"] = MakeString(FormatTimestamp(pImpl->createdAt));
    o["updatedAt"] = MakeString(FormatTimestamp(pImpl->updatedAt));
    return JSONValue{o};
}

} // namespace tfomcp
