//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: ConversationService.cpp
// Purpose: Conversation application service
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "tfomcp/ConversationService.h"
#include "tfomcp/errors/Errors.h"

namespace tfomcp {

namespace {
template <typename T>
std::vector<T> page(const std::vector<T>& items, std::size_t offset, std::size_t limit) {
    if (offset >= items.size()) return {};
    const std::size_t end = std::min(items.size(), offset + limit);
    return std::vector<T>(items.begin() + static_cast<std::ptrdiff_t>(offset),
                          items.begin() + static_cast<std::ptrdiff_t>(end));
}
} // namespace

ConversationService::ConversationService(std::shared_ptr<IConversationRepository> repository,
                                         std::shared_ptr<IChatService> chat)
    : repository_(std::move(repository)), chat_(std::move(chat)) {}

std::shared_ptr<Conversation> ConversationService::Create(const CreateConversationOptions& options) {
    LOG_INFO("Creating conversation: model={}", options.model);
    ConversationSettings settings;
    settings.maxTokens = options.maxTokens;
    settings.temperature = options.temperature;
    auto conversation = Conversation::Create(options.model, options.systemPrompt, settings, options.sessionId);
    repository_->Save(conversation).get();
    LOG_INFO("Conversation created: id={}", conversation->Id().Value());
    return conversation;
}

std::shared_ptr<Conversation> ConversationService::require(const std::string& conversationId) {
    auto conversation = repository_->GetById(conversationId).get();
    if (!conversation) {
        throw errors::ValidationError("Conversation not found: " + conversationId);
    }
    return conversation;
}

ChatRequest ConversationService::buildRequest(const Conversation& conversation,
                                              const std::vector<JSONValue>& tools) const {
    ChatRequest request;
    request.messages = conversation.Messages();
    request.model = conversation.GetModel();
    if (!conversation.GetSystemPrompt().IsEmpty()) {
        request.systemPrompt = conversation.GetSystemPrompt().Value();
    }
    const ConversationSettings settings = conversation.Settings();
    request.maxTokens = settings.maxTokens;
    request.temperature = settings.temperature;
    request.tools = tools;
    return request;
}

Message ConversationService::SendMessage(const std::string& conversationId, const std::string& text,
                                         const std::vector<JSONValue>& tools) {
    LOG_INFO("Sending message: conversation={}", conversationId);
    auto conversation = require(conversationId);
    conversation->AddMessage(Message::User(text));

    Message response = chat_->CreateMessage(buildRequest(*conversation, tools));
    conversation->AddMessage(response);
    repository_->Save(conversation).get();

    LOG_INFO("Message sent: conversation={} has_tool_use={}", conversationId, response.HasToolUse());
    return response;
}

void ConversationService::SendMessageStream(const std::string& conversationId, const std::string& text,
                                            const ChatStreamCallback& onEvent, const std::vector<JSONValue>& tools) {
    LOG_INFO("Sending message (streaming): conversation={}", conversationId);
    auto conversation = require(conversationId);
    conversation->AddMessage(Message::User(text));

    std::vector<ContentBlock> blocks;
    std::string currentText;

    chat_->CreateMessageStream(buildRequest(*conversation, tools), [&](const JSONValue& event) {
        const std::string type = GetStringMember(event, "type").value_or("");
        if (type == "content_block_start") {
            if (const JSONValue* block = FindMember(event, "content_block")) {
                if (GetStringMember(*block, "type").value_or("") == "text") {
                    currentText = GetStringMember(*block, "text").value_or("");
                }
            }
        } else if (type == "content_block_delta") {
            if (const JSONValue* delta = FindMember(event, "delta")) {
                if (GetStringMember(*delta, "type").value_or("") == "text_delta") {
                    currentText += GetStringMember(*delta, "text").value_or("");
                }
            }
        } else if (type == "content_block_stop") {
            if (!currentText.empty()) {
                blocks.push_back(TextBlock{currentText});
                currentText.clear();
            }
        } else if (type == "message_stop") {
            conversation->AddMessage(Message(Role::Assistant, blocks));
            repository_->Save(conversation).get();
        }
        if (onEvent) {
            onEvent(event);
        }
    });
}

std::shared_ptr<Conversation> ConversationService::Get(const std::string& conversationId) {
    return repository_->GetById(conversationId).get();
}

std::vector<std::shared_ptr<Conversation>> ConversationService::List(const std::optional<std::string>& sessionId,
                                                                     std::size_t offset, std::size_t limit) {
    auto all = sessionId.has_value() ? repository_->ListBySession(sessionId.value()).get()
                                     : repository_->ListAll().get();
    return page(all, offset, limit);
}

std::vector<Message> ConversationService::GetMessages(const std::string& conversationId, std::size_t offset,
                                                      std::size_t limit) {
    auto conversation = repository_->GetById(conversationId).get();
    if (!conversation) return {};
    return page(conversation->Messages(), offset, limit);
}

} // namespace tfomcp
