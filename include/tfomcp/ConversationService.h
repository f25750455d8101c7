//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: ConversationService.h
// Purpose: Application service driving conversations against the upstream chat client
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tfomcp/ChatService.h"
#include "tfomcp/Conversation.h"
#include "tfomcp/Repositories.h"

namespace tfomcp {

struct CreateConversationOptions {
    std::string model = Model::Default;
    std::string systemPrompt;
    int64_t maxTokens = 4096;
    double temperature = 1.0;
    std::string sessionId;
};

class ConversationService {
public:
    ConversationService(std::shared_ptr<IConversationRepository> repository, std::shared_ptr<IChatService> chat);

    // Throws errors::ValidationError for an unknown model or an oversized system prompt.
    std::shared_ptr<Conversation> Create(const CreateConversationOptions& options);

    //==========================================================================================================
    // SendMessage
    // Purpose: Appends the user message, calls the upstream service and appends its reply.
    // Args:
    //   conversationId: Existing conversation id.
    //   text: User message text.
    //   tools: Upstream tool definitions offered to the model.
    // Returns:
    //   The assistant message. Throws errors::ValidationError("Conversation not found: <id>").
    //==========================================================================================================
    Message SendMessage(const std::string& conversationId, const std::string& text,
                        const std::vector<JSONValue>& tools = {});

    //==========================================================================================================
    // SendMessageStream
    // Purpose: Streaming variant. Every upstream event is relayed to onEvent; text deltas are assembled
    //          and the assistant message is appended and saved on message_stop.
    //==========================================================================================================
    void SendMessageStream(const std::string& conversationId, const std::string& text,
                           const ChatStreamCallback& onEvent, const std::vector<JSONValue>& tools = {});

    std::shared_ptr<Conversation> Get(const std::string& conversationId);
    // Paged; sessionId filters when set.
    std::vector<std::shared_ptr<Conversation>> List(const std::optional<std::string>& sessionId = std::nullopt,
                                                    std::size_t offset = 0, std::size_t limit = 100);
    // Paged; empty for an unknown conversation.
    std::vector<Message> GetMessages(const std::string& conversationId, std::size_t offset = 0,
                                     std::size_t limit = 100);

private:
    std::shared_ptr<Conversation> require(const std::string& conversationId);
    ChatRequest buildRequest(const Conversation& conversation, const std::vector<JSONValue>& tools) const;

    std::shared_ptr<IConversationRepository> repository_;
    std::shared_ptr<IChatService> chat_;
};

} // namespace tfomcp
