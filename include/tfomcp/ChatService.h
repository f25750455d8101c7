//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: ChatService.h
// Purpose: Upstream chat client boundary consumed by the conversation service
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "tfomcp/JSONRPCTypes.h"
#include "tfomcp/Message.h"
#include "tfomcp/Protocol.h"

namespace tfomcp {

//==========================================================================================================
// ChatRequest
// Purpose: Parameters of one upstream completion call.
// Fields:
//   tools: Tool definitions in upstream format ({name, description, input_schema}); empty for none.
//==========================================================================================================
struct ChatRequest {
    std::vector<Message> messages;
    std::string model = Model::Default;
    std::optional<std::string> systemPrompt;
    int64_t maxTokens = 4096;
    double temperature = 1.0;
    std::vector<JSONValue> tools;
};

// Receives streaming events: message_start, content_block_start, content_block_delta,
// content_block_stop, message_delta, message_stop.
using ChatStreamCallback = std::function<void(const JSONValue& event)>;

//==========================================================================================================
// IChatService
// Purpose: Upstream LLM API adapter.
// Notes:
//   Retry and backoff on rate limiting or connection errors belong to implementations.
//   Calls are blocking and may run on tool worker threads.
//==========================================================================================================
class IChatService {
public:
    virtual ~IChatService() = default;

    // Returns the assistant message, token counters populated.
    virtual Message CreateMessage(const ChatRequest& request) = 0;

    // Delivers each event to onEvent in order; returns after message_stop or throws.
    virtual void CreateMessageStream(const ChatRequest& request, const ChatStreamCallback& onEvent) = 0;

    virtual int64_t CountTokens(const ChatRequest& request) = 0;
};

} // namespace tfomcp
