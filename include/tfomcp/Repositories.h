//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Repositories.h
// Purpose: Persistence boundary for sessions, conversations and capabilities
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tfomcp/Conversation.h"
#include "tfomcp/Prompt.h"
#include "tfomcp/Resource.h"
#include "tfomcp/Session.h"
#include "tfomcp/Tool.h"

namespace tfomcp {

//==========================================================================================================
// ISessionRepository
// Purpose: Session persistence. Sessions are shared aggregates, so the repository stores handles.
//==========================================================================================================
class ISessionRepository {
public:
    virtual ~ISessionRepository() = default;

    virtual std::future<void> Save(std::shared_ptr<Session> session) = 0;
    virtual std::future<std::shared_ptr<Session>> Get(const SessionId& id) = 0;
    // Lookup by raw id string; nullptr when absent.
    virtual std::future<std::shared_ptr<Session>> GetById(const std::string& id) = 0;
    virtual std::future<std::vector<std::shared_ptr<Session>>> ListAll() = 0;
    // true iff an entry existed and was removed.
    virtual std::future<bool> Delete(const SessionId& id) = 0;
};

class IConversationRepository {
public:
    virtual ~IConversationRepository() = default;

    virtual std::future<void> Save(std::shared_ptr<Conversation> conversation) = 0;
    virtual std::future<std::shared_ptr<Conversation>> Get(const ConversationId& id) = 0;
    virtual std::future<std::shared_ptr<Conversation>> GetById(const std::string& id) = 0;
    virtual std::future<std::vector<std::shared_ptr<Conversation>>> ListAll() = 0;
    virtual std::future<std::vector<std::shared_ptr<Conversation>>> ListBySession(const std::string& sessionId) = 0;
    virtual std::future<bool> Delete(const ConversationId& id) = 0;
};

class IToolRepository {
public:
    virtual ~IToolRepository() = default;

    virtual std::future<void> Save(const Tool& tool) = 0;
    virtual std::future<std::optional<Tool>> Get(const std::string& name) = 0;
    virtual std::future<std::vector<Tool>> ListAll() = 0;
    virtual std::future<std::vector<Tool>> ListEnabled() = 0;
    virtual std::future<std::vector<Tool>> ListByCategory(const std::string& category) = 0;
    virtual std::future<bool> Delete(const std::string& name) = 0;
};

class IResourceRepository {
public:
    virtual ~IResourceRepository() = default;

    virtual std::future<void> Save(const Resource& resource) = 0;
    // Exact URI first, then the first saved template whose literal prefix matches.
    virtual std::future<std::optional<Resource>> Get(const std::string& uri) = 0;
    virtual std::future<std::vector<Resource>> ListAll() = 0;
    virtual std::future<std::vector<Resource>> ListTemplates() = 0;
    virtual std::future<bool> Delete(const std::string& uri) = 0;
};

class IPromptRepository {
public:
    virtual ~IPromptRepository() = default;

    virtual std::future<void> Save(const Prompt& prompt) = 0;
    virtual std::future<std::optional<Prompt>> Get(const std::string& name) = 0;
    virtual std::future<std::vector<Prompt>> ListAll() = 0;
    virtual std::future<bool> Delete(const std::string& name) = 0;
};

} // namespace tfomcp
