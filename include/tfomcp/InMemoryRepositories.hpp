//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: InMemoryRepositories.hpp
// Purpose: Process-memory repository implementations (one coarse lock per repository)
//==========================================================================================================

#pragma once

#include <mutex>
#include <unordered_map>

#include "tfomcp/Repositories.h"

namespace tfomcp {

class InMemorySessionRepository : public ISessionRepository {
public:
    std::future<void> Save(std::shared_ptr<Session> session) override;
    std::future<std::shared_ptr<Session>> Get(const SessionId& id) override;
    std::future<std::shared_ptr<Session>> GetById(const std::string& id) override;
    std::future<std::vector<std::shared_ptr<Session>>> ListAll() override;
    std::future<bool> Delete(const SessionId& id) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

class InMemoryConversationRepository : public IConversationRepository {
public:
    std::future<void> Save(std::shared_ptr<Conversation> conversation) override;
    std::future<std::shared_ptr<Conversation>> Get(const ConversationId& id) override;
    std::future<std::shared_ptr<Conversation>> GetById(const std::string& id) override;
    std::future<std::vector<std::shared_ptr<Conversation>>> ListAll() override;
    std::future<std::vector<std::shared_ptr<Conversation>>> ListBySession(const std::string& sessionId) override;
    std::future<bool> Delete(const ConversationId& id) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Conversation>> conversations_;
};

class InMemoryToolRepository : public IToolRepository {
public:
    std::future<void> Save(const Tool& tool) override;
    std::future<std::optional<Tool>> Get(const std::string& name) override;
    std::future<std::vector<Tool>> ListAll() override;
    std::future<std::vector<Tool>> ListEnabled() override;
    std::future<std::vector<Tool>> ListByCategory(const std::string& category) override;
    std::future<bool> Delete(const std::string& name) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, Tool> tools_;
};

// Keeps save order so template lookup is first-saved-wins.
class InMemoryResourceRepository : public IResourceRepository {
public:
    std::future<void> Save(const Resource& resource) override;
    std::future<std::optional<Resource>> Get(const std::string& uri) override;
    std::future<std::vector<Resource>> ListAll() override;
    std::future<std::vector<Resource>> ListTemplates() override;
    std::future<bool> Delete(const std::string& uri) override;

private:
    std::mutex mutex_;
    std::vector<Resource> resources_;
};

class InMemoryPromptRepository : public IPromptRepository {
public:
    std::future<void> Save(const Prompt& prompt) override;
    std::future<std::optional<Prompt>> Get(const std::string& name) override;
    std::future<std::vector<Prompt>> ListAll() override;
    std::future<bool> Delete(const std::string& name) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, Prompt> prompts_;
};

} // namespace tfomcp
