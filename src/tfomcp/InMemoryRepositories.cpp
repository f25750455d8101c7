//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: InMemoryRepositories.cpp
// Purpose: In-memory repository implementations
//==========================================================================================================

#include <algorithm>
#include <iterator>

#include "tfomcp/InMemoryRepositories.hpp"

namespace tfomcp {

namespace {
template <typename T>
std::future<T> ready(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

std::future<void> ready() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}
} // namespace

////////////////////////////////////////////// Sessions //////////////////////////////////////////////

std::future<void> InMemorySessionRepository::Save(std::shared_ptr<Session> session) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = session->Id().Value();
    sessions_[key] = std::move(session);
    return ready();
}

std::future<std::shared_ptr<Session>> InMemorySessionRepository::Get(const SessionId& id) {
    return GetById(id.Value());
}

std::future<std::shared_ptr<Session>> InMemorySessionRepository::GetById(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return ready<std::shared_ptr<Session>>(it == sessions_.end() ? nullptr : it->second);
}

std::future<std::vector<std::shared_ptr<Session>>> InMemorySessionRepository::ListAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        (void)id;
        out.push_back(session);
    }
    return ready(std::move(out));
}

std::future<bool> InMemorySessionRepository::Delete(const SessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready(sessions_.erase(id.Value()) > 0);
}

/////////////////////////////////////////// Conversations ////////////////////////////////////////////

std::future<void> InMemoryConversationRepository::Save(std::shared_ptr<Conversation> conversation) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = conversation->Id().Value();
    conversations_[key] = std::move(conversation);
    return ready();
}

std::future<std::shared_ptr<Conversation>> InMemoryConversationRepository::Get(const ConversationId& id) {
    return GetById(id.Value());
}

std::future<std::shared_ptr<Conversation>> InMemoryConversationRepository::GetById(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(id);
    return ready<std::shared_ptr<Conversation>>(it == conversations_.end() ? nullptr : it->second);
}

std::future<std::vector<std::shared_ptr<Conversation>>> InMemoryConversationRepository::ListAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Conversation>> out;
    for (const auto& [id, c] : conversations_) {
        (void)id;
        out.push_back(c);
    }
    return ready(std::move(out));
}

std::future<std::vector<std::shared_ptr<Conversation>>> InMemoryConversationRepository::ListBySession(
    const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Conversation>> out;
    for (const auto& [id, c] : conversations_) {
        (void)id;
        if (c->SessionIdValue() == sessionId) out.push_back(c);
    }
    return ready(std::move(out));
}

std::future<bool> InMemoryConversationRepository::Delete(const ConversationId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready(conversations_.erase(id.Value()) > 0);
}

//////////////////////////////////////////////// Tools ///////////////////////////////////////////////

std::future<void> InMemoryToolRepository::Save(const Tool& tool) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_.insert_or_assign(tool.Name(), tool);
    return ready();
}

std::future<std::optional<Tool>> InMemoryToolRepository::Get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) return ready<std::optional<Tool>>(std::nullopt);
    return ready<std::optional<Tool>>(it->second);
}

std::future<std::vector<Tool>> InMemoryToolRepository::ListAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Tool> out;
    for (const auto& [name, tool] : tools_) {
        (void)name;
        out.push_back(tool);
    }
    return ready(std::move(out));
}

std::future<std::vector<Tool>> InMemoryToolRepository::ListEnabled() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Tool> out;
    for (const auto& [name, tool] : tools_) {
        (void)name;
        if (tool.IsEnabled()) out.push_back(tool);
    }
    return ready(std::move(out));
}

std::future<std::vector<Tool>> InMemoryToolRepository::ListByCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Tool> out;
    for (const auto& [name, tool] : tools_) {
        (void)name;
        if (tool.Category() == category) out.push_back(tool);
    }
    return ready(std::move(out));
}

std::future<bool> InMemoryToolRepository::Delete(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready(tools_.erase(name) > 0);
}

////////////////////////////////////////////// Resources /////////////////////////////////////////////

std::future<void> InMemoryResourceRepository::Save(const Resource& resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(resources_.begin(), resources_.end(),
                           [&](const Resource& r) { return r.Uri() == resource.Uri(); });
    if (it != resources_.end()) {
        *it = resource;
    } else {
        resources_.push_back(resource);
    }
    return ready();
}

std::future<std::optional<Resource>> InMemoryResourceRepository::Get(const std::string& uri) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& r : resources_) {
        if (r.Uri() == uri) return ready<std::optional<Resource>>(r);
    }
    for (const auto& r : resources_) {
        if (r.IsTemplate() && r.MatchesUri(uri)) return ready<std::optional<Resource>>(r);
    }
    return ready<std::optional<Resource>>(std::nullopt);
}

std::future<std::vector<Resource>> InMemoryResourceRepository::ListAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready(resources_);
}

std::future<std::vector<Resource>> InMemoryResourceRepository::ListTemplates() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Resource> out;
    std::copy_if(resources_.begin(), resources_.end(), std::back_inserter(out),
                 [](const Resource& r) { return r.IsTemplate(); });
    return ready(std::move(out));
}

std::future<bool> InMemoryResourceRepository::Delete(const std::string& uri) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(resources_.begin(), resources_.end(), [&](const Resource& r) { return r.Uri() == uri; });
    if (it == resources_.end()) return ready(false);
    resources_.erase(it);
    return ready(true);
}

/////////////////////////////////////////////// Prompts //////////////////////////////////////////////

std::future<void> InMemoryPromptRepository::Save(const Prompt& prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    prompts_.insert_or_assign(prompt.Name(), prompt);
    return ready();
}

std::future<std::optional<Prompt>> InMemoryPromptRepository::Get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prompts_.find(name);
    if (it == prompts_.end()) return ready<std::optional<Prompt>>(std::nullopt);
    return ready<std::optional<Prompt>>(it->second);
}

std::future<std::vector<Prompt>> InMemoryPromptRepository::ListAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Prompt> out;
    for (const auto& [name, prompt] : prompts_) {
        (void)name;
        out.push_back(prompt);
    }
    return ready(std::move(out));
}

std::future<bool> InMemoryPromptRepository::Delete(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready(prompts_.erase(name) > 0);
}

} // namespace tfomcp
