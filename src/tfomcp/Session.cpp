//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Session.cpp
// Purpose: Session aggregate implementation
//==========================================================================================================

#include <mutex>
#include <unordered_map>

#include "logging/Logger.h"
#include "tfomcp/Session.h"
#include "tfomcp/errors/Errors.h"

namespace tfomcp {

std::string ToString(SessionState state) {
    switch (state) {
        case SessionState::Created: return "created";
        case SessionState::Initializing: return "initializing";
        case SessionState::Ready: return "ready";
        case SessionState::Closing: return "closing";
        case SessionState::Closed: return "closed";
    }
    return "created";
}

JSONValue SessionCapabilities::ToJSON() const {
    JSONValue::Object caps;
    if (tools) {
        caps["tools"] = MakeObject();
    }
    if (resources) {
        JSONValue::Object r;
        r["subscribe"] = MakeBool(true);
        r["listChanged"] = MakeBool(true);
        caps["resources"] = MakeObject(std::move(r));
    }
    if (prompts) {
        JSONValue::Object p;
        p["listChanged"] = MakeBool(true);
        caps["prompts"] = MakeObject(std::move(p));
    }
    if (logging) {
        caps["logging"] = MakeObject();
    }
    if (sampling) {
        caps["sampling"] = MakeObject();
    }
    if (!experimental.empty()) {
        caps["experimental"] = MakeObject(experimental);
    }
    return JSONValue{caps};
}

SessionCapabilities SessionCapabilities::FromJSON(const JSONValue& v) {
    SessionCapabilities c;
    c.tools = FindMember(v, "tools") != nullptr;
    c.resources = FindMember(v, "resources") != nullptr;
    c.prompts = FindMember(v, "prompts") != nullptr;
    c.logging = FindMember(v, "logging") != nullptr;
    c.sampling = FindMember(v, "sampling") != nullptr;
    if (const JSONValue* e = FindMember(v, "experimental")) {
        if (e->IsObject()) c.experimental = std::get<JSONValue::Object>(e->value);
    }
    return c;
}

// Session implementation
class Session::Impl {
public:
    Impl(Implementation serverInfo, SessionCapabilities capabilities, std::string protocolVersion)
        : id(SessionId::Generate()), protocolVersion(std::move(protocolVersion)), serverInfo(std::move(serverInfo)),
          capabilities(std::move(capabilities)), createdAt(Now()) {}

    const SessionId id;
    const std::string protocolVersion;

    // Guarded by stateMutex
    mutable std::mutex stateMutex;
    SessionState state{SessionState::Created};
    std::optional<Implementation> clientInfo;
    std::optional<Implementation> serverInfo;
    SessionCapabilities capabilities;
    JSONValue clientCapabilities{JSONValue::Object{}};
    MCPLogLevel logLevel{MCPLogLevel::Info};
    Timestamp createdAt;
    std::optional<Timestamp> initializedAt;
    std::optional<Timestamp> closedAt;
    DomainEventList events;

    mutable std::mutex toolsMutex;
    std::unordered_map<std::string, Tool> tools;

    // Insertion-ordered; resourceIndex maps uri -> position in resources
    mutable std::mutex resourcesMutex;
    std::vector<Resource> resources;
    std::unordered_map<std::string, std::size_t> resourceIndex;

    mutable std::mutex promptsMutex;
    std::unordered_map<std::string, Prompt> prompts;

    JSONValue buildInitializeResult() const {
        JSONValue::Object o;
        o["protocolVersion"] = MakeString(protocolVersion);
        o["capabilities"] = std::make_shared<JSONValue>(capabilities.ToJSON());
        o["serverInfo"] = serverInfo.has_value() ? std::make_shared<JSONValue>(serverInfo->ToJSON()) : MakeObject();
        return JSONValue{o};
    }
};

Session::Session(Implementation serverInfo, SessionCapabilities capabilities, std::string protocolVersion)
    : pImpl(std::make_unique<Impl>(std::move(serverInfo), std::move(capabilities), std::move(protocolVersion))) {}

Session::~Session() = default;

std::shared_ptr<Session> Session::Create(Implementation serverInfo, SessionCapabilities capabilities,
                                         std::string protocolVersion) {
    std::shared_ptr<Session> session(
        new Session(std::move(serverInfo), std::move(capabilities), std::move(protocolVersion)));
    session->RecordEvent(std::make_shared<SessionCreated>(session->Id().Value()));
    LOG_DEBUG("Session created: {}", session->Id().Value());
    return session;
}

const SessionId& Session::Id() const { return pImpl->id; }
std::string Session::GetProtocolVersion() const { return pImpl->protocolVersion; }

SessionState Session::GetState() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->state;
}

bool Session::IsReady() const { return GetState() == SessionState::Ready; }
bool Session::IsClosed() const { return GetState() == SessionState::Closed; }

std::optional<Implementation> Session::GetClientInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->clientInfo;
}

std::optional<Implementation> Session::GetServerInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->serverInfo;
}

SessionCapabilities Session::GetCapabilities() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->capabilities;
}

MCPLogLevel Session::GetLogLevel() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->logLevel;
}

Timestamp Session::CreatedAt() const { return pImpl->createdAt; }

std::optional<Timestamp> Session::InitializedAt() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->initializedAt;
}

std::optional<Timestamp> Session::ClosedAt() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->closedAt;
}

JSONValue Session::Initialize(const Implementation& clientInfo, const JSONValue& clientCapabilities) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    if (pImpl->state != SessionState::Created && pImpl->state != SessionState::Initializing) {
        throw errors::ValidationError("Cannot initialize session in state: " + ToString(pImpl->state));
    }
    pImpl->state = SessionState::Initializing;
    pImpl->clientInfo = clientInfo;
    pImpl->clientCapabilities = clientCapabilities;
    pImpl->initializedAt = Now();
    pImpl->state = SessionState::Ready;
    pImpl->events.push_back(std::make_shared<SessionInitialized>(
        pImpl->id.Value(), clientInfo.name, clientInfo.version, pImpl->protocolVersion));
    LOG_INFO("Session {} initialized by {} {}", pImpl->id.Value(), clientInfo.name, clientInfo.version);
    return pImpl->buildInitializeResult();
}

void Session::Close(const std::string& reason) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    if (pImpl->state == SessionState::Closed) {
        return;
    }
    pImpl->state = SessionState::Closing;
    pImpl->closedAt = Now();
    pImpl->state = SessionState::Closed;
    pImpl->events.push_back(std::make_shared<SessionClosed>(pImpl->id.Value(), reason));
    LOG_INFO("Session {} closed", pImpl->id.Value());
}

void Session::SetLogLevel(MCPLogLevel level) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->logLevel = level;
}

//----------------------------------------------------------------------------------------------------------
// Tools
//----------------------------------------------------------------------------------------------------------
void Session::RegisterTool(const Tool& tool) {
    std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
    pImpl->tools.insert_or_assign(tool.Name(), tool);
}

bool Session::UnregisterTool(const std::string& name) {
    std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
    return pImpl->tools.erase(name) > 0;
}

std::optional<Tool> Session::GetTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
    auto it = pImpl->tools.find(name);
    if (it == pImpl->tools.end()) return std::nullopt;
    return it->second;
}

std::vector<Tool> Session::ListTools() const {
    std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
    std::vector<Tool> out;
    out.reserve(pImpl->tools.size());
    for (const auto& kv : pImpl->tools) out.push_back(kv.second);
    return out;
}

std::size_t Session::ToolCount() const {
    std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
    return pImpl->tools.size();
}

//----------------------------------------------------------------------------------------------------------
// Resources
//----------------------------------------------------------------------------------------------------------
void Session::RegisterResource(const Resource& resource) {
    std::lock_guard<std::mutex> lock(pImpl->resourcesMutex);
    auto it = pImpl->resourceIndex.find(resource.Uri());
    if (it != pImpl->resourceIndex.end()) {
        // Upsert keeps the original registration position
        pImpl->resources[it->second] = resource;
        return;
    }
    pImpl->resourceIndex.emplace(resource.Uri(), pImpl->resources.size());
    pImpl->resources.push_back(resource);
}

bool Session::UnregisterResource(const std::string& uri) {
    std::lock_guard<std::mutex> lock(pImpl->resourcesMutex);
    auto it = pImpl->resourceIndex.find(uri);
    if (it == pImpl->resourceIndex.end()) return false;
    pImpl->resources.erase(pImpl->resources.begin() + static_cast<std::ptrdiff_t>(it->second));
    pImpl->resourceIndex.clear();
    for (std::size_t i = 0; i < pImpl->resources.size(); ++i) {
        pImpl->resourceIndex.emplace(pImpl->resources[i].Uri(), i);
    }
    return true;
}

std::optional<Resource> Session::GetResource(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(pImpl->resourcesMutex);
    auto it = pImpl->resourceIndex.find(uri);
    if (it != pImpl->resourceIndex.end()) {
        return pImpl->resources[it->second];
    }
    for (const auto& r : pImpl->resources) {
        if (r.IsTemplate() && r.MatchesUri(uri)) {
            return r;
        }
    }
    return std::nullopt;
}

std::vector<Resource> Session::ListResources() const {
    std::lock_guard<std::mutex> lock(pImpl->resourcesMutex);
    return pImpl->resources;
}

std::size_t Session::ResourceCount() const {
    std::lock_guard<std::mutex> lock(pImpl->resourcesMutex);
    return pImpl->resources.size();
}

//----------------------------------------------------------------------------------------------------------
// Prompts
//----------------------------------------------------------------------------------------------------------
void Session::RegisterPrompt(const Prompt& prompt) {
    std::lock_guard<std::mutex> lock(pImpl->promptsMutex);
    pImpl->prompts.insert_or_assign(prompt.Name(), prompt);
}

bool Session::UnregisterPrompt(const std::string& name) {
    std::lock_guard<std::mutex> lock(pImpl->promptsMutex);
    return pImpl->prompts.erase(name) > 0;
}

std::optional<Prompt> Session::GetPrompt(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->promptsMutex);
    auto it = pImpl->prompts.find(name);
    if (it == pImpl->prompts.end()) return std::nullopt;
    return it->second;
}

std::vector<Prompt> Session::ListPrompts() const {
    std::lock_guard<std::mutex> lock(pImpl->promptsMutex);
    std::vector<Prompt> out;
    out.reserve(pImpl->prompts.size());
    for (const auto& kv : pImpl->prompts) out.push_back(kv.second);
    return out;
}

std::size_t Session::PromptCount() const {
    std::lock_guard<std::mutex> lock(pImpl->promptsMutex);
    return pImpl->prompts.size();
}

//----------------------------------------------------------------------------------------------------------
// Events
//----------------------------------------------------------------------------------------------------------
DomainEventList Session::GetEvents() {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    DomainEventList out;
    out.swap(pImpl->events);
    return out;
}

void Session::RecordEvent(DomainEventPtr event) {
    if (!event) return;
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->events.push_back(std::move(event));
}

JSONValue Session::ToJSON() const {
    // Counts first: registry locks are never taken while holding stateMutex
    const auto toolCount = static_cast<int64_t>(ToolCount());
    const auto resourceCount = static_cast<int64_t>(ResourceCount());
    const auto promptCount = static_cast<int64_t>(PromptCount());

    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    auto optInfo = [](const std::optional<Implementation>& i) {
        return i.has_value() ? std::make_shared<JSONValue>(i->ToJSON()) : std::make_shared<JSONValue>(nullptr);
    };
    auto optTime = [](const std::optional<Timestamp>& t) {
        return t.has_value() ? MakeString(FormatTimestamp(t.value())) : std::make_shared<JSONValue>(nullptr);
    };
    JSONValue::Object o;
    o["id"] = MakeString(pImpl->id.Value());
    o["protocolVersion"] = MakeString(pImpl->protocolVersion);
    o["state"] = MakeString(ToString(pImpl->state));
    o["clientInfo"] = optInfo(pImpl->clientInfo);
    o["serverInfo"] = optInfo(pImpl->serverInfo);
    o["capabilities"] = std::make_shared<JSONValue>(pImpl->capabilities.ToJSON());
    o["logLevel"] = MakeString(ToString(pImpl->logLevel));
    o["toolCount"] = MakeInt(toolCount);
    o["resourceCount"] = MakeInt(resourceCount);
    o["promptCount"] = MakeInt(promptCount);
    o["createdAt"] = MakeString(FormatTimestamp(pImpl->createdAt));
    o["initializedAt"] = optTime(pImpl->initializedAt);
    o["closedAt"] = optTime(pImpl->closedAt);
    return JSONValue{o};
}

} // namespace tfomcp
