//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: SessionService.cpp
// Purpose: Session application service
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "tfomcp/SessionService.h"

namespace tfomcp {

SessionService::SessionService(std::shared_ptr<ISessionRepository> repository, Implementation serverInfo,
                               SessionCapabilities capabilities, std::string protocolVersion)
    : repository_(std::move(repository)), serverInfo_(std::move(serverInfo)), capabilities_(std::move(capabilities)),
      protocolVersion_(std::move(protocolVersion)) {}

JSONValue SessionService::Initialize(const Implementation& clientInfo, const JSONValue& clientCapabilities) {
    LOG_INFO("Initializing session: client={} {}", clientInfo.name, clientInfo.version);
    auto session = Session::Create(serverInfo_, capabilities_, protocolVersion_);
    JSONValue result = session->Initialize(clientInfo, clientCapabilities);
    repository_->Save(session).get();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = session;
    }
    LOG_INFO("Session initialized: id={} protocol={}", session->Id().Value(), session->GetProtocolVersion());
    return result;
}

std::shared_ptr<Session> SessionService::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void SessionService::Close(const std::string& sessionId, const std::string& reason) {
    auto session = repository_->GetById(sessionId).get();
    if (!session) {
        return;
    }
    session->Close(reason);
    repository_->Save(session).get();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ && current_->Id().Value() == sessionId) {
            current_.reset();
        }
    }
    LOG_INFO("Session closed: id={}", sessionId);
}

void SessionService::SetLogLevel(MCPLogLevel level) {
    auto session = Current();
    if (session) {
        session->SetLogLevel(level);
        LOG_INFO("Log level set: {}", ToString(level));
    }
}

std::shared_ptr<Session> SessionService::Get(const std::string& sessionId) {
    return repository_->GetById(sessionId).get();
}

std::vector<std::shared_ptr<Session>> SessionService::List(std::size_t offset, std::size_t limit) {
    auto all = repository_->ListAll().get();
    if (offset >= all.size()) return {};
    const std::size_t end = std::min(all.size(), offset + limit);
    return std::vector<std::shared_ptr<Session>>(all.begin() + static_cast<std::ptrdiff_t>(offset),
                                                 all.begin() + static_cast<std::ptrdiff_t>(end));
}

std::optional<JSONValue> SessionService::Stats(const std::string& sessionId) {
    auto session = repository_->GetById(sessionId).get();
    if (!session) return std::nullopt;
    JSONValue::Object o;
    o["id"] = MakeString(session->Id().Value());
    o["state"] = MakeString(ToString(session->GetState()));
    o["toolCount"] = MakeInt(static_cast<int64_t>(session->ToolCount()));
    o["resourceCount"] = MakeInt(static_cast<int64_t>(session->ResourceCount()));
    o["promptCount"] = MakeInt(static_cast<int64_t>(session->PromptCount()));
    o["createdAt"] = MakeString(FormatTimestamp(session->CreatedAt()));
    auto initializedAt = session->InitializedAt();
    o["initializedAt"] = initializedAt.has_value() ? MakeString(FormatTimestamp(initializedAt.value()))
                                                   : std::make_shared<JSONValue>(nullptr);
    return JSONValue{o};
}

} // namespace tfomcp
