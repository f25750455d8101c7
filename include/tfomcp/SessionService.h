//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: SessionService.h
// Purpose: Application service creating, tracking and closing sessions through the session repository
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tfomcp/Repositories.h"
#include "tfomcp/Session.h"

namespace tfomcp {

class SessionService {
public:
    SessionService(std::shared_ptr<ISessionRepository> repository, Implementation serverInfo,
                   SessionCapabilities capabilities, std::string protocolVersion = PROTOCOL_VERSION);

    //==========================================================================================================
    // Initialize
    // Purpose: Creates a new session, initializes it with the client info and makes it current.
    // Returns:
    //   Initialize result { protocolVersion, capabilities, serverInfo }.
    //==========================================================================================================
    JSONValue Initialize(const Implementation& clientInfo, const JSONValue& clientCapabilities);

    // Current session or nullptr before initialize / after closing it.
    std::shared_ptr<Session> Current() const;

    // Closes the session with this id (no-op for unknown ids). Clears Current() when it matches.
    void Close(const std::string& sessionId, const std::string& reason = "");

    // Applies to the current session; no-op when there is none.
    void SetLogLevel(MCPLogLevel level);

    std::shared_ptr<Session> Get(const std::string& sessionId);
    std::vector<std::shared_ptr<Session>> List(std::size_t offset = 0, std::size_t limit = 100);

    // { id, state, toolCount, resourceCount, promptCount, createdAt, initializedAt|null }
    std::optional<JSONValue> Stats(const std::string& sessionId);

private:
    std::shared_ptr<ISessionRepository> repository_;
    const Implementation serverInfo_;
    const SessionCapabilities capabilities_;
    const std::string protocolVersion_;

    mutable std::mutex mutex_;
    std::shared_ptr<Session> current_;
};

} // namespace tfomcp
