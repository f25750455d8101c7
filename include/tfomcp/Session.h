//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Session.h
// Purpose: Session aggregate: lifecycle state machine, capability registries and domain event queue
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tfomcp/Events.h"
#include "tfomcp/Identifiers.h"
#include "tfomcp/JSONRPCTypes.h"
#include "tfomcp/Prompt.h"
#include "tfomcp/Protocol.h"
#include "tfomcp/Resource.h"
#include "tfomcp/Tool.h"

namespace tfomcp {

enum class SessionState {
    Created,
    Initializing,
    Ready,
    Closing,
    Closed
};

std::string ToString(SessionState state);

//==========================================================================================================
// SessionCapabilities
// Purpose: Capability flags advertised in the initialize result.
//==========================================================================================================
struct SessionCapabilities {
    bool tools = true;
    bool resources = true;
    bool prompts = true;
    bool logging = true;
    bool sampling = false;
    JSONValue::Object experimental;

    // tools => {}, resources => {subscribe:true, listChanged:true}, prompts => {listChanged:true},
    // logging => {}, sampling => {}, experimental when non-empty
    JSONValue ToJSON() const;
    // Each flag is true iff its key is present.
    static SessionCapabilities FromJSON(const JSONValue& v);
};

//==========================================================================================================
// Session
// Purpose: Aggregate root for one client connection.
// Notes:
//   - All methods are internally synchronized. State, metadata and the event queue share one lock;
//     each registry has its own lock.
//   - Registry lists return snapshots.
//   - Resources keep insertion order so template fallback is first-registered-wins.
//==========================================================================================================
class Session {
public:
    static constexpr const char* DefaultServerName = "TelemetryFlow-MCP";
    static constexpr const char* DefaultServerVersion = "1.1.2";

    // Creates a session in state Created and queues SessionCreated. protocolVersion is what Initialize answers with.
    static std::shared_ptr<Session> Create(Implementation serverInfo = Implementation(DefaultServerName, DefaultServerVersion),
                                           SessionCapabilities capabilities = {},
                                           std::string protocolVersion = PROTOCOL_VERSION);

    ~Session();
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const SessionId& Id() const;
    std::string GetProtocolVersion() const;
    SessionState GetState() const;
    bool IsReady() const;
    bool IsClosed() const;
    std::optional<Implementation> GetClientInfo() const;
    std::optional<Implementation> GetServerInfo() const;
    SessionCapabilities GetCapabilities() const;
    MCPLogLevel GetLogLevel() const;
    Timestamp CreatedAt() const;
    std::optional<Timestamp> InitializedAt() const;
    std::optional<Timestamp> ClosedAt() const;

    //==========================================================================================================
    // Initialize
    // Purpose: Created/Initializing -> Ready. Records client info and queues SessionInitialized.
    // Args:
    //   clientInfo: Client implementation info.
    //   clientCapabilities: Client-advertised capabilities (stored, not interpreted).
    // Returns:
    //   Initialize result { protocolVersion, capabilities, serverInfo }.
    //   Throws errors::ValidationError when in Ready, Closing or Closed.
    //==========================================================================================================
    JSONValue Initialize(const Implementation& clientInfo, const JSONValue& clientCapabilities = JSONValue{JSONValue::Object{}});

    // Idempotent. Queues SessionClosed on the first call only.
    void Close(const std::string& reason = "");

    void SetLogLevel(MCPLogLevel level);

    ////////////////////////////////////////////// Tools /////////////////////////////////////////////
    void RegisterTool(const Tool& tool);
    bool UnregisterTool(const std::string& name);
    std::optional<Tool> GetTool(const std::string& name) const;
    std::vector<Tool> ListTools() const;
    std::size_t ToolCount() const;

    //////////////////////////////////////////// Resources ////////////////////////////////////////////
    void RegisterResource(const Resource& resource);
    bool UnregisterResource(const std::string& uri);
    // Exact URI first, then the first registered template whose literal prefix matches.
    std::optional<Resource> GetResource(const std::string& uri) const;
    std::vector<Resource> ListResources() const;
    std::size_t ResourceCount() const;

    ///////////////////////////////////////////// Prompts /////////////////////////////////////////////
    void RegisterPrompt(const Prompt& prompt);
    bool UnregisterPrompt(const std::string& name);
    std::optional<Prompt> GetPrompt(const std::string& name) const;
    std::vector<Prompt> ListPrompts() const;
    std::size_t PromptCount() const;

    ////////////////////////////////////////////// Events /////////////////////////////////////////////
    // Atomically returns and clears the queued events.
    DomainEventList GetEvents();
    // Queues an event raised outside the aggregate (e.g. ToolExecuted).
    void RecordEvent(DomainEventPtr event);

    JSONValue ToJSON() const;

private:
    Session(Implementation serverInfo, SessionCapabilities capabilities, std::string protocolVersion);

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace tfomcp
