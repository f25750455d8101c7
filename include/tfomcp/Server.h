//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Server.h
// Purpose: MCP server protocol engine: envelope validation, method dispatch and the run loop
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "tfomcp/ChatService.h"
#include "tfomcp/Config.h"
#include "tfomcp/JSONRPCTypes.h"
#include "tfomcp/Session.h"
#include "tfomcp/Telemetry.h"
#include "tfomcp/ToolInvoker.h"
#include "tfomcp/Transport.h"

namespace tfomcp {

// Called once right after a session is initialized to populate its registries.
using SessionInitializer = std::function<void(const std::shared_ptr<Session>& session, ToolInvoker& invoker)>;

//==========================================================================================================
// MCP Server interface
// Purpose: One server instance serves one client over one transport with at most one current session.
//==========================================================================================================
class IServer {
public:
    virtual ~IServer() = default;

    /////////////////////////////////////////// Connection management //////////////////////////////////////////
    //==========================================================================================================
    // Starts the server using the provided transport and wires the line handler.
    // Args:
    //   transport: Transport implementation to own and use for JSON-RPC.
    // Returns:
    //   A future that completes once the transport reader loop is running.
    //==========================================================================================================
    virtual std::future<void> Start(std::unique_ptr<ITransport> transport) = 0;

    //==========================================================================================================
    // Stops the server: closes the current session, records the "closed" session event and closes the
    // transport. Idempotent.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    virtual bool IsRunning() const = 0;

    // Blocks until shutdown is requested (shutdown method, EOF on input or RequestShutdown()).
    virtual void WaitForShutdown() = 0;

    // Asks the run loop to stop. Safe from any thread except a signal handler.
    virtual void RequestShutdown() = 0;

    ////////////////////////////////////////// Message processing /////////////////////////////////////////
    //==========================================================================================================
    // Processes one raw input line.
    // Args:
    //   line: One JSON-RPC message.
    // Returns:
    //   The serialized response, or nullopt when nothing is written (notifications, blank or oversized lines,
    //   anything after shutdown was requested).
    //==========================================================================================================
    virtual std::optional<std::string> HandleLine(const std::string& line) = 0;

    //==========================================================================================================
    // Dispatches an already-parsed request.
    // Returns:
    //   Response with a result or an error object. Never nullptr.
    //==========================================================================================================
    virtual std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request) = 0;

    // The current session, or nullptr before initialize / after stop.
    virtual std::shared_ptr<Session> GetSession() const = 0;
};

//==========================================================================================================
// Server
// Purpose: Default IServer implementation.
// Notes:
//   - The session initializer defaults to registering the built-in tools, resources and prompts that the
//     configuration enables. Embedders replace it with SetSessionInitializer before Start().
//==========================================================================================================
class Server : public IServer {
public:
    explicit Server(Config config, std::shared_ptr<ITelemetrySink> telemetry = nullptr,
                    std::shared_ptr<IChatService> chatService = nullptr);
    ~Server() override;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    std::future<void> Start(std::unique_ptr<ITransport> transport) override;
    std::future<void> Stop() override;
    bool IsRunning() const override;
    void WaitForShutdown() override;
    void RequestShutdown() override;

    std::optional<std::string> HandleLine(const std::string& line) override;
    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request) override;

    std::shared_ptr<Session> GetSession() const override;

    void SetSessionInitializer(SessionInitializer initializer);

    const Config& GetConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace tfomcp
