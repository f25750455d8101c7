//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: ToolInvoker.h
// Purpose: Timeout-bounded tool invocation pipeline with outcome classification and metric/event hooks
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tfomcp/Session.h"
#include "tfomcp/Telemetry.h"
#include "tfomcp/Tool.h"

namespace tfomcp {

enum class OutcomeKind {
    Success,
    ToolError,      // handler returned a result flagged isError
    NotFound,
    Disabled,
    Timeout,
    HandlerFailure  // handler threw
};

std::string ToString(OutcomeKind kind);

//==========================================================================================================
// InvocationOutcome
// Purpose: Classified result of one tools/call.
// Fields:
//   result: Always populated; error kinds carry a single text item describing the failure.
//   errorMessage: Empty on success.
//==========================================================================================================
struct InvocationOutcome {
    OutcomeKind kind{OutcomeKind::Success};
    ToolResult result;
    double durationMs{0.0};
    std::string errorMessage;

    bool Succeeded() const { return kind == OutcomeKind::Success; }
};

//==========================================================================================================
// ToolInvoker
// Purpose: Runs tool handlers on a worker pool and waits for them under each tool's timeout.
// Notes:
//   - Invoke never throws for tool failures; every path yields an InvocationOutcome.
//   - On timeout the handler's stop token is signalled and its eventual result is discarded.
//   - Every path records a telemetry tool call and queues a ToolExecuted event on the session.
//   - Destruction signals all in-flight handlers and joins the pool.
//==========================================================================================================
class ToolInvoker {
public:
    static constexpr std::size_t DefaultWorkerThreads = 4;

    explicit ToolInvoker(std::shared_ptr<ITelemetrySink> telemetry = nullptr,
                         std::size_t workerThreads = DefaultWorkerThreads);
    ~ToolInvoker();
    ToolInvoker(const ToolInvoker&) = delete;
    ToolInvoker& operator=(const ToolInvoker&) = delete;

    //==========================================================================================================
    // Invoke
    // Purpose: Resolve, validate and execute a tool.
    // Args:
    //   session: Session whose registry is consulted and which receives the ToolExecuted event.
    //   name: Tool name as supplied by the client.
    //   arguments: Argument object passed to the handler unchanged.
    // Returns:
    //   Classified outcome. Messages: "Tool not found: <name>", "Tool is disabled: <name>",
    //   "Tool execution timed out after <t>s", "Tool execution failed: <what>".
    //==========================================================================================================
    InvocationOutcome Invoke(Session& session, const std::string& name, const JSONValue& arguments);

    // Registers (upsert) and queues ToolRegistered.
    void RegisterTool(Session& session, const Tool& tool);

    // Filtered registry snapshot.
    std::vector<Tool> ListTools(const Session& session, const std::optional<std::string>& category = std::nullopt,
                                bool enabledOnly = false) const;

    // Number of handlers still running (including ones abandoned after a timeout).
    std::size_t InFlight() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Seconds rendered with at least one decimal ("30.0", "0.25").
std::string FormatSeconds(double seconds);

} // namespace tfomcp
