//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: ToolInvoker.cpp
// Purpose: Tool invocation pipeline implementation
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stop_token>
#include <unordered_map>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "tfomcp/ToolInvoker.h"

namespace tfomcp {

std::string ToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Success: return "Success";
        case OutcomeKind::ToolError: return "ToolError";
        case OutcomeKind::NotFound: return "NotFound";
        case OutcomeKind::Disabled: return "Disabled";
        case OutcomeKind::Timeout: return "Timeout";
        case OutcomeKind::HandlerFailure: return "HandlerFailure";
    }
    return "Unknown";
}

std::string FormatSeconds(double seconds) {
    std::string s = fmt::format("{}", seconds);
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}

class ToolInvoker::Impl {
public:
    Impl(std::shared_ptr<ITelemetrySink> sink, std::size_t workers)
        : telemetry(sink ? std::move(sink) : std::make_shared<NullTelemetrySink>()),
          pool(workers == 0 ? DefaultWorkerThreads : workers) {}

    std::shared_ptr<ITelemetrySink> telemetry;
    boost::asio::thread_pool pool;

    mutable std::mutex inflightMutex;
    std::unordered_map<uint64_t, std::stop_source> inflight;
    std::atomic<uint64_t> nextTicket{1};

    uint64_t track(const std::stop_source& source) {
        const uint64_t ticket = nextTicket.fetch_add(1);
        std::lock_guard<std::mutex> lock(inflightMutex);
        inflight.emplace(ticket, source);
        return ticket;
    }

    void untrack(uint64_t ticket) {
        std::lock_guard<std::mutex> lock(inflightMutex);
        inflight.erase(ticket);
    }

    void stopAll() {
        std::lock_guard<std::mutex> lock(inflightMutex);
        for (auto& [ticket, source] : inflight) {
            (void)ticket;
            source.request_stop();
        }
    }

    // Runs the handler on the pool and waits up to timeoutSeconds.
    InvocationOutcome execute(const Tool& tool, const JSONValue& arguments);

    void emit(Session& session, const std::string& toolName, const InvocationOutcome& outcome);
};

InvocationOutcome ToolInvoker::Impl::execute(const Tool& tool, const JSONValue& arguments) {
    InvocationOutcome outcome;

    auto promise = std::make_shared<std::promise<ToolResult>>();
    std::future<ToolResult> future = promise->get_future();
    std::stop_source stopSource;
    const uint64_t ticket = track(stopSource);

    const std::string toolName = tool.Name();
    boost::asio::post(pool, [this, tool, arguments, promise, stopSource, ticket, toolName]() {
        std::stop_token token = stopSource.get_token();
        try {
            promise->set_value(tool.Execute(arguments, token));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        if (token.stop_requested()) {
            LOG_WARN("Tool '{}' completed after timeout; result discarded", toolName);
        }
        untrack(ticket);
    });

    const auto timeout = std::chrono::duration<double>(tool.TimeoutSeconds());
    if (future.wait_for(timeout) != std::future_status::ready) {
        stopSource.request_stop();
        outcome.kind = OutcomeKind::Timeout;
        outcome.errorMessage = "Tool execution timed out after " + FormatSeconds(tool.TimeoutSeconds()) + "s";
        outcome.result = ToolResult::Error(outcome.errorMessage);
        LOG_WARN("Tool '{}' timed out after {}s", toolName, FormatSeconds(tool.TimeoutSeconds()));
        return outcome;
    }

    try {
        outcome.result = future.get();
        if (outcome.result.isError) {
            outcome.kind = OutcomeKind::ToolError;
            outcome.errorMessage = outcome.result.TextContent();
            if (outcome.errorMessage.empty()) {
                outcome.errorMessage = "Unknown error";
            }
        } else {
            outcome.kind = OutcomeKind::Success;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Tool execution failed: tool={} error={}", toolName, e.what());
        outcome.kind = OutcomeKind::HandlerFailure;
        outcome.errorMessage = e.what();
        outcome.result = ToolResult::Error(std::string("Tool execution failed: ") + e.what());
    } catch (...) {
        LOG_ERROR("Tool execution failed: tool={} error=non-standard exception", toolName);
        outcome.kind = OutcomeKind::HandlerFailure;
        outcome.errorMessage = "unknown exception";
        outcome.result = ToolResult::Error("Tool execution failed: unknown exception");
    }
    return outcome;
}

void ToolInvoker::Impl::emit(Session& session, const std::string& toolName, const InvocationOutcome& outcome) {
    const bool success = outcome.Succeeded();
    try {
        telemetry->RecordToolCall(toolName, outcome.durationMs / 1000.0, success,
                                  success ? std::string() : ToString(outcome.kind));
    } catch (const std::exception& e) {
        LOG_WARN("Failed to record tool metric for '{}': {}", toolName, e.what());
    }
    try {
        session.RecordEvent(std::make_shared<ToolExecuted>(session.Id().Value(), toolName, success,
                                                           outcome.durationMs, outcome.errorMessage));
    } catch (const std::exception& e) {
        LOG_WARN("Failed to record ToolExecuted event for '{}': {}", toolName, e.what());
    }
}

ToolInvoker::ToolInvoker(std::shared_ptr<ITelemetrySink> telemetry, std::size_t workerThreads)
    : pImpl(std::make_unique<Impl>(std::move(telemetry), workerThreads)) {}

ToolInvoker::~ToolInvoker() {
    pImpl->stopAll();
    pImpl->pool.join();
}

InvocationOutcome ToolInvoker::Invoke(Session& session, const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    LOG_INFO("Executing tool: {}", name);
    const auto start = std::chrono::steady_clock::now();

    InvocationOutcome outcome;
    std::optional<Tool> tool = session.GetTool(name);
    if (!tool.has_value()) {
        outcome.kind = OutcomeKind::NotFound;
        outcome.errorMessage = "Tool not found: " + name;
        outcome.result = ToolResult::Error(outcome.errorMessage);
    } else if (!tool->IsEnabled()) {
        outcome.kind = OutcomeKind::Disabled;
        outcome.errorMessage = "Tool is disabled: " + name;
        outcome.result = ToolResult::Error(outcome.errorMessage);
    } else {
        outcome = pImpl->execute(tool.value(), arguments);
    }

    outcome.durationMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    pImpl->emit(session, name, outcome);
    LOG_INFO("Tool execution completed: tool={} outcome={} duration_ms={:.3f}", name, ToString(outcome.kind),
             outcome.durationMs);
    return outcome;
}

void ToolInvoker::RegisterTool(Session& session, const Tool& tool) {
    session.RegisterTool(tool);
    session.RecordEvent(std::make_shared<ToolRegistered>(session.Id().Value(), tool.Name(), tool.Category()));
    LOG_DEBUG("Tool registered: name={} category={}", tool.Name(), tool.Category());
}

std::vector<Tool> ToolInvoker::ListTools(const Session& session, const std::optional<std::string>& category,
                                         bool enabledOnly) const {
    std::vector<Tool> out;
    for (auto& tool : session.ListTools()) {
        if (category.has_value() && tool.Category() != category.value()) continue;
        if (enabledOnly && !tool.IsEnabled()) continue;
        out.push_back(std::move(tool));
    }
    return out;
}

std::size_t ToolInvoker::InFlight() const {
    std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
    return pImpl->inflight.size();
}

} // namespace tfomcp
