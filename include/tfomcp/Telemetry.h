//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Telemetry.h
// Purpose: Injected telemetry sink interface and its no-op and logging implementations
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace tfomcp {

//==========================================================================================================
// ITelemetrySink
// Purpose: Metric hooks called by the tool pipeline and the resource/prompt dispatch.
// Notes:
//   Implementations must be thread-safe. Callers treat any exception thrown here as non-fatal.
//==========================================================================================================
class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;

    // errorKind is empty on success (NotFound, Disabled, Timeout, ToolError, HandlerFailure otherwise).
    virtual void RecordToolCall(const std::string& toolName, double durationSeconds, bool success,
                                const std::string& errorKind) = 0;
    virtual void RecordResourceRead(const std::string& uri, double durationSeconds, bool success) = 0;
    virtual void RecordPromptGet(const std::string& name, double durationSeconds, bool success) = 0;
    // event: initialized, closed, error
    virtual void RecordSessionEvent(const std::string& event, const std::string& sessionId) = 0;
};

class NullTelemetrySink : public ITelemetrySink {
public:
    void RecordToolCall(const std::string&, double, bool, const std::string&) override {}
    void RecordResourceRead(const std::string&, double, bool) override {}
    void RecordPromptGet(const std::string&, double, bool) override {}
    void RecordSessionEvent(const std::string&, const std::string&) override {}
};

// Running totals kept by LoggingTelemetrySink.
struct TelemetryCounters {
    uint64_t toolCalls = 0;
    uint64_t toolErrors = 0;
    uint64_t resourceReads = 0;
    uint64_t promptGets = 0;
    uint64_t sessionEvents = 0;
};

//==========================================================================================================
// LoggingTelemetrySink
// Purpose: Writes one debug log record per metric and keeps counters.
//==========================================================================================================
class LoggingTelemetrySink : public ITelemetrySink {
public:
    LoggingTelemetrySink(std::string serviceName, std::string environment);
    ~LoggingTelemetrySink() override;

    void RecordToolCall(const std::string& toolName, double durationSeconds, bool success,
                        const std::string& errorKind) override;
    void RecordResourceRead(const std::string& uri, double durationSeconds, bool success) override;
    void RecordPromptGet(const std::string& name, double durationSeconds, bool success) override;
    void RecordSessionEvent(const std::string& event, const std::string& sessionId) override;

    TelemetryCounters Counters() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// LoggingTelemetrySink when enabled, NullTelemetrySink otherwise.
std::shared_ptr<ITelemetrySink> MakeTelemetrySink(bool enabled, const std::string& serviceName = "telemetryflow-cpp-mcp",
                                                  const std::string& environment = "production");

} // namespace tfomcp
