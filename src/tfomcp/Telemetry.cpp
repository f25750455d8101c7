//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Telemetry.cpp
// Purpose: Logging telemetry sink
//==========================================================================================================

#include <mutex>

#include "logging/Logger.h"
#include "tfomcp/Telemetry.h"

namespace tfomcp {

class LoggingTelemetrySink::Impl {
public:
    Impl(std::string serviceName, std::string environment)
        : serviceName(std::move(serviceName)), environment(std::move(environment)) {}

    const std::string serviceName;
    const std::string environment;
    mutable std::mutex mutex;
    TelemetryCounters counters;
};

LoggingTelemetrySink::LoggingTelemetrySink(std::string serviceName, std::string environment)
    : pImpl(std::make_unique<Impl>(std::move(serviceName), std::move(environment))) {}

LoggingTelemetrySink::~LoggingTelemetrySink() = default;

void LoggingTelemetrySink::RecordToolCall(const std::string& toolName, double durationSeconds, bool success,
                                          const std::string& errorKind) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->counters.toolCalls;
        if (!success) ++pImpl->counters.toolErrors;
    }
    LOG_DEBUG("metric tools.calls service={} env={} tool.name={} success={} error.type={} duration_s={:.6f}",
              pImpl->serviceName, pImpl->environment, toolName, success, errorKind.empty() ? "-" : errorKind,
              durationSeconds);
}

void LoggingTelemetrySink::RecordResourceRead(const std::string& uri, double durationSeconds, bool success) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->counters.resourceReads;
    }
    LOG_DEBUG("metric resources.reads service={} resource.uri={} success={} duration_s={:.6f}",
              pImpl->serviceName, uri, success, durationSeconds);
}

void LoggingTelemetrySink::RecordPromptGet(const std::string& name, double durationSeconds, bool success) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->counters.promptGets;
    }
    LOG_DEBUG("metric prompts.gets service={} prompt.name={} success={} duration_s={:.6f}",
              pImpl->serviceName, name, success, durationSeconds);
}

void LoggingTelemetrySink::RecordSessionEvent(const std::string& event, const std::string& sessionId) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->counters.sessionEvents;
    }
    LOG_DEBUG("metric sessions.events service={} event={} session.id={}", pImpl->serviceName, event, sessionId);
}

TelemetryCounters LoggingTelemetrySink::Counters() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->counters;
}

std::shared_ptr<ITelemetrySink> MakeTelemetrySink(bool enabled, const std::string& serviceName,
                                                  const std::string& environment) {
    if (!enabled) {
        return std::make_shared<NullTelemetrySink>();
    }
    LOG_INFO("Telemetry enabled (service={}, environment={})", serviceName, environment);
    return std::make_shared<LoggingTelemetrySink>(serviceName, environment);
}

} // namespace tfomcp
