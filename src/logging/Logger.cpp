//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Logger.cpp
// Purpose: Logger sinks, line layout and configuration.
//==========================================================================================================

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>

#include "env/EnvVars.h"
#include "logging/Logger.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
std::atomic<bool> Logger::sForceStderr{false};

namespace {

bool envFlag(const char* name, const char* fallback) {
    const std::string v = GetEnvOrDefault(name, fallback);
    return v == "1" || v == "true" || v == "TRUE";
}

// 2025-01-31T12:00:00.123Z
std::string utcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::gmtime_r(&secs, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
}

const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return Level::DEBUG;
    if (s == "INFO")  return Level::INFO;
    if (s == "WARN" || s == "WARNING") return Level::WARN;
    if (s == "ERROR") return Level::ERROR;
    if (s == "FATAL" || s == "CRITICAL") return Level::FATAL;
    return Level::INFO;
}

LogLevel Logger::toLogLevel(Level level) {
    switch (level) {
        case Level::DEBUG: return LogLevel::LOG_DEBUG_LEVEL;
        case Level::INFO:  return LogLevel::LOG_INFO_LEVEL;
        case Level::WARN:  return LogLevel::LOG_WARN_LEVEL;
        case Level::ERROR: return LogLevel::LOG_ERROR_LEVEL;
        default:           return LogLevel::LOG_FATAL_LEVEL;
    }
}

void Logger::configure(const std::string& level, const std::string& output) {
    setUseStderr(true);
    setLogLevelFromString(level);
    if (output == "stdout") {
        LOG_WARN("logging.output=stdout would corrupt the protocol stream; using stderr");
    } else if (!output.empty() && output != "stderr") {
        if (!setLogFile(output)) {
            LOG_WARN("Continuing with stderr only; cannot open log file {}", output);
        }
    }
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return false;
    }
    sLogFile << "\n=== Log opened at " << utcTimestamp() << " ===\n";
    sLogFile.flush();
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    // Colour applies to the console label only; the file copy stays plain
    static const bool colorEnabled = envFlag("TFOMCP_LOG_COLOR", "1");
    // stderr when TFOMCP_STDIO_MODE=1 to avoid corrupting stdout JSON-RPC lines
    static const bool envStderr = envFlag("TFOMCP_STDIO_MODE", "0");

    const std::string stamp = utcTimestamp();
    const std::string body = fmt::format("{}:{}: {}\n", baseName(file), line, msg);

    std::string consoleLine;
    if (colorEnabled) {
        const char* labelColor = (std::strncmp(level, "ERROR", 5) == 0 || std::strncmp(level, "FATAL", 5) == 0)
                                     ? "\033[38;5;88m" /* burgundy */ : "\033[35m" /* purple */;
        consoleLine = fmt::format("{} [{}{}\033[0m] {}", stamp, labelColor, level, body);
    } else {
        consoleLine = fmt::format("{} [{}] {}", stamp, level, body);
    }

    std::lock_guard<std::mutex> lock(sLogMutex);
    if (envStderr || sForceStderr.load()) {
        std::cerr << consoleLine << std::flush;
    } else {
        std::cout << consoleLine << std::flush;
    }
    if (sLogFile.is_open()) {
        sLogFile << stamp << " [" << level << "] " << body;
        sLogFile.flush();
    }
}
