//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Logger.h
// Purpose: Process-wide logger with level filtering, optional file sink and stdio-safe console output.
//==========================================================================================================
#pragma once

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <fmt/format.h>

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Severity level scoped to Logger
    enum class Level {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
        ERROR = 3,
        FATAL = 4
    };

    // Convert common level strings to Logger::Level (case-insensitive). Defaults to INFO.
    static Level levelFromString(const std::string& lvl);

    static LogLevel toLogLevel(Level level);

    // Set the active level from a string such as "debug" or "warning".
    static void setLogLevelFromString(const std::string& lvl) {
        setLogLevel(toLogLevel(levelFromString(lvl)));
    }

    //==========================================================================================================
    // configure
    // Purpose: Applies a logging section: level plus an output of "stderr", "stdout" or a file path.
    // Notes:
    //   Console output always goes to stderr once configured; "stdout" is downgraded with a warning since
    //   stdout carries the JSON-RPC stream. A file path keeps stderr as the console sink and appends to the file.
    //==========================================================================================================
    static void configure(const std::string& level, const std::string& output);

    // Variadic logging using {fmt} runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmt, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {}", e.what());
        }
        log(level, buffer, file, line);
    }

    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    // Route console output to stderr regardless of TFOMCP_STDIO_MODE.
    static void setUseStderr(bool v) {
        sForceStderr.store(v);
    }

    // Opens (append mode) a file that receives a copy of every line. Returns false if it cannot be opened.
    static bool setLogFile(const std::string& filePath);
    static void closeLogFile();

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line);

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
    static std::atomic<bool> sForceStderr;
};

// Enhanced logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit tracing, compiled in only for _DEBUG builds
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
