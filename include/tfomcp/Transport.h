//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Transport.h
// Purpose: Line-oriented JSON-RPC transport interface
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace tfomcp {

//==========================================================================================================
// ITransport
// Purpose: Carries one JSON-RPC message per line between the server and a single peer.
// Notes:
//   - The message handler is invoked on the transport's reader thread, one line at a time, in arrival
//     order. A returned string is written back as one line before the next line is handled.
//   - The closed handler fires once when the peer closes its side (EOF) or a fatal I/O error occurs.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    // Starts the reader loop. Future completes when the loop is running.
    virtual std::future<void> Start() = 0;

    // Stops the reader loop. Safe to call more than once and from within a handler.
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // Diagnostic identifier.
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Writes one serialized message followed by '\n'.
    // Args:
    //   line: Serialized JSON without embedded newlines.
    // Returns:
    //   true when the whole line was written.
    //==========================================================================================================
    virtual bool WriteLine(const std::string& line) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    using MessageHandler = std::function<std::optional<std::string>(const std::string& line)>;
    virtual void SetMessageHandler(MessageHandler handler) = 0;

    using ClosedHandler = std::function<void()>;
    virtual void SetClosedHandler(ClosedHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace tfomcp
