//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: StdioTransport.hpp
// Purpose: Newline-delimited JSON-RPC transport over a pair of file descriptors (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <memory>

#include "tfomcp/Protocol.h"
#include "tfomcp/Transport.h"

namespace tfomcp {

//==========================================================================================================
// StdioTransport
// Purpose: One JSON object per line on the input descriptor; one per line on the output descriptor.
// Notes:
//   - Lines longer than the maximum message size are dropped with a warning and no response.
//   - Blank lines are skipped; a trailing "\r" is stripped.
//   - A final unterminated line is processed at EOF.
//   - Descriptors are not closed by the transport.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    StdioTransport();
    StdioTransport(int inFd, int outFd);
    ~StdioTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    bool WriteLine(const std::string& line) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetClosedHandler(ClosedHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetMaxMessageSize
    // Purpose: Upper bound on a single line in bytes (default 10 MiB).
    //==========================================================================================================
    void SetMaxMessageSize(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

struct StdioTransportTestHooks {
    // Runs the line splitter over bytes as if they had been read from the input descriptor.
    static void feed(StdioTransport& t, const std::string& bytes);
    // Flushes a pending unterminated line as at EOF.
    static void finish(StdioTransport& t);
};

} // namespace tfomcp
