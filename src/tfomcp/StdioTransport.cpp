//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: StdioTransport.cpp
// Purpose: Newline-delimited stdio transport implementation
//==========================================================================================================

#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>

#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <random>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "tfomcp/StdioTransport.hpp"

namespace tfomcp {

class StdioTransport::Impl {
public:
    int inFd;
    int outFd;
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> readerExited{false};
    std::string sessionId;
    std::size_t maxMessageSize{DEFAULT_MAX_MESSAGE_SIZE};

    ITransport::MessageHandler messageHandler;
    ITransport::ClosedHandler closedHandler;
    ITransport::ErrorHandler errorHandler;

    std::thread readerThread;
    std::mutex writeMutex;
    int wakeEventFd{-1};

    // Line assembly state (reader thread only)
    std::string buffer;
    bool discarding{false};

    // Read timeout (ms) for the wait loop so Close() is honored promptly
    static constexpr int waitTimeoutMs = 100;

    Impl(int in, int out) : inFd(in), outFd(out) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));
    }

    ~Impl() {
        if (wakeEventFd >= 0) {
            ::close(wakeEventFd);
            wakeEventFd = -1;
        }
    }

    void wake() {
        if (wakeEventFd < 0) return;
        uint64_t one = 1;
        ssize_t wr;
        do { wr = ::write(wakeEventFd, &one, sizeof(one)); } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    void reportError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    bool writeAll(const std::string& data) {
        std::lock_guard<std::mutex> lock(writeMutex);
        std::size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::write(outFd, data.data() + off, data.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                reportError(std::string("StdioTransport: write failed: ") + ::strerror(errno));
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
        return true;
    }

    void dispatchLine(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() > maxMessageSize) {
            LOG_WARN("StdioTransport: dropping message of {} bytes (limit {})", line.size(), maxMessageSize);
            return;
        }
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            return;
        }
        if (!messageHandler) {
            LOG_WARN("StdioTransport: no message handler; dropping line");
            return;
        }
        std::optional<std::string> reply = messageHandler(line);
        if (reply.has_value()) {
            (void)writeAll(reply.value() + "\n");
        }
    }

    //==========================================================================================================
    // Splits incoming bytes on '\n'. Once the pending partial line exceeds the limit the remainder up to the
    // next newline is discarded without buffering.
    //==========================================================================================================
    void processChunk(const char* data, std::size_t n) {
        std::size_t pos = 0;
        while (pos < n) {
            const char* nl = static_cast<const char*>(std::memchr(data + pos, '\n', n - pos));
            if (discarding) {
                if (!nl) return;
                discarding = false;
                pos = static_cast<std::size_t>(nl - data) + 1;
                continue;
            }
            if (!nl) {
                buffer.append(data + pos, n - pos);
                if (buffer.size() > maxMessageSize + 1) {
                    LOG_WARN("StdioTransport: dropping oversized message (limit {} bytes)", maxMessageSize);
                    buffer.clear();
                    discarding = true;
                }
                return;
            }
            const std::size_t end = static_cast<std::size_t>(nl - data);
            buffer.append(data + pos, end - pos);
            std::string line;
            line.swap(buffer);
            pos = end + 1;
            dispatchLine(std::move(line));
        }
    }

    void finishInput() {
        if (!discarding && !buffer.empty()) {
            std::string line;
            line.swap(buffer);
            dispatchLine(std::move(line));
        }
        buffer.clear();
        discarding = false;
    }

    void readerLoop() {
        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            reportError(std::string("StdioTransport: epoll_create1 failed: ") + ::strerror(errno));
            onReaderExit();
            return;
        }
        epoll_event evIn{};
        evIn.events = EPOLLIN | EPOLLRDHUP | EPOLLERR;
        evIn.data.fd = inFd;
        if (::epoll_ctl(ep, EPOLL_CTL_ADD, inFd, &evIn) != 0) {
            reportError(std::string("StdioTransport: cannot watch input: ") + ::strerror(errno));
            ::close(ep);
            onReaderExit();
            return;
        }
        if (wakeEventFd >= 0) {
            epoll_event evWake{};
            evWake.events = EPOLLIN;
            evWake.data.fd = wakeEventFd;
            (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
        }

        std::array<char, 65536> tmp{};
        bool eof = false;
        while (connected.load() && !eof) {
            epoll_event events[2];
            int rc = ::epoll_wait(ep, events, 2, waitTimeoutMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                reportError(std::string("StdioTransport: epoll_wait failed: ") + ::strerror(errno));
                break;
            }
            for (int i = 0; i < rc && !eof; ++i) {
                if (events[i].data.fd == wakeEventFd) {
                    uint64_t v;
                    ssize_t r;
                    do { r = ::read(wakeEventFd, &v, sizeof(v)); } while (r < 0 && errno == EINTR);
                    continue;
                }
                ssize_t n;
                do { n = ::read(inFd, tmp.data(), tmp.size()); } while (n < 0 && errno == EINTR);
                if (n > 0) {
                    processChunk(tmp.data(), static_cast<std::size_t>(n));
                } else if (n == 0) {
                    LOG_INFO("StdioTransport: input closed");
                    eof = true;
                } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    reportError(std::string("StdioTransport: read failed: ") + ::strerror(errno));
                    eof = true;
                }
            }
        }
        ::close(ep);
        if (eof) {
            finishInput();
        }
        onReaderExit();
    }

    void onReaderExit() {
        connected.store(false);
        readerExited.store(true);
        if (!closing.load() && closedHandler) {
            closedHandler();
        }
    }
};

StdioTransport::StdioTransport() : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {}

StdioTransport::StdioTransport(int inFd, int outFd) : pImpl(std::make_unique<Impl>(inFd, outFd)) {}

StdioTransport::~StdioTransport() {
    try {
        Close().get();
    } catch (const std::exception& e) {
        LOG_ERROR("StdioTransport: close during destruction failed: {}", e.what());
    }
    if (pImpl->readerThread.joinable()) {
        if (pImpl->readerThread.get_id() == std::this_thread::get_id()) {
            pImpl->readerThread.detach();
        } else {
            pImpl->readerThread.join();
        }
    }
}

std::future<void> StdioTransport::Start() {
    std::promise<void> ready;
    if (pImpl->connected.load()) {
        ready.set_value();
        return ready.get_future();
    }
    pImpl->wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (pImpl->wakeEventFd < 0) {
        LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
    }
    pImpl->closing.store(false);
    pImpl->readerExited.store(false);
    pImpl->connected.store(true);
    pImpl->readerThread = std::thread([this]() { pImpl->readerLoop(); });
    LOG_INFO("StdioTransport started: {}", pImpl->sessionId);
    ready.set_value();
    return ready.get_future();
}

std::future<void> StdioTransport::Close() {
    std::promise<void> done;
    pImpl->closing.store(true);
    pImpl->connected.store(false);
    pImpl->wake();
    if (pImpl->readerThread.joinable() && pImpl->readerThread.get_id() != std::this_thread::get_id()) {
        pImpl->readerThread.join();
        LOG_DEBUG("StdioTransport: reader joined");
    }
    done.set_value();
    return done.get_future();
}

bool StdioTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string StdioTransport::GetSessionId() const {
    return pImpl->sessionId;
}

bool StdioTransport::WriteLine(const std::string& line) {
    return pImpl->writeAll(line + "\n");
}

void StdioTransport::SetMessageHandler(MessageHandler handler) {
    pImpl->messageHandler = std::move(handler);
}

void StdioTransport::SetClosedHandler(ClosedHandler handler) {
    pImpl->closedHandler = std::move(handler);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void StdioTransport::SetMaxMessageSize(std::size_t maxBytes) {
    pImpl->maxMessageSize = maxBytes;
}

void StdioTransportTestHooks::feed(StdioTransport& t, const std::string& bytes) {
    t.pImpl->processChunk(bytes.data(), bytes.size());
}

void StdioTransportTestHooks::finish(StdioTransport& t) {
    t.pImpl->finishInput();
}

} // namespace tfomcp
