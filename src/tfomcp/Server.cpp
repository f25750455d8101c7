//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Server.cpp
// Purpose: MCP server protocol engine implementation
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "tfomcp/Builtins.h"
#include "tfomcp/InMemoryRepositories.hpp"
#include "tfomcp/Server.h"
#include "tfomcp/SessionService.h"
#include "tfomcp/errors/Errors.h"

namespace tfomcp {

namespace {

// Raised by the dispatcher for methods without a handler.
class MethodNotFound : public std::runtime_error {
public:
    explicit MethodNotFound(const std::string& method) : std::runtime_error("Method not found: " + method) {}
};

SessionCapabilities capabilitiesFromConfig(const McpConfig& mcp) {
    SessionCapabilities caps;
    caps.tools = mcp.enableTools;
    caps.resources = mcp.enableResources;
    caps.prompts = mcp.enablePrompts;
    caps.logging = mcp.enableLogging;
    caps.sampling = mcp.enableSampling;
    return caps;
}

// Maps the envelope "id" member. A missing or null id marks a notification; ids that are neither a
// string nor an integer are answered with a null id.
JSONRPCId extractId(const JSONValue& message, bool& isNotification) {
    const JSONValue* idVal = FindMember(message, "id");
    isNotification = (idVal == nullptr || idVal->IsNull());
    if (isNotification) {
        return nullptr;
    }
    if (const auto* s = std::get_if<std::string>(&idVal->value)) {
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&idVal->value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&idVal->value)) {
        if (std::isfinite(*d) && std::floor(*d) == *d) {
            return static_cast<int64_t>(*d);
        }
    }
    return nullptr;
}

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string serializeError(const JSONRPCId& id, int code, const std::string& message) {
    return CreateErrorResponse(id, code, message)->Serialize();
}

} // namespace

class Server::Impl {
public:
    Config config;
    std::shared_ptr<ITelemetrySink> telemetry;
    std::shared_ptr<IChatService> chatService;
    SessionService sessions;
    ToolInvoker invoker;
    SessionInitializer initializer;

    std::unique_ptr<ITransport> transport;
    std::atomic<bool> running{false};
    std::atomic<bool> stopped{false};

    std::mutex shutdownMutex;
    std::condition_variable shutdownCv;
    bool shutdownRequested{false};

    Impl(Config cfg, std::shared_ptr<ITelemetrySink> sink, std::shared_ptr<IChatService> chat)
        : config(std::move(cfg)),
          telemetry(sink ? std::move(sink) : std::make_shared<NullTelemetrySink>()),
          chatService(std::move(chat)),
          sessions(std::make_shared<InMemorySessionRepository>(),
                   Implementation(config.server.name, config.server.version),
                   capabilitiesFromConfig(config.mcp), config.mcp.protocolVersion),
          invoker(telemetry, static_cast<std::size_t>(config.mcp.workerThreads > 0 ? config.mcp.workerThreads : 1)) {
        initializer = [this](const std::shared_ptr<Session>& session, ToolInvoker& inv) {
            RegisterBuiltins(session, inv, config, chatService);
        };
    }

    bool isShutdownRequested() {
        std::lock_guard<std::mutex> lock(shutdownMutex);
        return shutdownRequested;
    }

    void requestShutdown() {
        {
            std::lock_guard<std::mutex> lock(shutdownMutex);
            shutdownRequested = true;
        }
        shutdownCv.notify_all();
    }

    std::shared_ptr<Session> requireSession() const {
        auto session = sessions.Current();
        if (!session) {
            throw errors::ValidationError("Session not initialized");
        }
        return session;
    }

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////

    JSONValue handleInitialize(const JSONValue& params) {
        if (sessions.Current()) {
            throw errors::ValidationError("Session already initialized");
        }
        const std::string requested = GetStringMember(params, "protocolVersion").value_or(PROTOCOL_VERSION);
        if (!ProtocolVersion::IsSupported(requested)) {
            LOG_WARN("Client requested unsupported protocol version {}; answering with {}", requested,
                     config.mcp.protocolVersion);
        }
        Implementation clientInfo("unknown", "unknown");
        if (const JSONValue* ci = FindMember(params, "clientInfo")) {
            clientInfo = Implementation::FromJSON(*ci);
        }
        JSONValue clientCaps{JSONValue::Object{}};
        if (const JSONValue* cc = FindMember(params, "capabilities")) {
            clientCaps = *cc;
        }

        JSONValue result = sessions.Initialize(clientInfo, clientCaps);
        auto session = sessions.Current();
        if (initializer) {
            initializer(session, invoker);
        }
        telemetry->RecordSessionEvent("initialized", session->Id().Value());
        LOG_INFO("Registered {} tools, {} resources, {} prompts", session->ToolCount(), session->ResourceCount(),
                 session->PromptCount());
        return result;
    }

    JSONValue handleListTools() {
        auto session = requireSession();
        JSONValue::Array tools;
        for (const auto& tool : session->ListTools()) {
            tools.push_back(std::make_shared<JSONValue>(tool.ToMcpFormat()));
        }
        JSONValue::Object o;
        o["tools"] = MakeArray(std::move(tools));
        return JSONValue{o};
    }

    JSONValue handleCallTool(const JSONValue& params) {
        auto session = requireSession();
        const std::string name = GetStringMember(params, "name").value_or("");
        if (name.empty()) {
            throw errors::ValidationError("Tool name is required");
        }
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* a = FindMember(params, "arguments")) {
            if (!a->IsNull()) arguments = *a;
        }
        InvocationOutcome outcome = invoker.Invoke(*session, name, arguments);
        LOG_DEBUG("Tool {} finished: {} in {:.1f} ms", name, ToString(outcome.kind), outcome.durationMs);
        return outcome.result.ToJSON();
    }

    JSONValue handleListResources(bool templates) {
        auto session = requireSession();
        JSONValue::Array items;
        for (const auto& resource : session->ListResources()) {
            if (resource.IsTemplate() != templates) continue;
            if (templates) {
                auto tf = resource.ToTemplateFormat();
                if (tf) items.push_back(std::make_shared<JSONValue>(tf.value()));
            } else {
                items.push_back(std::make_shared<JSONValue>(resource.ToMcpFormat()));
            }
        }
        JSONValue::Object o;
        o[templates ? "resourceTemplates" : "resources"] = MakeArray(std::move(items));
        return JSONValue{o};
    }

    JSONValue handleReadResource(const JSONValue& params) {
        auto session = requireSession();
        const std::string uri = GetStringMember(params, "uri").value_or("");
        if (uri.empty()) {
            throw errors::ValidationError("Resource URI is required");
        }
        auto resource = session->GetResource(uri);
        if (!resource) {
            throw errors::ValidationError("Resource not found: " + uri);
        }
        JSONValue readParams{JSONValue::Object{}};
        if (const JSONValue* p = FindMember(params, "params")) {
            if (p->IsObject()) readParams = *p;
        }
        const auto start = std::chrono::steady_clock::now();
        ResourceContent content;
        try {
            content = resource->Read(uri, readParams);
        } catch (const std::exception&) {
            telemetry->RecordResourceRead(uri, secondsSince(start), false);
            throw;
        }
        telemetry->RecordResourceRead(uri, secondsSince(start), true);
        JSONValue::Array contents;
        contents.push_back(std::make_shared<JSONValue>(content.ToJSON()));
        JSONValue::Object o;
        o["contents"] = MakeArray(std::move(contents));
        return JSONValue{o};
    }

    JSONValue handleListPrompts() {
        auto session = requireSession();
        JSONValue::Array prompts;
        for (const auto& prompt : session->ListPrompts()) {
            prompts.push_back(std::make_shared<JSONValue>(prompt.ToMcpFormat()));
        }
        JSONValue::Object o;
        o["prompts"] = MakeArray(std::move(prompts));
        return JSONValue{o};
    }

    JSONValue handleGetPrompt(const JSONValue& params) {
        auto session = requireSession();
        const std::string name = GetStringMember(params, "name").value_or("");
        if (name.empty()) {
            throw errors::ValidationError("Prompt name is required");
        }
        auto prompt = session->GetPrompt(name);
        if (!prompt) {
            throw errors::ValidationError("Prompt not found: " + name);
        }
        PromptArguments arguments;
        if (const JSONValue* a = FindMember(params, "arguments")) {
            arguments = PromptArgumentsFromJSON(*a);
        }
        const auto start = std::chrono::steady_clock::now();
        std::vector<PromptMessage> messages;
        try {
            messages = prompt->GetMessages(arguments);
        } catch (const std::exception&) {
            telemetry->RecordPromptGet(name, secondsSince(start), false);
            throw;
        }
        telemetry->RecordPromptGet(name, secondsSince(start), true);
        JSONValue::Array items;
        for (const auto& m : messages) {
            items.push_back(std::make_shared<JSONValue>(m.ToJSON()));
        }
        JSONValue::Object o;
        o["messages"] = MakeArray(std::move(items));
        return JSONValue{o};
    }

    JSONValue handleSetLogLevel(const JSONValue& params) {
        requireSession();
        const std::string level = GetStringMember(params, "level").value_or("info");
        sessions.SetLogLevel(MCPLogLevelFromString(level));
        return JSONValue{JSONValue::Object{}};
    }

    //==========================================================================================================
    // Routes a method to its handler. Throws MethodNotFound for unknown methods; handler failures propagate.
    //==========================================================================================================
    JSONValue dispatch(const std::string& method, const JSONValue& params) {
        if (method == Methods::Initialize) {
            return handleInitialize(params);
        } else if (method == Methods::Initialized) {
            LOG_DEBUG("Client reported initialized");
            return JSONValue{JSONValue::Object{}};
        } else if (method == Methods::Ping) {
            return JSONValue{JSONValue::Object{}};
        } else if (method == Methods::ListTools) {
            return handleListTools();
        } else if (method == Methods::CallTool) {
            return handleCallTool(params);
        } else if (method == Methods::ListResources) {
            return handleListResources(false);
        } else if (method == Methods::ListResourceTemplates) {
            return handleListResources(true);
        } else if (method == Methods::ReadResource) {
            return handleReadResource(params);
        } else if (method == Methods::ListPrompts) {
            return handleListPrompts();
        } else if (method == Methods::GetPrompt) {
            return handleGetPrompt(params);
        } else if (method == Methods::SetLogLevel) {
            return handleSetLogLevel(params);
        } else if (method == Methods::Shutdown) {
            LOG_INFO("Shutdown requested by client");
            requestShutdown();
            return JSONValue{JSONValue::Object{}};
        }
        throw MethodNotFound(method);
    }

    void handleNotification(const std::string& method, const JSONValue& params) {
        try {
            (void)dispatch(method, params);
        } catch (const MethodNotFound&) {
            LOG_DEBUG("Ignoring notification: {}", method);
        } catch (const std::exception& e) {
            LOG_WARN("Notification {} failed: {}", method, e.what());
        }
    }
};

Server::Server(Config config, std::shared_ptr<ITelemetrySink> telemetry, std::shared_ptr<IChatService> chatService)
    : pImpl(std::make_unique<Impl>(std::move(config), std::move(telemetry), std::move(chatService))) {}

Server::~Server() {
    try {
        Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server: stop during destruction failed: {}", e.what());
    }
}

std::future<void> Server::Start(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        throw std::invalid_argument("Server::Start requires a transport");
    }
    pImpl->transport = std::move(transport);
    pImpl->transport->SetMessageHandler([this](const std::string& line) { return HandleLine(line); });
    pImpl->transport->SetClosedHandler([this]() {
        LOG_INFO("Transport closed; stopping");
        pImpl->requestShutdown();
    });
    pImpl->transport->SetErrorHandler([](const std::string& error) { LOG_ERROR("Transport error: {}", error); });
    pImpl->stopped.store(false);
    pImpl->running.store(true);
    LOG_INFO("Starting {} v{} (protocol {})", pImpl->config.server.name, pImpl->config.server.version,
             pImpl->config.mcp.protocolVersion);
    return pImpl->transport->Start();
}

std::future<void> Server::Stop() {
    std::promise<void> done;
    if (pImpl->stopped.exchange(true)) {
        done.set_value();
        return done.get_future();
    }
    if (auto session = pImpl->sessions.Current()) {
        const std::string id = session->Id().Value();
        pImpl->sessions.Close(id, "server stopped");
        pImpl->telemetry->RecordSessionEvent("closed", id);
    }
    if (pImpl->transport) {
        pImpl->transport->Close().get();
    }
    pImpl->running.store(false);
    pImpl->requestShutdown();
    LOG_INFO("Server stopped");
    done.set_value();
    return done.get_future();
}

bool Server::IsRunning() const {
    return pImpl->running.load();
}

void Server::WaitForShutdown() {
    std::unique_lock<std::mutex> lock(pImpl->shutdownMutex);
    pImpl->shutdownCv.wait(lock, [this]() { return pImpl->shutdownRequested; });
}

void Server::RequestShutdown() {
    pImpl->requestShutdown();
}

std::optional<std::string> Server::HandleLine(const std::string& line) {
    if (line.size() > static_cast<std::size_t>(pImpl->config.mcp.maxMessageSize)) {
        LOG_WARN("Dropping message of {} bytes (limit {})", line.size(), pImpl->config.mcp.maxMessageSize);
        return std::nullopt;
    }
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }
    if (pImpl->isShutdownRequested()) {
        LOG_DEBUG("Shutting down; ignoring message");
        return std::nullopt;
    }

    JSONValue message;
    try {
        message = parseJSONValue(line);
    } catch (const JSONParseError& e) {
        LOG_WARN("Parse error: {}", e.what());
        return serializeError(nullptr, JSONRPCErrorCodes::ParseError, std::string("Parse error: ") + e.what());
    }
    if (!message.IsObject()) {
        LOG_WARN("Parse error: message is not a JSON object");
        return serializeError(nullptr, JSONRPCErrorCodes::ParseError, "Parse error: expected a JSON object");
    }

    bool isNotification = false;
    JSONRPCId id = extractId(message, isNotification);

    auto version = GetStringMember(message, "jsonrpc");
    if (!version.has_value() || version.value() != JSONRPC_VERSION) {
        return serializeError(id, JSONRPCErrorCodes::InvalidRequest, "Invalid JSON-RPC version");
    }

    const std::string method = GetStringMember(message, "method").value_or("");
    JSONValue params{JSONValue::Object{}};
    if (const JSONValue* p = FindMember(message, "params")) {
        if (p->IsObject()) {
            params = *p;
        } else if (!p->IsNull()) {
            if (isNotification) return std::nullopt;
            return serializeError(id, JSONRPCErrorCodes::InvalidParams, "Invalid params: expected an object");
        }
    }

    LOG_DEBUG("Received {}: {}", isNotification ? "notification" : "request", method);
    // notifications/initialized is never answered, even when a client attaches an id
    if (isNotification || method == Methods::Initialized) {
        pImpl->handleNotification(method, params);
        return std::nullopt;
    }
    JSONRPCRequest request(id, method, params);
    return HandleRequest(request)->Serialize();
}

std::unique_ptr<JSONRPCResponse> Server::HandleRequest(const JSONRPCRequest& request) {
    const JSONValue params = request.params.value_or(JSONValue{JSONValue::Object{}});
    try {
        JSONValue result = pImpl->dispatch(request.method, params);
        return std::make_unique<JSONRPCResponse>(request.id, std::move(result));
    } catch (const MethodNotFound& e) {
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, e.what());
    } catch (const errors::ValidationError& e) {
        LOG_DEBUG("Invalid params for {}: {}", request.method, e.what());
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidParams, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling {}: {}", request.method, e.what());
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
    }
}

std::shared_ptr<Session> Server::GetSession() const {
    return pImpl->sessions.Current();
}

void Server::SetSessionInitializer(SessionInitializer initializer) {
    pImpl->initializer = std::move(initializer);
}

const Config& Server::GetConfig() const {
    return pImpl->config;
}

} // namespace tfomcp
