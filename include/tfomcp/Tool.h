//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Tool.h
// Purpose: Tool entity, input schema, tool results and the tool handler interface
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "tfomcp/Identifiers.h"
#include "tfomcp/JSONRPCTypes.h"

namespace tfomcp {

//==========================================================================================================
// ToolResult
// Purpose: Outcome of a tool invocation in MCP wire shape.
// Fields:
//   content: Array of content items ({type:"text", text} etc).
//   isError: Serialized only when true.
//==========================================================================================================
struct ToolResult {
    std::vector<JSONValue> content;
    bool isError = false;

    static ToolResult Text(const std::string& text);
    static ToolResult Error(const std::string& message);
    // Pretty value rendered as a single text item containing the serialized JSON.
    static ToolResult Json(const JSONValue& value);

    // Concatenation of all text items (newline separated).
    std::string TextContent() const;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// ToolInputSchema
// Purpose: JSON-Schema-like description of tool arguments.
// Notes:
//   ToJSON() omits "required" when empty and emits "additionalProperties":false only when false.
//==========================================================================================================
struct ToolInputSchema {
    std::string type = "object";
    JSONValue::Object properties;
    std::vector<std::string> required;
    bool additionalProperties = false;

    JSONValue ToJSON() const;
    static ToolInputSchema FromJSON(const JSONValue& v);
};

//==========================================================================================================
// IToolHandler
// Purpose: Capability-to-function binding for a tool.
// Notes:
//   Invoke runs on a worker thread. The stop token is signalled when the caller stops waiting
//   (timeout); long-running handlers should poll it and return early.
//==========================================================================================================
class IToolHandler {
public:
    virtual ~IToolHandler() = default;
    virtual ToolResult Invoke(const JSONValue& arguments, std::stop_token stopToken) = 0;
};

using ToolFunction = std::function<ToolResult(const JSONValue&, std::stop_token)>;

// Adapts a callable to IToolHandler.
std::shared_ptr<IToolHandler> MakeToolHandler(ToolFunction fn);

//==========================================================================================================
// ToolOptions
// Purpose: Optional attributes supplied at tool construction.
//==========================================================================================================
struct ToolOptions {
    std::string category = "general";
    std::vector<std::string> tags;
    bool enabled = true;
    double timeoutSeconds = 30.0;
};

//==========================================================================================================
// Tool
// Purpose: Invocable capability identified by its name.
// Notes:
//   A tool without a handler is listable but every execution returns an error result.
//==========================================================================================================
class Tool {
public:
    static constexpr double DefaultTimeoutSeconds = 30.0;

    Tool(ToolName name, ToolDescription description, ToolInputSchema inputSchema = {},
         std::shared_ptr<IToolHandler> handler = nullptr, ToolOptions options = {});

    // Validating convenience constructor (throws errors::ValidationError).
    static Tool Create(const std::string& name, const std::string& description,
                       ToolInputSchema inputSchema = {},
                       std::shared_ptr<IToolHandler> handler = nullptr,
                       ToolOptions options = {});

    const std::string& Name() const { return name_.Value(); }
    const std::string& Description() const { return description_.Value(); }
    const ToolInputSchema& InputSchema() const { return inputSchema_; }
    const std::shared_ptr<IToolHandler>& Handler() const { return handler_; }
    const std::string& Category() const { return options_.category; }
    const std::vector<std::string>& Tags() const { return options_.tags; }
    bool IsEnabled() const { return options_.enabled; }
    double TimeoutSeconds() const { return options_.timeoutSeconds; }
    Timestamp CreatedAt() const { return createdAt_; }

    void SetHandler(std::shared_ptr<IToolHandler> handler) { handler_ = std::move(handler); }
    void Enable() { options_.enabled = true; }
    void Disable() { options_.enabled = false; }
    void SetTimeoutSeconds(double seconds) { options_.timeoutSeconds = seconds; }

    // Runs the handler on the calling thread. Handler exceptions propagate.
    ToolResult Execute(const JSONValue& arguments, std::stop_token stopToken = {}) const;

    // { name, description, inputSchema }
    JSONValue ToMcpFormat() const;
    // MCP format plus category, tags, enabled and timeout_seconds.
    JSONValue ToDict() const;

private:
    ToolName name_;
    ToolDescription description_;
    ToolInputSchema inputSchema_;
    std::shared_ptr<IToolHandler> handler_;
    ToolOptions options_;
    Timestamp createdAt_;
};

} // namespace tfomcp
