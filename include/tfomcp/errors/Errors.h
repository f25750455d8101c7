//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Errors.h
// Purpose: Typed error structures, the validation failure type, and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "tfomcp/JSONRPCTypes.h"

namespace tfomcp {
namespace errors {

//==========================================================================================================
// ValidationError
// Purpose: Validation-class failure. Raised by value objects, missing required params, unknown
//          resources/prompts and session state violations. The dispatcher maps it to INVALID_PARAMS.
//==========================================================================================================
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpToolNotFound,
    McpResourceNotFound,
    McpPromptNotFound,
    McpToolExecution,
    McpResourceRead,
    McpPrompt,
    McpRateLimited,
    McpSessionNotInitialized,
    McpSessionAlreadyInitialized,
    McpUnsupportedProtocolVersion,
    Unknown
};

// Typed error representation.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        case JSONRPCErrorCodes::ToolExecutionError: return ErrorCategory::McpToolExecution;
        case JSONRPCErrorCodes::ResourceReadError: return ErrorCategory::McpResourceRead;
        case JSONRPCErrorCodes::PromptError: return ErrorCategory::McpPrompt;
        case JSONRPCErrorCodes::RateLimited: return ErrorCategory::McpRateLimited;
        case JSONRPCErrorCodes::SessionNotInitialized: return ErrorCategory::McpSessionNotInitialized;
        case JSONRPCErrorCodes::SessionAlreadyInitialized: return ErrorCategory::McpSessionAlreadyInitialized;
        case JSONRPCErrorCodes::UnsupportedProtocolVersion: return ErrorCategory::McpUnsupportedProtocolVersion;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(code.value());
    e.message = std::move(message.value());
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Build an McpError for a code/message pair.
inline McpError makeError(int code, const std::string& message) {
    McpError e;
    e.code = code;
    e.message = message;
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace tfomcp
