//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: JSONRPCTypes.h
// Purpose: JSON value model, parser/serializer entry points and JSON-RPC 2.0 message types
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace tfomcp {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// JSONParseError
// Purpose: Raised by parseJSONValue when the input is not a single well-formed JSON document.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    explicit JSONParseError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// parseJSONValue
// Purpose: Parses a complete JSON document (RFC 8259). Trailing non-whitespace is rejected.
// Args:
//   json: UTF-8 text.
// Returns:
//   Parsed JSONValue. Throws JSONParseError on malformed input.
//==========================================================================================================
JSONValue parseJSONValue(const std::string& json);

//==========================================================================================================
// serializeJSONValue
// Purpose: Compact single-line serialization (control characters escaped, no embedded newlines).
//==========================================================================================================
std::string serializeJSONValue(const JSONValue& value);

//==========================================================================================================
// Object field helpers
// Purpose: Typed lookups on Object values. All return std::nullopt / nullptr when the value is not an
//          object, the key is absent, or the member has a different type.
//==========================================================================================================
const JSONValue* FindMember(const JSONValue& obj, const std::string& key);
std::optional<std::string> GetStringMember(const JSONValue& obj, const std::string& key);
std::optional<bool> GetBoolMember(const JSONValue& obj, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& obj, const std::string& key);
// Accepts both integer and floating point members.
std::optional<double> GetNumberMember(const JSONValue& obj, const std::string& key);

// Convenience builders used by wire-format serializers.
std::shared_ptr<JSONValue> MakeString(const std::string& s);
std::shared_ptr<JSONValue> MakeBool(bool b);
std::shared_ptr<JSONValue> MakeInt(int64_t v);
std::shared_ptr<JSONValue> MakeDouble(double v);
std::shared_ptr<JSONValue> MakeObject(JSONValue::Object o = {});
std::shared_ptr<JSONValue> MakeArray(JSONValue::Array a = {});

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant (per JSON-RPC): string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Render an id for logging ("null" for null ids).
std::string idToString(const JSONRPCId& id);
JSONValue idToJSON(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns canonical single-line JSON string for the message.
//   Deserialize(json): Parses JSON string into this object; returns true on success.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the MCP server-error range.
// Notes:
//   Only the five standard codes are emitted by the protocol engine. The -320xx values are stable
//   vocabulary for embedders and error categorisation.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    constexpr int ServerErrorStart = -32099;
    constexpr int ServerErrorEnd = -32000;

    // MCP specific error codes
    constexpr int ToolNotFound = -32001;
    constexpr int ResourceNotFound = -32002;
    constexpr int PromptNotFound = -32003;
    constexpr int ToolExecutionError = -32004;
    constexpr int ResourceReadError = -32005;
    constexpr int PromptError = -32006;
    constexpr int RateLimited = -32007;
    constexpr int SessionNotInitialized = -32008;
    constexpr int SessionAlreadyInitialized = -32009;
    constexpr int UnsupportedProtocolVersion = -32010;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace tfomcp
