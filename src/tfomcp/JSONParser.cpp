//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: JSONParser.cpp
// Purpose: Strict recursive-descent JSON parser, compact serializer and JSON-RPC message codecs
//==========================================================================================================

#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include "tfomcp/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace tfomcp {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {

constexpr int kMaxDepth = 512;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what + " at offset " + std::to_string(i));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }

    JSONValue parseNumber() {
        skipWs();
        const std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !isDigit(s[i])) fail("Invalid value");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && isDigit(s[i])) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !isDigit(s[i])) fail("Expected digit after decimal point");
            while (i < s.size() && isDigit(s[i])) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !isDigit(s[i])) fail("Expected digit in exponent");
            while (i < s.size() && isDigit(s[i])) ++i;
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) {
                return JSONValue(v);
            }
            // Integer overflow falls through to double
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ptr != last || (ec != std::errc() && ec != std::errc::result_out_of_range)) {
            fail("Invalid number");
        }
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') {
            if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
            fail("Invalid literal");
        }
        if (c == 'f') {
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
            fail("Invalid literal");
        }
        if (c == 'n') {
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
            fail("Invalid literal");
        }
        return parseNumber();
    }

    JSONValue parseDocument() {
        JSONValue v = parseValue();
        skipWs();
        if (i != s.size()) fail("Trailing characters after JSON value");
        return v;
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void serializeInto(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                out += "null";
                return;
            }
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
            if (ec != std::errc()) {
                out += "null";
                return;
            }
            std::string num(buf, ptr);
            // Keep doubles recognisable as floating point on re-parse
            if (num.find_first_of(".eE") == std::string::npos) num += ".0";
            out += num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                if (v[k]) serializeInto(out, *v[k]); else out += "null";
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (val) serializeInto(out, *val); else out += "null";
            }
            out.push_back('}');
        }
    }, value.get());
}

// Extract an id member; non-conforming ids (bool, object, fractional numbers) read as null.
JSONRPCId readId(const JSONValue& obj) {
    const JSONValue* v = FindMember(obj, "id");
    if (!v) return nullptr;
    if (auto* s = std::get_if<std::string>(&v->value)) return *s;
    if (auto* n = std::get_if<int64_t>(&v->value)) return *n;
    if (auto* d = std::get_if<double>(&v->value)) {
        if (std::isfinite(*d) && std::floor(*d) == *d) return static_cast<int64_t>(*d);
    }
    return nullptr;
}

} // namespace

JSONValue parseJSONValue(const std::string& json) {
    JsonParser p(json);
    return p.parseDocument();
}

std::string serializeJSONValue(const JSONValue& value) {
    std::string out;
    serializeInto(out, value);
    return out;
}

//----------------------------------------------------------------------------------------------------------
// Object field helpers
//----------------------------------------------------------------------------------------------------------
const JSONValue* FindMember(const JSONValue& obj, const std::string& key) {
    const auto* o = std::get_if<JSONValue::Object>(&obj.value);
    if (!o) return nullptr;
    auto it = o->find(key);
    if (it == o->end() || !it->second) return nullptr;
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v) {
        if (auto* s = std::get_if<std::string>(&v->value)) return *s;
    }
    return std::nullopt;
}

std::optional<bool> GetBoolMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v) {
        if (auto* b = std::get_if<bool>(&v->value)) return *b;
    }
    return std::nullopt;
}

std::optional<int64_t> GetIntMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v) {
        if (auto* n = std::get_if<int64_t>(&v->value)) return *n;
    }
    return std::nullopt;
}

std::optional<double> GetNumberMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v) {
        if (auto* n = std::get_if<int64_t>(&v->value)) return static_cast<double>(*n);
        if (auto* d = std::get_if<double>(&v->value)) return *d;
    }
    return std::nullopt;
}

std::shared_ptr<JSONValue> MakeString(const std::string& s) { return std::make_shared<JSONValue>(s); }
std::shared_ptr<JSONValue> MakeBool(bool b) { return std::make_shared<JSONValue>(b); }
std::shared_ptr<JSONValue> MakeInt(int64_t v) { return std::make_shared<JSONValue>(v); }
std::shared_ptr<JSONValue> MakeDouble(double v) { return std::make_shared<JSONValue>(v); }
std::shared_ptr<JSONValue> MakeObject(JSONValue::Object o) { return std::make_shared<JSONValue>(std::move(o)); }
std::shared_ptr<JSONValue> MakeArray(JSONValue::Array a) { return std::make_shared<JSONValue>(std::move(a)); }

std::string idToString(const JSONRPCId& id) {
    if (auto* s = std::get_if<std::string>(&id)) return *s;
    if (auto* n = std::get_if<int64_t>(&id)) return std::to_string(*n);
    return "null";
}

JSONValue idToJSON(const JSONRPCId& id) {
    if (auto* s = std::get_if<std::string>(&id)) return JSONValue(*s);
    if (auto* n = std::get_if<int64_t>(&id)) return JSONValue(*n);
    return JSONValue(nullptr);
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    JSONValue::Object o;
    o["jsonrpc"] = MakeString(jsonrpc);
    o["id"] = std::make_shared<JSONValue>(idToJSON(id));
    o["method"] = MakeString(method);
    if (params.has_value()) {
        o["params"] = std::make_shared<JSONValue>(params.value());
    }
    return serializeJSONValue(JSONValue(std::move(o)));
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue v = parseJSONValue(json);
        if (!v.IsObject()) return false;
        jsonrpc = GetStringMember(v, "jsonrpc").value_or("");
        method = GetStringMember(v, "method").value_or("");
        id = readId(v);
        if (const JSONValue* p = FindMember(v, "params")) {
            params = *p;
        } else {
            params.reset();
        }
        return !method.empty();
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    JSONValue::Object o;
    o["jsonrpc"] = MakeString(jsonrpc);
    o["id"] = std::make_shared<JSONValue>(idToJSON(id));
    if (error.has_value()) {
        o["error"] = std::make_shared<JSONValue>(error.value());
    } else {
        o["result"] = std::make_shared<JSONValue>(result.value_or(JSONValue(JSONValue::Object{})));
    }
    return serializeJSONValue(JSONValue(std::move(o)));
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue v = parseJSONValue(json);
        if (!v.IsObject()) return false;
        jsonrpc = GetStringMember(v, "jsonrpc").value_or("");
        id = readId(v);
        result.reset();
        error.reset();
        if (const JSONValue* r = FindMember(v, "result")) result = *r;
        if (const JSONValue* e = FindMember(v, "error")) error = *e;
        return result.has_value() || error.has_value();
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    JSONValue::Object o;
    o["jsonrpc"] = MakeString(jsonrpc);
    o["method"] = MakeString(method);
    if (params.has_value()) {
        o["params"] = std::make_shared<JSONValue>(params.value());
    }
    return serializeJSONValue(JSONValue(std::move(o)));
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue v = parseJSONValue(json);
        if (!v.IsObject()) return false;
        jsonrpc = GetStringMember(v, "jsonrpc").value_or("");
        method = GetStringMember(v, "method").value_or("");
        if (const JSONValue* p = FindMember(v, "params")) {
            params = *p;
        } else {
            params.reset();
        }
        return !method.empty();
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = MakeInt(static_cast<int64_t>(code));
    errorObj["message"] = MakeString(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace tfomcp
