//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Tool.cpp
// Purpose: Tool entity implementation and wire formats
//==========================================================================================================

#include "tfomcp/Tool.h"

namespace tfomcp {

namespace {
JSONValue makeTextItem(const std::string& text) {
    JSONValue::Object o;
    o["type"] = MakeString("text");
    o["text"] = MakeString(text);
    return JSONValue{o};
}

class FunctionToolHandler : public IToolHandler {
public:
    explicit FunctionToolHandler(ToolFunction fn) : fn(std::move(fn)) {}
    ToolResult Invoke(const JSONValue& arguments, std::stop_token stopToken) override {
        return fn(arguments, stopToken);
    }
private:
    ToolFunction fn;
};
} // namespace

//----------------------------------------------------------------------------------------------------------
// ToolResult
//----------------------------------------------------------------------------------------------------------
ToolResult ToolResult::Text(const std::string& text) {
    ToolResult r;
    r.content.push_back(makeTextItem(text));
    return r;
}

ToolResult ToolResult::Error(const std::string& message) {
    ToolResult r = Text(message);
    r.isError = true;
    return r;
}

ToolResult ToolResult::Json(const JSONValue& value) {
    return Text(serializeJSONValue(value));
}

std::string ToolResult::TextContent() const {
    std::string out;
    for (const auto& item : content) {
        auto text = GetStringMember(item, "text");
        if (!text.has_value()) continue;
        if (!out.empty()) out.push_back('\n');
        out += text.value();
    }
    return out;
}

JSONValue ToolResult::ToJSON() const {
    JSONValue::Object o;
    JSONValue::Array arr;
    for (const auto& item : content) arr.push_back(std::make_shared<JSONValue>(item));
    o["content"] = MakeArray(std::move(arr));
    if (isError) {
        o["isError"] = MakeBool(true);
    }
    return JSONValue{o};
}

//----------------------------------------------------------------------------------------------------------
// ToolInputSchema
//----------------------------------------------------------------------------------------------------------
JSONValue ToolInputSchema::ToJSON() const {
    JSONValue::Object o;
    o["type"] = MakeString(type);
    o["properties"] = MakeObject(properties);
    if (!required.empty()) {
        JSONValue::Array req;
        for (const auto& r : required) req.push_back(MakeString(r));
        o["required"] = MakeArray(std::move(req));
    }
    if (!additionalProperties) {
        o["additionalProperties"] = MakeBool(false);
    }
    return JSONValue{o};
}

ToolInputSchema ToolInputSchema::FromJSON(const JSONValue& v) {
    ToolInputSchema s;
    s.type = GetStringMember(v, "type").value_or("object");
    if (const JSONValue* props = FindMember(v, "properties")) {
        if (props->IsObject()) s.properties = std::get<JSONValue::Object>(props->value);
    }
    if (const JSONValue* req = FindMember(v, "required")) {
        if (req->IsArray()) {
            for (const auto& item : std::get<JSONValue::Array>(req->value)) {
                if (item && item->IsString()) s.required.push_back(std::get<std::string>(item->value));
            }
        }
    }
    s.additionalProperties = GetBoolMember(v, "additionalProperties").value_or(false);
    return s;
}

std::shared_ptr<IToolHandler> MakeToolHandler(ToolFunction fn) {
    return std::make_shared<FunctionToolHandler>(std::move(fn));
}

//----------------------------------------------------------------------------------------------------------
// Tool
//----------------------------------------------------------------------------------------------------------
Tool::Tool(ToolName name, ToolDescription description, ToolInputSchema inputSchema,
           std::shared_ptr<IToolHandler> handler, ToolOptions options)
    : name_(std::move(name)), description_(std::move(description)), inputSchema_(std::move(inputSchema)),
      handler_(std::move(handler)), options_(std::move(options)), createdAt_(Now()) {}

Tool Tool::Create(const std::string& name, const std::string& description, ToolInputSchema inputSchema,
                  std::shared_ptr<IToolHandler> handler, ToolOptions options) {
    return Tool(ToolName(name), ToolDescription(description), std::move(inputSchema),
                std::move(handler), std::move(options));
}

ToolResult Tool::Execute(const JSONValue& arguments, std::stop_token stopToken) const {
    if (!handler_) {
        return ToolResult::Error("Tool '" + Name() + "' has no handler");
    }
    return handler_->Invoke(arguments, stopToken);
}

JSONValue Tool::ToMcpFormat() const {
    JSONValue::Object o;
    o["name"] = MakeString(Name());
    o["description"] = MakeString(Description());
    o["inputSchema"] = std::make_shared<JSONValue>(inputSchema_.ToJSON());
    return JSONValue{o};
}

JSONValue Tool::ToDict() const {
    JSONValue v = ToMcpFormat();
    auto& o = std::get<JSONValue::Object>(v.value);
    o["category"] = MakeString(options_.category);
    JSONValue::Array tags;
    for (const auto& t : options_.tags) tags.push_back(MakeString(t));
    o["tags"] = MakeArray(std::move(tags));
    o["enabled"] = MakeBool(options_.enabled);
    o["timeout_seconds"] = MakeDouble(options_.timeoutSeconds);
    return v;
}

} // namespace tfomcp
