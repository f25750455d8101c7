//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Prompt.cpp
// Purpose: Prompt entity implementation and wire formats
//==========================================================================================================

#include "tfomcp/Prompt.h"
#include "tfomcp/errors/Errors.h"

namespace tfomcp {

namespace {
class FunctionPromptGenerator : public IPromptGenerator {
public:
    explicit FunctionPromptGenerator(PromptGenerateFunction fn) : fn(std::move(fn)) {}
    std::vector<PromptMessage> Generate(const PromptArguments& arguments) override {
        return fn(arguments);
    }
private:
    PromptGenerateFunction fn;
};
} // namespace

PromptArguments PromptArgumentsFromJSON(const JSONValue& v) {
    PromptArguments out;
    const auto* obj = std::get_if<JSONValue::Object>(&v.value);
    if (!obj) return out;
    for (const auto& [key, val] : *obj) {
        if (!val) continue;
        if (val->IsString()) {
            out[key] = std::get<std::string>(val->value);
        } else {
            out[key] = serializeJSONValue(*val);
        }
    }
    return out;
}

JSONValue PromptArgument::ToJSON() const {
    JSONValue::Object o;
    o["name"] = MakeString(name);
    if (!description.empty()) {
        o["description"] = MakeString(description);
    }
    if (required) {
        o["required"] = MakeBool(true);
    }
    return JSONValue{o};
}

JSONValue PromptMessage::ToJSON() const {
    JSONValue::Object content;
    content["type"] = MakeString("text");
    content["text"] = MakeString(this->content);
    JSONValue::Object o;
    o["role"] = MakeString(ToString(role));
    o["content"] = MakeObject(std::move(content));
    return JSONValue{o};
}

std::shared_ptr<IPromptGenerator> MakePromptGenerator(PromptGenerateFunction fn) {
    return std::make_shared<FunctionPromptGenerator>(std::move(fn));
}

Prompt::Prompt(std::string name, std::string description, std::vector<PromptArgument> arguments,
               std::shared_ptr<IPromptGenerator> generator)
    : name_(std::move(name)), description_(std::move(description)), arguments_(std::move(arguments)),
      generator_(std::move(generator)), createdAt_(Now()) {
    if (name_.empty()) {
        throw errors::ValidationError("Prompt name cannot be empty");
    }
}

std::vector<PromptMessage> Prompt::GetMessages(const PromptArguments& arguments) const {
    for (const auto& arg : arguments_) {
        if (arg.required && arguments.find(arg.name) == arguments.end()) {
            throw errors::ValidationError("Missing required argument: " + arg.name);
        }
    }
    if (!generator_) {
        return {};
    }
    return generator_->Generate(arguments);
}

JSONValue Prompt::ToMcpFormat() const {
    JSONValue::Object o;
    o["name"] = MakeString(name_);
    if (!description_.empty()) {
        o["description"] = MakeString(description_);
    }
    if (!arguments_.empty()) {
        JSONValue::Array args;
        for (const auto& a : arguments_) args.push_back(std::make_shared<JSONValue>(a.ToJSON()));
        o["arguments"] = MakeArray(std::move(args));
    }
    return JSONValue{o};
}

} // namespace tfomcp
