//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Prompt.h
// Purpose: Prompt entity, prompt arguments/messages and the prompt generator interface
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "tfomcp/Identifiers.h"
#include "tfomcp/JSONRPCTypes.h"
#include "tfomcp/Protocol.h"

namespace tfomcp {

using PromptArguments = std::map<std::string, std::string>;

// Converts a prompts/get "arguments" object. Non-string values are kept in serialized JSON form.
PromptArguments PromptArgumentsFromJSON(const JSONValue& v);

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;

    // description omitted when empty; required emitted only when true
    JSONValue ToJSON() const;
};

struct PromptMessage {
    Role role = Role::User;
    std::string content;

    // { role, content: { type: "text", text } }
    JSONValue ToJSON() const;
};

//==========================================================================================================
// IPromptGenerator
// Purpose: Maps a validated argument map to an ordered list of messages.
//==========================================================================================================
class IPromptGenerator {
public:
    virtual ~IPromptGenerator() = default;
    virtual std::vector<PromptMessage> Generate(const PromptArguments& arguments) = 0;
};

using PromptGenerateFunction = std::function<std::vector<PromptMessage>(const PromptArguments&)>;

std::shared_ptr<IPromptGenerator> MakePromptGenerator(PromptGenerateFunction fn);

//==========================================================================================================
// Prompt
// Purpose: Parameterised message template identified by name.
//==========================================================================================================
class Prompt {
public:
    Prompt(std::string name, std::string description = "", std::vector<PromptArgument> arguments = {},
           std::shared_ptr<IPromptGenerator> generator = nullptr);

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }
    const std::vector<PromptArgument>& Arguments() const { return arguments_; }
    Timestamp CreatedAt() const { return createdAt_; }

    //==========================================================================================================
    // GetMessages
    // Purpose: Validates required arguments and runs the generator.
    // Returns:
    //   Generated messages; empty when no generator is configured.
    //   Throws errors::ValidationError("Missing required argument: <name>").
    //==========================================================================================================
    std::vector<PromptMessage> GetMessages(const PromptArguments& arguments) const;

    // { name, description?, arguments? }
    JSONValue ToMcpFormat() const;

private:
    std::string name_;
    std::string description_;
    std::vector<PromptArgument> arguments_;
    std::shared_ptr<IPromptGenerator> generator_;
    Timestamp createdAt_;
};

} // namespace tfomcp
