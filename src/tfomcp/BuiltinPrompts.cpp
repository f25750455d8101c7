//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: BuiltinPrompts.cpp
// Purpose: Built-in prompt templates for code review, explanation and debugging
//==========================================================================================================

#include "tfomcp/Builtins.h"

namespace tfomcp {

namespace {

std::string arg(const PromptArguments& args, const std::string& name, const std::string& fallback = "") {
    auto it = args.find(name);
    return it != args.end() ? it->second : fallback;
}

std::string fenced(const std::string& language, const std::string& code) {
    return "```" + language + "\n" + code + "\n```";
}

std::vector<PromptMessage> codeReview(const PromptArguments& args) {
    const std::string code = arg(args, "code");
    const std::string language = arg(args, "language");
    std::string text = "Please review the following " + language + " code and provide feedback on:\n"
                       "1. Code quality and best practices\n"
                       "2. Potential bugs or issues\n"
                       "3. Performance considerations\n"
                       "4. Security concerns\n"
                       "5. Suggestions for improvement\n\n"
                       "Code to review:\n" +
                       fenced(language, code) +
                       "\n\nPlease provide a thorough code review with specific recommendations.";
    return {PromptMessage{Role::User, std::move(text)}};
}

std::vector<PromptMessage> explainCode(const PromptArguments& args) {
    const std::string code = arg(args, "code");
    const std::string language = arg(args, "language");
    const std::string level = arg(args, "detail_level", "medium");
    std::string instruction = "Provide a balanced explanation with key details.";
    if (level == "brief") {
        instruction = "Provide a brief, high-level explanation.";
    } else if (level == "detailed") {
        instruction = "Provide a comprehensive, in-depth explanation.";
    }
    std::string text = "Please explain the following " + language + " code.\n\n" + instruction +
                       "\n\nCode to explain:\n" + fenced(language, code) +
                       "\n\nInclude:\n"
                       "- What the code does overall\n"
                       "- Key functions and their purposes\n"
                       "- Important data structures\n"
                       "- Any notable patterns or techniques used";
    return {PromptMessage{Role::User, std::move(text)}};
}

std::vector<PromptMessage> debugHelp(const PromptArguments& args) {
    const std::string code = arg(args, "code");
    const std::string error = arg(args, "error");
    const std::string language = arg(args, "language");
    std::string text = "I need help debugging this " + language + " code.\n\nThe code:\n" + fenced(language, code) +
                       "\n\nThe error/issue:\n" + error +
                       "\n\nPlease help me:\n"
                       "1. Understand what's causing the error\n"
                       "2. Identify the root cause\n"
                       "3. Suggest a fix with explanation\n"
                       "4. Recommend any preventive measures for similar issues";
    return {PromptMessage{Role::User, std::move(text)}};
}

PromptArgument languageArgument() {
    return PromptArgument{"language", "Programming language of the code", false};
}

} // namespace

std::vector<Prompt> CreateBuiltinPrompts() {
    std::vector<Prompt> prompts;
    prompts.emplace_back("code_review", "Get a thorough code review with actionable feedback",
                         std::vector<PromptArgument>{{"code", "The code to review", true}, languageArgument()},
                         MakePromptGenerator(codeReview));
    prompts.emplace_back("explain_code", "Get a detailed explanation of what code does",
                         std::vector<PromptArgument>{{"code", "The code to explain", true},
                                                     languageArgument(),
                                                     {"detail_level", "Level of detail: brief, medium, or detailed", false}},
                         MakePromptGenerator(explainCode));
    prompts.emplace_back("debug_help", "Get help debugging code errors",
                         std::vector<PromptArgument>{{"code", "The code with the bug", true},
                                                     {"error", "The error message or description of the issue", true},
                                                     languageArgument()},
                         MakePromptGenerator(debugHelp));
    return prompts;
}

} // namespace tfomcp
