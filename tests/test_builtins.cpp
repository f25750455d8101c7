//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: test_builtins.cpp
// Purpose: GoogleTests for the built-in tools, resources and prompts
//==========================================================================================================

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tfomcp/Builtins.h"
#include "tfomcp/Identifiers.h"
#include "tfomcp/errors/Errors.h"

using namespace tfomcp;
namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() / ("tfomcp-builtins-" + GenerateUuid())) {
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }
    void write(const std::string& rel, const std::string& body) const {
        fs::create_directories((path_ / rel).parent_path());
        std::ofstream(path_ / rel, std::ios::binary) << body;
    }
private:
    fs::path path_;
};

class StubChat : public IChatService {
public:
    Message CreateMessage(const ChatRequest& request) override {
        lastModel = request.model;
        return Message::Assistant("stub reply to " + request.messages.back().Text());
    }
    void CreateMessageStream(const ChatRequest&, const ChatStreamCallback&) override {}
    int64_t CountTokens(const ChatRequest&) override { return 0; }
    std::string lastModel;
};

std::optional<Tool> findTool(const std::vector<Tool>& tools, const std::string& name) {
    for (const auto& t : tools) {
        if (t.Name() == name) return t;
    }
    return std::nullopt;
}

ToolResult run(const std::string& name, const std::string& argsJson) {
    auto tools = CreateBuiltinTools(Config());
    auto tool = findTool(tools, name);
    if (!tool) throw std::runtime_error("missing built-in " + name);
    return tool->Execute(parseJSONValue(argsJson));
}

std::string quoted(const fs::path& p) {
    return serializeJSONValue(JSONValue{p.string()});
}

const JSONValue::Array& arrayOf(const JSONValue& v) {
    return std::get<JSONValue::Array>(v.value);
}

} // namespace

TEST(BuiltinTools, CatalogueAndTimeouts) {
    Config config;
    config.mcp.toolTimeout = 12.0;
    auto tools = CreateBuiltinTools(config);
    EXPECT_EQ(tools.size(), 7u);
    for (const char* name : {"echo", "read_file", "write_file", "list_directory", "search_files", "execute_command",
                             "system_info"}) {
        auto tool = findTool(tools, name);
        ASSERT_TRUE(tool.has_value()) << name;
        EXPECT_DOUBLE_EQ(tool->TimeoutSeconds(), 12.0);
    }
    EXPECT_FALSE(findTool(tools, "claude_conversation").has_value());

    auto withChat = CreateBuiltinTools(config, std::make_shared<StubChat>());
    ASSERT_EQ(withChat.size(), 8u);
    EXPECT_DOUBLE_EQ(findTool(withChat, "claude_conversation")->TimeoutSeconds(), 120.0);
}

TEST(BuiltinTools, SchemaDescriptionsKeepParentheses) {
    auto tools = CreateBuiltinTools(Config());
    auto description = [&tools](const std::string& tool, const std::string& prop) {
        auto found = findTool(tools, tool);
        if (!found) return std::string();
        const auto& props = found->InputSchema().properties;
        auto it = props.find(prop);
        if (it == props.end()) return std::string();
        return GetStringMember(*it->second, "description").value_or("");
    };
    EXPECT_EQ(description("read_file", "encoding"), "File encoding (default: utf-8)");
    EXPECT_EQ(description("search_files", "pattern"), "Glob pattern to match (e.g., '*.py', '**/*.txt')");
    EXPECT_EQ(description("execute_command", "timeout"), "Timeout in seconds (default: 30)");
    auto exec = findTool(tools, "execute_command");
    ASSERT_TRUE(exec.has_value());
    EXPECT_EQ(exec->InputSchema().required, std::vector<std::string>{"command"});
}

TEST(BuiltinTools, Echo) {
    ToolResult r = run("echo", R"({"message":"hello"})");
    EXPECT_FALSE(r.isError);
    EXPECT_EQ(r.TextContent(), "Echo: hello");
}

TEST(BuiltinTools, WriteThenReadFile) {
    TempDir dir;
    const fs::path file = dir.path() / "nested" / "note.txt";

    ToolResult missingDir = run("write_file", R"({"path":)" + quoted(file) + R"(,"content":"x"})");
    EXPECT_TRUE(missingDir.isError);
    EXPECT_EQ(missingDir.TextContent().rfind("Directory does not exist: ", 0), 0u);

    ToolResult wrote =
        run("write_file", R"({"path":)" + quoted(file) + R"(,"content":"h\u00e9llo","create_dirs":true})");
    EXPECT_FALSE(wrote.isError);
    EXPECT_EQ(wrote.TextContent(), "Successfully wrote 6 bytes to " + file.string());

    ToolResult read = run("read_file", R"({"path":)" + quoted(file) + "}");
    EXPECT_FALSE(read.isError);
    EXPECT_EQ(read.TextContent(), "h\xC3\xA9llo");
}

TEST(BuiltinTools, ReadFileErrors) {
    TempDir dir;
    EXPECT_EQ(run("read_file", "{}").TextContent(), "Path is required");

    const fs::path missing = dir.path() / "missing.txt";
    ToolResult r = run("read_file", R"({"path":)" + quoted(missing) + "}");
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(r.TextContent(), "File not found: " + missing.string());

    r = run("read_file", R"({"path":)" + quoted(dir.path()) + "}");
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(r.TextContent(), "Not a file: " + dir.path().string());
}

TEST(BuiltinTools, ListDirectorySorted) {
    TempDir dir;
    dir.write("b.txt", "b");
    dir.write("a.txt", "a");
    dir.write("sub/c.txt", "c");

    ToolResult flat = run("list_directory", R"({"path":)" + quoted(dir.path()) + "}");
    ASSERT_FALSE(flat.isError);
    JSONValue entries = parseJSONValue(flat.TextContent());
    ASSERT_EQ(arrayOf(entries).size(), 3u);
    EXPECT_EQ(GetStringMember(*arrayOf(entries)[0], "name").value(), "a.txt");
    EXPECT_EQ(GetStringMember(*arrayOf(entries)[2], "name").value(), "sub");
    EXPECT_EQ(GetStringMember(*arrayOf(entries)[2], "type").value(), "directory");

    ToolResult deep = run("list_directory", R"({"path":)" + quoted(dir.path()) + R"(,"recursive":true})");
    JSONValue all = parseJSONValue(deep.TextContent());
    ASSERT_EQ(arrayOf(all).size(), 4u);
    EXPECT_EQ(GetStringMember(*arrayOf(all)[3], "path").value(), "sub/c.txt");

    ToolResult notDir = run("list_directory", R"({"path":)" + quoted(dir.path() / "a.txt") + "}");
    EXPECT_TRUE(notDir.isError);
}

TEST(BuiltinTools, SearchFiles) {
    TempDir dir;
    dir.write("top.txt", "");
    dir.write("top.md", "");
    dir.write("src/inner.txt", "");
    dir.write("src/deep/more.txt", "");

    ToolResult byName = run("search_files", R"({"path":)" + quoted(dir.path()) + R"(,"pattern":"*.txt"})");
    JSONValue found = parseJSONValue(byName.TextContent());
    EXPECT_EQ(GetIntMember(found, "count").value(), 3);
    const auto& matches = std::get<JSONValue::Array>(FindMember(found, "matches")->value);
    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(std::get<std::string>(matches[0]->value), "src/deep/more.txt");
    EXPECT_EQ(std::get<std::string>(matches[2]->value), "top.txt");

    ToolResult byPath = run("search_files", R"({"path":)" + quoted(dir.path()) + R"(,"pattern":"**/*.txt"})");
    EXPECT_EQ(GetIntMember(parseJSONValue(byPath.TextContent()), "count").value(), 2);

    ToolResult missing = run("search_files", R"({"path":"/nonexistent-tfomcp","pattern":"*"})");
    EXPECT_TRUE(missing.isError);
    EXPECT_EQ(missing.TextContent(), "Directory not found: /nonexistent-tfomcp");
}

TEST(BuiltinTools, ExecuteCommand) {
    ToolResult ok = run("execute_command", R"({"command":"echo out; echo err 1>&2"})");
    EXPECT_FALSE(ok.isError);
    JSONValue body = parseJSONValue(ok.TextContent());
    EXPECT_EQ(GetIntMember(body, "exit_code").value(), 0);
    EXPECT_EQ(GetStringMember(body, "stdout").value(), "out\n");
    EXPECT_EQ(GetStringMember(body, "stderr").value(), "err\n");

    ToolResult failed = run("execute_command", R"({"command":"exit 3"})");
    EXPECT_TRUE(failed.isError);
    EXPECT_EQ(GetIntMember(parseJSONValue(failed.TextContent()), "exit_code").value(), 3);

    TempDir dir;
    ToolResult inDir = run("execute_command", R"({"command":"pwd","working_dir":)" + quoted(dir.path()) + "}");
    EXPECT_EQ(GetStringMember(parseJSONValue(inDir.TextContent()), "stdout").value(),
              fs::canonical(dir.path()).string() + "\n");

    EXPECT_EQ(run("execute_command", "{}").TextContent(), "Command is required");
}

TEST(BuiltinTools, ExecuteCommandTimeout) {
    ToolResult r = run("execute_command", R"({"command":"sleep 5","timeout":0.2})");
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(r.TextContent(), "Command timed out after 0.2s");
}

TEST(BuiltinTools, SystemInfoKeys) {
    ToolResult r = run("system_info", "{}");
    ASSERT_FALSE(r.isError);
    JSONValue info = parseJSONValue(r.TextContent());
    for (const char* key : {"platform", "platform_release", "architecture", "hostname", "cwd", "user"}) {
        EXPECT_TRUE(GetStringMember(info, key).has_value()) << key;
    }
    EXPECT_EQ(GetStringMember(info, "platform").value(), "Linux");
}

TEST(BuiltinTools, ClaudeConversationUsesChatService) {
    auto chat = std::make_shared<StubChat>();
    auto tools = CreateBuiltinTools(Config(), chat);
    auto tool = findTool(tools, "claude_conversation");
    ASSERT_TRUE(tool.has_value());

    ToolResult r = tool->Execute(parseJSONValue(R"({"message":"ping","model":"not-a-model"})"));
    EXPECT_FALSE(r.isError);
    EXPECT_EQ(r.TextContent(), "stub reply to ping");
    EXPECT_EQ(chat->lastModel, Model::Default);

    EXPECT_EQ(tool->Execute(parseJSONValue("{}")).TextContent(), "Message is required");
}

TEST(BuiltinResources, HealthTracksSession) {
    auto session = Session::Create();
    auto resources = CreateBuiltinResources(session, Config());
    ASSERT_EQ(resources.size(), 3u);
    const Resource& health = resources[1];
    EXPECT_EQ(health.Uri(), "status://health");

    JSONValue before = parseJSONValue(health.Read("status://health").text.value());
    EXPECT_EQ(GetStringMember(before, "status").value(), "not_ready");

    session->Initialize(Implementation("c", "1"));
    JSONValue after = parseJSONValue(health.Read("status://health").text.value());
    EXPECT_EQ(GetStringMember(after, "status").value(), "healthy");
    EXPECT_EQ(GetStringMember(*FindMember(after, "session"), "state").value(), "ready");

    std::weak_ptr<Session> gone;
    auto orphaned = CreateBuiltinResources(gone, Config());
    JSONValue none = parseJSONValue(orphaned[1].Read("status://health").text.value());
    EXPECT_EQ(GetStringMember(none, "status").value(), "not_ready");
    EXPECT_EQ(FindMember(none, "session"), nullptr);
}

TEST(BuiltinResources, FileTemplate) {
    TempDir dir;
    dir.write("readme.md", "# Title\n");
    dir.write("raw.bin", std::string("\xC3\x28\x00\x01", 4));
    auto resources = CreateBuiltinResources(std::weak_ptr<Session>(), Config());
    const Resource& file = resources[2];
    ASSERT_TRUE(file.IsTemplate());

    const std::string textUri = "file://" + (dir.path() / "readme.md").string();
    ASSERT_TRUE(file.MatchesUri(textUri));
    ResourceContent text = file.Read(textUri);
    EXPECT_EQ(text.uri, textUri);
    EXPECT_EQ(text.text.value(), "# Title\n");
    EXPECT_EQ(text.mimeType, MimeType::TextMarkdown);

    const std::string binUri = "file://" + (dir.path() / "raw.bin").string();
    ResourceContent blob = file.Read(binUri);
    EXPECT_FALSE(blob.text.has_value());
    ASSERT_TRUE(blob.blob.has_value());
    EXPECT_EQ(blob.blob->size(), 4u);
    EXPECT_EQ(blob.mimeType, MimeType::OctetStream);

    ResourceContent missing = file.Read("file:///nonexistent-tfomcp/x.txt");
    EXPECT_EQ(missing.text.value(), "Error: File not found: /nonexistent-tfomcp/x.txt");
}

TEST(BuiltinResources, ConfigSnapshot) {
    Config config;
    config.server.name = "custom-name";
    auto resources = CreateBuiltinResources(std::weak_ptr<Session>(), config);
    ResourceContent c = resources[0].Read("config://server");
    EXPECT_EQ(c.mimeType, MimeType::ApplicationJson);
    JSONValue body = parseJSONValue(c.text.value());
    EXPECT_EQ(GetStringMember(*FindMember(body, "server"), "name").value(), "custom-name");
    EXPECT_EQ(GetBoolMember(*FindMember(body, "mcp"), "enableTools").value(), true);
}

TEST(BuiltinPrompts, RenderedTexts) {
    auto prompts = CreateBuiltinPrompts();
    ASSERT_EQ(prompts.size(), 3u);
    EXPECT_EQ(prompts[0].Name(), "code_review");
    EXPECT_EQ(prompts[1].Name(), "explain_code");
    EXPECT_EQ(prompts[2].Name(), "debug_help");

    auto review = prompts[0].GetMessages({{"code", "x = 1"}, {"language", "python"}});
    ASSERT_EQ(review.size(), 1u);
    EXPECT_EQ(review[0].role, Role::User);
    EXPECT_EQ(review[0].content.rfind("Please review the following python code", 0), 0u);
    EXPECT_NE(review[0].content.find("```python\nx = 1\n```"), std::string::npos);

    auto brief = prompts[1].GetMessages({{"code", "f()"}, {"detail_level", "brief"}});
    EXPECT_NE(brief[0].content.find("Provide a brief, high-level explanation."), std::string::npos);
    auto medium = prompts[1].GetMessages({{"code", "f()"}});
    EXPECT_NE(medium[0].content.find("Provide a balanced explanation with key details."), std::string::npos);

    EXPECT_THROW(prompts[2].GetMessages({{"code", "f()"}}), errors::ValidationError);
    auto debug = prompts[2].GetMessages({{"code", "f()"}, {"error", "boom"}});
    EXPECT_NE(debug[0].content.find("The error/issue:\nboom"), std::string::npos);
}

TEST(BuiltinRegistration, HonoursEnableFlags) {
    ToolInvoker invoker(std::make_shared<NullTelemetrySink>(), 1);

    auto all = Session::Create();
    RegisterBuiltins(all, invoker, Config(), nullptr);
    EXPECT_EQ(all->ToolCount(), 7u);
    EXPECT_EQ(all->ResourceCount(), 3u);
    EXPECT_EQ(all->PromptCount(), 3u);

    auto withChat = Session::Create();
    RegisterBuiltins(withChat, invoker, Config(), std::make_shared<StubChat>());
    EXPECT_EQ(withChat->ToolCount(), 8u);

    Config toolsOnly;
    toolsOnly.mcp.enableResources = false;
    toolsOnly.mcp.enablePrompts = false;
    auto narrow = Session::Create();
    RegisterBuiltins(narrow, invoker, toolsOnly, nullptr);
    EXPECT_EQ(narrow->ToolCount(), 7u);
    EXPECT_EQ(narrow->ResourceCount(), 0u);
    EXPECT_EQ(narrow->PromptCount(), 0u);
}
