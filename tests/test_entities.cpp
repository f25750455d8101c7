//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: test_entities.cpp
// Purpose: GoogleTests for tools, resources, prompts, messages, events and protocol helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include <string>
#include "tfomcp/Events.h"
#include "tfomcp/Message.h"
#include "tfomcp/Prompt.h"
#include "tfomcp/Protocol.h"
#include "tfomcp/Resource.h"
#include "tfomcp/Tool.h"
#include "tfomcp/errors/Errors.h"

using namespace tfomcp;

namespace {

std::size_t arraySize(const JSONValue& v, const std::string& key) {
    const JSONValue* a = FindMember(v, key);
    if (!a || !a->IsArray()) return 0;
    return std::get<JSONValue::Array>(a->value).size();
}

const JSONValue& arrayAt(const JSONValue& v, const std::string& key, std::size_t i) {
    return *std::get<JSONValue::Array>(FindMember(v, key)->value).at(i);
}

} // namespace

TEST(ToolEntity, McpFormatIncludesSchema) {
    ToolInputSchema schema = ToolInputSchema::FromJSON(parseJSONValue(
        R"({"type":"object","properties":{"message":{"type":"string"}},"required":["message"]})"));
    Tool tool = Tool::Create("echo", "Echo a message", schema);
    JSONValue mcp = tool.ToMcpFormat();
    EXPECT_EQ(GetStringMember(mcp, "name").value(), "echo");
    EXPECT_EQ(GetStringMember(mcp, "description").value(), "Echo a message");
    const JSONValue* is = FindMember(mcp, "inputSchema");
    ASSERT_NE(is, nullptr);
    EXPECT_EQ(GetStringMember(*is, "type").value(), "object");
    EXPECT_NE(FindMember(*FindMember(*is, "properties"), "message"), nullptr);
    EXPECT_EQ(arraySize(*is, "required"), 1u);
    EXPECT_EQ(FindMember(mcp, "category"), nullptr);
}

TEST(ToolEntity, DictAddsOperationalFields) {
    Tool tool = Tool::Create("list_things", "List things", {}, nullptr, ToolOptions{"file", {"fs", "read"}, false, 12.5});
    EXPECT_FALSE(tool.IsEnabled());
    JSONValue d = tool.ToDict();
    EXPECT_EQ(GetStringMember(d, "category").value(), "file");
    EXPECT_EQ(arraySize(d, "tags"), 2u);
    EXPECT_FALSE(GetBoolMember(d, "enabled").value());
    EXPECT_DOUBLE_EQ(GetNumberMember(d, "timeout_seconds").value(), 12.5);
    tool.Enable();
    EXPECT_TRUE(tool.IsEnabled());
}

TEST(ToolEntity, CreateValidatesNameAndDescription) {
    EXPECT_THROW(Tool::Create("Bad Name", "desc"), errors::ValidationError);
    EXPECT_THROW(Tool::Create("good", ""), errors::ValidationError);
}

TEST(ToolEntity, ExecuteWithoutHandlerIsError) {
    Tool tool = Tool::Create("noop", "No handler");
    ToolResult r = tool.Execute(JSONValue{JSONValue::Object{}});
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(r.TextContent(), "Tool 'noop' has no handler");
}

TEST(ToolResultShape, TextAndErrorContent) {
    JSONValue ok = ToolResult::Text("hello").ToJSON();
    ASSERT_EQ(arraySize(ok, "content"), 1u);
    EXPECT_EQ(GetStringMember(arrayAt(ok, "content", 0), "type").value(), "text");
    EXPECT_EQ(GetStringMember(arrayAt(ok, "content", 0), "text").value(), "hello");
    EXPECT_EQ(FindMember(ok, "isError"), nullptr);

    JSONValue err = ToolResult::Error("boom").ToJSON();
    EXPECT_TRUE(GetBoolMember(err, "isError").value());

    ToolResult json = ToolResult::Json(parseJSONValue(R"({"count":2})"));
    EXPECT_EQ(GetIntMember(parseJSONValue(json.TextContent()), "count").value(), 2);
}

TEST(ResourceEntity, CreateDerivesTemplateFlag) {
    Resource plain = Resource::Create("config://server", "Server Configuration", "desc", MimeType::ApplicationJson);
    EXPECT_FALSE(plain.IsTemplate());
    EXPECT_FALSE(plain.ToTemplateFormat().has_value());
    EXPECT_TRUE(plain.MatchesUri("config://server"));
    EXPECT_FALSE(plain.MatchesUri("config://server/x"));

    Resource tpl = Resource::Create("file:///{path}", "File");
    EXPECT_TRUE(tpl.IsTemplate());
    EXPECT_TRUE(tpl.MatchesUri("file:///tmp/a.txt"));
    EXPECT_FALSE(tpl.MatchesUri("http://tmp/a.txt"));
    auto fmt = tpl.ToTemplateFormat();
    ASSERT_TRUE(fmt.has_value());
    EXPECT_EQ(GetStringMember(fmt.value(), "uriTemplate").value(), "file:///{path}");
    EXPECT_EQ(GetStringMember(fmt.value(), "mimeType").value(), "text/plain");
}

TEST(ResourceEntity, InvalidUriRejected) {
    EXPECT_THROW(Resource::Create("mailto:someone", "bad"), errors::ValidationError);
    EXPECT_THROW(Resource::Create("ftp://x/y", "bad"), errors::ValidationError);
}

TEST(ResourceEntity, ReadPassesRequestedUri) {
    Resource tpl = Resource::Template("file:///{path}", "File", "", MimeType::TextPlain,
                                      MakeResourceReader([](const std::string& uri, const JSONValue& params) {
                                          std::string tag = GetStringMember(params, "tag").value_or("");
                                          return ResourceContent::Text(uri, MimeType::TextPlain, "read:" + uri + tag);
                                      }));
    JSONValue::Object params;
    params["tag"] = MakeString("#1");
    ResourceContent c = tpl.Read("file:///etc/hosts", JSONValue{params});
    EXPECT_EQ(c.uri, "file:///etc/hosts");
    EXPECT_EQ(c.text.value(), "read:file:///etc/hosts#1");

    Resource noReader = Resource::Create("status://x", "X");
    EXPECT_EQ(noReader.Read().text.value(), "No reader configured for resource: status://x");
}

TEST(ResourceContentShape, TextAndBlob) {
    JSONValue t = ResourceContent::Text("config://server", "application/json", "{}").ToJSON();
    EXPECT_EQ(GetStringMember(t, "text").value(), "{}");
    EXPECT_EQ(FindMember(t, "blob"), nullptr);

    JSONValue b = ResourceContent::Blob("file:///bin", "application/octet-stream", std::string("Man")).ToJSON();
    EXPECT_EQ(GetStringMember(b, "blob").value(), "TWFu");
    EXPECT_EQ(FindMember(b, "text"), nullptr);
}

TEST(ResourceContentShape, Base64Padding) {
    EXPECT_EQ(EncodeBase64(""), "");
    EXPECT_EQ(EncodeBase64("M"), "TQ==");
    EXPECT_EQ(EncodeBase64("Ma"), "TWE=");
    EXPECT_EQ(EncodeBase64("\x01\x02\x03"), "AQID");
}

TEST(PromptEntity, RequiredArgumentEnforced) {
    Prompt prompt("greet", "Say hello",
                  {PromptArgument{"name", "Who to greet", true}, PromptArgument{"tone", "", false}},
                  MakePromptGenerator([](const PromptArguments& args) {
                      return std::vector<PromptMessage>{PromptMessage{Role::User, "Hello " + args.at("name")}};
                  }));
    try {
        prompt.GetMessages({});
        FAIL() << "expected ValidationError";
    } catch (const errors::ValidationError& e) {
        EXPECT_STREQ(e.what(), "Missing required argument: name");
    }
    auto msgs = prompt.GetMessages({{"name", "Ada"}});
    ASSERT_EQ(msgs.size(), 1u);
    JSONValue m = msgs[0].ToJSON();
    EXPECT_EQ(GetStringMember(m, "role").value(), "user");
    EXPECT_EQ(GetStringMember(*FindMember(m, "content"), "text").value(), "Hello Ada");
}

TEST(PromptEntity, McpFormatOmitsOptionalFields) {
    JSONValue bare = Prompt("bare").ToMcpFormat();
    EXPECT_EQ(FindMember(bare, "description"), nullptr);
    EXPECT_EQ(FindMember(bare, "arguments"), nullptr);

    Prompt p("p", "d", {PromptArgument{"code", "The code", true}, PromptArgument{"lang", "", false}});
    JSONValue f = p.ToMcpFormat();
    ASSERT_EQ(arraySize(f, "arguments"), 2u);
    EXPECT_TRUE(GetBoolMember(arrayAt(f, "arguments", 0), "required").value());
    EXPECT_EQ(FindMember(arrayAt(f, "arguments", 1), "required"), nullptr);
    EXPECT_EQ(FindMember(arrayAt(f, "arguments", 1), "description"), nullptr);
    EXPECT_TRUE(Prompt("empty").GetMessages({}).empty());
    EXPECT_THROW(Prompt(""), errors::ValidationError);
}

TEST(PromptEntity, ArgumentsFromJsonStringifiesNonStrings) {
    PromptArguments args = PromptArgumentsFromJSON(parseJSONValue(R"({"code":"x=1","count":3,"flag":true})"));
    EXPECT_EQ(args.at("code"), "x=1");
    EXPECT_EQ(args.at("count"), "3");
    EXPECT_EQ(args.at("flag"), "true");
    EXPECT_TRUE(PromptArgumentsFromJSON(parseJSONValue("[1]")).empty());
}

TEST(MessageEntity, TextAndToolUse) {
    Message m(Role::Assistant, {TextBlock{"first"}, ToolUseBlock{"tu_1", "echo", parseJSONValue(R"({"message":"x"})")},
                                TextBlock{"second"}});
    EXPECT_EQ(m.Text(), "first\nsecond");
    EXPECT_TRUE(m.HasToolUse());
    ASSERT_EQ(m.ToolUses().size(), 1u);
    EXPECT_EQ(m.ToolUses()[0].name, "echo");
    EXPECT_FALSE(Message::User("hi").HasToolUse());
}

TEST(MessageEntity, ApiFormatAlwaysCarriesIsError) {
    Message m(Role::User, {ToolResultBlock{"tu_1", "output", false}});
    JSONValue api = m.ToApiFormat();
    EXPECT_EQ(GetStringMember(api, "role").value(), "user");
    const JSONValue& block = arrayAt(api, "content", 0);
    EXPECT_EQ(GetStringMember(block, "type").value(), "tool_result");
    EXPECT_EQ(GetStringMember(block, "tool_use_id").value(), "tu_1");
    EXPECT_FALSE(GetBoolMember(block, "is_error").value());

    JSONValue plain = ContentBlockToJSON(ToolResultBlock{"tu_1", "output", false});
    EXPECT_EQ(FindMember(plain, "is_error"), nullptr);
}

TEST(MessageEntity, TokenTotals) {
    Message m = Message::Assistant("ok");
    m.inputTokens = 10;
    m.outputTokens = 5;
    EXPECT_EQ(m.TotalTokens(), 15);
    JSONValue j = m.ToJSON();
    EXPECT_EQ(GetIntMember(j, "inputTokens").value(), 10);
    EXPECT_EQ(GetStringMember(j, "id").value(), m.id.Value());
}

TEST(DomainEvents, SerializeCommonAndPayload) {
    ToolExecuted ev("sess-1", "echo", false, 12.0, "boom");
    JSONValue j = ev.ToJSON();
    EXPECT_EQ(GetStringMember(j, "eventType").value(), "ToolExecuted");
    EXPECT_EQ(GetStringMember(j, "eventId").value().size(), 36u);
    EXPECT_TRUE(GetStringMember(j, "occurredAt").has_value());
    ASSERT_NE(FindMember(j, "metadata"), nullptr);
    EXPECT_EQ(GetStringMember(j, "toolName").value(), "echo");

    SessionInitialized init("sess-1", "client", "1.0", PROTOCOL_VERSION);
    JSONValue k = init.ToJSON();
    EXPECT_EQ(GetStringMember(k, "clientName").value(), "client");
    EXPECT_EQ(GetStringMember(k, "protocolVersion").value(), "2024-11-05");
}

TEST(ProtocolHelpers, RolesAndLogLevels) {
    EXPECT_EQ(ToString(Role::Assistant), "assistant");
    EXPECT_EQ(RoleFromString("SYSTEM"), Role::System);
    EXPECT_THROW(RoleFromString("robot"), errors::ValidationError);
    EXPECT_EQ(MCPLogLevelFromString("warning"), MCPLogLevel::Warning);
    EXPECT_EQ(ToString(MCPLogLevel::Error), "error");
    EXPECT_TRUE(ProtocolVersion::IsSupported("2024-11-05"));
    EXPECT_FALSE(ProtocolVersion::IsSupported("1999-01-01"));
}

TEST(ProtocolHelpers, ModelsAndMimeTypes) {
    EXPECT_TRUE(Model::IsKnown(Model::Default));
    EXPECT_EQ(Model::Validate(Model::Claude3Haiku), "claude-3-haiku-20240307");
    EXPECT_THROW(Model::Validate("gpt-4"), errors::ValidationError);

    EXPECT_EQ(MimeType::FromPath("/tmp/readme.md"), "text/markdown");
    EXPECT_EQ(MimeType::FromPath("/tmp/data.JSON"), "application/json");
    EXPECT_EQ(MimeType::FromPath("/tmp.d/noext"), "application/octet-stream");
    EXPECT_EQ(MimeType::FromExtension(".png"), "image/png");
    EXPECT_TRUE(MimeType::IsText("text/csv"));
    EXPECT_FALSE(MimeType::IsText("image/png"));
}
