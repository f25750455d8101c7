//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: test_server.cpp
// Purpose: GoogleTests for JSON-RPC envelope handling and MCP method dispatch
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <poll.h>
#include <unistd.h>
#include "tfomcp/Server.h"
#include "tfomcp/StdioTransport.hpp"

using namespace tfomcp;

namespace {

const char* kInitialize =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05",)"
    R"("capabilities":{},"clientInfo":{"name":"test-client","version":"0.1"}}})";

JSONValue send(Server& server, const std::string& line) {
    auto reply = server.HandleLine(line);
    if (!reply.has_value()) {
        ADD_FAILURE() << "no response for: " << line;
        return JSONValue{};
    }
    return parseJSONValue(reply.value());
}

int64_t errorCode(const JSONValue& response) {
    const JSONValue* err = FindMember(response, "error");
    if (!err) return 0;
    return GetIntMember(*err, "code").value_or(0);
}

std::string errorMessage(const JSONValue& response) {
    const JSONValue* err = FindMember(response, "error");
    if (!err) return "";
    return GetStringMember(*err, "message").value_or("");
}

const JSONValue& result(const JSONValue& response) {
    static const JSONValue empty{JSONValue::Object{}};
    const JSONValue* r = FindMember(response, "result");
    return r ? *r : empty;
}

const JSONValue::Array& arrayMember(const JSONValue& v, const std::string& key) {
    static const JSONValue::Array empty;
    const JSONValue* a = FindMember(v, key);
    if (!a || !a->IsArray()) return empty;
    return std::get<JSONValue::Array>(a->value);
}

std::string firstText(const JSONValue& toolResult) {
    const auto& content = arrayMember(toolResult, "content");
    if (content.empty()) return "";
    return GetStringMember(*content[0], "text").value_or("");
}

std::string request(int id, const std::string& method, const std::string& params = "{}") {
    return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":")" + method + R"(","params":)" + params +
           "}";
}

} // namespace

TEST(ServerEnvelope, ParseErrorHasNullId) {
    Server server{Config()};
    JSONValue r = send(server, "{not json");
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::ParseError);
    EXPECT_EQ(errorMessage(r).rfind("Parse error: ", 0), 0u);
    ASSERT_NE(FindMember(r, "id"), nullptr);
    EXPECT_TRUE(FindMember(r, "id")->IsNull());
}

TEST(ServerEnvelope, InvalidRequests) {
    Server server{Config()};
    JSONValue r = send(server, R"({"jsonrpc":"1.0","id":3,"method":"ping"})");
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(GetIntMember(r, "id").value(), 3);

    r = send(server, R"({"id":4,"method":"ping"})");
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::InvalidRequest);
}

TEST(ServerEnvelope, NonObjectJsonIsParseError) {
    Server server{Config()};
    for (const char* line : {"[1,2,3]", "42", "\"ping\"", "null"}) {
        JSONValue r = send(server, line);
        EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::ParseError) << line;
        ASSERT_NE(FindMember(r, "id"), nullptr);
        EXPECT_TRUE(FindMember(r, "id")->IsNull());
    }
}

TEST(ServerEnvelope, UnknownMethod) {
    Server server{Config()};
    JSONValue r = send(server, request(7, "foo/bar"));
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(r), "Method not found: foo/bar");
}

TEST(ServerEnvelope, NonObjectParamsRejected) {
    Server server{Config()};
    JSONValue r = send(server, R"({"jsonrpc":"2.0","id":"abc","method":"ping","params":[1]})");
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(GetStringMember(r, "id").value(), "abc");
}

TEST(ServerEnvelope, NotificationsAreSilent) {
    Server server{Config()};
    EXPECT_FALSE(server.HandleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    EXPECT_FALSE(server.HandleLine(R"({"jsonrpc":"2.0","method":"notifications/unknown","params":{}})").has_value());
    EXPECT_FALSE(server.HandleLine(R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})").has_value());
    EXPECT_FALSE(server.HandleLine("   ").has_value());
}

TEST(ServerEnvelope, PingWorksBeforeInitialize) {
    Server server{Config()};
    JSONValue r = send(server, request(1, "ping"));
    ASSERT_TRUE(FindMember(r, "result") != nullptr);
    EXPECT_TRUE(std::get<JSONValue::Object>(result(r).value).empty());
}

TEST(ServerLifecycle, RequiresInitialize) {
    Server server{Config()};
    JSONValue r = send(server, request(2, "tools/list"));
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(r), "Session not initialized");
    EXPECT_EQ(server.GetSession(), nullptr);
}

TEST(ServerLifecycle, InitializeHandshake) {
    Server server{Config()};
    JSONValue r = send(server, kInitialize);
    const JSONValue& res = result(r);
    EXPECT_EQ(GetStringMember(res, "protocolVersion").value(), "2024-11-05");
    EXPECT_EQ(GetStringMember(*FindMember(res, "serverInfo"), "name").value(), "TelemetryFlow-MCP");
    ASSERT_NE(FindMember(res, "capabilities"), nullptr);
    ASSERT_NE(server.GetSession(), nullptr);
    EXPECT_TRUE(server.GetSession()->IsReady());
    EXPECT_EQ(server.GetSession()->ToolCount(), 7u);
    EXPECT_EQ(server.GetSession()->PromptCount(), 3u);

    JSONValue again = send(server, kInitialize);
    EXPECT_EQ(errorCode(again), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(again), "Session already initialized");
}

TEST(ServerTools, ListAndCall) {
    Server server{Config()};
    send(server, kInitialize);

    JSONValue list = send(server, request(2, "tools/list"));
    const auto& tools = arrayMember(result(list), "tools");
    EXPECT_EQ(tools.size(), 7u);
    bool sawEcho = false;
    for (const auto& t : tools) {
        if (GetStringMember(*t, "name").value_or("") == "echo") sawEcho = true;
        EXPECT_NE(FindMember(*t, "inputSchema"), nullptr);
    }
    EXPECT_TRUE(sawEcho);

    JSONValue call = send(server, request(3, "tools/call", R"({"name":"echo","arguments":{"message":"hi"}})"));
    EXPECT_EQ(firstText(result(call)), "Echo: hi");
    EXPECT_EQ(FindMember(result(call), "isError"), nullptr);
}

TEST(ServerTools, FailuresAreToolResults) {
    Server server{Config()};
    send(server, kInitialize);

    JSONValue r = send(server, request(4, "tools/call", R"({"name":"nope"})"));
    EXPECT_EQ(FindMember(r, "error"), nullptr);
    EXPECT_EQ(GetBoolMember(result(r), "isError").value_or(false), true);
    EXPECT_EQ(firstText(result(r)), "Tool not found: nope");

    r = send(server, request(5, "tools/call", R"({"arguments":{}})"));
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(r), "Tool name is required");
}

TEST(ServerResources, ListReadAndTemplates) {
    Server server{Config()};
    send(server, kInitialize);

    JSONValue list = send(server, request(2, "resources/list"));
    EXPECT_EQ(arrayMember(result(list), "resources").size(), 2u);

    JSONValue templates = send(server, request(3, "resources/templates/list"));
    const auto& tpl = arrayMember(result(templates), "resourceTemplates");
    ASSERT_EQ(tpl.size(), 1u);
    EXPECT_EQ(GetStringMember(*tpl[0], "uriTemplate").value(), "file:///{path}");

    JSONValue read = send(server, request(4, "resources/read", R"({"uri":"config://server"})"));
    const auto& contents = arrayMember(result(read), "contents");
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(GetStringMember(*contents[0], "uri").value(), "config://server");
    JSONValue body = parseJSONValue(GetStringMember(*contents[0], "text").value());
    EXPECT_EQ(GetStringMember(*FindMember(body, "server"), "name").value(), "TelemetryFlow-MCP");

    JSONValue missing = send(server, request(5, "resources/read", R"({"uri":"status://nothing"})"));
    EXPECT_EQ(errorCode(missing), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(missing), "Resource not found: status://nothing");
}

TEST(ServerPrompts, GetValidatesArguments) {
    Server server{Config()};
    send(server, kInitialize);

    JSONValue list = send(server, request(2, "prompts/list"));
    EXPECT_EQ(arrayMember(result(list), "prompts").size(), 3u);

    JSONValue bad = send(server, request(3, "prompts/get", R"({"name":"code_review","arguments":{}})"));
    EXPECT_EQ(errorCode(bad), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(bad), "Missing required argument: code");

    JSONValue ok = send(server, request(4, "prompts/get",
                                        R"({"name":"code_review","arguments":{"code":"int x;","language":"cpp"}})"));
    const auto& messages = arrayMember(result(ok), "messages");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(GetStringMember(*messages[0], "role").value(), "user");
    const std::string text = GetStringMember(*FindMember(*messages[0], "content"), "text").value();
    EXPECT_NE(text.find("```cpp\nint x;\n```"), std::string::npos);

    JSONValue unknown = send(server, request(5, "prompts/get", R"({"name":"nope"})"));
    EXPECT_EQ(errorMessage(unknown), "Prompt not found: nope");
}

TEST(ServerConfig, DisabledFamiliesAreNotRegistered) {
    Config config;
    config.mcp.enablePrompts = false;
    config.mcp.enableResources = false;
    Server server{config};
    JSONValue init = send(server, kInitialize);
    const JSONValue* caps = FindMember(result(init), "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_EQ(FindMember(*caps, "prompts"), nullptr);
    EXPECT_EQ(server.GetSession()->PromptCount(), 0u);
    EXPECT_EQ(server.GetSession()->ResourceCount(), 0u);
}

TEST(ServerConfig, CustomSessionInitializer) {
    Server server{Config()};
    server.SetSessionInitializer([](const std::shared_ptr<Session>& session, ToolInvoker& invoker) {
        invoker.RegisterTool(*session, Tool::Create("only", "The only tool", {},
                                                    MakeToolHandler([](const JSONValue&, std::stop_token) {
                                                        return ToolResult::Text("done");
                                                    })));
    });
    send(server, kInitialize);
    EXPECT_EQ(arrayMember(result(send(server, request(2, "tools/list"))), "tools").size(), 1u);
    JSONValue call = send(server, request(3, "tools/call", R"({"name":"only"})"));
    EXPECT_EQ(firstText(result(call)), "done");
}

TEST(ServerTools, ConcurrentCallsCompleteIndependently) {
    std::atomic<int> counter{0};
    Server server{Config()};
    server.SetSessionInitializer([&counter](const std::shared_ptr<Session>& session, ToolInvoker& invoker) {
        invoker.RegisterTool(*session, Tool::Create("bump", "Increment a counter", {},
                                                    MakeToolHandler([&counter](const JSONValue& args, std::stop_token) {
                                                        std::this_thread::sleep_for(std::chrono::milliseconds(20));
                                                        ++counter;
                                                        return ToolResult::Text(
                                                            "call " + std::to_string(GetIntMember(args, "n").value_or(-1)));
                                                    })));
    });
    send(server, kInitialize);

    std::vector<std::string> texts(10);
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&server, &texts, i] {
            auto reply = server.HandleLine(request(100 + i, "tools/call",
                                                   R"({"name":"bump","arguments":{"n":)" + std::to_string(i) + "}}"));
            if (reply) texts[i] = firstText(result(parseJSONValue(reply.value())));
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(counter.load(), 10);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(texts[i], "call " + std::to_string(i));
    }
}

TEST(ServerTools, UnregisteredToolDisappearsFromList) {
    Server server{Config()};
    send(server, kInitialize);
    auto countEcho = [&server] {
        int n = 0;
        const JSONValue list = send(server, request(9, "tools/list"));
        for (const auto& t : arrayMember(result(list), "tools")) {
            if (GetStringMember(*t, "name").value_or("") == "echo") ++n;
        }
        return n;
    };
    EXPECT_EQ(countEcho(), 1);
    EXPECT_TRUE(server.GetSession()->UnregisterTool("echo"));
    EXPECT_EQ(countEcho(), 0);
}

TEST(ServerLifecycle, SetLogLevelAndShutdown) {
    Server server{Config()};
    send(server, kInitialize);
    JSONValue r = send(server, request(2, "logging/setLevel", R"({"level":"error"})"));
    EXPECT_NE(FindMember(r, "result"), nullptr);
    EXPECT_EQ(server.GetSession()->GetLogLevel(), MCPLogLevel::Error);

    send(server, request(3, "shutdown"));
    auto waiter = std::async(std::launch::async, [&server] { server.WaitForShutdown(); });
    EXPECT_EQ(waiter.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    auto session = server.GetSession();
    server.Stop().get();
    EXPECT_EQ(server.GetSession(), nullptr);
    EXPECT_TRUE(session->IsClosed());
    EXPECT_FALSE(server.IsRunning());
}

TEST(ServerLifecycle, InitializedNotificationNeverAnswered) {
    Server server{Config()};
    send(server, kInitialize);
    EXPECT_FALSE(server.HandleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    EXPECT_FALSE(server.HandleLine(R"({"jsonrpc":"2.0","id":9,"method":"notifications/initialized"})").has_value());
    EXPECT_FALSE(server.HandleLine(request(10, "notifications/initialized")).has_value());
    EXPECT_TRUE(server.GetSession()->IsReady());
}

TEST(ServerLifecycle, NothingIsAnsweredAfterShutdown) {
    Server server{Config()};
    send(server, kInitialize);
    JSONValue r = send(server, request(2, "shutdown"));
    EXPECT_NE(FindMember(r, "result"), nullptr);
    EXPECT_FALSE(server.HandleLine(request(3, "ping")).has_value());
    EXPECT_FALSE(server.HandleLine(request(4, "tools/list")).has_value());
    server.Stop().get();
}

TEST(ServerLifecycle, ShutdownStopsLaterLinesInSameChunk) {
    int in[2];
    int out[2];
    ASSERT_EQ(::pipe(in), 0);
    ASSERT_EQ(::pipe(out), 0);

    Server server{Config()};
    server.Start(std::make_unique<StdioTransport>(in[0], out[1])).get();

    const std::string chunk = request(1, "shutdown") + "\n" + request(2, "ping") + "\n";
    ASSERT_EQ(::write(in[1], chunk.data(), chunk.size()), static_cast<ssize_t>(chunk.size()));

    auto waiter = std::async(std::launch::async, [&server] { server.WaitForShutdown(); });
    ASSERT_EQ(waiter.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    // Give the reader time to get through the ping line before collecting output
    std::string replies;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(300);
    while (std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{out[0], POLLIN, 0};
        if (::poll(&pfd, 1, 50) <= 0) continue;
        char buf[4096];
        ssize_t n = ::read(out[0], buf, sizeof(buf));
        if (n <= 0) break;
        replies.append(buf, static_cast<std::size_t>(n));
    }
    server.Stop().get();

    ASSERT_NE(replies.find('\n'), std::string::npos);
    EXPECT_EQ(replies.find('\n'), replies.size() - 1) << replies;
    JSONValue response = parseJSONValue(replies.substr(0, replies.find('\n')));
    EXPECT_EQ(GetIntMember(response, "id").value(), 1);

    ::close(in[1]);
    ::close(in[0]);
    ::close(out[0]);
    ::close(out[1]);
}

TEST(ServerInitialize, AnswersWithConfiguredProtocolVersion) {
    Config config;
    config.mcp.protocolVersion = "2025-03-26";
    Server server{config};
    JSONValue r = send(server, kInitialize);
    EXPECT_EQ(GetStringMember(result(r), "protocolVersion").value_or(""), "2025-03-26");
    EXPECT_EQ(server.GetSession()->GetProtocolVersion(), "2025-03-26");
}

TEST(ServerLifecycle, RunsOverStdioUntilEof) {
    int in[2];
    int out[2];
    ASSERT_EQ(::pipe(in), 0);
    ASSERT_EQ(::pipe(out), 0);

    Server server{Config()};
    server.Start(std::make_unique<StdioTransport>(in[0], out[1])).get();
    EXPECT_TRUE(server.IsRunning());

    const std::string line = std::string(kInitialize) + "\n";
    ASSERT_EQ(::write(in[1], line.data(), line.size()), static_cast<ssize_t>(line.size()));

    std::string reply;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (reply.find('\n') == std::string::npos && std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{out[0], POLLIN, 0};
        if (::poll(&pfd, 1, 50) <= 0) continue;
        char buf[4096];
        ssize_t n = ::read(out[0], buf, sizeof(buf));
        if (n <= 0) break;
        reply.append(buf, static_cast<std::size_t>(n));
    }
    ASSERT_NE(reply.find('\n'), std::string::npos);
    JSONValue response = parseJSONValue(reply.substr(0, reply.find('\n')));
    EXPECT_EQ(GetIntMember(response, "id").value(), 1);
    EXPECT_NE(FindMember(response, "result"), nullptr);

    ::close(in[1]);
    auto waiter = std::async(std::launch::async, [&server] { server.WaitForShutdown(); });
    EXPECT_EQ(waiter.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    server.Stop().get();

    ::close(in[0]);
    ::close(out[0]);
    ::close(out[1]);
}
