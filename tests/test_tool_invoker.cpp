//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: test_tool_invoker.cpp
// Purpose: GoogleTests for tool invocation outcomes, timeouts and telemetry emission
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "tfomcp/ToolInvoker.h"

using namespace tfomcp;

namespace {

struct ToolCallRecord {
    std::string name;
    bool success;
    std::string errorKind;
};

class RecordingTelemetrySink : public ITelemetrySink {
public:
    void RecordToolCall(const std::string& toolName, double, bool success, const std::string& errorKind) override {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back({toolName, success, errorKind});
    }
    void RecordResourceRead(const std::string&, double, bool) override {}
    void RecordPromptGet(const std::string&, double, bool) override {}
    void RecordSessionEvent(const std::string&, const std::string&) override {}

    std::vector<ToolCallRecord> Calls() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }

private:
    std::mutex mutex;
    std::vector<ToolCallRecord> calls;
};

Tool makeTool(const std::string& name, ToolFunction fn, ToolOptions options = {}) {
    return Tool::Create(name, "test tool " + name, {}, MakeToolHandler(std::move(fn)), std::move(options));
}

JSONValue args(const std::string& json) {
    return parseJSONValue(json);
}

} // namespace

TEST(ToolInvokerTest, SuccessReturnsHandlerResult) {
    auto sink = std::make_shared<RecordingTelemetrySink>();
    ToolInvoker invoker(sink, 2);
    auto session = Session::Create();
    invoker.RegisterTool(*session, makeTool("echo", [](const JSONValue& a, std::stop_token) {
        return ToolResult::Text("Echo: " + GetStringMember(a, "message").value_or(""));
    }));

    InvocationOutcome out = invoker.Invoke(*session, "echo", args(R"({"message":"hi"})"));
    EXPECT_EQ(out.kind, OutcomeKind::Success);
    EXPECT_TRUE(out.Succeeded());
    EXPECT_FALSE(out.result.isError);
    EXPECT_EQ(out.result.TextContent(), "Echo: hi");
    EXPECT_GE(out.durationMs, 0.0);

    auto calls = sink->Calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].name, "echo");
    EXPECT_TRUE(calls[0].success);
    EXPECT_TRUE(calls[0].errorKind.empty());
}

TEST(ToolInvokerTest, UnknownToolIsErrorResult) {
    ToolInvoker invoker;
    auto session = Session::Create();
    InvocationOutcome out = invoker.Invoke(*session, "nope", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(out.kind, OutcomeKind::NotFound);
    EXPECT_TRUE(out.result.isError);
    EXPECT_EQ(out.result.TextContent(), "Tool not found: nope");
}

TEST(ToolInvokerTest, DisabledToolIsNotRun) {
    ToolInvoker invoker;
    auto session = Session::Create();
    std::atomic<bool> ran{false};
    ToolOptions opts;
    opts.enabled = false;
    invoker.RegisterTool(*session, makeTool("off", [&ran](const JSONValue&, std::stop_token) {
        ran = true;
        return ToolResult::Text("ran");
    }, opts));

    InvocationOutcome out = invoker.Invoke(*session, "off", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(out.kind, OutcomeKind::Disabled);
    EXPECT_EQ(out.result.TextContent(), "Tool is disabled: off");
    EXPECT_FALSE(ran.load());
}

TEST(ToolInvokerTest, HandlerExceptionBecomesErrorResult) {
    auto sink = std::make_shared<RecordingTelemetrySink>();
    ToolInvoker invoker(sink);
    auto session = Session::Create();
    invoker.RegisterTool(*session, makeTool("boom", [](const JSONValue&, std::stop_token) -> ToolResult {
        throw std::runtime_error("kaput");
    }));

    InvocationOutcome out = invoker.Invoke(*session, "boom", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(out.kind, OutcomeKind::HandlerFailure);
    EXPECT_TRUE(out.result.isError);
    EXPECT_EQ(out.result.TextContent(), "Tool execution failed: kaput");
    EXPECT_EQ(out.errorMessage, "kaput");
    ASSERT_EQ(sink->Calls().size(), 1u);
    EXPECT_FALSE(sink->Calls()[0].success);
    EXPECT_EQ(sink->Calls()[0].errorKind, "HandlerFailure");
}

TEST(ToolInvokerTest, ToolReportedErrorKeepsResult) {
    ToolInvoker invoker;
    auto session = Session::Create();
    invoker.RegisterTool(*session, makeTool("picky", [](const JSONValue&, std::stop_token) {
        return ToolResult::Error("Path is required");
    }));
    InvocationOutcome out = invoker.Invoke(*session, "picky", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(out.kind, OutcomeKind::ToolError);
    EXPECT_EQ(out.errorMessage, "Path is required");
    EXPECT_EQ(out.result.TextContent(), "Path is required");
}

TEST(ToolInvokerTest, TimeoutSignalsStopToken) {
    ToolInvoker invoker(nullptr, 2);
    auto session = Session::Create();
    std::atomic<bool> sawStop{false};
    ToolOptions opts;
    opts.timeoutSeconds = 0.1;
    invoker.RegisterTool(*session, makeTool("slow", [&sawStop](const JSONValue&, std::stop_token st) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        sawStop = st.stop_requested();
        return ToolResult::Text("late");
    }, opts));

    const auto start = std::chrono::steady_clock::now();
    InvocationOutcome out = invoker.Invoke(*session, "slow", JSONValue{JSONValue::Object{}});
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(out.kind, OutcomeKind::Timeout);
    EXPECT_TRUE(out.result.isError);
    EXPECT_EQ(out.result.TextContent(), "Tool execution timed out after 0.1s");
    EXPECT_LT(elapsed, std::chrono::seconds(2));

    for (int i = 0; i < 200 && invoker.InFlight() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(invoker.InFlight(), 0u);
    EXPECT_TRUE(sawStop.load());
}

TEST(ToolInvokerTest, ConcurrentInvocations) {
    ToolInvoker invoker(nullptr, 4);
    auto session = Session::Create();
    invoker.RegisterTool(*session, makeTool("square", [](const JSONValue& a, std::stop_token) {
        const int64_t n = GetIntMember(a, "n").value_or(0);
        return ToolResult::Text(std::to_string(n * n));
    }));

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto out = invoker.Invoke(*session, "square", args("{\"n\":" + std::to_string(i) + "}"));
            if (out.Succeeded() && out.result.TextContent() == std::to_string(i * i)) ++ok;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(ok.load(), 8);
}

TEST(ToolInvokerTest, RegisterRecordsEventAndListFilters) {
    ToolInvoker invoker;
    auto session = Session::Create();
    session->GetEvents();
    ToolOptions fileOpts;
    fileOpts.category = "file";
    ToolOptions offOpts;
    offOpts.category = "file";
    offOpts.enabled = false;
    auto noop = [](const JSONValue&, std::stop_token) { return ToolResult::Text(""); };
    invoker.RegisterTool(*session, makeTool("read_it", noop, fileOpts));
    invoker.RegisterTool(*session, makeTool("hidden", noop, offOpts));
    invoker.RegisterTool(*session, makeTool("ping_it", noop));

    auto events = session->GetEvents();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0]->EventType(), "ToolRegistered");

    EXPECT_EQ(invoker.ListTools(*session).size(), 3u);
    EXPECT_EQ(invoker.ListTools(*session, std::string("file")).size(), 2u);
    EXPECT_EQ(invoker.ListTools(*session, std::string("file"), true).size(), 1u);
}

TEST(ToolInvokerTest, InvokeRecordsToolExecutedEvent) {
    ToolInvoker invoker;
    auto session = Session::Create();
    session->GetEvents();
    invoker.Invoke(*session, "ghost", JSONValue{JSONValue::Object{}});
    auto events = session->GetEvents();
    ASSERT_EQ(events.size(), 1u);
    auto executed = std::dynamic_pointer_cast<const ToolExecuted>(events[0]);
    ASSERT_NE(executed, nullptr);
    EXPECT_FALSE(executed->success);
    EXPECT_EQ(executed->errorMessage, "Tool not found: ghost");
}

TEST(ToolInvokerTest, FormatSecondsKeepsFraction) {
    EXPECT_EQ(FormatSeconds(30.0), "30.0");
    EXPECT_EQ(FormatSeconds(0.5), "0.5");
    EXPECT_EQ(FormatSeconds(120.0), "120.0");
}
