//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: test_services.cpp
// Purpose: GoogleTests for the session service
//==========================================================================================================

#include <gtest/gtest.h>
#include <memory>
#include "tfomcp/InMemoryRepositories.hpp"
#include "tfomcp/SessionService.h"

using namespace tfomcp;

namespace {

SessionService makeService(std::shared_ptr<InMemorySessionRepository> repo) {
    SessionCapabilities caps;
    caps.prompts = false;
    return SessionService(std::move(repo), Implementation("TelemetryFlow-MCP", "1.1.2"), caps);
}

} // namespace

TEST(SessionServiceTest, InitializeCreatesCurrentSession) {
    auto repo = std::make_shared<InMemorySessionRepository>();
    SessionService service = makeService(repo);
    EXPECT_EQ(service.Current(), nullptr);

    JSONValue result = service.Initialize(Implementation("inspector", "0.1"), JSONValue{JSONValue::Object{}});
    auto current = service.Current();
    ASSERT_NE(current, nullptr);
    EXPECT_TRUE(current->IsReady());
    EXPECT_EQ(repo->GetById(current->Id().Value()).get(), current);

    const JSONValue* caps = FindMember(result, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(FindMember(*caps, "tools"), nullptr);
    EXPECT_EQ(FindMember(*caps, "prompts"), nullptr);
    EXPECT_EQ(GetStringMember(*FindMember(result, "serverInfo"), "name").value(), "TelemetryFlow-MCP");
}

TEST(SessionServiceTest, CloseClearsCurrentAndPersists) {
    auto repo = std::make_shared<InMemorySessionRepository>();
    SessionService service = makeService(repo);
    service.Initialize(Implementation("c", "1"), JSONValue{JSONValue::Object{}});
    const std::string id = service.Current()->Id().Value();

    service.Close(id, "bye");
    EXPECT_EQ(service.Current(), nullptr);
    auto stored = service.Get(id);
    ASSERT_NE(stored, nullptr);
    EXPECT_TRUE(stored->IsClosed());

    // Unknown ids are ignored
    EXPECT_NO_THROW(service.Close("does-not-exist"));
}

TEST(SessionServiceTest, SetLogLevelAppliesToCurrent) {
    SessionService service = makeService(std::make_shared<InMemorySessionRepository>());
    EXPECT_NO_THROW(service.SetLogLevel(MCPLogLevel::Debug));
    service.Initialize(Implementation("c", "1"), JSONValue{JSONValue::Object{}});
    service.SetLogLevel(MCPLogLevel::Error);
    EXPECT_EQ(service.Current()->GetLogLevel(), MCPLogLevel::Error);
}

TEST(SessionServiceTest, StatsAndListing) {
    SessionService service = makeService(std::make_shared<InMemorySessionRepository>());
    EXPECT_FALSE(service.Stats("missing").has_value());

    service.Initialize(Implementation("a", "1"), JSONValue{JSONValue::Object{}});
    auto first = service.Current();
    first->RegisterTool(Tool::Create("echo", "Echo"));
    service.Initialize(Implementation("b", "1"), JSONValue{JSONValue::Object{}});

    auto stats = service.Stats(first->Id().Value());
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(GetStringMember(stats.value(), "state").value(), "ready");
    EXPECT_EQ(GetIntMember(stats.value(), "toolCount").value(), 1);
    EXPECT_EQ(GetIntMember(stats.value(), "promptCount").value(), 0);
    EXPECT_TRUE(GetStringMember(stats.value(), "initializedAt").has_value());
    EXPECT_TRUE(GetStringMember(stats.value(), "createdAt").has_value());

    EXPECT_EQ(service.List().size(), 2u);
    EXPECT_EQ(service.List(1, 5).size(), 1u);
    EXPECT_TRUE(service.List(2, 5).empty());
}
