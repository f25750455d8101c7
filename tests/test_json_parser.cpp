//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: test_json_parser.cpp
// Purpose: GoogleTests for the JSON parser, serializer and JSON-RPC message types
//==========================================================================================================

#include <gtest/gtest.h>
#include <string>
#include "tfomcp/JSONRPCTypes.h"

using namespace tfomcp;

TEST(JSONParser, ScalarsAndContainers) {
    JSONValue v = parseJSONValue(R"({"s":"x","i":42,"d":1.5,"b":true,"n":null,"a":[1,"two",false]})");
    ASSERT_TRUE(v.IsObject());
    EXPECT_EQ(GetStringMember(v, "s").value(), "x");
    EXPECT_EQ(GetIntMember(v, "i").value(), 42);
    EXPECT_DOUBLE_EQ(GetNumberMember(v, "d").value(), 1.5);
    EXPECT_DOUBLE_EQ(GetNumberMember(v, "i").value(), 42.0);
    EXPECT_TRUE(GetBoolMember(v, "b").value());
    const JSONValue* n = FindMember(v, "n");
    ASSERT_NE(n, nullptr);
    EXPECT_TRUE(n->IsNull());
    const JSONValue* a = FindMember(v, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->IsArray());
    EXPECT_EQ(std::get<JSONValue::Array>(a->value).size(), 3u);
}

TEST(JSONParser, TypedLookupsRejectMismatches) {
    JSONValue v = parseJSONValue(R"({"s":"x","i":1})");
    EXPECT_FALSE(GetIntMember(v, "s").has_value());
    EXPECT_FALSE(GetStringMember(v, "i").has_value());
    EXPECT_FALSE(GetStringMember(v, "missing").has_value());
    JSONValue arr = parseJSONValue("[1,2]");
    EXPECT_EQ(FindMember(arr, "x"), nullptr);
}

TEST(JSONParser, StringEscapesAndUnicode) {
    JSONValue v = parseJSONValue(R"(["a\nb", "tab\t", "é", "😀", "q\"uote"])");
    const auto& arr = std::get<JSONValue::Array>(v.value);
    EXPECT_EQ(std::get<std::string>(arr[0]->value), "a\nb");
    EXPECT_EQ(std::get<std::string>(arr[1]->value), "tab\t");
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "\xC3\xA9");
    EXPECT_EQ(std::get<std::string>(arr[3]->value), "\xF0\x9F\x98\x80");
    EXPECT_EQ(std::get<std::string>(arr[4]->value), "q\"uote");
}

TEST(JSONParser, MalformedInputThrows) {
    EXPECT_THROW(parseJSONValue(""), JSONParseError);
    EXPECT_THROW(parseJSONValue("{"), JSONParseError);
    EXPECT_THROW(parseJSONValue(R"({"a":1,})"), JSONParseError);
    EXPECT_THROW(parseJSONValue("[1,2] trailing"), JSONParseError);
    EXPECT_THROW(parseJSONValue("{'a':1}"), JSONParseError);
    EXPECT_THROW(parseJSONValue("tru"), JSONParseError);
}

TEST(JSONSerializer, SingleLineWithEscapedControls) {
    JSONValue::Object o;
    o["text"] = MakeString("line1\nline2\r\x01");
    const std::string out = serializeJSONValue(JSONValue{o});
    EXPECT_EQ(out.find('\n'), std::string::npos);
    EXPECT_EQ(out.find('\r'), std::string::npos);
    EXPECT_NE(out.find("\\n"), std::string::npos);
    EXPECT_NE(out.find("\\u0001"), std::string::npos);

    JSONValue back = parseJSONValue(out);
    EXPECT_EQ(GetStringMember(back, "text").value(), "line1\nline2\r\x01");
}

TEST(JSONSerializer, NumbersKeepTheirKind) {
    EXPECT_EQ(serializeJSONValue(JSONValue(static_cast<int64_t>(7))), "7");
    EXPECT_EQ(serializeJSONValue(JSONValue(2.0)), "2.0");
    EXPECT_EQ(serializeJSONValue(JSONValue(0.25)), "0.25");
    EXPECT_EQ(serializeJSONValue(JSONValue(nullptr)), "null");
    EXPECT_EQ(serializeJSONValue(JSONValue(true)), "true");
}

TEST(JSONRPCTypes, RequestDeserializeReadsIdKinds) {
    JSONRPCRequest r;
    ASSERT_TRUE(r.Deserialize(R"({"jsonrpc":"2.0","id":"abc","method":"ping"})"));
    EXPECT_EQ(std::get<std::string>(r.id), "abc");
    EXPECT_EQ(r.method, "ping");
    EXPECT_FALSE(r.params.has_value());

    ASSERT_TRUE(r.Deserialize(R"({"jsonrpc":"2.0","id":7,"method":"tools/list","params":{}})"));
    EXPECT_EQ(std::get<int64_t>(r.id), 7);
    EXPECT_TRUE(r.params.has_value());

    ASSERT_TRUE(r.Deserialize(R"({"jsonrpc":"2.0","id":true,"method":"ping"})"));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(r.id));

    EXPECT_FALSE(r.Deserialize("not json"));
    EXPECT_FALSE(r.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
}

TEST(JSONRPCTypes, ResponseSerializeShapes) {
    JSONValue::Object result;
    result["ok"] = MakeBool(true);
    JSONRPCResponse ok(static_cast<int64_t>(3), JSONValue{result});
    JSONValue parsed = parseJSONValue(ok.Serialize());
    EXPECT_EQ(GetStringMember(parsed, "jsonrpc").value(), "2.0");
    EXPECT_EQ(GetIntMember(parsed, "id").value(), 3);
    ASSERT_NE(FindMember(parsed, "result"), nullptr);
    EXPECT_EQ(FindMember(parsed, "error"), nullptr);

    auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error");
    ASSERT_TRUE(err->IsError());
    JSONValue e = parseJSONValue(err->Serialize());
    const JSONValue* id = FindMember(e, "id");
    ASSERT_NE(id, nullptr);
    EXPECT_TRUE(id->IsNull());
    EXPECT_EQ(FindMember(e, "result"), nullptr);
    const JSONValue* eo = FindMember(e, "error");
    ASSERT_NE(eo, nullptr);
    EXPECT_EQ(GetIntMember(*eo, "code").value(), -32700);
    EXPECT_EQ(GetStringMember(*eo, "message").value(), "Parse error");
    EXPECT_EQ(FindMember(*eo, "data"), nullptr);
}

TEST(JSONRPCTypes, NotificationHasNoId) {
    JSONRPCNotification n("notifications/initialized");
    JSONValue v = parseJSONValue(n.Serialize());
    EXPECT_EQ(FindMember(v, "id"), nullptr);
    EXPECT_EQ(GetStringMember(v, "method").value(), "notifications/initialized");
}

TEST(JSONRPCTypes, IdRendering) {
    EXPECT_EQ(idToString(JSONRPCId{std::string("x")}), "x");
    EXPECT_EQ(idToString(JSONRPCId{static_cast<int64_t>(5)}), "5");
    EXPECT_EQ(idToString(JSONRPCId{nullptr}), "null");
}
