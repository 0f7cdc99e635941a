#include <gtest/gtest.h>

#include "jsonrpc.hpp"

using namespace capsule;
using nlohmann::json;

TEST(JsonRpcTest, ToolsCallRequestShape) {
  auto j = ToJson(MakeToolsCallRequest(7, "weather", {{"city", "Oslo"}}));
  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["id"], 7);
  EXPECT_EQ(j["method"], "tools/call");
  EXPECT_EQ(j["params"]["name"], "weather");
  EXPECT_EQ(j["params"]["arguments"]["city"], "Oslo");
}

TEST(JsonRpcTest, NullArgumentsBecomeEmptyObject) {
  auto j = ToJson(MakeToolsCallRequest(1, "t", nullptr));
  EXPECT_TRUE(j["params"]["arguments"].is_object());
  EXPECT_TRUE(j["params"]["arguments"].empty());
}

TEST(JsonRpcTest, ParseHello) {
  auto msg = json::parse(R"({"jsonrpc":"2.0","method":"orla.hello","params":{"name":"fs","version":"2.1.0","capabilities":["tools/call","stream"]}})");
  auto hello = ParseHelloNotification(msg);
  ASSERT_TRUE(hello.has_value());
  EXPECT_EQ(hello->params.name, "fs");
  EXPECT_EQ(hello->params.version, "2.1.0");
  ASSERT_EQ(hello->params.capabilities.size(), 2u);
  EXPECT_EQ(hello->params.capabilities[1], "stream");
  EXPECT_FALSE(ParseResponse(msg).has_value());
}

TEST(JsonRpcTest, HelloWithoutParamsStillMatches) {
  auto hello = ParseHelloNotification(json::parse(R"({"method":"orla.hello"})"));
  ASSERT_TRUE(hello.has_value());
  EXPECT_TRUE(hello->params.name.empty());
}

TEST(JsonRpcTest, OtherMethodsAreNotHello) {
  EXPECT_FALSE(ParseHelloNotification(json::parse(R"({"jsonrpc":"2.0","method":"log","params":{}})")).has_value());
  EXPECT_FALSE(ParseHelloNotification(json::parse("[1,2]")).has_value());
}

TEST(JsonRpcTest, ParseResultResponse) {
  auto resp = ParseResponse(json::parse(R"({"jsonrpc":"2.0","id":3,"result":{"ok":true}})"));
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->id, 3);
  ASSERT_TRUE(resp->result.has_value());
  EXPECT_EQ((*resp->result)["ok"], true);
  EXPECT_FALSE(resp->error.has_value());
}

TEST(JsonRpcTest, ParseErrorResponse) {
  auto resp = ParseResponse(json::parse(R"({"jsonrpc":"2.0","id":4,"error":{"code":-32601,"message":"no such method","data":{"m":"x"}}})"));
  ASSERT_TRUE(resp.has_value());
  ASSERT_TRUE(resp->error.has_value());
  EXPECT_EQ(resp->error->code, -32601);
  EXPECT_EQ(resp->error->message, "no such method");
  EXPECT_EQ(resp->error->data["m"], "x");
  EXPECT_FALSE(resp->result.has_value());
}

TEST(JsonRpcTest, WideErrorCodeIsKeptWhole) {
  auto resp = ParseResponse(json::parse(R"({"jsonrpc":"2.0","id":4,"error":{"code":4294967346,"message":"wide"}})"));
  ASSERT_TRUE(resp.has_value());
  ASSERT_TRUE(resp->error.has_value());
  EXPECT_EQ(resp->error->code, int64_t{4294967346});
}

TEST(JsonRpcTest, ResponsesNeedNonZeroIntegerId) {
  EXPECT_FALSE(ParseResponse(json::parse(R"({"jsonrpc":"2.0","id":0,"result":1})")).has_value());
  EXPECT_FALSE(ParseResponse(json::parse(R"({"jsonrpc":"2.0","result":1})")).has_value());
  EXPECT_FALSE(ParseResponse(json::parse(R"({"jsonrpc":"2.0","id":"5","result":1})")).has_value());
  EXPECT_FALSE(ParseResponse(json::parse(R"({"jsonrpc":"2.0","id":5,"method":"x"})")).has_value());
}

TEST(JsonRpcTest, ResponseToJsonOmitsAbsentMembers) {
  JsonRpcResponse resp;
  resp.id = 9;
  resp.result = json{{"v", 1}};
  auto j = ToJson(resp);
  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_FALSE(j.contains("error"));

  resp.result.reset();
  resp.error = JsonRpcError{-1, "bad", nullptr};
  j = ToJson(resp);
  EXPECT_FALSE(j.contains("result"));
  EXPECT_EQ(j["error"]["message"], "bad");
  EXPECT_FALSE(j["error"].contains("data"));
}

TEST(JsonRpcTest, HelloToJsonParsesBack) {
  HelloNotification hello;
  hello.params.name = "n";
  hello.params.version = "v";
  hello.params.capabilities = {"a"};
  auto parsed = ParseHelloNotification(ToJson(hello));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->jsonrpc, "2.0");
  EXPECT_EQ(parsed->params.capabilities, std::vector<std::string>{"a"});
}
