#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace capsule {

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kHelloMethod = "orla.hello";
constexpr const char* kToolsCallMethod = "tools/call";

struct HelloParams {
  std::string name;
  std::string version;
  std::vector<std::string> capabilities;
};

// The one-time startup notification a capsule emits before reading stdin.
struct HelloNotification {
  std::string jsonrpc;
  std::string method;
  HelloParams params;
};

struct JsonRpcError {
  int64_t code = 0;
  std::string message;
  nlohmann::json data;
};

struct JsonRpcRequest {
  std::string jsonrpc = kJsonRpcVersion;
  int64_t id = 0;
  std::string method;
  nlohmann::json params;
};

struct JsonRpcResponse {
  std::string jsonrpc;
  int64_t id = 0;
  std::optional<nlohmann::json> result;
  std::optional<JsonRpcError> error;
};

JsonRpcRequest MakeToolsCallRequest(int64_t id, const std::string& tool_name, const nlohmann::json& arguments);

nlohmann::json ToJson(const JsonRpcRequest& req);
nlohmann::json ToJson(const JsonRpcResponse& resp);
nlohmann::json ToJson(const HelloNotification& hello);

// Matches on method == "orla.hello". Missing or mistyped params fields are
// left empty.
std::optional<HelloNotification> ParseHelloNotification(const nlohmann::json& msg);

// Matches an object with a non-zero integer "id" and no "method".
std::optional<JsonRpcResponse> ParseResponse(const nlohmann::json& msg);

}  // namespace capsule
