#include "jsonrpc.hpp"

#include <utility>

namespace capsule {
namespace {

static std::string GetString(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object()) return {};
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

static std::optional<JsonRpcError> ParseError(const nlohmann::json& e) {
  if (!e.is_object()) return std::nullopt;
  JsonRpcError out;
  if (e.contains("code") && e["code"].is_number_integer()) out.code = e["code"].get<int64_t>();
  out.message = GetString(e, "message");
  if (e.contains("data")) out.data = e["data"];
  return out;
}

}  // namespace

JsonRpcRequest MakeToolsCallRequest(int64_t id, const std::string& tool_name, const nlohmann::json& arguments) {
  JsonRpcRequest req;
  req.id = id;
  req.method = kToolsCallMethod;
  req.params = {{"name", tool_name}, {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}};
  return req;
}

nlohmann::json ToJson(const JsonRpcRequest& req) {
  nlohmann::json j;
  j["jsonrpc"] = req.jsonrpc;
  j["id"] = req.id;
  j["method"] = req.method;
  j["params"] = req.params;
  return j;
}

nlohmann::json ToJson(const JsonRpcResponse& resp) {
  nlohmann::json j;
  j["jsonrpc"] = resp.jsonrpc.empty() ? std::string(kJsonRpcVersion) : resp.jsonrpc;
  j["id"] = resp.id;
  if (resp.result) j["result"] = *resp.result;
  if (resp.error) {
    nlohmann::json e;
    e["code"] = resp.error->code;
    e["message"] = resp.error->message;
    if (!resp.error->data.is_null()) e["data"] = resp.error->data;
    j["error"] = std::move(e);
  }
  return j;
}

nlohmann::json ToJson(const HelloNotification& hello) {
  nlohmann::json j;
  j["jsonrpc"] = hello.jsonrpc.empty() ? std::string(kJsonRpcVersion) : hello.jsonrpc;
  j["method"] = kHelloMethod;
  j["params"] = {{"name", hello.params.name},
                 {"version", hello.params.version},
                 {"capabilities", hello.params.capabilities}};
  return j;
}

std::optional<HelloNotification> ParseHelloNotification(const nlohmann::json& msg) {
  if (!msg.is_object()) return std::nullopt;
  if (GetString(msg, "method") != kHelloMethod) return std::nullopt;

  HelloNotification out;
  out.jsonrpc = GetString(msg, "jsonrpc");
  out.method = kHelloMethod;
  if (msg.contains("params") && msg["params"].is_object()) {
    const auto& p = msg["params"];
    out.params.name = GetString(p, "name");
    out.params.version = GetString(p, "version");
    if (p.contains("capabilities") && p["capabilities"].is_array()) {
      for (const auto& c : p["capabilities"]) {
        if (c.is_string()) out.params.capabilities.push_back(c.get<std::string>());
      }
    }
  }
  return out;
}

std::optional<JsonRpcResponse> ParseResponse(const nlohmann::json& msg) {
  if (!msg.is_object()) return std::nullopt;
  if (msg.contains("method")) return std::nullopt;
  if (!msg.contains("id") || !msg["id"].is_number_integer()) return std::nullopt;

  JsonRpcResponse out;
  out.id = msg["id"].get<int64_t>();
  if (out.id == 0) return std::nullopt;
  out.jsonrpc = GetString(msg, "jsonrpc");
  if (msg.contains("result")) out.result = msg["result"];
  if (msg.contains("error")) out.error = ParseError(msg["error"]);
  return out;
}

}  // namespace capsule
