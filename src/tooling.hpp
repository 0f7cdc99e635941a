#pragma once

#include "clock.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace capsule {

class CapsuleManager;

struct ToolSchema {
  std::string name;
  std::string description;
  nlohmann::json parameters;
};

struct ToolResult {
  std::string tool_call_id;
  std::string name;
  nlohmann::json result;
  bool ok = true;
  std::string error;
};

using ToolHandler = std::function<ToolResult(const std::string& tool_call_id, const nlohmann::json& arguments)>;

class ToolRegistry {
 public:
  ToolRegistry() = default;
  ~ToolRegistry();
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  // Registers `manager` under the schema's name and keeps it alive for
  // StopAllCapsules(). A second registration under the same name replaces
  // the first.
  void RegisterCapsule(ToolSchema schema, ToolHandler handler, std::shared_ptr<CapsuleManager> manager);

  std::optional<ToolSchema> GetSchema(const std::string& name) const;
  std::optional<ToolHandler> GetHandler(const std::string& name) const;
  std::shared_ptr<CapsuleManager> GetCapsule(const std::string& name) const;

  // Stops every registered capsule, continuing past failures. `err` gets
  // the failures joined with "; ".
  bool StopAllCapsules(std::string* err);

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ToolSchema> schemas_;
  std::unordered_map<std::string, ToolHandler> handlers_;
  std::unordered_map<std::string, std::shared_ptr<CapsuleManager>> capsules_;
};

// Schema derived from the manager's manifest; a missing input schema becomes
// an empty object schema.
ToolSchema CapsuleToolSchema(const CapsuleManager& manager);

// Handler that forwards to manager->CallTool() under a fresh deadline of
// `call_timeout` on `clock` (DefaultClock() when empty).
ToolHandler MakeCapsuleToolHandler(std::shared_ptr<CapsuleManager> manager,
                                   std::chrono::milliseconds call_timeout,
                                   std::shared_ptr<Clock> clock = nullptr);

void RegisterCapsuleTool(ToolRegistry* registry,
                         std::shared_ptr<CapsuleManager> manager,
                         std::chrono::milliseconds call_timeout,
                         std::shared_ptr<Clock> clock = nullptr);

}  // namespace capsule
