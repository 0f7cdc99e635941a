#include "tooling.hpp"

#include "capsule_manager.hpp"
#include "context.hpp"

#include <algorithm>
#include <utility>

namespace capsule {
namespace {

static ToolResult MakeError(const std::string& tool_call_id, const std::string& name, std::string error) {
  ToolResult r;
  r.tool_call_id = tool_call_id;
  r.name = name;
  r.ok = false;
  r.error = std::move(error);
  return r;
}

static nlohmann::json ErrorToJson(const JsonRpcError& e) {
  nlohmann::json j;
  j["code"] = e.code;
  j["message"] = e.message;
  if (!e.data.is_null()) j["data"] = e.data;
  return j;
}

}  // namespace

ToolRegistry::~ToolRegistry() = default;

void ToolRegistry::RegisterCapsule(ToolSchema schema, ToolHandler handler, std::shared_ptr<CapsuleManager> manager) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  const auto name = schema.name;
  schemas_[name] = std::move(schema);
  handlers_[name] = std::move(handler);
  capsules_[name] = std::move(manager);
}

std::optional<ToolSchema> ToolRegistry::GetSchema(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = schemas_.find(name);
  if (it == schemas_.end()) return std::nullopt;
  return it->second;
}

std::optional<ToolHandler> ToolRegistry::GetHandler(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = handlers_.find(name);
  if (it == handlers_.end()) return std::nullopt;
  return it->second;
}

std::shared_ptr<CapsuleManager> ToolRegistry::GetCapsule(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = capsules_.find(name);
  if (it == capsules_.end()) return nullptr;
  return it->second;
}

bool ToolRegistry::StopAllCapsules(std::string* err) {
  // Stop() can block on process teardown; do it outside the lock.
  std::vector<std::pair<std::string, std::shared_ptr<CapsuleManager>>> capsules;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    capsules.assign(capsules_.begin(), capsules_.end());
  }
  std::sort(capsules.begin(), capsules.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

  std::string failures;
  for (const auto& [name, manager] : capsules) {
    CapsuleError stop_err;
    if (manager->Stop(&stop_err)) continue;
    if (!failures.empty()) failures += "; ";
    failures += name + ": " + stop_err.message;
  }
  if (failures.empty()) return true;
  if (err) *err = std::move(failures);
  return false;
}

ToolSchema CapsuleToolSchema(const CapsuleManager& manager) {
  const auto& tool = manager.tool();
  ToolSchema schema;
  schema.name = tool.name;
  schema.description = tool.description;
  if (tool.input_schema.is_object()) {
    schema.parameters = tool.input_schema;
  } else {
    schema.parameters = {{"type", "object"}, {"properties", nlohmann::json::object()}};
  }
  return schema;
}

ToolHandler MakeCapsuleToolHandler(std::shared_ptr<CapsuleManager> manager,
                                   std::chrono::milliseconds call_timeout,
                                   std::shared_ptr<Clock> clock) {
  if (!clock) clock = DefaultClock();
  return [manager = std::move(manager), call_timeout, clock = std::move(clock)](
             const std::string& tool_call_id, const nlohmann::json& arguments) -> ToolResult {
    const auto& name = manager->tool().name;
    auto ctx = Context::WithTimeout(clock, call_timeout);

    CapsuleError err;
    auto resp = manager->CallTool(ctx, arguments, &err);
    ctx.Cancel();
    if (!resp) return MakeError(tool_call_id, name, err.message);

    if (resp->error) {
      auto r = MakeError(tool_call_id, name, resp->error->message);
      r.result = ErrorToJson(*resp->error);
      return r;
    }

    ToolResult r;
    r.tool_call_id = tool_call_id;
    r.name = name;
    r.result = resp->result ? *resp->result : nlohmann::json();
    return r;
  };
}

void RegisterCapsuleTool(ToolRegistry* registry,
                         std::shared_ptr<CapsuleManager> manager,
                         std::chrono::milliseconds call_timeout,
                         std::shared_ptr<Clock> clock) {
  if (!registry || !manager) return;
  auto schema = CapsuleToolSchema(*manager);
  auto handler = MakeCapsuleToolHandler(manager, call_timeout, std::move(clock));
  registry->RegisterCapsule(std::move(schema), std::move(handler), std::move(manager));
}

}  // namespace capsule
