#include "capsule_manager.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "tool_manifest.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

static std::string Trim(std::string s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static nlohmann::json ResultToJson(const capsule::ToolResult& r) {
  nlohmann::json out;
  out["id"] = r.tool_call_id;
  out["name"] = r.name;
  out["ok"] = r.ok;
  if (!r.result.is_null()) out["result"] = r.result;
  if (!r.ok) out["error"] = r.error;
  return out;
}

}  // namespace

// Reads one JSON arguments object per stdin line and writes one JSON result
// per line to stdout. Logs go to stderr.
int main() {
  auto cfg = capsule::LoadConfigFromEnv();
  auto logger = std::make_shared<capsule::StreamLogger>(&std::cerr, cfg.log_level);

  if (cfg.manifest_path.empty()) {
    logger->Error("no tool manifest configured", {{"env", "CAPSULE_MANIFEST"}});
    return 2;
  }

  capsule::ToolManifest manifest;
  std::string err;
  if (!capsule::LoadToolManifestFile(cfg.manifest_path, &manifest, &err)) {
    logger->Error("failed to load tool manifest", {{"path", cfg.manifest_path}, {"error", err}});
    return 2;
  }
  if (!manifest.runtime || manifest.runtime->mode != capsule::RuntimeMode::kCapsule) {
    logger->Error("tool is not a capsule-mode tool", {{"tool", manifest.name}});
    return 2;
  }

  capsule::CapsuleManagerOptions options;
  options.logger = logger;
  options.default_startup_timeout_ms = cfg.default_startup_timeout_ms;
  auto manager = std::make_shared<capsule::CapsuleManager>(manifest, options);

  logger->Info("starting capsule", {{"tool", manifest.name},
                                    {"path", manifest.path},
                                    {"interpreter", manifest.interpreter.empty() ? "-" : manifest.interpreter},
                                    {"startup_timeout_ms", std::to_string(manager->startup_timeout().count())}});

  capsule::CapsuleError start_err;
  if (!manager->Start(&start_err)) {
    logger->Error("failed to start capsule",
                  {{"tool", manifest.name}, {"code", capsule::ToString(start_err.code)}, {"error", start_err.message}});
    return 1;
  }

  capsule::ToolRegistry tools;
  capsule::RegisterCapsuleTool(&tools, manager, std::chrono::milliseconds(cfg.call_timeout_ms));
  auto schema = tools.GetSchema(manifest.name);
  auto handler = tools.GetHandler(manifest.name);
  if (!schema || !handler) {
    logger->Error("capsule tool was not registered", {{"tool", manifest.name}});
    return 1;
  }
  logger->Debug("capsule tool registered",
                {{"tool", schema->name}, {"description", schema->description}, {"parameters", schema->parameters.dump()}});

  int exit_code = 0;
  long long seq = 0;
  std::string line;
  while (std::getline(std::cin, line)) {
    line = Trim(line);
    if (line.empty()) continue;
    const auto call_id = "call_" + std::to_string(++seq);

    auto args = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (args.is_discarded()) {
      capsule::ToolResult bad;
      bad.tool_call_id = call_id;
      bad.name = manifest.name;
      bad.ok = false;
      bad.error = "invalid JSON arguments";
      std::cout << ResultToJson(bad).dump() << std::endl;
      continue;
    }

    auto result = (*handler)(call_id, args);
    if (!result.ok) {
      logger->Warn("tool call failed", {{"tool", manifest.name}, {"id", call_id}, {"error", result.error}});
    }
    std::cout << ResultToJson(result).dump() << std::endl;
  }

  std::string stop_err;
  if (!tools.StopAllCapsules(&stop_err)) {
    logger->Error("failed to stop capsule", {{"tool", manifest.name}, {"error", stop_err}});
    exit_code = 1;
  }
  logger->Info("capsule stopped", {{"tool", manifest.name}, {"calls", std::to_string(seq)}});
  return exit_code;
}
