#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace capsule {

constexpr int kDefaultStartupTimeoutMs = 5000;
constexpr const char* kToolManifestFileName = "tool.yaml";

enum class RuntimeMode {
  kSimple,
  kCapsule,
};

// Parsed and validated, but no watcher acts on it yet.
struct HotLoad {
  std::vector<std::string> watch;
  // Only "restart" is recognized.
  std::string mode = "restart";
  int debounce_ms = 0;
};

struct ToolRuntime {
  RuntimeMode mode = RuntimeMode::kSimple;
  // 0 means "use the default".
  int startup_timeout_ms = 0;
  std::optional<HotLoad> hot_load;
  std::map<std::string, std::string> env;
  std::vector<std::string> args;
};

// Declarative tool description. Read-only input to CapsuleManager.
struct ToolManifest {
  std::string name;
  std::string version;
  std::string description;
  std::string entrypoint;
  // Absolute path to the entrypoint.
  std::string path;
  // Empty when the entrypoint is executed directly.
  std::string interpreter;
  std::optional<ToolRuntime> runtime;
  nlohmann::json input_schema;
  nlohmann::json output_schema;
};

// Startup timeout from the manifest, or `fallback_ms` when it has none.
int EffectiveStartupTimeoutMs(const ToolManifest& manifest, int fallback_ms = kDefaultStartupTimeoutMs);

bool TryParseRuntimeMode(const std::string& s, RuntimeMode* out);
const char* ToString(RuntimeMode mode);

// `base_dir` resolves a relative entrypoint. The interpreter falls back to
// the entrypoint's shebang when the manifest does not name one.
bool ParseToolManifest(const nlohmann::json& j,
                       const std::string& base_dir,
                       ToolManifest* out,
                       std::string* err);

// Reads a tool.yaml manifest (JSON is accepted as a YAML subset). A directory
// path loads the tool.yaml inside it.
bool LoadToolManifestFile(const std::string& file_path, ToolManifest* out, std::string* err);

// First token after "#!" on the first line of `path`.
bool ParseShebangInterpreter(const std::string& path, std::string* interpreter, std::string* err);

}  // namespace capsule
