#include "tool_manifest.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace capsule {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

// YAML turns `version: 1.0` into a number; such values are taken as written.
static bool RequireString(const nlohmann::json& j, const char* key, std::string* out, std::string* err) {
  std::string v;
  if (j.contains(key) && j[key].is_string()) {
    v = j[key].get<std::string>();
  } else if (j.contains(key) && j[key].is_number()) {
    v = j[key].dump();
  }
  if (v.empty()) {
    if (err) *err = std::string("manifest: missing required field: ") + key;
    return false;
  }
  *out = std::move(v);
  return true;
}

// Accepts integers in [0, INT_MAX]; wider values are rejected instead of
// being narrowed.
static bool ReadNonNegativeInt(const nlohmann::json& j, const char* key, const std::string& field, int* out, std::string* err) {
  const auto& v = j[key];
  if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<int64_t>() < 0)) {
    if (err) *err = "manifest: " + field + " must be a non-negative integer";
    return false;
  }
  if (v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
    if (err) *err = "manifest: " + field + " is out of range";
    return false;
  }
  *out = static_cast<int>(v.get<uint64_t>());
  return true;
}

static bool ParseHotLoad(const nlohmann::json& h, HotLoad* out, std::string* err) {
  if (!h.is_object()) {
    if (err) *err = "manifest: runtime.hot_load must be an object";
    return false;
  }
  if (h.contains("watch")) {
    if (!h["watch"].is_array()) {
      if (err) *err = "manifest: runtime.hot_load.watch must be an array";
      return false;
    }
    for (const auto& w : h["watch"]) {
      if (!w.is_string()) {
        if (err) *err = "manifest: runtime.hot_load.watch entries must be strings";
        return false;
      }
      out->watch.push_back(w.get<std::string>());
    }
  }
  if (h.contains("mode")) {
    if (!h["mode"].is_string() || ToLower(Trim(h["mode"].get<std::string>())) != "restart") {
      if (err) *err = "manifest: runtime.hot_load.mode must be: restart";
      return false;
    }
  }
  if (h.contains("debounce_ms") && !ReadNonNegativeInt(h, "debounce_ms", "runtime.hot_load.debounce_ms", &out->debounce_ms, err)) {
    return false;
  }
  return true;
}

static bool ParseRuntime(const nlohmann::json& r, ToolRuntime* out, std::string* err) {
  if (!r.is_object()) {
    if (err) *err = "manifest: runtime must be an object";
    return false;
  }
  if (r.contains("mode")) {
    if (!r["mode"].is_string() || !TryParseRuntimeMode(r["mode"].get<std::string>(), &out->mode)) {
      if (err) *err = "manifest: runtime.mode must be one of: simple, capsule";
      return false;
    }
  }
  if (r.contains("startup_timeout_ms") &&
      !ReadNonNegativeInt(r, "startup_timeout_ms", "runtime.startup_timeout_ms", &out->startup_timeout_ms, err)) {
    return false;
  }
  if (r.contains("hot_load") && !r["hot_load"].is_null()) {
    HotLoad hl;
    if (!ParseHotLoad(r["hot_load"], &hl, err)) return false;
    out->hot_load = std::move(hl);
  }
  if (r.contains("env")) {
    if (!r["env"].is_object()) {
      if (err) *err = "manifest: runtime.env must be an object";
      return false;
    }
    for (const auto& kv : r["env"].items()) {
      if (kv.value().is_string()) {
        out->env[kv.key()] = kv.value().get<std::string>();
      } else {
        out->env[kv.key()] = kv.value().dump();
      }
    }
  }
  if (r.contains("args")) {
    if (!r["args"].is_array()) {
      if (err) *err = "manifest: runtime.args must be an array";
      return false;
    }
    for (const auto& a : r["args"]) {
      out->args.push_back(a.is_string() ? a.get<std::string>() : a.dump());
    }
  }
  return true;
}

// Plain scalars become numbers or booleans when that loses nothing: a number
// must print back as the same text ("1.10" and "007" stay strings). Quoted
// scalars always stay strings.
static nlohmann::json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return nullptr;
    case YAML::NodeType::Sequence: {
      auto arr = nlohmann::json::array();
      for (const auto& item : node) arr.push_back(YamlToJson(item));
      return arr;
    }
    case YAML::NodeType::Map: {
      auto obj = nlohmann::json::object();
      for (const auto& kv : node) obj[kv.first.as<std::string>()] = YamlToJson(kv.second);
      return obj;
    }
    case YAML::NodeType::Scalar:
      break;
  }
  const auto& text = node.Scalar();
  if (node.Tag() == "!") return text;
  int64_t i = 0;
  if (YAML::convert<int64_t>::decode(node, i) && nlohmann::json(i).dump() == text) return i;
  double d = 0;
  if (YAML::convert<double>::decode(node, d) && nlohmann::json(d).dump() == text) return d;
  bool b = false;
  if (YAML::convert<bool>::decode(node, b)) return b;
  return text;
}

}  // namespace

int EffectiveStartupTimeoutMs(const ToolManifest& manifest, int fallback_ms) {
  if (manifest.runtime && manifest.runtime->startup_timeout_ms > 0) return manifest.runtime->startup_timeout_ms;
  return fallback_ms > 0 ? fallback_ms : kDefaultStartupTimeoutMs;
}

bool TryParseRuntimeMode(const std::string& s, RuntimeMode* out) {
  if (!out) return false;
  const auto v = ToLower(Trim(s));
  if (v == "simple") {
    *out = RuntimeMode::kSimple;
    return true;
  }
  if (v == "capsule") {
    *out = RuntimeMode::kCapsule;
    return true;
  }
  return false;
}

const char* ToString(RuntimeMode mode) {
  return mode == RuntimeMode::kCapsule ? "capsule" : "simple";
}

bool ParseToolManifest(const nlohmann::json& j,
                       const std::string& base_dir,
                       ToolManifest* out,
                       std::string* err) {
  if (!out) return false;
  if (!j.is_object()) {
    if (err) *err = "manifest: expected a json object";
    return false;
  }

  ToolManifest m;
  if (!RequireString(j, "name", &m.name, err)) return false;
  if (!RequireString(j, "version", &m.version, err)) return false;
  if (!RequireString(j, "description", &m.description, err)) return false;
  if (!RequireString(j, "entrypoint", &m.entrypoint, err)) return false;

  std::filesystem::path p = m.entrypoint;
  if (p.is_relative() && !base_dir.empty()) p = std::filesystem::path(base_dir) / p;
  std::error_code ec;
  auto abs = std::filesystem::absolute(p, ec);
  if (ec) {
    if (err) *err = "manifest: invalid entrypoint path: " + m.entrypoint;
    return false;
  }
  m.path = abs.lexically_normal().string();

  if (j.contains("interpreter") && j["interpreter"].is_string()) m.interpreter = Trim(j["interpreter"].get<std::string>());
  if (m.interpreter.empty()) {
    std::string interp;
    if (ParseShebangInterpreter(m.path, &interp, nullptr)) m.interpreter = interp;
  }

  if (j.contains("runtime")) {
    ToolRuntime rt;
    if (!ParseRuntime(j["runtime"], &rt, err)) return false;
    m.runtime = std::move(rt);
  }

  if (j.contains("mcp") && j["mcp"].is_object()) {
    const auto& mcp = j["mcp"];
    if (mcp.contains("input_schema") && mcp["input_schema"].is_object()) m.input_schema = mcp["input_schema"];
    if (mcp.contains("output_schema") && mcp["output_schema"].is_object()) m.output_schema = mcp["output_schema"];
  }

  *out = std::move(m);
  return true;
}

bool LoadToolManifestFile(const std::string& file_path, ToolManifest* out, std::string* err) {
  std::filesystem::path p = file_path;
  std::error_code ec;
  if (std::filesystem::is_directory(p, ec)) p /= kToolManifestFileName;

  std::ifstream in(p);
  if (!in) {
    if (err) *err = "manifest: failed to open " + p.string();
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();

  nlohmann::json j;
  try {
    j = YamlToJson(YAML::Load(ss.str()));
  } catch (const YAML::Exception& e) {
    if (err) *err = "manifest: failed to parse " + p.string() + ": " + e.what();
    return false;
  }
  return ParseToolManifest(j, p.parent_path().string(), out, err);
}

bool ParseShebangInterpreter(const std::string& path, std::string* interpreter, std::string* err) {
  std::ifstream in(path);
  if (!in) {
    if (err) *err = "failed to read shebang file: " + path;
    return false;
  }
  std::string line;
  std::getline(in, line);
  line = Trim(line);
  if (line.rfind("#!", 0) != 0) {
    if (err) *err = "invalid shebang prefix: " + line;
    return false;
  }
  std::istringstream fields(line.substr(2));
  std::string first;
  if (!(fields >> first)) {
    if (err) *err = "invalid shebang: " + line + ", expected an interpreter";
    return false;
  }
  if (interpreter) *interpreter = first;
  return true;
}

}  // namespace capsule
