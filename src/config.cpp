#include "config.hpp"

#include <cstdlib>
#include <string>

namespace capsule {
namespace {

static std::string GetEnvStr(const std::string& name) {
  const char* v = std::getenv(name.c_str());
  return v ? std::string(v) : std::string();
}

static bool TryParsePositiveInt(const std::string& s, int* out) {
  if (!out || s.empty()) return false;
  char* end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || v <= 0 || v > 24L * 60 * 60 * 1000) return false;
  *out = static_cast<int>(v);
  return true;
}

}  // namespace

std::string GetEnv(const std::string& key) {
  if (auto v = GetEnvStr(key); !v.empty()) return v;
  return GetEnvStr("ORLA_" + key);
}

RuntimeConfig LoadConfigFromEnv() {
  RuntimeConfig cfg;

  if (auto path = GetEnv("CAPSULE_MANIFEST"); !path.empty()) cfg.manifest_path = path;

  if (auto level = GetEnv("CAPSULE_LOG_LEVEL"); !level.empty()) {
    LogLevel parsed = cfg.log_level;
    if (TryParseLogLevel(level, &parsed)) cfg.log_level = parsed;
  }

  if (auto ms = GetEnv("CAPSULE_STARTUP_TIMEOUT_MS"); !ms.empty()) {
    int v = 0;
    if (TryParsePositiveInt(ms, &v)) cfg.default_startup_timeout_ms = v;
  }

  if (auto ms = GetEnv("CAPSULE_CALL_TIMEOUT_MS"); !ms.empty()) {
    int v = 0;
    if (TryParsePositiveInt(ms, &v)) cfg.call_timeout_ms = v;
  }

  return cfg;
}

}  // namespace capsule
