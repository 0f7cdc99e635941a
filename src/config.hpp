#pragma once

#include "logger.hpp"

#include <string>

namespace capsule {

struct RuntimeConfig {
  std::string manifest_path;
  LogLevel log_level = LogLevel::kInfo;
  int default_startup_timeout_ms = 5000;
  int call_timeout_ms = 30000;
};

// Every variable is also accepted with an ORLA_ prefix; the plain name wins.
RuntimeConfig LoadConfigFromEnv();

std::string GetEnv(const std::string& key);

}  // namespace capsule
