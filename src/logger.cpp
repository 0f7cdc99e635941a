#include "logger.hpp"

#include <cctype>
#include <iostream>
#include <ostream>

namespace capsule {
namespace {

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  s.resize(max_chars);
  s += kSuffix;
  return s;
}

static bool NeedsQuotes(const std::string& v) {
  if (v.empty()) return true;
  for (char c : v) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '"') return true;
  }
  return false;
}

}  // namespace

StreamLogger::StreamLogger(std::ostream* out, LogLevel min_level, std::string tag)
    : out_(out), min_level_(min_level), tag_(std::move(tag)) {}

void StreamLogger::Log(LogLevel level, const std::string& message, const LogFields& fields) {
  if (level < min_level_ || !out_) return;

  std::string line = "[" + tag_;
  if (level >= LogLevel::kWarn) {
    line += ":";
    line += ToString(level);
  }
  line += "] ";
  line += message;
  for (const auto& kv : fields) {
    auto value = TruncateForLog(kv.second, 2000);
    line += " " + kv.first + "=";
    if (NeedsQuotes(value)) {
      line += "\"" + value + "\"";
    } else {
      line += value;
    }
  }
  line += "\n";

  std::lock_guard<std::mutex> lock(mu_);
  *out_ << line;
  out_->flush();
}

std::shared_ptr<Logger> DefaultLogger() {
  static std::shared_ptr<Logger> logger = std::make_shared<StreamLogger>(&std::cerr, LogLevel::kInfo);
  return logger;
}

bool TryParseLogLevel(const std::string& s, LogLevel* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "debug") {
    *out = LogLevel::kDebug;
  } else if (v == "info") {
    *out = LogLevel::kInfo;
  } else if (v == "warn" || v == "warning") {
    *out = LogLevel::kWarn;
  } else if (v == "error") {
    *out = LogLevel::kError;
  } else {
    return false;
  }
  return true;
}

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

}  // namespace capsule
