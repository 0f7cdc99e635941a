#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace capsule {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

using LogFields = std::vector<std::pair<std::string, std::string>>;

class Logger {
 public:
  virtual ~Logger() = default;

  virtual void Log(LogLevel level, const std::string& message, const LogFields& fields) = 0;

  void Debug(const std::string& message, const LogFields& fields = {}) { Log(LogLevel::kDebug, message, fields); }
  void Info(const std::string& message, const LogFields& fields = {}) { Log(LogLevel::kInfo, message, fields); }
  void Warn(const std::string& message, const LogFields& fields = {}) { Log(LogLevel::kWarn, message, fields); }
  void Error(const std::string& message, const LogFields& fields = {}) { Log(LogLevel::kError, message, fields); }
};

// Writes "[tag] message key=value ..." lines. Warnings and errors get a
// "[tag:warn]" / "[tag:error]" marker.
class StreamLogger : public Logger {
 public:
  StreamLogger(std::ostream* out, LogLevel min_level, std::string tag = "capsule");

  void Log(LogLevel level, const std::string& message, const LogFields& fields) override;

  LogLevel min_level() const { return min_level_; }

 private:
  std::ostream* out_;
  LogLevel min_level_;
  std::string tag_;
  std::mutex mu_;
};

class NullLogger : public Logger {
 public:
  void Log(LogLevel, const std::string&, const LogFields&) override {}
};

// stderr, info level.
std::shared_ptr<Logger> DefaultLogger();

bool TryParseLogLevel(const std::string& s, LogLevel* out);
const char* ToString(LogLevel level);

}  // namespace capsule
