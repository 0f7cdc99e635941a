#include <gtest/gtest.h>

#include "config.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <sstream>

using namespace capsule;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearAll(); }
  void TearDown() override { ClearAll(); }

  static void ClearAll() {
    for (const char* key : {"CAPSULE_MANIFEST", "CAPSULE_LOG_LEVEL", "CAPSULE_STARTUP_TIMEOUT_MS", "CAPSULE_CALL_TIMEOUT_MS"}) {
      ::unsetenv(key);
      ::unsetenv((std::string("ORLA_") + key).c_str());
    }
  }
};

TEST_F(ConfigTest, Defaults) {
  auto cfg = LoadConfigFromEnv();
  EXPECT_TRUE(cfg.manifest_path.empty());
  EXPECT_EQ(cfg.log_level, LogLevel::kInfo);
  EXPECT_EQ(cfg.default_startup_timeout_ms, 5000);
  EXPECT_EQ(cfg.call_timeout_ms, 30000);
}

TEST_F(ConfigTest, ReadsEnvironment) {
  ::setenv("CAPSULE_MANIFEST", "/etc/tools/fs.json", 1);
  ::setenv("CAPSULE_LOG_LEVEL", "Debug", 1);
  ::setenv("CAPSULE_STARTUP_TIMEOUT_MS", "1500", 1);
  ::setenv("CAPSULE_CALL_TIMEOUT_MS", "2500", 1);

  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.manifest_path, "/etc/tools/fs.json");
  EXPECT_EQ(cfg.log_level, LogLevel::kDebug);
  EXPECT_EQ(cfg.default_startup_timeout_ms, 1500);
  EXPECT_EQ(cfg.call_timeout_ms, 2500);
}

TEST_F(ConfigTest, PrefixedNameIsFallback) {
  ::setenv("ORLA_CAPSULE_STARTUP_TIMEOUT_MS", "700", 1);
  EXPECT_EQ(LoadConfigFromEnv().default_startup_timeout_ms, 700);

  ::setenv("CAPSULE_STARTUP_TIMEOUT_MS", "800", 1);
  EXPECT_EQ(LoadConfigFromEnv().default_startup_timeout_ms, 800);
  EXPECT_EQ(GetEnv("CAPSULE_STARTUP_TIMEOUT_MS"), "800");
}

TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
  ::setenv("CAPSULE_LOG_LEVEL", "loud", 1);
  ::setenv("CAPSULE_STARTUP_TIMEOUT_MS", "-5", 1);
  ::setenv("CAPSULE_CALL_TIMEOUT_MS", "12abc", 1);

  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.log_level, LogLevel::kInfo);
  EXPECT_EQ(cfg.default_startup_timeout_ms, 5000);
  EXPECT_EQ(cfg.call_timeout_ms, 30000);
}

TEST(LoggerTest, FormatsTaggedLines) {
  std::ostringstream out;
  StreamLogger logger(&out, LogLevel::kInfo);
  logger.Info("capsule ready", {{"tool", "fs"}, {"note", "two words"}, {"empty", ""}});
  logger.Warn("slow", {{"ms", "900"}});
  logger.Debug("hidden");

  EXPECT_EQ(out.str(),
            "[capsule] capsule ready tool=fs note=\"two words\" empty=\"\"\n"
            "[capsule:warn] slow ms=900\n");
}

TEST(LoggerTest, ParsesLevels) {
  LogLevel level = LogLevel::kInfo;
  EXPECT_TRUE(TryParseLogLevel("WARNING", &level));
  EXPECT_EQ(level, LogLevel::kWarn);
  EXPECT_TRUE(TryParseLogLevel("error", &level));
  EXPECT_EQ(level, LogLevel::kError);
  EXPECT_FALSE(TryParseLogLevel("verbose", &level));
  EXPECT_STREQ(ToString(LogLevel::kError), "error");
}
