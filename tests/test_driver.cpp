#include <gtest/gtest.h>

#include "test_util.hpp"

#include <nlohmann/json.hpp>

#include <sys/wait.h>

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using capsule_test::TempDir;
using nlohmann::json;

namespace {

struct RunResult {
  int exit_code = -1;
  std::vector<std::string> lines;
};

}  // namespace

class DriverTest : public ::testing::Test {
 protected:
  void WriteTool(const std::string& mode, const char* script, int startup_timeout_ms = 5000) {
    dir_.WriteFile("capsule.sh", script, /*executable=*/true);
    dir_.WriteFile("tool.yaml", "name: echo\n"
                                "version: 1.0.0\n"
                                "description: echo capsule\n"
                                "entrypoint: capsule.sh\n"
                                "runtime:\n"
                                "  mode: " + mode + "\n"
                                "  startup_timeout_ms: " + std::to_string(startup_timeout_ms) + "\n");
  }

  // Runs the driver binary with `manifest` (nothing when empty) and `input` on stdin.
  RunResult Run(const std::string& manifest, const std::string& input) {
    const auto in = dir_.WriteFile("stdin.txt", input);
    const auto out = dir_.path() + "/stdout.txt";
    const auto log = dir_.path() + "/stderr.txt";
    std::string cmd = "env -u CAPSULE_MANIFEST CAPSULE_LOG_LEVEL=error ";
    if (!manifest.empty()) cmd += "CAPSULE_MANIFEST='" + manifest + "' ";
    cmd += "'" + std::string(CAPSULE_RUNTIME_BINARY) + "' < '" + in + "' > '" + out + "' 2> '" + log + "'";

    RunResult r;
    const int status = std::system(cmd.c_str());
    if (status != -1 && WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
    std::ifstream f(out);
    std::string line;
    while (std::getline(f, line)) r.lines.push_back(line);
    return r;
  }

  TempDir dir_;
};

TEST_F(DriverTest, AnswersEachLineInOrder) {
  WriteTool("capsule", capsule_test::kEchoCapsule);
  auto r = Run(dir_.path(), "{\"message\":\"hi\"}\nnot json\n\n   \n{\"n\":2}\n");
  EXPECT_EQ(r.exit_code, 0);
  ASSERT_EQ(r.lines.size(), 3u);

  auto first = json::parse(r.lines[0]);
  EXPECT_EQ(first["id"], "call_1");
  EXPECT_EQ(first["name"], "echo");
  EXPECT_EQ(first["ok"], true);
  EXPECT_EQ(first["result"]["echoed"]["params"]["arguments"]["message"], "hi");
  EXPECT_FALSE(first.contains("error"));

  auto second = json::parse(r.lines[1]);
  EXPECT_EQ(second["id"], "call_2");
  EXPECT_EQ(second["ok"], false);
  EXPECT_EQ(second["error"], "invalid JSON arguments");
  EXPECT_FALSE(second.contains("result"));

  // The bad line consumed no request id on the capsule side.
  auto third = json::parse(r.lines[2]);
  EXPECT_EQ(third["id"], "call_3");
  EXPECT_EQ(third["ok"], true);
  EXPECT_EQ(third["result"]["echoed"]["id"], 2);
  EXPECT_EQ(third["result"]["echoed"]["params"]["arguments"]["n"], 2);
}

TEST_F(DriverTest, EmptyInputStopsCleanly) {
  WriteTool("capsule", capsule_test::kEchoCapsule);
  auto r = Run(dir_.path() + "/tool.yaml", "");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_TRUE(r.lines.empty());
}

TEST_F(DriverTest, MissingManifestIsUsageError) {
  EXPECT_EQ(Run("", "{}\n").exit_code, 2);
  EXPECT_EQ(Run(dir_.path() + "/nope.yaml", "{}\n").exit_code, 2);
}

TEST_F(DriverTest, SimpleModeToolIsRejected) {
  WriteTool("simple", capsule_test::kEchoCapsule);
  auto r = Run(dir_.path(), "{}\n");
  EXPECT_EQ(r.exit_code, 2);
  EXPECT_TRUE(r.lines.empty());
}

TEST_F(DriverTest, HandshakeTimeoutFailsStartup) {
  WriteTool("capsule", "#!/bin/sh\nexec sleep 1000\n", /*startup_timeout_ms=*/50);
  auto r = Run(dir_.path(), "{}\n");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_TRUE(r.lines.empty());
}
