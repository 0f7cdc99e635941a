#pragma once

#include "tool_manifest.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace capsule_test {

// mkdtemp() directory removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "capsule_test_XXXXXX").string();
    if (::mkdtemp(tmpl.data())) path_ = tmpl;
  }
  ~TempDir() {
    std::error_code ec;
    if (!path_.empty()) std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }

  std::string WriteFile(const std::string& name, const std::string& content, bool executable = false) const {
    const auto file = (std::filesystem::path(path_) / name).string();
    {
      std::ofstream out(file, std::ios::binary | std::ios::trunc);
      out << content;
    }
    if (executable) ::chmod(file.c_str(), 0755);
    return file;
  }

 private:
  std::string path_;
};

// Emits the handshake, then answers each request with {"echoed": <request>}.
// Requests are dumped with sorted keys, so "id" is always the first member.
inline const char* kEchoCapsule = R"(#!/bin/sh
printf '%s\n' '{"jsonrpc":"2.0","method":"orla.hello","params":{"name":"echo-capsule","version":"1.0.0","capabilities":["tools/call"]}}'
while IFS= read -r line; do
  id=$(printf '%s\n' "$line" | sed -n 's/^{"id":\([0-9][0-9]*\),.*/\1/p')
  printf '{"jsonrpc":"2.0","id":%s,"result":{"echoed":%s}}\n' "$id" "$line"
done
)";

inline capsule::ToolManifest CapsuleManifest(const std::string& name, const std::string& path, int startup_timeout_ms = 0) {
  capsule::ToolManifest m;
  m.name = name;
  m.version = "1.0.0";
  m.description = "test capsule";
  m.entrypoint = std::filesystem::path(path).filename().string();
  m.path = path;
  capsule::ToolRuntime rt;
  rt.mode = capsule::RuntimeMode::kCapsule;
  rt.startup_timeout_ms = startup_timeout_ms;
  m.runtime = rt;
  return m;
}

}  // namespace capsule_test
