#pragma once

#include "context.hpp"
#include "tool_manifest.hpp"

#include <sys/types.h>

#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <streambuf>
#include <string>
#include <vector>

namespace capsule {

struct LaunchSpec {
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  std::string working_dir;
};

// `interpreter path args...` when the manifest names an interpreter,
// otherwise `path args...`. The working directory is the entrypoint's parent.
LaunchSpec BuildLaunchSpec(const ToolManifest& manifest);

// Current environment with `overrides` applied, as "KEY=VALUE" entries.
std::vector<std::string> MergeEnvironment(const std::map<std::string, std::string>& overrides);

// Resolves a bare program name against PATH. Names containing '/' are
// returned unchanged.
std::string ResolveExecutable(const std::string& name);

enum class LaunchFailure {
  kNone,
  kPipe,
  kSpawn,
};

// Read side of a pipe that gives up (reports EOF) once the wake descriptor
// becomes readable.
class InterruptibleReadBuf : public std::streambuf {
 public:
  InterruptibleReadBuf(int fd, int wake_fd);

 protected:
  int_type underflow() override;

 private:
  int fd_;
  int wake_fd_;
  char buf_[4096];
};

// One child process with captured stdin/stdout. stderr is inherited.
class ProcessSupervisor {
 public:
  ProcessSupervisor();
  ~ProcessSupervisor();
  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  bool Launch(const LaunchSpec& spec, LaunchFailure* failure, std::string* err);

  // Blocks until every byte is written, the pipe breaks, or Interrupt().
  // While no byte of `data` has gone out yet, a fired `cancel` also gives up
  // (waiting for the write lock included). Once part of `data` is written the
  // rest follows regardless, so the stream never carries a torn message.
  bool WriteAll(const std::string& data, const Signal* cancel, std::string* err);
  std::istream& Stdout();

  // Unblocks pending and future reads and writes. Safe from any thread.
  void Interrupt();

  bool CloseStdin(std::string* err);
  bool CloseStdout(std::string* err);

  bool HasExited();
  // SIGKILL to the child's process group.
  bool Kill(std::string* err);
  bool Wait(std::string* err);

  pid_t pid() const { return pid_; }
  bool launched() const { return pid_ > 0; }

 private:
  void CloseAll();

  pid_t pid_ = -1;
  bool reaped_ = false;
  int exit_status_ = 0;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int wake_read_fd_ = -1;
  int wake_write_fd_ = -1;
  std::unique_ptr<InterruptibleReadBuf> stdout_buf_;
  std::unique_ptr<std::istream> stdout_stream_;
  // Whole messages only; concurrent writers never interleave.
  std::timed_mutex write_mu_;
  std::mutex wait_mu_;
};

}  // namespace capsule
