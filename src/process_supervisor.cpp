#include "process_supervisor.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <sstream>

extern char** environ;

namespace capsule {
namespace {

constexpr int kCancelPollMs = 20;

static std::string ErrnoString(int e) {
  return std::strerror(e);
}

static void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

static void CloseFd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

static bool MakePipe(int fds[2], int extra_flags) {
  return ::pipe2(fds, O_CLOEXEC | extra_flags) == 0;
}

// Writes errno to the status pipe and exits. Async-signal-safe.
[[noreturn]] static void ChildFail(int status_fd) {
  int e = errno;
  ssize_t unused = ::write(status_fd, &e, sizeof(e));
  (void)unused;
  ::_exit(127);
}

}  // namespace

LaunchSpec BuildLaunchSpec(const ToolManifest& manifest) {
  LaunchSpec spec;
  if (!manifest.interpreter.empty()) {
    spec.argv.push_back(manifest.interpreter);
    spec.argv.push_back(manifest.path);
  } else {
    spec.argv.push_back(manifest.path);
  }
  if (manifest.runtime) {
    for (const auto& a : manifest.runtime->args) spec.argv.push_back(a);
    spec.env = manifest.runtime->env;
  }
  auto dir = std::filesystem::path(manifest.path).parent_path();
  if (!dir.empty()) spec.working_dir = dir.string();
  return spec;
}

std::vector<std::string> MergeEnvironment(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; e++) {
    std::string entry(*e);
    auto eq = entry.find('=');
    const auto key = eq == std::string::npos ? entry : entry.substr(0, eq);
    if (overrides.find(key) != overrides.end()) continue;
    out.push_back(std::move(entry));
  }
  for (const auto& kv : overrides) out.push_back(kv.first + "=" + kv.second);
  return out;
}

std::string ResolveExecutable(const std::string& name) {
  if (name.empty() || name.find('/') != std::string::npos) return name;
  const char* path_env = std::getenv("PATH");
  std::stringstream ss(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) dir = ".";
    auto candidate = dir + "/" + name;
    if (::access(candidate.c_str(), X_OK) == 0) return candidate;
  }
  return name;
}

InterruptibleReadBuf::InterruptibleReadBuf(int fd, int wake_fd) : fd_(fd), wake_fd_(wake_fd) {
  setg(buf_, buf_, buf_);
}

InterruptibleReadBuf::int_type InterruptibleReadBuf::underflow() {
  if (gptr() < egptr()) return traits_type::to_int_type(*gptr());
  for (;;) {
    pollfd fds[2];
    fds[0] = {fd_, POLLIN, 0};
    fds[1] = {wake_fd_, POLLIN, 0};
    int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR) continue;
      return traits_type::eof();
    }
    if (fds[1].revents != 0) return traits_type::eof();
    if (fds[0].revents == 0) continue;

    ssize_t n = ::read(fd_, buf_, sizeof(buf_));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      return traits_type::eof();
    }
    if (n == 0) return traits_type::eof();
    setg(buf_, buf_, buf_ + n);
    return traits_type::to_int_type(*gptr());
  }
}

ProcessSupervisor::ProcessSupervisor() = default;

ProcessSupervisor::~ProcessSupervisor() {
  if (launched()) {
    Interrupt();
    if (!HasExited()) {
      std::string ignored;
      Kill(&ignored);
    }
    std::string ignored;
    Wait(&ignored);
  }
  CloseAll();
}

void ProcessSupervisor::CloseAll() {
  stdout_stream_.reset();
  stdout_buf_.reset();
  CloseFd(&stdin_fd_);
  CloseFd(&stdout_fd_);
  CloseFd(&wake_read_fd_);
  CloseFd(&wake_write_fd_);
}

bool ProcessSupervisor::Launch(const LaunchSpec& spec, LaunchFailure* failure, std::string* err) {
  auto fail = [&](LaunchFailure f, const std::string& msg) {
    if (failure) *failure = f;
    if (err) *err = msg;
    CloseAll();
    return false;
  };

  if (launched()) return fail(LaunchFailure::kSpawn, "process already launched");
  if (spec.argv.empty()) return fail(LaunchFailure::kSpawn, "empty command");
  IgnoreSigpipeOnce();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  int wake_pipe[2] = {-1, -1};
  auto close_pair = [](int p[2]) {
    CloseFd(&p[0]);
    CloseFd(&p[1]);
  };

  if (!MakePipe(in_pipe, 0)) {
    return fail(LaunchFailure::kPipe, "failed to create stdin pipe: " + ErrnoString(errno));
  }
  if (!MakePipe(out_pipe, 0)) {
    const int e = errno;
    close_pair(in_pipe);
    return fail(LaunchFailure::kPipe, "failed to create stdout pipe: " + ErrnoString(e));
  }
  if (!MakePipe(status_pipe, 0) || !MakePipe(wake_pipe, O_NONBLOCK)) {
    const int e = errno;
    close_pair(in_pipe);
    close_pair(out_pipe);
    close_pair(status_pipe);
    close_pair(wake_pipe);
    return fail(LaunchFailure::kPipe, "failed to create control pipe: " + ErrnoString(e));
  }

  // Everything the child touches is prepared before fork().
  const std::string exe = ResolveExecutable(spec.argv[0]);
  std::vector<char*> argv;
  argv.reserve(spec.argv.size() + 1);
  for (const auto& a : spec.argv) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);
  const auto env_entries = MergeEnvironment(spec.env);
  std::vector<char*> envp;
  envp.reserve(env_entries.size() + 1);
  for (const auto& e : env_entries) envp.push_back(const_cast<char*>(e.c_str()));
  envp.push_back(nullptr);
  const char* cwd = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

  pid_t pid = ::fork();
  if (pid < 0) {
    const int e = errno;
    close_pair(in_pipe);
    close_pair(out_pipe);
    close_pair(status_pipe);
    close_pair(wake_pipe);
    return fail(LaunchFailure::kSpawn, "failed to start capsule process: " + ErrnoString(e));
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    if (::dup2(in_pipe[0], STDIN_FILENO) < 0) ChildFail(status_pipe[1]);
    if (::dup2(out_pipe[1], STDOUT_FILENO) < 0) ChildFail(status_pipe[1]);
    if (cwd && ::chdir(cwd) != 0) ChildFail(status_pipe[1]);
    ::signal(SIGPIPE, SIG_DFL);
    ::execve(exe.c_str(), argv.data(), envp.data());
    ChildFail(status_pipe[1]);
  }

  ::setpgid(pid, pid);
  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&status_pipe[1]);

  int child_errno = 0;
  ssize_t n = -1;
  do {
    n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&status_pipe[0]);

  pid_ = pid;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  wake_read_fd_ = wake_pipe[0];
  wake_write_fd_ = wake_pipe[1];

  if (n > 0) {
    std::string ignored;
    Wait(&ignored);
    pid_ = -1;
    return fail(LaunchFailure::kSpawn, "failed to start capsule process: " + exe + ": " + ErrnoString(child_errno));
  }

  int flags = ::fcntl(stdin_fd_, F_GETFL, 0);
  if (flags >= 0) ::fcntl(stdin_fd_, F_SETFL, flags | O_NONBLOCK);

  stdout_buf_ = std::make_unique<InterruptibleReadBuf>(stdout_fd_, wake_read_fd_);
  stdout_stream_ = std::make_unique<std::istream>(stdout_buf_.get());
  if (failure) *failure = LaunchFailure::kNone;
  return true;
}

bool ProcessSupervisor::WriteAll(const std::string& data, const Signal* cancel, std::string* err) {
  auto cancelled = [&] {
    if (!cancel || !cancel->Fired()) return false;
    if (err) *err = "write cancelled";
    return true;
  };

  std::unique_lock<std::timed_mutex> lock(write_mu_, std::defer_lock);
  if (cancel) {
    while (!lock.try_lock_for(std::chrono::milliseconds(kCancelPollMs))) {
      if (cancelled()) return false;
    }
  } else {
    lock.lock();
  }

  if (stdin_fd_ < 0) {
    if (err) *err = "stdin pipe is not available";
    return false;
  }
  size_t off = 0;
  while (off < data.size()) {
    if (off == 0 && cancelled()) return false;
    ssize_t n = ::write(stdin_fd_, data.data() + off, data.size() - off);
    if (n > 0) {
      off += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      if (err) *err = ErrnoString(errno);
      return false;
    }

    pollfd fds[2];
    fds[0] = {stdin_fd_, POLLOUT, 0};
    fds[1] = {wake_read_fd_, POLLIN, 0};
    const int timeout_ms = cancel && off == 0 ? kCancelPollMs : -1;
    int rc = ::poll(fds, 2, timeout_ms);
    if (rc < 0 && errno != EINTR) {
      if (err) *err = ErrnoString(errno);
      return false;
    }
    if (fds[1].revents != 0) {
      if (err) *err = "write interrupted";
      return false;
    }
    if (fds[0].revents & (POLLERR | POLLHUP)) {
      if (err) *err = ErrnoString(EPIPE);
      return false;
    }
  }
  return true;
}

std::istream& ProcessSupervisor::Stdout() {
  return *stdout_stream_;
}

void ProcessSupervisor::Interrupt() {
  if (wake_write_fd_ < 0) return;
  const char b = 1;
  ssize_t unused = ::write(wake_write_fd_, &b, 1);
  (void)unused;
}

bool ProcessSupervisor::CloseStdin(std::string* err) {
  std::lock_guard<std::timed_mutex> lock(write_mu_);
  if (stdin_fd_ < 0) return true;
  const int fd = stdin_fd_;
  stdin_fd_ = -1;
  if (::close(fd) != 0) {
    if (err) *err = "failed to close stdin pipe: " + ErrnoString(errno);
    return false;
  }
  return true;
}

bool ProcessSupervisor::CloseStdout(std::string* err) {
  stdout_stream_.reset();
  stdout_buf_.reset();
  if (stdout_fd_ < 0) return true;
  const int fd = stdout_fd_;
  stdout_fd_ = -1;
  if (::close(fd) != 0) {
    if (err) *err = "failed to close stdout pipe: " + ErrnoString(errno);
    return false;
  }
  return true;
}

bool ProcessSupervisor::HasExited() {
  std::lock_guard<std::mutex> lock(wait_mu_);
  if (pid_ <= 0 || reaped_) return true;
  int status = 0;
  pid_t r = ::waitpid(pid_, &status, WNOHANG);
  if (r == pid_) {
    reaped_ = true;
    exit_status_ = status;
    return true;
  }
  return false;
}

bool ProcessSupervisor::Kill(std::string* err) {
  if (pid_ <= 0) return true;
  if (::kill(-pid_, SIGKILL) == 0) return true;
  // The group may be gone while the leader is still unreaped.
  if (errno == ESRCH && ::kill(pid_, SIGKILL) == 0) return true;
  if (errno == ESRCH) return true;
  if (err) *err = "failed to kill capsule process: " + ErrnoString(errno);
  return false;
}

bool ProcessSupervisor::Wait(std::string* err) {
  std::lock_guard<std::mutex> lock(wait_mu_);
  if (pid_ <= 0 || reaped_) return true;
  int status = 0;
  pid_t r = -1;
  do {
    r = ::waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);
  if (r < 0) {
    if (err) *err = "failed to wait for capsule process: " + ErrnoString(errno);
    return false;
  }
  reaped_ = true;
  exit_status_ = status;
  return true;
}

}  // namespace capsule
