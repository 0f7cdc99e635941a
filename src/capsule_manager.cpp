#include "capsule_manager.hpp"

#include "process_supervisor.hpp"

#include <utility>
#include <vector>

namespace capsule {
namespace {

static void SetError(CapsuleError* err, CapsuleErrc code, std::string message) {
  if (!err) return;
  err->code = code;
  err->message = std::move(message);
}

static void SetContextError(CapsuleError* err, const Context& ctx) {
  const auto code = ctx.Err() == ContextErr::kDeadlineExceeded ? CapsuleErrc::kCallTimeout : CapsuleErrc::kCallCancelled;
  SetError(err, code, "request timeout: " + ctx.ErrString());
}

static std::string JoinStrings(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); i++) {
    if (i > 0) out += sep;
    out += items[i];
  }
  return out;
}

}  // namespace

const char* ToString(CapsuleState state) {
  switch (state) {
    case CapsuleState::kCreated:
      return "CREATED";
    case CapsuleState::kStarting:
      return "STARTING";
    case CapsuleState::kReady:
      return "READY";
    case CapsuleState::kReloading:
      return "RELOADING";
    case CapsuleState::kCrashed:
      return "CRASHED";
    case CapsuleState::kStopped:
      return "STOPPED";
  }
  return "UNKNOWN";
}

const char* ToString(CapsuleErrc code) {
  switch (code) {
    case CapsuleErrc::kNone:
      return "none";
    case CapsuleErrc::kInvalidState:
      return "invalid_state";
    case CapsuleErrc::kPipeFailed:
      return "pipe_failed";
    case CapsuleErrc::kSpawnFailed:
      return "spawn_failed";
    case CapsuleErrc::kHandshakeTimeout:
      return "handshake_timeout";
    case CapsuleErrc::kHandshakeCancelled:
      return "handshake_cancelled";
    case CapsuleErrc::kNotReady:
      return "not_ready";
    case CapsuleErrc::kEncodeFailed:
      return "encode_failed";
    case CapsuleErrc::kWriteFailed:
      return "write_failed";
    case CapsuleErrc::kCallTimeout:
      return "call_timeout";
    case CapsuleErrc::kCallCancelled:
      return "call_cancelled";
    case CapsuleErrc::kKillFailed:
      return "kill_failed";
    case CapsuleErrc::kWaitFailed:
      return "wait_failed";
  }
  return "unknown";
}

CapsuleManager::CapsuleManager(ToolManifest tool, CapsuleManagerOptions options)
    : tool_(std::move(tool)),
      clock_(options.clock ? std::move(options.clock) : DefaultClock()),
      logger_(options.logger ? std::move(options.logger) : DefaultLogger()),
      startup_timeout_(EffectiveStartupTimeoutMs(tool_, options.default_startup_timeout_ms)) {}

CapsuleManager::~CapsuleManager() {
  CapsuleError err;
  if (!Stop(&err)) {
    logger_->Error("failed to stop capsule on destruction", {{"tool", tool_.name}, {"error", err.message}});
  }
}

bool CapsuleManager::Start(CapsuleError* err) {
  std::unique_lock<std::mutex> lifecycle(lifecycle_mu_);

  {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (state_ != CapsuleState::kCreated && state_ != CapsuleState::kCrashed && state_ != CapsuleState::kStopped) {
      SetError(err, CapsuleErrc::kInvalidState, std::string("cannot start capsule in state ") + ToString(state_));
      return false;
    }
    SetStateLocked(CapsuleState::kStarting);
  }

  auto proc = std::make_shared<ProcessSupervisor>();
  auto handshake = std::make_shared<HandshakeSlot>();
  Context lifetime = Context::WithCancel();

  LaunchFailure failure = LaunchFailure::kNone;
  std::string launch_err;
  if (!proc->Launch(BuildLaunchSpec(tool_), &failure, &launch_err)) {
    SetState(CapsuleState::kCrashed);
    logger_->Error("capsule launch failed", {{"tool", tool_.name}, {"error", launch_err}});
    SetError(err, failure == LaunchFailure::kPipe ? CapsuleErrc::kPipeFailed : CapsuleErrc::kSpawnFailed,
             std::move(launch_err));
    return false;
  }

  std::thread reader(&CapsuleManager::ReadResponses, this, proc, lifetime, handshake);
  {
    std::lock_guard<std::mutex> lock(process_mu_);
    process_ = proc;
    lifetime_ = lifetime;
    reader_ = std::move(reader);
  }
  logger_->Debug("capsule process started", {{"tool", tool_.name}, {"pid", std::to_string(proc->pid())}});

  auto timer = clock_->After(startup_timeout_);
  lifecycle.unlock();

  const size_t hit = WaitAny({&handshake->ready, lifetime.Done(), timer->Fired()});
  timer->Stop();

  if (hit == 0 && !lifetime.IsDone()) {
    HelloNotification hello;
    {
      std::lock_guard<std::mutex> lock(handshake->mu);
      hello = *handshake->hello;
    }
    if (TransitionIf(CapsuleState::kStarting, CapsuleState::kReady)) {
      logger_->Info("capsule handshake received", {{"tool", tool_.name},
                                                   {"name", hello.params.name},
                                                   {"version", hello.params.version},
                                                   {"capabilities", JoinStrings(hello.params.capabilities, ",")}});
      return true;
    }
  }

  if (hit != 2 || lifetime.IsDone()) {
    TransitionIf(CapsuleState::kStarting, CapsuleState::kStopped);
    SetError(err, CapsuleErrc::kHandshakeCancelled, "capsule context cancelled");
    return false;
  }

  {
    std::lock_guard<std::mutex> relock(lifecycle_mu_);
    // Stop() got here first; it owns the final state.
    if (lifetime.IsDone()) {
      SetError(err, CapsuleErrc::kHandshakeCancelled, "capsule context cancelled");
      return false;
    }
    SetState(CapsuleState::kCrashed);
    CapsuleError stop_err;
    Teardown(&stop_err);
    if (stop_err.code != CapsuleErrc::kNone) {
      logger_->Error("failed to stop capsule on timeout", {{"tool", tool_.name}, {"error", stop_err.message}});
    }
  }

  logger_->Warn("capsule handshake timed out",
                {{"tool", tool_.name}, {"timeout_ms", std::to_string(startup_timeout_.count())}});
  SetError(err, CapsuleErrc::kHandshakeTimeout,
           "handshake timeout after " + std::to_string(startup_timeout_.count()) + "ms");
  return false;
}

void CapsuleManager::ReadResponses(std::shared_ptr<ProcessSupervisor> proc,
                                   Context lifetime,
                                   std::shared_ptr<HandshakeSlot> handshake) {
  std::istream& in = proc->Stdout();
  for (;;) {
    if (lifetime.IsDone()) return;

    nlohmann::json msg;
    try {
      in >> msg;
    } catch (const nlohmann::json::exception& e) {
      // EOF, a closed pipe, or garbage: the stream cannot be resynchronized.
      if (!lifetime.IsDone()) {
        logger_->Debug("stopping response reader", {{"tool", tool_.name}, {"reason", e.what()}});
      }
      return;
    }

    if (auto hello = ParseHelloNotification(msg)) {
      {
        std::lock_guard<std::mutex> lock(handshake->mu);
        if (!handshake->hello) handshake->hello = std::move(*hello);
      }
      handshake->ready.Fire();
      continue;
    }

    if (auto resp = ParseResponse(msg)) {
      std::shared_ptr<PendingCall> call;
      {
        std::unique_lock<std::shared_mutex> lock(responses_mu_);
        auto it = responses_.find(resp->id);
        if (it != responses_.end()) {
          call = std::move(it->second);
          responses_.erase(it);
        }
      }
      if (!call) {
        logger_->Debug("dropping response with no pending call", {{"tool", tool_.name}, {"id", std::to_string(resp->id)}});
        continue;
      }
      {
        std::lock_guard<std::mutex> lock(call->mu);
        call->response = std::move(*resp);
      }
      call->ready.Fire();
      continue;
    }

    logger_->Debug("dropping unrecognized message", {{"tool", tool_.name}, {"message", msg.dump()}});
  }
}

bool CapsuleManager::Stop(CapsuleError* err) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (state_ == CapsuleState::kStopped) return true;
  }

  CapsuleError teardown_err;
  Teardown(&teardown_err);
  SetState(CapsuleState::kStopped);

  if (teardown_err.code != CapsuleErrc::kNone) {
    logger_->Error("capsule stop reported errors", {{"tool", tool_.name}, {"error", teardown_err.message}});
    if (err) *err = std::move(teardown_err);
    return false;
  }
  return true;
}

void CapsuleManager::Teardown(CapsuleError* err) {
  std::shared_ptr<ProcessSupervisor> proc;
  Context lifetime;
  std::thread reader;
  {
    std::lock_guard<std::mutex> lock(process_mu_);
    proc = std::move(process_);
    lifetime = lifetime_;
    reader = std::move(reader_);
  }

  lifetime.Cancel();
  DropAllPending();
  if (!proc) return;

  proc->Interrupt();
  if (reader.joinable()) reader.join();

  std::string close_err;
  if (!proc->CloseStdin(&close_err)) logger_->Error("failed to close stdin pipe", {{"tool", tool_.name}, {"error", close_err}});
  if (!proc->CloseStdout(&close_err)) logger_->Error("failed to close stdout pipe", {{"tool", tool_.name}, {"error", close_err}});

  std::vector<std::string> failures;
  CapsuleErrc code = CapsuleErrc::kNone;
  std::string e;
  if (!proc->HasExited() && !proc->Kill(&e)) {
    failures.push_back(e);
    code = CapsuleErrc::kKillFailed;
  }
  if (!proc->Wait(&e)) {
    failures.push_back(e);
    if (code == CapsuleErrc::kNone) code = CapsuleErrc::kWaitFailed;
  }
  if (!failures.empty()) SetError(err, code, JoinStrings(failures, "; "));
}

std::optional<JsonRpcResponse> CapsuleManager::CallTool(const Context& ctx,
                                                        const nlohmann::json& arguments,
                                                        CapsuleError* err) {
  const auto state = GetState();
  if (state != CapsuleState::kReady) {
    SetError(err, CapsuleErrc::kNotReady, std::string("capsule is not ready (state: ") + ToString(state) + ")");
    return std::nullopt;
  }

  int64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(request_id_mu_);
    id = ++request_id_;
  }

  // Registered before the write so a fast reply always finds its slot.
  auto call = std::make_shared<PendingCall>();
  {
    std::unique_lock<std::shared_mutex> lock(responses_mu_);
    responses_[id] = call;
  }

  std::shared_ptr<ProcessSupervisor> proc;
  Context lifetime;
  {
    std::lock_guard<std::mutex> lock(process_mu_);
    proc = process_;
    lifetime = lifetime_;
  }

  if (!proc) {
    DropPending(id);
    SetError(err, CapsuleErrc::kWriteFailed, "stdin pipe is not available");
    return std::nullopt;
  }

  std::string line;
  try {
    line = ToJson(MakeToolsCallRequest(id, tool_.name, arguments)).dump();
  } catch (const nlohmann::json::exception& e) {
    DropPending(id);
    SetError(err, CapsuleErrc::kEncodeFailed, std::string("failed to send JSON-RPC request: ") + e.what());
    return std::nullopt;
  }
  line += "\n";

  std::string write_err;
  if (!proc->WriteAll(line, ctx.Done(), &write_err)) {
    DropPending(id);
    if (ctx.IsDone()) {
      SetContextError(err, ctx);
      return std::nullopt;
    }
    SetError(err, CapsuleErrc::kWriteFailed, "failed to send JSON-RPC request: " + write_err);
    return std::nullopt;
  }

  const size_t hit = WaitAny({&call->ready, ctx.Done(), lifetime.Done()});
  if (hit == 0) {
    std::lock_guard<std::mutex> lock(call->mu);
    return std::move(call->response);
  }

  DropPending(id);
  if (hit == 1) {
    SetContextError(err, ctx);
    return std::nullopt;
  }
  SetError(err, CapsuleErrc::kCallCancelled, "capsule context cancelled");
  return std::nullopt;
}

CapsuleState CapsuleManager::GetState() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return state_;
}

bool CapsuleManager::IsReady() const {
  return GetState() == CapsuleState::kReady;
}

size_t CapsuleManager::PendingCalls() const {
  std::shared_lock<std::shared_mutex> lock(responses_mu_);
  return responses_.size();
}

int64_t CapsuleManager::LastRequestId() const {
  std::lock_guard<std::mutex> lock(request_id_mu_);
  return request_id_;
}

void CapsuleManager::SetState(CapsuleState next) {
  std::lock_guard<std::mutex> lock(state_mu_);
  SetStateLocked(next);
}

void CapsuleManager::SetStateLocked(CapsuleState next) {
  const auto prev = state_;
  state_ = next;
  if (prev != next) {
    logger_->Debug("capsule state changed", {{"tool", tool_.name}, {"old_state", ToString(prev)}, {"new_state", ToString(next)}});
  }
}

bool CapsuleManager::TransitionIf(CapsuleState from, CapsuleState to) {
  std::lock_guard<std::mutex> lock(state_mu_);
  if (state_ != from) return false;
  SetStateLocked(to);
  return true;
}

void CapsuleManager::DropPending(int64_t id) {
  std::unique_lock<std::shared_mutex> lock(responses_mu_);
  responses_.erase(id);
}

void CapsuleManager::DropAllPending() {
  std::unique_lock<std::shared_mutex> lock(responses_mu_);
  responses_.clear();
}

}  // namespace capsule
