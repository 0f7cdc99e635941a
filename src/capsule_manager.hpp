#pragma once

#include "clock.hpp"
#include "context.hpp"
#include "jsonrpc.hpp"
#include "logger.hpp"
#include "tool_manifest.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace capsule {

class ProcessSupervisor;

enum class CapsuleState {
  kCreated,
  kStarting,
  kReady,
  // Reserved for reload-in-place; no operation enters it.
  kReloading,
  kCrashed,
  kStopped,
};

const char* ToString(CapsuleState state);

enum class CapsuleErrc {
  kNone,
  // Startup
  kInvalidState,
  kPipeFailed,
  kSpawnFailed,
  // Handshake
  kHandshakeTimeout,
  kHandshakeCancelled,
  // Call
  kNotReady,
  kEncodeFailed,
  kWriteFailed,
  kCallTimeout,
  kCallCancelled,
  // Shutdown
  kKillFailed,
  kWaitFailed,
};

const char* ToString(CapsuleErrc code);

struct CapsuleError {
  CapsuleErrc code = CapsuleErrc::kNone;
  std::string message;
};

struct CapsuleManagerOptions {
  // DefaultClock() when empty.
  std::shared_ptr<Clock> clock;
  // DefaultLogger() when empty.
  std::shared_ptr<Logger> logger;
  // Used when the manifest does not set runtime.startup_timeout_ms.
  int default_startup_timeout_ms = kDefaultStartupTimeoutMs;
};

// Runs one capsule-mode tool as a persistent child process and multiplexes
// concurrent tools/call requests over its stdin/stdout.
//
// Start()/Stop() may be called repeatedly; Start() is legal from CREATED,
// CRASHED and STOPPED. CallTool() requires READY. All methods are safe to
// call from any thread.
class CapsuleManager {
 public:
  explicit CapsuleManager(ToolManifest tool, CapsuleManagerOptions options = {});
  ~CapsuleManager();
  CapsuleManager(const CapsuleManager&) = delete;
  CapsuleManager& operator=(const CapsuleManager&) = delete;

  // Launches the child and blocks until its orla.hello handshake arrives,
  // the startup timeout elapses (-> CRASHED), or Stop() runs (-> STOPPED).
  bool Start(CapsuleError* err);

  // Idempotent. Always ends in STOPPED; kill/wait failures are reported but
  // do not prevent the transition.
  bool Stop(CapsuleError* err);

  // Returns the capsule's JSON-RPC response as-is: a response carrying an
  // "error" member is still a successful call at this layer.
  std::optional<JsonRpcResponse> CallTool(const Context& ctx, const nlohmann::json& arguments, CapsuleError* err);

  CapsuleState GetState() const;
  bool IsReady() const;

  const ToolManifest& tool() const { return tool_; }
  std::chrono::milliseconds startup_timeout() const { return startup_timeout_; }
  size_t PendingCalls() const;
  int64_t LastRequestId() const;

 private:
  struct PendingCall {
    Signal ready;
    std::mutex mu;
    std::optional<JsonRpcResponse> response;
  };

  struct HandshakeSlot {
    Signal ready;
    std::mutex mu;
    std::optional<HelloNotification> hello;
  };

  void ReadResponses(std::shared_ptr<ProcessSupervisor> proc, Context lifetime, std::shared_ptr<HandshakeSlot> handshake);

  // Requires lifecycle_mu_. Leaves the state untouched.
  void Teardown(CapsuleError* err);

  void SetState(CapsuleState next);
  void SetStateLocked(CapsuleState next);
  bool TransitionIf(CapsuleState from, CapsuleState to);

  void DropPending(int64_t id);
  void DropAllPending();

  ToolManifest tool_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<Logger> logger_;
  std::chrono::milliseconds startup_timeout_;

  // Serializes the launch phase of Start() with Stop(). Taken before any of
  // the locks below and never held while waiting for the handshake.
  std::mutex lifecycle_mu_;

  // None of the following locks is held while acquiring another.
  mutable std::mutex state_mu_;
  CapsuleState state_ = CapsuleState::kCreated;

  std::mutex process_mu_;
  std::shared_ptr<ProcessSupervisor> process_;
  Context lifetime_;
  std::thread reader_;

  mutable std::mutex request_id_mu_;
  int64_t request_id_ = 0;

  mutable std::shared_mutex responses_mu_;
  std::unordered_map<int64_t, std::shared_ptr<PendingCall>> responses_;
};

}  // namespace capsule
