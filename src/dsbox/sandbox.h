#ifndef DSBOX_SANDBOX_H_
#define DSBOX_SANDBOX_H_

#include <chrono>
#include <string>
#include <filesystem>

#define ENUM_SANDBOX_STATE_ \
  X(NOT_STARTED) \
  X(RUNNING) \
  X(STOPPED)
enum class SandboxState {
#define X(name) name,
  ENUM_SANDBOX_STATE_
#undef X
};
const char* SandboxStateName(SandboxState);

// Declared at launch; enforced by the isolation primitive itself.
// Network access is never granted.
struct SandboxLimits {
  long memory_bytes; // 0 = unlimited
  int cpu_shares; // relative weight; 0 = default
};

// One isolated process running dsbox-runtime against a workspace.
class Sandbox {
 public:
  virtual ~Sandbox() = default;

  // Launch bound to the workspace (mounted at kSandboxMountPoint). No-op if
  // already running. Throws LaunchError.
  virtual void Launch(const std::filesystem::path& workspace) = 0;
  // Ask for a graceful exit, wait up to grace, then force removal.
  // Idempotent; never throws; errors are logged.
  virtual void Terminate(std::chrono::seconds grace) = 0;
  // false once the isolated process is gone
  virtual bool IsAlive() = 0;

  virtual SandboxState State() const = 0;
  // logging
  virtual std::string Id() const = 0;
};

// Backstop for sandboxes whose owner was never destroyed: everything still
// registered at process exit is terminated from an atexit handler.
void RegisterLiveSandbox(Sandbox*);
void UnregisterLiveSandbox(Sandbox*);
// for the atexit handler and tests; return the number terminated
size_t TerminateLiveSandboxes();

#endif  // DSBOX_SANDBOX_H_
