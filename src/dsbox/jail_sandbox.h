#ifndef DSBOX_JAIL_SANDBOX_H_
#define DSBOX_JAIL_SANDBOX_H_

#include <string>
#include <vector>
#include <sys/types.h>

#include "sandbox.h"
#include "jail_options.h"

struct JailSettings {
  std::filesystem::path rootfs;
  std::string runtime_command;
  std::vector<int> cpu_set;
  std::chrono::seconds lifetime;
  SandboxLimits limits;
};

// cjail-based sandbox. cjail_exec blocks and must not run in a multithreaded
// process, so it runs in the dsbox-jail helper, which we fork and exec.
class JailSandbox : public Sandbox {
  JailSettings settings_;
  SandboxState state_;
  std::filesystem::path workspace_;
  pid_t pid_;
  int result_fd_;

  // collect the helper if it has exited; return true if it is gone
  bool Reap(bool block);
 public:
  explicit JailSandbox(JailSettings settings) :
      settings_(std::move(settings)), state_(SandboxState::NOT_STARTED), pid_(-1), result_fd_(-1) {}
  ~JailSandbox() override { Terminate(std::chrono::seconds(0)); }

  JailOptions Options(const std::filesystem::path& workspace) const;
  // configured limits that cjail has no knob for; the CPU weight is one,
  // pinned CPUs being the jail's only CPU control
  static std::vector<std::string> UnenforcedLimits(const JailSettings&);

  void Launch(const std::filesystem::path& workspace) override;
  void Terminate(std::chrono::seconds grace) override;
  bool IsAlive() override;
  SandboxState State() const override { return state_; }
  std::string Id() const override;
};

#endif  // DSBOX_JAIL_SANDBOX_H_
