#include "sandbox.h"

#include <mutex>
#include <cstdlib>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace {

std::mutex live_mtx;
std::unordered_set<Sandbox*> live_sandboxes;
bool atexit_registered = false;

void AtExit() {
  if (size_t n = TerminateLiveSandboxes()) {
    spdlog::warn("Terminated {} leaked sandbox(es) at exit", n);
  }
}

} // namespace

const char* SandboxStateName(SandboxState state) {
  switch (state) {
#define X(name) case SandboxState::name: return #name;
    ENUM_SANDBOX_STATE_
#undef X
  }
  __builtin_unreachable();
}

void RegisterLiveSandbox(Sandbox* sandbox) {
  std::lock_guard lck(live_mtx);
  if (!atexit_registered) {
    std::atexit(AtExit);
    atexit_registered = true;
  }
  live_sandboxes.insert(sandbox);
}

void UnregisterLiveSandbox(Sandbox* sandbox) {
  std::lock_guard lck(live_mtx);
  live_sandboxes.erase(sandbox);
}

size_t TerminateLiveSandboxes() {
  std::unordered_set<Sandbox*> to_stop;
  {
    std::lock_guard lck(live_mtx);
    to_stop.swap(live_sandboxes);
  }
  for (Sandbox* i : to_stop) {
    spdlog::info("Terminating sandbox {} left running", i->Id());
    i->Terminate(std::chrono::seconds(0));
  }
  return to_stop.size();
}
