#include "container_executor.h"

#include <spdlog/spdlog.h>
#include <dsbox/paths.h>
#include <dsbox/result_codec.h>
#include "docker_sandbox.h"
#include "jail_sandbox.h"
#include "transport.h"

SandboxFactory MakeSandboxFactory(const ExecutorConfig& config) {
  SandboxLimits limits{config.MemoryLimitBytes(), config.cpu_shares};
  switch (config.Kind()) {
    case SandboxKind::DOCKER: {
      return [config, limits]() -> std::unique_ptr<Sandbox> {
        return std::make_unique<DockerSandbox>(
            config.docker_socket, config.image, config.runtime_command, limits);
      };
    }
    case SandboxKind::JAIL: {
      JailSettings settings;
      settings.rootfs = config.jail_root;
      settings.runtime_command = config.runtime_command;
      settings.lifetime = config.lifetime;
      settings.limits = limits;
      if (!ParseCpuList(config.pinned_cpus, settings.cpu_set)) {
        throw ConfigError("invalid pinned_cpus '" + config.pinned_cpus + "'");
      }
      for (auto& name : JailSandbox::UnenforcedLimits(settings)) {
        spdlog::warn("Jail sandboxes cannot apply {}; use pinned_cpus to restrict CPU usage", name);
      }
      return [settings]() -> std::unique_ptr<Sandbox> {
        return std::make_unique<JailSandbox>(settings);
      };
    }
  }
  __builtin_unreachable();
}

void ContainerExecutor::StartLocked() {
  if (sandbox_ && sandbox_->State() == SandboxState::RUNNING) return;
  // leftovers of a sandbox that died on its own
  StopLocked();

  fs::path root = config_.workspace_root.empty() ? kWorkspaceRoot : config_.workspace_root;
  // destroyed on every exception below
  auto workspace = Workspace::Create(root);
  if (!workspace) throw LaunchError("cannot create a workspace under " + root.string());
  Table table;
  try {
    table = source_->GetFull();
  } catch (const DataSourceError& err) {
    throw LaunchError("cannot load dataset from " + source_->Name() + ": " + err.what());
  }
  if (!workspace->Stage(table)) {
    throw LaunchError("cannot stage dataset into " + workspace->Path().string());
  }
  auto sandbox = factory_();
  sandbox->Launch(workspace->Path());
  RegisterLiveSandbox(sandbox.get());
  spdlog::info("Sandbox {} running on {}", sandbox->Id(), workspace->Path().c_str());
  workspace_ = std::move(workspace);
  sandbox_ = std::move(sandbox);
}

void ContainerExecutor::StopLocked() {
  if (sandbox_) {
    UnregisterLiveSandbox(sandbox_.get());
    sandbox_->Terminate(config_.stop_timeout);
    sandbox_.reset();
  }
  if (workspace_) {
    if (!workspace_->Destroy()) spdlog::warn("Workspace {} left behind", workspace_->Path().c_str());
    workspace_.reset();
  }
}

void ContainerExecutor::Start() {
  std::lock_guard lck(mtx_);
  StartLocked();
}

void ContainerExecutor::Stop() {
  std::lock_guard lck(mtx_);
  StopLocked();
}

bool ContainerExecutor::IsRunning() const {
  std::lock_guard lck(mtx_);
  return sandbox_ && sandbox_->State() == SandboxState::RUNNING;
}

fs::path ContainerExecutor::WorkspacePath() const {
  std::lock_guard lck(mtx_);
  return workspace_ ? workspace_->Path() : fs::path();
}

ExecuteResult ContainerExecutor::Run(const std::string& code, const CancelToken& cancel,
                                     ExecuteOutcome& outcome) {
  std::lock_guard lck(mtx_);
  StartLocked();
  Channel channel(workspace_->Path());
  if (!channel.Submit(code)) {
    StopLocked();
    outcome = ExecuteOutcome::RUNTIME_FAILURE;
    return ExecuteResult::Failure("failed to submit request");
  }
  Sandbox* sandbox = sandbox_.get();
  std::string response;
  WaitStatus status = channel.WaitResponse(response, config_.timeout, config_.poll_interval, &cancel,
                                           [sandbox]() { return sandbox->IsAlive(); });
  spdlog::debug("Wait on {} ended: {}", sandbox->Id(), WaitStatusName(status));
  switch (status) {
    case WaitStatus::READY: {
      ExecuteResult ret = ParseResult(response);
      outcome = ret.success ? ExecuteOutcome::SUCCESS : ExecuteOutcome::RUNTIME_FAILURE;
      return ret;
    }
    case WaitStatus::TIMEOUT:
      spdlog::warn("Sandbox {} timed out after {} ms; discarding it", sandbox->Id(), config_.timeout.count());
      StopLocked();
      outcome = ExecuteOutcome::TIMEOUT;
      return ExecuteResult::Failure("execution timed out");
    case WaitStatus::CANCELLED:
      spdlog::info("Execution on {} cancelled; discarding it", sandbox->Id());
      StopLocked();
      outcome = ExecuteOutcome::CANCELLED;
      return ExecuteResult::Failure("execution cancelled");
    case WaitStatus::ABORTED:
      spdlog::warn("Sandbox {} exited during a request", sandbox->Id());
      StopLocked();
      outcome = ExecuteOutcome::RUNTIME_FAILURE;
      return ExecuteResult::Failure("sandbox exited unexpectedly");
  }
  __builtin_unreachable();
}
