#ifndef DSBOX_CONTAINER_EXECUTOR_H_
#define DSBOX_CONTAINER_EXECUTOR_H_

#include <mutex>
#include <memory>
#include <optional>
#include <functional>

#include <dsbox/executor.h>
#include <dsbox/data_source.h>
#include "sandbox.h"
#include "workspace.h"

using SandboxFactory = std::function<std::unique_ptr<Sandbox>()>;

// docker or jail, according to the configuration; throws ConfigError
SandboxFactory MakeSandboxFactory(const ExecutorConfig&);

// Owns one sandbox and its workspace. A sandbox that timed out, was
// cancelled or died is discarded; the next Execute starts a fresh one.
class ContainerExecutor : public Executor {
  ExecutorConfig config_;
  std::shared_ptr<const DataSource> source_;
  SandboxFactory factory_;

  mutable std::mutex mtx_;
  std::optional<Workspace> workspace_;
  std::unique_ptr<Sandbox> sandbox_;

  void StartLocked();
  void StopLocked();
 public:
  ContainerExecutor(ExecutorConfig config, std::shared_ptr<const DataSource> source,
                    SandboxFactory factory) :
      config_(std::move(config)), source_(std::move(source)), factory_(std::move(factory)) {}
  ~ContainerExecutor() override { Stop(); }

  void Start() override;
  void Stop() override;
  bool IsRunning() const override;
  // empty if not running
  std::filesystem::path WorkspacePath() const;

 protected:
  ExecuteResult Run(const std::string& code, const CancelToken& cancel,
                    ExecuteOutcome& outcome) override;
};

#endif  // DSBOX_CONTAINER_EXECUTOR_H_
