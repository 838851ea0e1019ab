#include <dsbox/executor.h>

#include <spdlog/spdlog.h>
#include <dsbox/config.h>
#include <dsbox/data_source.h>
#include "container_executor.h"
#include "shared_executor.h"
#include "python.h"
#include "utils.h"

ExecutorMode ExecutorConfig::Mode() const {
  if (image.size() || !jail_root.empty()) return ExecutorMode::CONTAINER;
  if (!data_dir.empty()) return ExecutorMode::SHARED;
  throw ConfigError("none of runner image, jail root or executor data directory is configured");
}

SandboxKind ExecutorConfig::Kind() const {
  return image.size() ? SandboxKind::DOCKER : SandboxKind::JAIL;
}

long ExecutorConfig::MemoryLimitBytes() const {
  long bytes = 0;
  if (!ParseMemoryLimit(memory_limit, bytes)) {
    throw ConfigError("invalid memory limit '" + memory_limit + "'");
  }
  return bytes;
}

void CancelToken::Cancel() {
  {
    std::lock_guard lck(state_->mtx);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancelToken::IsCancelled() const {
  std::lock_guard lck(state_->mtx);
  return state_->cancelled;
}

bool CancelToken::WaitFor(std::chrono::milliseconds dur) const {
  std::unique_lock lck(state_->mtx);
  return state_->cv.wait_for(lck, dur, [this]() { return state_->cancelled; });
}

ExecuteResult Executor::Execute(const std::string& code) {
  return Execute(code, CancelToken());
}

ExecuteResult Executor::Execute(const std::string& code, const CancelToken& cancel) {
  spdlog::info("Execute request of {} bytes", code.size());
  last_outcome_ = ExecuteOutcome::PENDING;
  ExecuteOutcome outcome = ExecuteOutcome::PENDING;
  ExecuteResult ret;
  if (auto err = CheckSyntax(code)) {
    outcome = ExecuteOutcome::SYNTAX_REJECTED;
    ret = ExecuteResult::Failure(std::move(*err));
  } else {
    ret = Run(code, cancel, outcome);
  }
  last_outcome_ = outcome;
  spdlog::info("Execute finished: outcome={}", ExecuteOutcomeName(outcome));
  return ret;
}

std::future<ExecuteResult> Executor::ExecuteAsync(std::string code, CancelToken cancel) {
  return std::async(std::launch::async, [this, code = std::move(code), cancel]() {
    return Execute(code, cancel);
  });
}

ScopedExecutor::ScopedExecutor(std::unique_ptr<Executor>&& executor, StartPolicy policy) :
    executor_(std::move(executor)) {
  if (policy == StartPolicy::EAGER) executor_->Start();
}

ScopedExecutor::~ScopedExecutor() {
  executor_->Stop();
}

std::unique_ptr<Executor> CreateExecutor(const ExecutorConfig& config,
                                         std::shared_ptr<const DataSource> source) {
  if (!source) throw ConfigError("no data source given");
  int configured = (config.image.size() > 0) + !config.jail_root.empty() + !config.data_dir.empty();
  ExecutorMode mode = config.Mode();
  if (configured > 1) {
    spdlog::warn("More than one of image, jail_root and data_dir is set; using {} mode{}",
                 ExecutorModeName(mode),
                 mode == ExecutorMode::CONTAINER ? std::string(" with ") + SandboxKindName(config.Kind()) : "");
  }
  // validate early
  config.MemoryLimitBytes();
  switch (mode) {
    case ExecutorMode::CONTAINER:
      return std::make_unique<ContainerExecutor>(config, std::move(source), MakeSandboxFactory(config));
    case ExecutorMode::SHARED:
      return std::make_unique<SharedExecutor>(config, std::move(source));
  }
  __builtin_unreachable();
}
