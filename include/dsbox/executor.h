#ifndef INCLUDE_DSBOX_EXECUTOR_H_
#define INCLUDE_DSBOX_EXECUTOR_H_

#include <mutex>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <future>
#include <stdexcept>
#include <filesystem>
#include <condition_variable>

#include "result.h"

class DataSource;

#define ENUM_EXECUTOR_MODE_ \
  X(CONTAINER) /* one sandbox per executor */ \
  X(SHARED) /* long-lived worker behind a pre-provisioned data directory */
enum class ExecutorMode {
#define X(name) name,
  ENUM_EXECUTOR_MODE_
#undef X
};

#define ENUM_SANDBOX_KIND_ \
  X(DOCKER) \
  X(JAIL)
enum class SandboxKind {
#define X(name) name,
  ENUM_SANDBOX_KIND_
#undef X
};

#define ENUM_EXECUTE_OUTCOME_ \
  X(PENDING) \
  X(SYNTAX_REJECTED) \
  X(TIMEOUT) \
  X(CANCELLED) \
  X(RUNTIME_FAILURE) \
  X(SUCCESS)
enum class ExecuteOutcome {
#define X(name) name,
  ENUM_EXECUTE_OUTCOME_
#undef X
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class LaunchError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ExecutorConfig {
 public:
  // exactly one of these selects the mode; precedence image > jail_root > data_dir
  std::string image; // docker image containing dsbox-runtime
  std::filesystem::path jail_root; // root filesystem for the cjail sandbox
  std::filesystem::path data_dir; // shared worker directory

  std::string memory_limit; // "<n>[b|k|m|g]"
  int cpu_shares;
  std::chrono::milliseconds timeout;
  std::chrono::milliseconds poll_interval;
  std::chrono::seconds stop_timeout;
  std::chrono::seconds lifetime; // wall clock ceiling of a jail sandbox
  std::string docker_socket;
  std::filesystem::path workspace_root; // empty: kWorkspaceRoot
  std::string pinned_cpus; // jail only; "0-3,6"
  std::string runtime_command; // path of dsbox-runtime inside the sandbox

  ExecutorConfig() :
      memory_limit("512m"),
      cpu_shares(2),
      timeout(30'000),
      poll_interval(500),
      stop_timeout(1),
      lifetime(3600),
      docker_socket("/var/run/docker.sock"),
      runtime_command("/usr/local/bin/dsbox-runtime") {}

  // throws ConfigError if nothing is configured
  ExecutorMode Mode() const;
  // only meaningful in CONTAINER mode
  SandboxKind Kind() const;
  // throws ConfigError if memory_limit is malformed
  long MemoryLimitBytes() const;
};

// Shared between a caller and an in-flight Execute(); copies refer to the same flag
class CancelToken {
  struct State {
    std::mutex mtx;
    std::condition_variable cv;
    bool cancelled = false;
  };
  std::shared_ptr<State> state_;
 public:
  CancelToken() : state_(std::make_shared<State>()) {}

  void Cancel();
  bool IsCancelled() const;
  // Sleep for at most dur; return true if cancelled
  bool WaitFor(std::chrono::milliseconds dur) const;
};

class Executor {
 public:
  virtual ~Executor() = default;

  // Idempotent. Throws LaunchError if the sandbox cannot be provisioned.
  virtual void Start() = 0;
  // Idempotent and never throws.
  virtual void Stop() = 0;
  virtual bool IsRunning() const = 0;

  // Syntax errors, timeouts, cancellation and script failures are all returned
  // as unsuccessful results; only LaunchError (from the lazy start) is raised.
  ExecuteResult Execute(const std::string& code);
  ExecuteResult Execute(const std::string& code, const CancelToken& cancel);

  // Runs Execute on a worker thread. The executor must outlive the future.
  std::future<ExecuteResult> ExecuteAsync(std::string code, CancelToken cancel = CancelToken());

  ExecuteOutcome LastOutcome() const { return last_outcome_.load(); }

 protected:
  // called after the syntax check passed
  virtual ExecuteResult Run(const std::string& code, const CancelToken& cancel,
                            ExecuteOutcome& outcome) = 0;

 private:
  std::atomic<ExecuteOutcome> last_outcome_{ExecuteOutcome::PENDING};
};

#define ENUM_START_POLICY_ \
  X(EAGER) /* Start() on construction */ \
  X(LAZY) /* left to the first Execute(), after the syntax check */
enum class StartPolicy {
#define X(name) name,
  ENUM_START_POLICY_
#undef X
};

// Stop on destruction; Start on construction unless the policy is LAZY
class ScopedExecutor {
  std::unique_ptr<Executor> executor_;
 public:
  explicit ScopedExecutor(std::unique_ptr<Executor>&& executor,
                          StartPolicy policy = StartPolicy::EAGER);
  ~ScopedExecutor();
  ScopedExecutor(const ScopedExecutor&) = delete;
  ScopedExecutor& operator=(const ScopedExecutor&) = delete;

  Executor& operator*() { return *executor_; }
  Executor* operator->() { return executor_.get(); }
};

// throws ConfigError
std::unique_ptr<Executor> CreateExecutor(const ExecutorConfig&, std::shared_ptr<const DataSource>);

#endif  // INCLUDE_DSBOX_EXECUTOR_H_
