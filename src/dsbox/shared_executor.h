#ifndef DSBOX_SHARED_EXECUTOR_H_
#define DSBOX_SHARED_EXECUTOR_H_

#include <mutex>
#include <memory>
#include <optional>

#include <dsbox/executor.h>
#include <dsbox/data_source.h>

// Talks to a long-lived `dsbox-runtime --shared` worker that someone else
// provisioned behind data_dir. Every call gets its own request directory
// holding the script and a copy of the dataset.
class SharedExecutor : public Executor {
  ExecutorConfig config_;
  std::shared_ptr<const DataSource> source_;

  mutable std::mutex mtx_;
  // CSV snapshot taken at start
  std::optional<std::string> dataset_;

  void StartLocked();
 public:
  SharedExecutor(ExecutorConfig config, std::shared_ptr<const DataSource> source) :
      config_(std::move(config)), source_(std::move(source)) {}
  ~SharedExecutor() override { Stop(); }

  void Start() override;
  void Stop() override;
  bool IsRunning() const override;

 protected:
  ExecuteResult Run(const std::string& code, const CancelToken& cancel,
                    ExecuteOutcome& outcome) override;
};

#endif  // DSBOX_SHARED_EXECUTOR_H_
