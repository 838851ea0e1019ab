#include "shared_executor.h"

#include <sstream>

#include <spdlog/spdlog.h>
#include <dsbox/paths.h>
#include <dsbox/result_codec.h>
#include "csv.h"
#include "paths.h"
#include "transport.h"
#include "utils.h"

namespace {

// removes the request directory when the call ends
class RequestDir {
  fs::path path_;
 public:
  explicit RequestDir(fs::path path) : path_(std::move(path)) {}
  ~RequestDir() { RemoveAll(path_); }
  RequestDir(const RequestDir&) = delete;
  RequestDir& operator=(const RequestDir&) = delete;
  const fs::path& Path() const { return path_; }
};

} // namespace

void SharedExecutor::StartLocked() {
  if (dataset_) return;
  std::error_code ec;
  if (!fs::is_directory(config_.data_dir, ec)) {
    throw LaunchError("executor data directory " + config_.data_dir.string() + " does not exist");
  }
  Table table;
  try {
    table = source_->GetFull();
  } catch (const DataSourceError& err) {
    throw LaunchError("cannot load dataset from " + source_->Name() + ": " + err.what());
  }
  std::ostringstream ss;
  WriteCsv(ss, table);
  dataset_ = ss.str();
  spdlog::info("Shared executor ready on {}", config_.data_dir.c_str());
}

void SharedExecutor::Start() {
  std::lock_guard lck(mtx_);
  StartLocked();
}

void SharedExecutor::Stop() {
  std::lock_guard lck(mtx_);
  // the worker is not ours to stop
  dataset_.reset();
}

bool SharedExecutor::IsRunning() const {
  std::lock_guard lck(mtx_);
  return dataset_.has_value();
}

ExecuteResult SharedExecutor::Run(const std::string& code, const CancelToken& cancel,
                                  ExecuteOutcome& outcome) {
  std::lock_guard lck(mtx_);
  StartLocked();
  RequestDir dir(SharedRequestDir(config_.data_dir, RandomHex(16)));
  if (!CreateDirs(dir.Path(), kPerm777) ||
      !WriteFileAtomic(DatasetFile(dir.Path()), *dataset_, kPerm666)) {
    throw LaunchError("cannot create request directory " + dir.Path().string());
  }
  Channel channel(dir.Path());
  if (!channel.Submit(code)) {
    outcome = ExecuteOutcome::RUNTIME_FAILURE;
    return ExecuteResult::Failure("failed to submit request");
  }
  std::string response;
  WaitStatus status = channel.WaitResponse(response, config_.timeout, config_.poll_interval, &cancel);
  spdlog::debug("Wait on {} ended: {}", dir.Path().c_str(), WaitStatusName(status));
  switch (status) {
    case WaitStatus::READY: {
      ExecuteResult ret = ParseResult(response);
      outcome = ret.success ? ExecuteOutcome::SUCCESS : ExecuteOutcome::RUNTIME_FAILURE;
      return ret;
    }
    case WaitStatus::TIMEOUT:
      spdlog::warn("Shared request {} timed out", dir.Path().filename().c_str());
      outcome = ExecuteOutcome::TIMEOUT;
      return ExecuteResult::Failure("execution timed out");
    case WaitStatus::CANCELLED:
      outcome = ExecuteOutcome::CANCELLED;
      return ExecuteResult::Failure("execution cancelled");
    case WaitStatus::ABORTED:
      break;
  }
  // no liveness probe here
  outcome = ExecuteOutcome::RUNTIME_FAILURE;
  return ExecuteResult::Failure("sandbox exited unexpectedly");
}
