#ifndef DSBOX_RUNTIME_H_
#define DSBOX_RUNTIME_H_

#include <chrono>
#include <memory>
#include <string>
#include <stdexcept>
#include <filesystem>

#include <dsbox/result.h>

class RuntimeSetupError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A persistent script context: df (the staged dataset), pd, np, plt, mpl.
// Scripts see the bindings left by earlier scripts, except `result`, which
// is cleared before every run.
class Runtime {
  struct Context;
  std::unique_ptr<Context> ctx_;
 public:
  // throws RuntimeSetupError if pandas/numpy/matplotlib or the dataset cannot be loaded
  explicit Runtime(const std::filesystem::path& dataset);
  ~Runtime();
  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  // never throws; failures of the script are reported in the result
  ExecuteResult Execute(const std::string& code);
};

// Serve the single-slot channel of one workspace until a stop marker appears
// or the workspace is removed.
void ServeWorkspace(const std::filesystem::path& workspace, std::chrono::milliseconds interval);

// Serve every request directory under data_dir, each with a fresh context,
// until a stop marker appears in data_dir or it is removed.
void ServeShared(const std::filesystem::path& data_dir, std::chrono::milliseconds interval);

#endif  // DSBOX_RUNTIME_H_
