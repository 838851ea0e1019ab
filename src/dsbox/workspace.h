#ifndef DSBOX_WORKSPACE_H_
#define DSBOX_WORKSPACE_H_

#include <optional>
#include <filesystem>

#include <dsbox/result.h>

// An exclusively-owned staging directory shared with exactly one sandbox.
// The directory is removed recursively on Destroy() or destruction.
class Workspace {
  std::filesystem::path path_;

  explicit Workspace(std::filesystem::path path) : path_(std::move(path)) {}
 public:
  Workspace() = default;
  ~Workspace() { Destroy(); }
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  Workspace(Workspace&& x) noexcept : path_(std::move(x.path_)) { x.path_.clear(); }
  Workspace& operator=(Workspace&& x) noexcept;

  // nullopt (with a warning logged) if the directory cannot be created
  static std::optional<Workspace> Create(const std::filesystem::path& root);

  bool Valid() const { return !path_.empty(); }
  const std::filesystem::path& Path() const { return path_; }

  // write the dataset snapshot (CSV) into the workspace
  bool Stage(const Table&) const;
  // idempotent; return false if the removal failed
  bool Destroy();
};

#endif  // DSBOX_WORKSPACE_H_
