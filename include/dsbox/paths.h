#ifndef INCLUDE_DSBOX_PATHS_H_
#define INCLUDE_DSBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// parent of every workspace created by this process
extern fs::path kWorkspaceRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// exchange files, relative to a workspace (or a shared request directory)
fs::path DatasetFile(const fs::path& workspace);
fs::path RequestFile(const fs::path& workspace);
fs::path ResponseFile(const fs::path& workspace);
fs::path StopFile(const fs::path& workspace);

// where the workspace appears inside a sandbox
extern const char kSandboxMountPoint[];

#endif  // INCLUDE_DSBOX_PATHS_H_
