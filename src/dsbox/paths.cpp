#include "paths.h"

fs::path kWorkspaceRoot = "/tmp/dsbox_workspace";

namespace internal {
fs::path kDataDir = fs::path(DSBOX_DATA_DIR);
} // internal

const char kSandboxMountPoint[] = "/data";

namespace {

const char kDatasetName[] = "data.csv";
const char kRequestName[] = "input.py";
const char kResponseName[] = "output.json";
const char kStopName[] = "stop";
const char kPartialSuffix[] = ".partial";

} // namespace

fs::path DatasetFile(const fs::path& workspace) {
  return workspace / kDatasetName;
}
fs::path RequestFile(const fs::path& workspace) {
  return workspace / kRequestName;
}
fs::path ResponseFile(const fs::path& workspace) {
  return workspace / kResponseName;
}
fs::path StopFile(const fs::path& workspace) {
  return workspace / kStopName;
}

fs::path PartialFile(const fs::path& path) {
  fs::path ret = path;
  ret += kPartialSuffix;
  return ret;
}

fs::path JailHelperPath() {
  return internal::kDataDir / "dsbox-jail";
}

fs::path SharedRequestDir(const fs::path& data_dir, const std::string& request_id) {
  return data_dir / request_id;
}
