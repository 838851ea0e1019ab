#include "workspace.h"

#include <cstdlib>
#include <cstring>
#include <sstream>

#include <spdlog/spdlog.h>
#include "csv.h"
#include "paths.h"
#include "utils.h"

Workspace& Workspace::operator=(Workspace&& x) noexcept {
  if (this != &x) {
    Destroy();
    path_ = std::move(x.path_);
    x.path_.clear();
  }
  return *this;
}

std::optional<Workspace> Workspace::Create(const fs::path& root) {
  if (!CreateDirs(root)) return std::nullopt;
  std::string tmpl = root / "ws_XXXXXX";
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("Failed creating workspace under {}: {}", root.c_str(), strerror(errno));
    return std::nullopt;
  }
  fs::path path = tmpl;
  // the sandbox may run under another uid
  std::error_code ec;
  fs::permissions(path, kPerm777, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), strerror(ec.value()));
    RemoveAll(path);
    return std::nullopt;
  }
  spdlog::info("Workspace {} created", path.c_str());
  return Workspace(std::move(path));
}

bool Workspace::Stage(const Table& table) const {
  if (!Valid()) return false;
  std::ostringstream ss;
  WriteCsv(ss, table);
  spdlog::debug("Staging dataset {}x{} into {}", table.NumRows(), table.NumColumns(), path_.c_str());
  return WriteFileAtomic(DatasetFile(path_), ss.str(), kPerm666);
}

bool Workspace::Destroy() {
  if (path_.empty()) return true;
  spdlog::info("Removing workspace {}", path_.c_str());
  bool ret = RemoveAll(path_);
  path_.clear();
  return ret;
}
