#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <random>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include "paths.h"

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(ResultType, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ResultTypeName, ResultType, ENUM_RESULT_TYPE_)
#undef X

#define X(...) X_RETURN_ARG1(ExecutorMode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutorModeName, ExecutorMode, ENUM_EXECUTOR_MODE_)
#undef X

#define X(...) X_RETURN_ARG1(SandboxKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SandboxKindName, SandboxKind, ENUM_SANDBOX_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(ExecuteOutcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecuteOutcomeName, ExecuteOutcome, ENUM_EXECUTE_OUTCOME_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

static const char* kResultTypeTable[] = {
#define X(name, tag) tag,
  ENUM_RESULT_TYPE_
#undef X
};

bool GetResultType(const std::string& str, ResultType& type) {
  for (size_t i = 0; i < sizeof(kResultTypeTable) / sizeof(kResultTypeTable[0]); i++) {
    if (str == kResultTypeTable[i]) {
      type = (ResultType)i;
      return true;
    }
  }
  return false;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveFile(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

bool WriteFileAtomic(const fs::path& path, const std::string& content, fs::perms perms) {
  fs::path tmp = PartialFile(path);
  {
    std::ofstream fout(tmp, std::ios::binary | std::ios::trunc);
    if (!fout) {
      spdlog::warn("Failed opening {} for writing: {}", tmp.c_str(), strerror(errno));
      return false;
    }
    fout.write(content.data(), content.size());
    fout.flush();
    if (!fout) {
      spdlog::warn("Failed writing {}", tmp.c_str());
      fout.close();
      RemoveFile(tmp);
      return false;
    }
  }
  std::error_code ec;
  if (perms != fs::perms::unknown) {
    fs::permissions(tmp, perms, ec);
    if (ec) spdlog::warn("Failed setting permissions of {}: {}", tmp.c_str(), strerror(ec.value()));
  }
  // same directory, so rename is atomic
  fs::rename(tmp, path, ec);
  if (ec) {
    spdlog::warn("Failed renaming {} -> {}: {}", tmp.c_str(), path.c_str(), strerror(ec.value()));
    RemoveFile(tmp);
    return false;
  }
  return true;
}

std::optional<std::string> ReadFile(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return std::nullopt;
  std::ostringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

std::optional<std::string> ConsumeFile(const fs::path& path) {
  auto content = ReadFile(path);
  if (!content) return std::nullopt;
  RemoveFile(path);
  return content;
}

std::string RandomHex(size_t bytes) {
  static const char kHex[] = "0123456789abcdef";
  thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 255);
  std::string ret;
  ret.reserve(bytes * 2);
  for (size_t i = 0; i < bytes; i++) {
    int x = dist(gen);
    ret.push_back(kHex[x >> 4]);
    ret.push_back(kHex[x & 15]);
  }
  return ret;
}
