#include <dsbox/config.h>

#include <cerrno>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>

bool ParseConfig(const std::filesystem::path& conf_path, ExecutorConfig& config) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  auto&& section = ini[""];
  config.image = section["image"] | config.image;
  std::string jail_root = section["jail_root"] | "";
  std::string data_dir = section["data_dir"] | "";
  std::string workspace_root = section["workspace_root"] | "";
  if (jail_root.size()) config.jail_root = jail_root;
  if (data_dir.size()) config.data_dir = data_dir;
  if (workspace_root.size()) config.workspace_root = workspace_root;
  config.memory_limit = section["memory_limit"] | config.memory_limit;
  config.cpu_shares = section["cpu_shares"] | config.cpu_shares;
  config.timeout = std::chrono::milliseconds(long(
      (section["timeout_seconds"] | (config.timeout.count() / 1000.)) * 1000));
  config.poll_interval = std::chrono::milliseconds(
      section["poll_interval_ms"] | (long)config.poll_interval.count());
  config.stop_timeout = std::chrono::seconds(
      section["stop_timeout_seconds"] | (long)config.stop_timeout.count());
  config.lifetime = std::chrono::seconds(
      section["lifetime_seconds"] | (long)config.lifetime.count());
  config.docker_socket = section["docker_socket"] | config.docker_socket;
  config.pinned_cpus = section["pinned_cpus"] | config.pinned_cpus;
  config.runtime_command = section["runtime_command"] | config.runtime_command;
  return true;
}

void ApplyEnvironment(ExecutorConfig& config) {
  if (const char* image = getenv("DSBOX_RUNNER_IMAGE"); image && *image) {
    spdlog::debug("Runner image from environment: {}", image);
    config.image = image;
  }
  if (const char* data_dir = getenv("DSBOX_EXECUTOR_DATA_DIR"); data_dir && *data_dir) {
    spdlog::debug("Executor data directory from environment: {}", data_dir);
    config.data_dir = data_dir;
  }
}

bool ParseMemoryLimit(const std::string& str, long& bytes) {
  if (str.empty() || !isdigit((unsigned char)str[0])) return false;
  char* end;
  errno = 0;
  long long val = strtoll(str.c_str(), &end, 10);
  if (errno == ERANGE) return false;
  long long mul = 1;
  if (*end) {
    switch (tolower((unsigned char)*end)) {
      case 'b': mul = 1; break;
      case 'k': mul = 1LL << 10; break;
      case 'm': mul = 1LL << 20; break;
      case 'g': mul = 1LL << 30; break;
      default: return false;
    }
    if (end[1]) return false;
  }
  if (val > __LONG_MAX__ / mul) return false;
  bytes = val * mul;
  return true;
}
