#include "jail_sandbox.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>
#include <mutex>
#include <thread>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <dsbox/executor.h>
#include "paths.h"
#include "utils.h"

namespace {

constexpr std::chrono::milliseconds kReapInterval(50);

} // namespace

JailOptions JailSandbox::Options(const fs::path& workspace) const {
  JailOptions opt;
  opt.rootfs = settings_.rootfs;
  opt.command = {settings_.runtime_command, kSandboxMountPoint};
  opt.envs = {
    "PATH=/usr/local/bin:/usr/bin:/bin",
    std::string("HOME=") + kSandboxMountPoint,
    "MPLBACKEND=Agg",
    "MPLCONFIGDIR=/tmp",
    "PYTHONDONTWRITEBYTECODE=1",
  };
  opt.workdir = kSandboxMountPoint;
  opt.cpu_set = settings_.cpu_set;
  opt.wall_time = (long)settings_.lifetime.count() * 1'000'000;
  opt.rss = settings_.limits.memory_bytes / 1024;
  // numpy and matplotlib spawn a handful of threads
  opt.proc_num = 64;
  opt.file_num = 256;
  opt.fsize = 1024 * 1024; // the PNG of a large figure fits easily
  opt.binds.emplace_back(workspace.string(), kSandboxMountPoint);
  return opt;
}

std::vector<std::string> JailSandbox::UnenforcedLimits(const JailSettings& settings) {
  std::vector<std::string> ret;
  if (settings.limits.cpu_shares > 0) ret.push_back("cpu_shares");
  return ret;
}

void JailSandbox::Launch(const fs::path& workspace) {
  if (state_ == SandboxState::RUNNING) return;
  std::error_code ec;
  if (!fs::is_directory(settings_.rootfs, ec)) {
    state_ = SandboxState::STOPPED;
    throw LaunchError("jail root filesystem " + settings_.rootfs.string() + " is not a directory");
  }
  static std::once_flag sigpipe_flag;
  // a helper that died early must not kill us while we write its options
  std::call_once(sigpipe_flag, []() { signal(SIGPIPE, SIG_IGN); });

  fs::path helper = JailHelperPath();
  JailOptions opt = Options(workspace);
  auto vec = opt.Serialize();
  long size = vec.size();

  // execpipe reports a failed execl; it is closed on a successful one
  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1}, execpipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int fd : {inpipe[0], inpipe[1], outpipe[0], outpipe[1], execpipe[0], execpipe[1]}) {
      if (fd >= 0) close(fd);
    }
  };
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0 || pipe2(execpipe, O_CLOEXEC) < 0) {
    int err = errno;
    close_all();
    throw LaunchError(std::string("pipe failed: ") + strerror(err));
  }
  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close_all();
    throw LaunchError(std::string("fork failed: ") + strerror(err));
  }
  if (pid == 0) {
    // own process group, so that the whole jail can be killed at once
    setpgid(0, 0);
    // dup2 clears FD_CLOEXEC on the new descriptors
    dup2(inpipe[1], 1);
    dup2(outpipe[0], 0);
    int errfd = execpipe[1];
    if (errfd != 3) errfd = dup3(execpipe[1], 3, O_CLOEXEC);
    // nothing else of ours leaks into the jail
    CloseFrom(4);
    execl(helper.c_str(), helper.c_str(), nullptr);
    int err = errno;
    IGNORE_RETURN(write(errfd, &err, sizeof(err)));
    _exit(127);
  }
  setpgid(pid, pid);
  close(inpipe[1]);
  close(outpipe[0]);
  close(execpipe[1]);
  int exec_err = 0;
  ssize_t n;
  do {
    n = read(execpipe[0], &exec_err, sizeof(exec_err));
  } while (n < 0 && errno == EINTR);
  close(execpipe[0]);
  pid_ = pid;
  result_fd_ = inpipe[0];
  if (n > 0) {
    close(outpipe[1]);
    Reap(true);
    state_ = SandboxState::STOPPED;
    throw LaunchError("cannot execute " + helper.string() + ": " + strerror(exec_err));
  }
  spdlog::debug("dsbox-jail pid={} rootfs={} command={}", pid, opt.rootfs, fmt::format("{}", opt.command));
  bool ok = write(outpipe[1], &size, sizeof(size)) == (ssize_t)sizeof(size) &&
            write(outpipe[1], vec.data(), vec.size()) == (ssize_t)vec.size();
  int err = errno;
  close(outpipe[1]);
  if (!ok) {
    Terminate(std::chrono::seconds(0));
    throw LaunchError("failed sending options to " + helper.string() + ": " + strerror(err));
  }
  workspace_ = workspace;
  state_ = SandboxState::RUNNING;
  spdlog::info("Started jail {} (rootfs={} rss={}KiB cpus={})",
               pid_, opt.rootfs, opt.rss, fmt::format("{}", opt.cpu_set));
}

bool JailSandbox::Reap(bool block) {
  if (pid_ < 0) return true;
  int status = 0;
  pid_t ret;
  do {
    ret = waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (ret < 0 && errno == EINTR);
  if (ret == 0) return false;
  if (ret < 0) {
    spdlog::warn("waitpid {} failed: {}", pid_, strerror(errno));
  } else if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    struct cjail_result res = {};
    if (read(result_fd_, &res, sizeof(res)) == (ssize_t)sizeof(res)) {
      if (res.timekill == -1) {
        spdlog::warn("cjail_exec error: errno={} {}", res.oomkill, strerror(res.oomkill));
      } else {
        spdlog::info("Jail {} finished: timekill={} oomkill={}", pid_, res.timekill, res.oomkill);
      }
    }
  } else {
    spdlog::warn("dsbox-jail {} exited abnormally: status={}", pid_, status);
  }
  close(result_fd_);
  result_fd_ = -1;
  pid_ = -1;
  return true;
}

void JailSandbox::Terminate(std::chrono::seconds grace) {
  if (pid_ < 0) {
    if (state_ == SandboxState::RUNNING) state_ = SandboxState::STOPPED;
    return;
  }
  spdlog::info("Stopping jail {}", pid_);
  if (!workspace_.empty() && fs::is_directory(workspace_)) {
    if (!WriteFileAtomic(StopFile(workspace_), "")) {
      spdlog::warn("Failed asking jail {} to stop", pid_);
    }
  }
  auto deadline = std::chrono::steady_clock::now() + grace;
  while (!Reap(false) && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kReapInterval);
  }
  if (pid_ >= 0) {
    if (kill(-pid_, SIGKILL) < 0 && errno != ESRCH) {
      spdlog::warn("Failed killing jail {}: {}", pid_, strerror(errno));
    }
    Reap(true);
  }
  workspace_.clear();
  state_ = SandboxState::STOPPED;
}

bool JailSandbox::IsAlive() {
  if (state_ != SandboxState::RUNNING) return false;
  if (Reap(false)) {
    state_ = SandboxState::STOPPED;
    return false;
  }
  return true;
}

std::string JailSandbox::Id() const {
  return pid_ < 0 ? "jail:" + settings_.rootfs.string() : "jail:" + std::to_string(pid_);
}
