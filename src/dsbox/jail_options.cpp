#include "jail_options.h"

#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <cstdlib>

bool JailOptions::Deserialize(const std::vector<uint8_t>& vec) {
  size_t cur = 0;
  bool ok = true;
  auto ReadInt = [&]() -> Int {
    if (cur + sizeof(Int) > vec.size()) {
      ok = false;
      return 0;
    }
    Int r;
    memcpy(&r, vec.data() + cur, sizeof(Int));
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    if (!ok || size < 0 || cur + size > vec.size()) {
      ok = false;
      return std::string();
    }
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  auto ReadCount = [&]() -> size_t {
    Int n = ReadInt();
    // every element takes at least one Int
    if (!ok || n < 0 || (size_t)n > (vec.size() - cur) / sizeof(Int)) {
      ok = false;
      return 0;
    }
    return n;
  };
  rootfs = ReadString();
  command.resize(ReadCount());
  for (auto& i : command) i = ReadString();
  envs.resize(ReadCount());
  for (auto& i : envs) i = ReadString();
  workdir = ReadString();
  cpu_set.resize(ReadCount());
  for (auto& i : cpu_set) i = ReadInt();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  rss = ReadInt();
  proc_num = ReadInt();
  file_num = ReadInt();
  fsize = ReadInt();
  binds.resize(ReadCount());
  for (auto& i : binds) {
    i.first = ReadString();
    i.second = ReadString();
  }
  return ok && cur == vec.size();
}

std::vector<uint8_t> JailOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto PushInt = [&](Int r) {
    size_t cur = ret.size();
    ret.resize(cur + sizeof(Int));
    memcpy(ret.data() + cur, &r, sizeof(Int));
  };
  auto PushString = [&](const std::string& str){
    PushInt(str.size());
    ret.insert(ret.end(), str.begin(), str.end());
  };
  PushString(rootfs);
  PushInt(command.size());
  for (auto& i : command) PushString(i);
  PushInt(envs.size());
  for (auto& i : envs) PushString(i);
  PushString(workdir);
  PushInt(cpu_set.size());
  for (auto& i : cpu_set) PushInt(i);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(rss);
  PushInt(proc_num);
  PushInt(file_num);
  PushInt(fsize);
  PushInt(binds.size());
  for (auto& i : binds) {
    PushString(i.first);
    PushString(i.second);
  }
  return ret;
}

void JailOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  ctx.sharenet = 0;
  // stdin and stdout of dsbox-jail carry the options and the result;
  // the runtime talks through files only
  ctx.fd_input = open("/dev/null", O_RDONLY | O_CLOEXEC);
  ctx.fd_output = open("/dev/null", O_WRONLY | O_CLOEXEC);
  ret.argv_buf_.clear();
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  ret.env_buf_.clear();
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = const_cast<char*>(rootfs.data());
  ctx.working_dir = const_cast<char*>(workdir.data());
  if (cpu_set.empty()) {
    ctx.cpuset = nullptr;
  } else {
    CPU_ZERO(&ret.cpu_set_);
    for (auto& i : cpu_set) CPU_SET(i, &ret.cpu_set_);
    ctx.cpuset = &ret.cpu_set_;
  }
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  // mnt_buf_ must not reallocate after its elements are added to the list
  ret.mnt_buf_.reserve(binds.size());
  for (auto& i : binds) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    mnt_ctx.type = const_cast<char*>("bind");
    mnt_ctx.source = const_cast<char*>(i.first.data());
    mnt_ctx.target = const_cast<char*>(i.second.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = 0;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}

bool ParseCpuList(const std::string& str, std::vector<int>& cpus) {
  cpus.clear();
  if (str.empty() || str == "none") return true;
  long ncpu = sysconf(_SC_NPROCESSORS_CONF);
  if (str == "all") {
    for (int i = 0; i < ncpu; i++) cpus.push_back(i);
    return true;
  }
  const char* p = str.c_str();
  while (*p) {
    char* end;
    long a = strtol(p, &end, 10);
    if (end == p || a < 0) return false;
    long b = a;
    p = end;
    if (*p == '-') {
      p++;
      b = strtol(p, &end, 10);
      if (end == p || b < a) return false;
      p = end;
    }
    if (b >= CPU_SETSIZE) return false;
    for (long i = a; i <= b; i++) cpus.push_back(i);
    if (*p == ',') {
      p++;
      if (!*p) return false;
    } else if (*p) {
      return false;
    }
  }
  return true;
}
