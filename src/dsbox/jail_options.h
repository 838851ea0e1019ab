#ifndef DSBOX_JAIL_OPTIONS_H_
#define DSBOX_JAIL_OPTIONS_H_

#include <string>
#include <vector>
#include <utility>

#include <cjail/cjail.h>

class JailOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  cpu_set_t cpu_set_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class JailOptions;
};

// Everything dsbox-jail needs to start the runtime; passed through a pipe
class JailOptions {
  using Int = long; // serialize
 public:
  std::string rootfs;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  std::string workdir; // inside rootfs
  std::vector<int> cpu_set;
  int uid, gid;
  long wall_time; // us; lifetime ceiling of the whole sandbox
  long rss; // KiB
  int proc_num;
  int file_num;
  long fsize; // KiB
  // bind mounts: host path -> path inside rootfs
  std::vector<std::pair<std::string, std::string>> binds;

  JailOptions() :
      uid(65534), gid(65534),
      wall_time(0),
      rss(0),
      proc_num(0),
      file_num(0),
      fsize(0) {}
  // false if the buffer is truncated
  bool Deserialize(const std::vector<uint8_t>& serial);

  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // the result refers to the strings of this object; do not modify it while the context is in use
  // the network namespace is never shared
  void ToCJailCtx(CJailCtxClass&) const;
};

// "all", "none", or a list like "0-3,6"; return false if malformed
bool ParseCpuList(const std::string&, std::vector<int>&);

#endif  // DSBOX_JAIL_OPTIONS_H_
