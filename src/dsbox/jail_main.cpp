// dsbox-jail: run one cjail sandbox and report how it ended.
// stdin: <long size><serialized JailOptions>; stdout: struct cjail_result
#include <errno.h>
#include <unistd.h>

#include <vector>

#include "jail_options.h"

namespace {

bool ReadAll(int fd, void* buf, size_t len) {
  auto ptr = static_cast<uint8_t*>(buf);
  while (len) {
    ssize_t n = read(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n;
    len -= n;
  }
  return true;
}

struct cjail_result JailExec(const JailOptions& opt) {
  CJailCtxClass ctx;
  opt.ToCJailCtx(ctx);
  struct cjail_result ret = {};
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz < 0) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  JailOptions opt;
  if (!opt.Deserialize(buf)) return 1;
  struct cjail_result res = JailExec(opt);
  if (write(1, &res, sizeof(res)) < 0) return 1;
}
