#include <unistd.h>
#include <gtest/gtest.h>

#include <dsbox/paths.h>
#include <dsbox/executor.h>
#include "jail_options.h"
#include "jail_sandbox.h"

namespace {

JailOptions Example() {
  JailOptions opt;
  opt.rootfs = "/srv/dsbox/rootfs";
  opt.command = {"/usr/local/bin/dsbox-runtime", "/data"};
  opt.envs = {"PATH=/usr/bin:/bin", "HOME=/data"};
  opt.workdir = "/data";
  opt.cpu_set = {1, 3};
  opt.wall_time = 3600L * 1'000'000;
  opt.rss = 512 * 1024;
  opt.proc_num = 64;
  opt.file_num = 256;
  opt.fsize = 1024;
  opt.binds = {{"/tmp/dsbox_workspace/ws_x", "/data"}};
  return opt;
}

void ExpectSame(const JailOptions& a, const JailOptions& b) {
  EXPECT_EQ(a.rootfs, b.rootfs);
  EXPECT_EQ(a.command, b.command);
  EXPECT_EQ(a.envs, b.envs);
  EXPECT_EQ(a.workdir, b.workdir);
  EXPECT_EQ(a.cpu_set, b.cpu_set);
  EXPECT_EQ(a.uid, b.uid);
  EXPECT_EQ(a.gid, b.gid);
  EXPECT_EQ(a.wall_time, b.wall_time);
  EXPECT_EQ(a.rss, b.rss);
  EXPECT_EQ(a.proc_num, b.proc_num);
  EXPECT_EQ(a.file_num, b.file_num);
  EXPECT_EQ(a.fsize, b.fsize);
  EXPECT_EQ(a.binds, b.binds);
}

TEST(JailOptionsTest, SerializeForHelper) {
  JailOptions opt = Example();
  JailOptions back;
  ASSERT_TRUE(back.Deserialize(opt.Serialize()));
  ExpectSame(opt, back);
}

TEST(JailOptionsTest, TruncatedInputIsRejected) {
  auto buf = Example().Serialize();
  JailOptions back;
  for (size_t len : {size_t(0), size_t(3), buf.size() / 2, buf.size() - 1}) {
    std::vector<uint8_t> part(buf.begin(), buf.begin() + len);
    EXPECT_FALSE(back.Deserialize(part)) << "length " << len;
  }
  buf.push_back(0);
  EXPECT_FALSE(back.Deserialize(buf));
}

TEST(JailOptionsTest, CpuList) {
  std::vector<int> cpus;
  EXPECT_TRUE(ParseCpuList("0-2,5", cpus));
  EXPECT_EQ(cpus, (std::vector<int>{0, 1, 2, 5}));
  EXPECT_TRUE(ParseCpuList("", cpus));
  EXPECT_TRUE(cpus.empty());
  EXPECT_TRUE(ParseCpuList("none", cpus));
  EXPECT_TRUE(cpus.empty());
  EXPECT_TRUE(ParseCpuList("all", cpus));
  EXPECT_EQ((long)cpus.size(), sysconf(_SC_NPROCESSORS_CONF));
  EXPECT_FALSE(ParseCpuList("2-1", cpus));
  EXPECT_FALSE(ParseCpuList("1,", cpus));
  EXPECT_FALSE(ParseCpuList("a", cpus));
  EXPECT_FALSE(ParseCpuList("1;2", cpus));
}

TEST(JailSandboxTest, OptionsIsolateTheRuntime) {
  JailSettings settings;
  settings.rootfs = "/srv/dsbox/rootfs";
  settings.runtime_command = "/usr/local/bin/dsbox-runtime";
  settings.cpu_set = {2};
  settings.lifetime = std::chrono::seconds(60);
  settings.limits = SandboxLimits{256L << 20, 2};
  JailSandbox sandbox(settings);
  JailOptions opt = sandbox.Options("/tmp/dsbox_workspace/ws_x");
  EXPECT_EQ(opt.rootfs, "/srv/dsbox/rootfs");
  EXPECT_EQ(opt.command, (std::vector<std::string>{"/usr/local/bin/dsbox-runtime", "/data"}));
  EXPECT_EQ(opt.workdir, "/data");
  EXPECT_EQ(opt.binds, (std::vector<std::pair<std::string, std::string>>{
      {"/tmp/dsbox_workspace/ws_x", "/data"}}));
  EXPECT_EQ(opt.rss, 256 * 1024);
  EXPECT_EQ(opt.wall_time, 60L * 1'000'000);
  EXPECT_EQ(opt.cpu_set, std::vector<int>{2});
  // never root inside the jail
  EXPECT_NE(opt.uid, 0);
  EXPECT_NE(opt.gid, 0);
}

TEST(JailSandboxTest, NetworkNamespaceIsNotShared) {
  CJailCtxClass ctx;
  Example().ToCJailCtx(ctx);
  EXPECT_EQ(ctx.GetCtx().sharenet, 0);
  EXPECT_STREQ(ctx.GetCtx().chroot, "/srv/dsbox/rootfs");
  EXPECT_EQ(ctx.GetCtx().cg_rss, 512 * 1024);
}

JailSettings MinimalSettings(const std::string& rootfs) {
  JailSettings settings;
  settings.rootfs = rootfs;
  settings.runtime_command = "/usr/local/bin/dsbox-runtime";
  settings.lifetime = std::chrono::seconds(10);
  settings.limits = SandboxLimits{0, 0};
  return settings;
}

TEST(JailSandboxTest, CpuWeightIsReportedAsUnenforced) {
  JailSettings settings = MinimalSettings("/srv/dsbox/rootfs");
  EXPECT_TRUE(JailSandbox::UnenforcedLimits(settings).empty());
  settings.limits.cpu_shares = 2;
  EXPECT_EQ(JailSandbox::UnenforcedLimits(settings), std::vector<std::string>{"cpu_shares"});
  // memory is enforced through the cgroup
  settings.limits.memory_bytes = 64L << 20;
  EXPECT_EQ(JailSandbox::UnenforcedLimits(settings).size(), 1u);
  EXPECT_EQ(JailSandbox(settings).Options("/tmp").rss, 64 * 1024);
}

TEST(JailSandboxTest, MissingRootfsFailsLaunch) {
  JailSandbox sandbox(MinimalSettings("/nonexistent/rootfs"));
  EXPECT_THROW(sandbox.Launch("/tmp"), LaunchError);
  EXPECT_FALSE(sandbox.IsAlive());
  sandbox.Terminate(std::chrono::seconds(0));
  EXPECT_EQ(sandbox.State(), SandboxState::STOPPED);
}

TEST(JailSandboxTest, MissingHelperFailsLaunch) {
  fs::path data_dir = internal::kDataDir;
  internal::kDataDir = "/nonexistent/libexec";
  JailSandbox sandbox(MinimalSettings("/"));
  EXPECT_THROW(sandbox.Launch("/tmp"), LaunchError);
  internal::kDataDir = data_dir;
  EXPECT_FALSE(sandbox.IsAlive());
  EXPECT_EQ(sandbox.State(), SandboxState::STOPPED);
}

} // namespace
