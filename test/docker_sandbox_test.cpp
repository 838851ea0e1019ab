#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <dsbox/executor.h>
#include "docker_sandbox.h"

namespace {

DockerSandbox MakeSandbox(const std::string& socket = "/nonexistent/docker.sock") {
  return DockerSandbox(socket, "dsbox-runner:latest", "/usr/local/bin/dsbox-runtime",
                       SandboxLimits{512L << 20, 2});
}

TEST(DockerSandboxTest, ContainerHasNoNetwork) {
  DockerSandbox sandbox = MakeSandbox();
  nlohmann::json spec = sandbox.ContainerSpec("/tmp/dsbox_workspace/ws_abc123");
  EXPECT_EQ(spec["HostConfig"]["NetworkMode"], "none");
  EXPECT_EQ(spec["NetworkDisabled"], true);
}

TEST(DockerSandboxTest, ContainerSpec) {
  DockerSandbox sandbox = MakeSandbox();
  nlohmann::json spec = sandbox.ContainerSpec("/tmp/dsbox_workspace/ws_abc123");
  EXPECT_EQ(spec["Image"], "dsbox-runner:latest");
  EXPECT_EQ(spec["WorkingDir"], "/data");
  EXPECT_EQ(spec["Cmd"], nlohmann::json::array({"/usr/local/bin/dsbox-runtime", "/data"}));
  auto& host = spec["HostConfig"];
  EXPECT_EQ(host["Memory"], 512L << 20);
  EXPECT_EQ(host["MemorySwap"], 512L << 20);
  EXPECT_EQ(host["CpuShares"], 2);
  EXPECT_EQ(host["AutoRemove"], true);
  EXPECT_EQ(host["Binds"], nlohmann::json::array({"/tmp/dsbox_workspace/ws_abc123:/data:rw"}));
}

TEST(DockerSandboxTest, UnlimitedOmitsLimits) {
  DockerSandbox sandbox("/nonexistent/docker.sock", "img", "dsbox-runtime", SandboxLimits{0, 0});
  nlohmann::json spec = sandbox.ContainerSpec("/ws");
  EXPECT_FALSE(spec["HostConfig"].contains("Memory"));
  EXPECT_FALSE(spec["HostConfig"].contains("CpuShares"));
  EXPECT_EQ(spec["HostConfig"]["NetworkMode"], "none");
}

TEST(DockerSandboxTest, UnreachableDaemonFailsLaunch) {
  DockerSandbox sandbox = MakeSandbox();
  EXPECT_EQ(sandbox.State(), SandboxState::NOT_STARTED);
  EXPECT_THROW(sandbox.Launch("/tmp"), LaunchError);
  EXPECT_EQ(sandbox.State(), SandboxState::STOPPED);
  EXPECT_FALSE(sandbox.IsAlive());
  // nothing to tear down
  sandbox.Terminate(std::chrono::seconds(0));
  sandbox.Terminate(std::chrono::seconds(0));
  EXPECT_EQ(sandbox.State(), SandboxState::STOPPED);
}

} // namespace
