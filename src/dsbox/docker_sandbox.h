#ifndef DSBOX_DOCKER_SANDBOX_H_
#define DSBOX_DOCKER_SANDBOX_H_

#include <string>
#include <optional>

#include <nlohmann/json_fwd.hpp>
#include "sandbox.h"

// Docker Engine API over the daemon's unix socket
class DockerClient {
  std::string socket_;
 public:
  explicit DockerClient(std::string socket) : socket_(std::move(socket)) {}

  // return the container id; empty (with the reason in error) on failure
  std::string CreateContainer(const nlohmann::json& spec, std::string& error) const;
  bool StartContainer(const std::string& id, std::string& error) const;
  bool StopContainer(const std::string& id, std::chrono::seconds timeout) const;
  // a missing container counts as removed
  bool RemoveContainer(const std::string& id) const;
  // nullopt if the daemon could not be asked
  std::optional<bool> IsRunning(const std::string& id) const;
};

class DockerSandbox : public Sandbox {
  DockerClient client_;
  std::string image_;
  std::string runtime_command_;
  SandboxLimits limits_;
  SandboxState state_;
  std::string container_id_;
 public:
  DockerSandbox(std::string socket, std::string image, std::string runtime_command, SandboxLimits limits) :
      client_(std::move(socket)),
      image_(std::move(image)),
      runtime_command_(std::move(runtime_command)),
      limits_(limits),
      state_(SandboxState::NOT_STARTED) {}
  ~DockerSandbox() override { Terminate(std::chrono::seconds(0)); }

  // the container specification sent to the daemon
  nlohmann::json ContainerSpec(const std::filesystem::path& workspace) const;

  void Launch(const std::filesystem::path& workspace) override;
  void Terminate(std::chrono::seconds grace) override;
  bool IsAlive() override;
  SandboxState State() const override { return state_; }
  std::string Id() const override;
};

#endif  // DSBOX_DOCKER_SANDBOX_H_
