#include "docker_sandbox.h"

#include <sys/socket.h>

#include <nlohmann/json.hpp>
#include <dsbox/executor.h>
#include "http_utils.h"
#include "paths.h"

namespace {

const std::string kApiPrefix = "/v1.41";
constexpr std::chrono::seconds kConnectTimeout(5);
constexpr std::chrono::seconds kRequestTimeout(30);

std::string ContainerPath(const std::string& id, const std::string& action = "") {
  std::string ret = kApiPrefix + "/containers/" + id;
  if (!action.empty()) ret += "/" + action;
  return ret;
}

std::string ShortId(const std::string& id) {
  return id.substr(0, 12);
}

std::string ResponseError(const httplib::Result& res) {
  if (!res) return "cannot reach docker daemon: " + httplib::to_string(res.error());
  return "docker daemon returned " + ErrorMessage(res);
}

httplib::Client Connect(const std::string& socket, std::chrono::seconds read_timeout) {
  httplib::Client cli(socket);
  cli.set_address_family(AF_UNIX);
  cli.set_connection_timeout(kConnectTimeout);
  cli.set_read_timeout(read_timeout);
  cli.set_write_timeout(kRequestTimeout);
  return cli;
}

} // namespace

std::string DockerClient::CreateContainer(const nlohmann::json& spec, std::string& error) const {
  auto cli = Connect(socket_, kRequestTimeout);
  auto res = HTTPRequest<HTTPPost>(cli, kApiPrefix + "/containers/create", spec.dump(), "application/json");
  if (!IsSuccess(res)) {
    error = ResponseError(res);
    return "";
  }
  try {
    return nlohmann::json::parse(res->body).at("Id").get<std::string>();
  } catch (const nlohmann::json::exception& err) {
    error = std::string("malformed create response: ") + err.what();
    return "";
  }
}

bool DockerClient::StartContainer(const std::string& id, std::string& error) const {
  auto cli = Connect(socket_, kRequestTimeout);
  auto res = HTTPRequest<HTTPPost>(cli, ContainerPath(id, "start"), "", "application/json");
  // 304: already started
  if (IsSuccess(res, {304})) return true;
  error = ResponseError(res);
  return false;
}

bool DockerClient::StopContainer(const std::string& id, std::chrono::seconds timeout) const {
  auto cli = Connect(socket_, timeout + kRequestTimeout);
  auto res = HTTPRequest<HTTPPost>(cli, ContainerPath(id, "stop") + "?t=" + std::to_string(timeout.count()),
                                   "", "application/json");
  // 304: already stopped; 404: already removed
  if (IsSuccess(res, {304, 404})) return true;
  spdlog::warn("Failed stopping container {}: {}", ShortId(id), ResponseError(res));
  return false;
}

bool DockerClient::RemoveContainer(const std::string& id) const {
  auto cli = Connect(socket_, kRequestTimeout);
  auto res = HTTPRequest<HTTPDelete>(cli, ContainerPath(id) + "?force=true");
  // 404: auto-removed after stop; 409: removal already in progress
  if (IsSuccess(res, {404, 409})) return true;
  spdlog::warn("Failed removing container {}: {}", ShortId(id), ResponseError(res));
  return false;
}

std::optional<bool> DockerClient::IsRunning(const std::string& id) const {
  auto cli = Connect(socket_, kRequestTimeout);
  auto res = HTTPRequest<HTTPGet>(cli, ContainerPath(id, "json"));
  if (res && res->status == 404) return false;
  if (!IsSuccess(res)) {
    spdlog::debug("Failed inspecting container {}: {}", ShortId(id), ResponseError(res));
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(res->body).at("State").at("Running").get<bool>();
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

nlohmann::json DockerSandbox::ContainerSpec(const fs::path& workspace) const {
  nlohmann::json host_config{
    {"Binds", nlohmann::json::array({workspace.string() + ":" + kSandboxMountPoint + ":rw"})},
    {"NetworkMode", "none"},
    {"AutoRemove", true},
  };
  if (limits_.memory_bytes > 0) {
    host_config["Memory"] = limits_.memory_bytes;
    host_config["MemorySwap"] = limits_.memory_bytes; // no swap on top of the ceiling
  }
  if (limits_.cpu_shares > 0) host_config["CpuShares"] = limits_.cpu_shares;
  return {
    {"Image", image_},
    {"Cmd", nlohmann::json::array({runtime_command_, kSandboxMountPoint})},
    {"WorkingDir", kSandboxMountPoint},
    {"NetworkDisabled", true},
    {"Labels", {{"dsbox.workspace", workspace.string()}}},
    {"HostConfig", std::move(host_config)},
  };
}

void DockerSandbox::Launch(const fs::path& workspace) {
  if (state_ == SandboxState::RUNNING) return;
  std::string error;
  std::string id = client_.CreateContainer(ContainerSpec(workspace), error);
  if (id.empty()) {
    state_ = SandboxState::STOPPED;
    throw LaunchError("failed to create container from " + image_ + ": " + error);
  }
  if (!client_.StartContainer(id, error)) {
    client_.RemoveContainer(id);
    state_ = SandboxState::STOPPED;
    throw LaunchError("failed to start container " + ShortId(id) + ": " + error);
  }
  container_id_ = std::move(id);
  state_ = SandboxState::RUNNING;
  spdlog::info("Started container {} (image={} memory={} cpu_shares={})",
               ShortId(container_id_), image_, limits_.memory_bytes, limits_.cpu_shares);
}

void DockerSandbox::Terminate(std::chrono::seconds grace) {
  if (container_id_.empty()) {
    if (state_ == SandboxState::RUNNING) state_ = SandboxState::STOPPED;
    return;
  }
  spdlog::info("Stopping container {}", ShortId(container_id_));
  // both steps run even if the first one failed
  bool stopped = client_.StopContainer(container_id_, grace);
  bool removed = client_.RemoveContainer(container_id_);
  if (!stopped || !removed) {
    spdlog::warn("Container {} may still be present", ShortId(container_id_));
  }
  container_id_.clear();
  state_ = SandboxState::STOPPED;
}

bool DockerSandbox::IsAlive() {
  if (state_ != SandboxState::RUNNING) return false;
  // an unreachable daemon is not evidence that the container died
  return client_.IsRunning(container_id_).value_or(true);
}

std::string DockerSandbox::Id() const {
  return container_id_.empty() ? "docker:" + image_ : "docker:" + ShortId(container_id_);
}
