#include "transport.h"

#include <thread>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

const char* WaitStatusName(WaitStatus status) {
  switch (status) {
#define X(name) case WaitStatus::name: return #name;
    ENUM_WAIT_STATUS_
#undef X
  }
  __builtin_unreachable();
}

bool Channel::HasPendingRequest() const {
  std::error_code ec;
  return fs::exists(RequestFile(dir_), ec);
}

bool Channel::Submit(const std::string& code) {
  if (HasPendingRequest()) {
    spdlog::warn("A request is still pending in {}", dir_.c_str());
    return false;
  }
  // a stale response would be mistaken for the answer to this request
  if (std::error_code ec; fs::exists(ResponseFile(dir_), ec)) {
    spdlog::warn("Discarding stale response in {}", dir_.c_str());
    RemoveFile(ResponseFile(dir_));
  }
  spdlog::debug("Submit request of {} bytes to {}", code.size(), dir_.c_str());
  return WriteFileAtomic(RequestFile(dir_), code, kPerm666);
}

std::optional<std::string> Channel::TakeResponse() {
  return ConsumeFile(ResponseFile(dir_));
}

WaitStatus Channel::WaitResponse(std::string& response,
                                 std::chrono::milliseconds timeout,
                                 std::chrono::milliseconds interval,
                                 const CancelToken* cancel,
                                 const std::function<bool()>& alive) {
  using clock = std::chrono::steady_clock;
  auto deadline = clock::now() + timeout;
  while (true) {
    if (auto res = TakeResponse()) {
      response = std::move(*res);
      return WaitStatus::READY;
    }
    if (cancel && cancel->IsCancelled()) return WaitStatus::CANCELLED;
    auto now = clock::now();
    if (now >= deadline) return WaitStatus::TIMEOUT;
    if (alive && !alive()) {
      // the response may have landed right before the other side exited
      if (auto res = TakeResponse()) {
        response = std::move(*res);
        return WaitStatus::READY;
      }
      return WaitStatus::ABORTED;
    }
    auto dur = std::min(interval,
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) + std::chrono::milliseconds(1));
    if (cancel) {
      if (cancel->WaitFor(dur)) return WaitStatus::CANCELLED;
    } else {
      std::this_thread::sleep_for(dur);
    }
  }
}

void Channel::Reset() {
  std::error_code ec;
  for (auto& path : {RequestFile(dir_), ResponseFile(dir_)}) {
    if (fs::exists(path, ec)) RemoveFile(path);
  }
}

std::optional<std::string> Channel::TakeRequest() {
  // consume immediately so the slot is free for the next submission
  return ConsumeFile(RequestFile(dir_));
}

bool Channel::PutResponse(const std::string& payload) {
  return WriteFileAtomic(ResponseFile(dir_), payload, kPerm666);
}

bool Channel::StopRequested() const {
  std::error_code ec;
  return fs::exists(StopFile(dir_), ec) || !fs::is_directory(dir_, ec);
}
