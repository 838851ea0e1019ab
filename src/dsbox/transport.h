#ifndef DSBOX_TRANSPORT_H_
#define DSBOX_TRANSPORT_H_

#include <chrono>
#include <string>
#include <optional>
#include <functional>
#include <filesystem>

#include <dsbox/executor.h>

#define ENUM_WAIT_STATUS_ \
  X(READY) \
  X(TIMEOUT) \
  X(CANCELLED) \
  X(ABORTED) /* the other side is gone */
enum class WaitStatus {
#define X(name) name,
  ENUM_WAIT_STATUS_
#undef X
};
const char* WaitStatusName(WaitStatus);

// Single-slot request/response exchange through files in a shared directory.
// There is no network path between the two sides.
//  host:    Submit -> WaitResponse (or TakeResponse)
//  sandbox: TakeRequest -> PutResponse
// Only one request may be outstanding; it is the caller's job to serialize.
class Channel {
  std::filesystem::path dir_;
 public:
  explicit Channel(std::filesystem::path dir) : dir_(std::move(dir)) {}
  const std::filesystem::path& Dir() const { return dir_; }

  /// host side
  bool HasPendingRequest() const;
  // false if a request is still unconsumed or the write failed
  bool Submit(const std::string& code);
  std::optional<std::string> TakeResponse();
  // Poll until a response is available. alive (if set) is consulted once per
  // interval; returning false ends the wait with ABORTED.
  WaitStatus WaitResponse(std::string& response,
                          std::chrono::milliseconds timeout,
                          std::chrono::milliseconds interval,
                          const CancelToken* cancel = nullptr,
                          const std::function<bool()>& alive = nullptr);
  // drop leftovers of an abandoned exchange
  void Reset();

  /// sandbox side
  std::optional<std::string> TakeRequest();
  bool PutResponse(const std::string& payload);
  bool StopRequested() const;
};

#endif  // DSBOX_TRANSPORT_H_
