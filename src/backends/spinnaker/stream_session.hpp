#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace photoncount::backends::spinnaker {

// Balanced BeginAcquisition/EndAcquisition guard.
//
// The two SDK calls are injected so the same bookkeeping wraps a live
// `Spinnaker::CameraPtr` in the backend and plain counters in tests. Stop is
// idempotent and the destructor ends a session that is still running.
class StreamSession {
public:
  using Hook = std::function<bool(std::string& error)>;

  StreamSession(Hook begin_acquisition, Hook end_acquisition);
  ~StreamSession();

  StreamSession(const StreamSession&) = delete;
  StreamSession& operator=(const StreamSession&) = delete;
  StreamSession(StreamSession&&) = delete;
  StreamSession& operator=(StreamSession&&) = delete;

  bool Start(std::string& error);

  // Calling Stop on a session that is not running succeeds.
  bool Stop(std::string& error);

  bool running() const;

  struct Snapshot {
    bool running = false;
    std::uint64_t start_calls = 0;
    std::uint64_t stop_calls = 0;
  };

  Snapshot DebugSnapshot() const;

private:
  Hook begin_acquisition_;
  Hook end_acquisition_;

  mutable std::mutex mu_;
  bool running_ = false;
  std::uint64_t start_calls_ = 0;
  std::uint64_t stop_calls_ = 0;
};

} // namespace photoncount::backends::spinnaker
