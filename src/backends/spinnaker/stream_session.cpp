#include "backends/spinnaker/stream_session.hpp"

#include <utility>

namespace photoncount::backends::spinnaker {

StreamSession::StreamSession(Hook begin_acquisition, Hook end_acquisition)
    : begin_acquisition_(std::move(begin_acquisition)),
      end_acquisition_(std::move(end_acquisition)) {}

StreamSession::~StreamSession() {
  // Destructors cannot surface errors; owners call Stop() on the checked path.
  std::string stop_error;
  (void)Stop(stop_error);
}

bool StreamSession::Start(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (running_) {
    error = "stream session is already running";
    return false;
  }
  if (!begin_acquisition_) {
    error = "stream session has no acquisition start hook";
    return false;
  }
  if (!begin_acquisition_(error)) {
    return false;
  }
  running_ = true;
  ++start_calls_;
  error.clear();
  return true;
}

bool StreamSession::Stop(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!running_) {
    error.clear();
    return true;
  }
  // The stream counts as stopped even when EndAcquisition reports an error;
  // retrying would only raise the same error again.
  running_ = false;
  ++stop_calls_;
  if (end_acquisition_ && !end_acquisition_(error)) {
    return false;
  }
  error.clear();
  return true;
}

bool StreamSession::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_;
}

StreamSession::Snapshot StreamSession::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .running = running_,
      .start_calls = start_calls_,
      .stop_calls = stop_calls_,
  };
}

} // namespace photoncount::backends::spinnaker
