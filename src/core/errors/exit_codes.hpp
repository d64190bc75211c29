#pragma once

namespace photoncount::core::errors {

// Process-exit contract for scripts wrapping `photoncount`.
//
// 0/1/2 keep their conventional meanings (success, failure, usage). The rest
// classify camera-side failure modes so wrappers can tell "no camera plugged
// in" apart from "camera dropped out mid-session" without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kCameraConnectFailed = 20,
  kNoCameraDetected = 21,
  kAcquisitionFailed = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace photoncount::core::errors
