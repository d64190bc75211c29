#pragma once

#include <string>
#include <string_view>

namespace photoncount::backends::spinnaker {

// Stable classification for camera-side failures. Raw SDK text changes between
// Spinnaker releases; these codes do not.
enum class CameraErrorCode {
  kSdkUnavailable,
  kNotFound,
  kTimeout,
  kIncompleteFrame,
  kBusy,
  kInterfaceError,
  kInvalidConfiguration,
  kStateConflict,
  kUnknown,
};

std::string_view ToStableErrorCode(CameraErrorCode code);

struct CameraErrorMapping {
  CameraErrorCode code = CameraErrorCode::kUnknown;
  std::string actionable_message;
  std::string detail;
};

// Maps raw backend/SDK error text to a stable code and human-actionable message.
// `operation` is a human label like "connect", "grab" or "device_discovery".
CameraErrorMapping MapCameraError(std::string_view operation, std::string_view detail);

// Returns single-line contract text:
//   "<STABLE_CODE>: <actionable_message> detail: <raw_detail>"
// The detail suffix is omitted when raw detail is empty.
std::string FormatCameraError(std::string_view operation, std::string_view detail);

} // namespace photoncount::backends::spinnaker
