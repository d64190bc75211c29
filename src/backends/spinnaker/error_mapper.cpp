#include "backends/spinnaker/error_mapper.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>

namespace photoncount::backends::spinnaker {

namespace {

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = true;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!previous_was_space) {
        normalized.push_back(' ');
      }
      previous_was_space = true;
      continue;
    }
    normalized.push_back(c);
    previous_was_space = false;
  }
  if (!normalized.empty() && normalized.back() == ' ') {
    normalized.pop_back();
  }
  return normalized;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (const std::string_view needle : needles) {
    if (!needle.empty() && haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

std::string BuildActionableMessage(const CameraErrorCode code, std::string_view operation) {
  const std::string operation_label =
      operation.empty() ? "requested operation" : std::string(operation);

  switch (code) {
  case CameraErrorCode::kSdkUnavailable:
    return "Spinnaker SDK is unavailable; install the SDK, set SPINNAKER_GENTL64_CTI and rebuild "
           "with PHOTONCOUNT_ENABLE_SPINNAKER=ON.";
  case CameraErrorCode::kNotFound:
    return "Camera was not found during " + operation_label +
           "; check the USB3 cable, camera power and --camera-index.";
  case CameraErrorCode::kTimeout:
    return "Camera timed out during " + operation_label +
           "; raise --timeout-ms or check that the exposure fits inside it.";
  case CameraErrorCode::kIncompleteFrame:
    return "Camera delivered an incomplete frame during " + operation_label +
           "; check USB3 bandwidth and avoid shared hubs.";
  case CameraErrorCode::kBusy:
    return "Camera is busy during " + operation_label +
           "; close SpinView or other processes holding the camera and retry.";
  case CameraErrorCode::kInterfaceError:
    return "Camera interface error during " + operation_label +
           "; a previous session did not release the camera, replug it and retry.";
  case CameraErrorCode::kInvalidConfiguration:
    return "Configuration is invalid for this camera; review exposure, ROI and timeout values.";
  case CameraErrorCode::kStateConflict:
    return "Backend state conflict during " + operation_label +
           "; verify connect/start/stop ordering.";
  case CameraErrorCode::kUnknown:
  default:
    return "Unexpected camera failure during " + operation_label +
           "; rerun with --log-level debug for SDK detail.";
  }
}

CameraErrorCode ClassifyFromNormalizedDetail(const std::string& normalized_detail) {
  if (normalized_detail.empty()) {
    return CameraErrorCode::kUnknown;
  }

  if (ContainsAny(normalized_detail, {"disabled at build time", "sdk not found", "sdk missing",
                                      "failed to initialize spinnaker", "gentl producer"})) {
    return CameraErrorCode::kSdkUnavailable;
  }

  if (ContainsAny(normalized_detail, {"-1004", "interface error"})) {
    return CameraErrorCode::kInterfaceError;
  }

  if (ContainsAny(normalized_detail,
                  {"no cameras detected", "no camera", "camera index", "not found",
                   "not present"})) {
    return CameraErrorCode::kNotFound;
  }

  if (ContainsAny(normalized_detail, {"timeout", "timed out", "time out", "-1011"})) {
    return CameraErrorCode::kTimeout;
  }

  if (ContainsAny(normalized_detail, {"incomplete"})) {
    return CameraErrorCode::kIncompleteFrame;
  }

  if (ContainsAny(normalized_detail, {"busy", "in use", "already open", "-1022"})) {
    return CameraErrorCode::kBusy;
  }

  if (ContainsAny(normalized_detail,
                  {"already connected", "already running", "not running", "must be connected",
                   "must be running", "not initialized", "-1002"})) {
    return CameraErrorCode::kStateConflict;
  }

  if (ContainsAny(normalized_detail, {"invalid", "out of range", "must be", "not writable",
                                      "-1009", "-1019"})) {
    return CameraErrorCode::kInvalidConfiguration;
  }

  return CameraErrorCode::kUnknown;
}

} // namespace

std::string_view ToStableErrorCode(const CameraErrorCode code) {
  switch (code) {
  case CameraErrorCode::kSdkUnavailable:
    return "CAM_SDK_UNAVAILABLE";
  case CameraErrorCode::kNotFound:
    return "CAM_NOT_FOUND";
  case CameraErrorCode::kTimeout:
    return "CAM_TIMEOUT";
  case CameraErrorCode::kIncompleteFrame:
    return "CAM_INCOMPLETE_FRAME";
  case CameraErrorCode::kBusy:
    return "CAM_BUSY";
  case CameraErrorCode::kInterfaceError:
    return "CAM_INTERFACE_ERROR";
  case CameraErrorCode::kInvalidConfiguration:
    return "CAM_INVALID_CONFIGURATION";
  case CameraErrorCode::kStateConflict:
    return "CAM_STATE_CONFLICT";
  case CameraErrorCode::kUnknown:
  default:
    return "CAM_UNKNOWN_ERROR";
  }
}

CameraErrorMapping MapCameraError(std::string_view operation, std::string_view detail) {
  CameraErrorMapping mapped;
  mapped.detail = CollapseWhitespace(detail);
  mapped.code = ClassifyFromNormalizedDetail(ToLowerAscii(mapped.detail));
  mapped.actionable_message = BuildActionableMessage(mapped.code, operation);
  return mapped;
}

std::string FormatCameraError(std::string_view operation, std::string_view detail) {
  const CameraErrorMapping mapped = MapCameraError(operation, detail);
  std::string formatted =
      std::string(ToStableErrorCode(mapped.code)) + ": " + mapped.actionable_message;
  if (!mapped.detail.empty()) {
    formatted += " detail: " + mapped.detail;
  }
  return formatted;
}

} // namespace photoncount::backends::spinnaker
