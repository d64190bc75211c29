#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace photoncount::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kSessionStarted:
    return "SESSION_STARTED";
  case EventType::kCameraConnected:
    return "CAMERA_CONNECTED";
  case EventType::kExposureConfigured:
    return "EXPOSURE_CONFIGURED";
  case EventType::kAcquisitionStarted:
    return "ACQUISITION_STARTED";
  case EventType::kCalibrationComplete:
    return "CALIBRATION_COMPLETE";
  case EventType::kFrameFailed:
    return "FRAME_FAILED";
  case EventType::kAcquisitionStopped:
    return "ACQUISITION_STOPPED";
  case EventType::kSessionStopped:
    return "SESSION_STOPPED";
  case EventType::kWarning:
    return "warning";
  case EventType::kError:
    return "error";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  // `payload` is a std::map, so key order is stable across runs.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << "\"" << core::EscapeJson(key) << "\":\"" << core::EscapeJson(value) << "\"";
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace photoncount::events
