#pragma once

#include <chrono>
#include <map>
#include <string>

namespace photoncount::events {

// Session timeline categories. Downstream tooling keys off the serialized
// names, so keep them stable.
enum class EventType {
  kSessionStarted,
  kCameraConnected,
  kExposureConfigured,
  kAcquisitionStarted,
  kCalibrationComplete,
  kFrameFailed,
  kAcquisitionStopped,
  kSessionStopped,
  kWarning,
  kError,
};

// Canonical timeline event contract.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: lightweight string key/value attributes for context.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kWarning;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace photoncount::events
