#include "events/emitter.hpp"

#include "core/json_utils.hpp"
#include "events/jsonl_writer.hpp"

#include <utility>

namespace photoncount::events {

Emitter::Emitter(std::filesystem::path output_dir, std::string session_id)
    : output_dir_(std::move(output_dir)), session_id_(std::move(session_id)) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  event.payload["session_id"] = session_id_;
  return AppendEventJsonl(event, output_dir_, events_path_, error);
}

bool Emitter::EmitSessionStarted(const SessionStartedEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionStarted, event.ts,
                 {
                     {"backend", event.backend},
                     {"exposure_us", core::FormatJsonNumber(event.exposure_us, 1)},
                     {"roi", event.roi},
                     {"baseline_frames", std::to_string(event.baseline_frames)},
                     {"max_frames", std::to_string(event.max_frames)},
                 },
                 error);
}

bool Emitter::EmitCameraConnected(const CameraConnectedEvent& event, std::string& error) {
  return EmitRaw(EventType::kCameraConnected, event.ts,
                 {
                     {"model", event.model},
                     {"serial", event.serial},
                     {"vendor", event.vendor},
                 },
                 error);
}

bool Emitter::EmitCalibrationComplete(const CalibrationCompleteEvent& event, std::string& error) {
  return EmitRaw(EventType::kCalibrationComplete, event.ts,
                 {
                     {"frame", std::to_string(event.frame_idx)},
                     {"mean_dark_adu", core::FormatJsonNumber(event.mean_dark_adu, 3)},
                     {"dark_std_adu", core::FormatJsonNumber(event.dark_std_adu, 3)},
                     {"dark_std_e", core::FormatJsonNumber(event.dark_std_e, 3)},
                     {"samples", std::to_string(event.sample_count)},
                 },
                 error);
}

bool Emitter::EmitFrameFailed(const FrameFailedEvent& event, std::string& error) {
  return EmitRaw(EventType::kFrameFailed, event.ts,
                 {
                     {"frame", std::to_string(event.frame_idx)},
                     {"outcome", event.outcome},
                     {"error", event.error},
                 },
                 error);
}

bool Emitter::EmitSessionStopped(const SessionStoppedEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionStopped, event.ts,
                 {
                     {"reason", event.reason},
                     {"frames_total", std::to_string(event.frames_total)},
                     {"frames_measured", std::to_string(event.frames_measured)},
                     {"frames_failed", std::to_string(event.frames_failed)},
                 },
                 error);
}

} // namespace photoncount::events
