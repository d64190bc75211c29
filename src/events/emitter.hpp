#pragma once

#include "events/event_model.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace photoncount::events {

// Typed facade over the JSONL writer so every session event carries the same
// payload keys regardless of which code path emits it.
class Emitter {
public:
  struct SessionStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string backend;
    double exposure_us = 0.0;
    std::string roi;
    std::uint32_t baseline_frames = 0;
    std::uint64_t max_frames = 0;
  };

  struct CameraConnectedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string model;
    std::string serial;
    std::string vendor;
  };

  struct CalibrationCompleteEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t frame_idx = 0;
    double mean_dark_adu = 0.0;
    double dark_std_adu = 0.0;
    double dark_std_e = 0.0;
    std::uint64_t sample_count = 0;
  };

  struct FrameFailedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t frame_idx = 0;
    std::string outcome;
    std::string error;
  };

  struct SessionStoppedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string reason;
    std::uint64_t frames_total = 0;
    std::uint64_t frames_measured = 0;
    std::uint64_t frames_failed = 0;
  };

  Emitter(std::filesystem::path output_dir, std::string session_id);

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitSessionStarted(const SessionStartedEvent& event, std::string& error);
  bool EmitCameraConnected(const CameraConnectedEvent& event, std::string& error);
  bool EmitCalibrationComplete(const CalibrationCompleteEvent& event, std::string& error);
  bool EmitFrameFailed(const FrameFailedEvent& event, std::string& error);
  bool EmitSessionStopped(const SessionStoppedEvent& event, std::string& error);

  // Empty until the first successful append.
  const std::filesystem::path& events_path() const {
    return events_path_;
  }

private:
  std::filesystem::path output_dir_;
  std::string session_id_;
  std::filesystem::path events_path_;
};

} // namespace photoncount::events
