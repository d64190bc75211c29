#pragma once

#include "acquisition/acquisition_state.hpp"
#include "backends/camera_backend.hpp"
#include "core/logging/logger.hpp"
#include "frames/image_frame.hpp"
#include "frames/roi.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace photoncount::acquisition {

constexpr std::uint32_t kDefaultLogEveryNFrames = 100;
constexpr std::chrono::milliseconds kDefaultGrabTimeout{1000};

enum class FrameStatus {
  kFailed = 0,
  kCalibrating,
  kMeasured,
};

const char* ToString(FrameStatus status);

struct FrameResult {
  FrameStatus status = FrameStatus::kFailed;
  frames::FrameOutcome outcome = frames::FrameOutcome::kError;
  // State frame index after this frame was counted.
  std::uint64_t frame_idx = 0;
  double mean_adu = 0.0;
  // Photons per pixel per exposure. Zero while calibrating, unset on failure.
  std::optional<double> photons;
  std::string error;
  // Set on the frame that completed the dark baseline.
  std::optional<DarkCalibrationSummary> calibration;
};

// Grabs one frame. Anything other than `kReceived` leaves `frame` untouched
// and explains itself in `error`.
frames::FrameOutcome AcquireFrame(backends::ICameraBackend& backend,
                                  std::chrono::milliseconds timeout, frames::ImageFrame& frame,
                                  std::string& error);

// Per-frame pipeline: grab, centered ROI mean, baseline or photon conversion.
// Reuses one frame buffer across calls.
class FrameProcessor {
public:
  FrameProcessor(backends::ICameraBackend& backend, frames::RoiSize roi,
                 std::chrono::milliseconds timeout, std::uint32_t log_every_n_frames,
                 core::logging::Logger& logger);

  FrameResult ProcessFrame(AcquisitionState& state);

  const frames::ImageFrame& last_frame() const {
    return frame_;
  }

private:
  backends::ICameraBackend& backend_;
  frames::RoiSize roi_;
  std::chrono::milliseconds timeout_;
  std::uint32_t log_every_n_frames_ = kDefaultLogEveryNFrames;
  core::logging::Logger& logger_;
  frames::ImageFrame frame_;
};

} // namespace photoncount::acquisition
