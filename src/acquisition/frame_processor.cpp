#include "acquisition/frame_processor.hpp"

#include "core/json_utils.hpp"
#include "photon/conversion.hpp"

#include <utility>

namespace photoncount::acquisition {

namespace {

std::string FormatValue(double value, int precision) {
  return core::FormatJsonNumber(value, precision);
}

} // namespace

const char* ToString(const FrameStatus status) {
  switch (status) {
  case FrameStatus::kFailed:
    return "failed";
  case FrameStatus::kCalibrating:
    return "calibrating";
  case FrameStatus::kMeasured:
    return "measured";
  }
  return "failed";
}

frames::FrameOutcome AcquireFrame(backends::ICameraBackend& backend,
                                  const std::chrono::milliseconds timeout,
                                  frames::ImageFrame& frame, std::string& error) {
  frames::ImageFrame grabbed;
  const frames::FrameOutcome outcome = backend.GrabFrame(timeout, grabbed, error);
  if (outcome != frames::FrameOutcome::kReceived) {
    if (error.empty()) {
      error = "frame " + std::string(frames::ToString(outcome));
    }
    return outcome;
  }
  if (grabbed.empty()) {
    error = "backend reported a received frame without pixel data";
    return frames::FrameOutcome::kError;
  }

  frame = std::move(grabbed);
  return outcome;
}

FrameProcessor::FrameProcessor(backends::ICameraBackend& backend, frames::RoiSize roi,
                               const std::chrono::milliseconds timeout,
                               const std::uint32_t log_every_n_frames,
                               core::logging::Logger& logger)
    : backend_(backend), roi_(roi), timeout_(timeout), log_every_n_frames_(log_every_n_frames),
      logger_(logger) {}

FrameResult FrameProcessor::ProcessFrame(AcquisitionState& state) {
  FrameResult result;

  result.outcome = AcquireFrame(backend_, timeout_, frame_, result.error);
  if (result.outcome != frames::FrameOutcome::kReceived) {
    ++state.frame_idx;
    result.frame_idx = state.frame_idx;
    result.status = FrameStatus::kFailed;
    logger_.Warn("frame acquisition failed",
                 {{"frame", std::to_string(state.frame_idx)},
                  {"outcome", frames::ToString(result.outcome)},
                  {"error", result.error}});
    return result;
  }

  if (!frames::MeanOfCenteredRoi(frame_, roi_, result.mean_adu, result.error)) {
    ++state.frame_idx;
    result.frame_idx = state.frame_idx;
    result.status = FrameStatus::kFailed;
    result.outcome = frames::FrameOutcome::kError;
    logger_.Warn("ROI mean failed",
                 {{"frame", std::to_string(state.frame_idx)}, {"error", result.error}});
    return result;
  }

  if (!state.is_calibrated) {
    state.baseline_values.push_back(result.mean_adu);
    ++state.frame_idx;
    result.frame_idx = state.frame_idx;
    result.status = FrameStatus::kCalibrating;
    result.photons = 0.0;

    if (state.baseline_values.size() >= state.baseline_frames) {
      const DarkCalibrationSummary summary = CompleteCalibration(state);
      logger_.Info("baseline calibration complete",
                   {{"mean_dark_adu", FormatValue(summary.mean_dark_adu, 2)},
                    {"dark_std_adu", FormatValue(summary.dark_std_adu, 2)},
                    {"dark_std_e", FormatValue(summary.dark_std_e, 2)},
                    {"samples", std::to_string(summary.sample_count)}});
      result.calibration = summary;
    }
    return result;
  }

  const double photons =
      photon::AduToPhotons(result.mean_adu, state.mean_dark, state.gain, state.qe);
  ++state.frame_idx;
  result.frame_idx = state.frame_idx;
  result.status = FrameStatus::kMeasured;
  result.photons = photons;

  if (log_every_n_frames_ > 0U && state.frame_idx % log_every_n_frames_ == 0U) {
    logger_.Info("photon sample",
                 {{"frame", std::to_string(state.frame_idx)},
                  {"photons_per_px", FormatValue(photons, 1)},
                  {"adu", FormatValue(result.mean_adu, 1)},
                  {"dark", FormatValue(state.mean_dark, 1)},
                  {"delta", FormatValue(result.mean_adu - state.mean_dark, 1)}});
  }
  return result;
}

} // namespace photoncount::acquisition
