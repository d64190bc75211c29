#pragma once

#include "frames/image_frame.hpp"
#include "frames/roi.hpp"
#include "photon/sensor_calibration.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace photoncount::acquisition {

constexpr std::uint32_t kDefaultBaselineFrames = 50;

// Progress of one monitoring session.
//
// `frame_idx` counts every grab attempt (failed, calibrating and measured)
// so it lines up with the frame axis of the live plot.
struct AcquisitionState {
  std::uint64_t frame_idx = 0;
  std::vector<double> baseline_values;
  double mean_dark = 0.0;
  bool is_calibrated = false;
  std::uint32_t baseline_frames = kDefaultBaselineFrames;
  double gain = photon::kDefaultSystemGainEPerAdu;
  double qe = photon::kDefaultQuantumEfficiency;
};

struct DarkCalibrationSummary {
  double mean_dark_adu = 0.0;
  // Population standard deviation of the per-frame ROI means.
  double dark_std_adu = 0.0;
  double dark_std_e = 0.0;
  std::size_t sample_count = 0;
};

// Fails when `baseline_frames` is 0 or the calibration constants are invalid.
bool CreateAcquisitionState(std::uint32_t baseline_frames,
                            const photon::SensorCalibration& calibration, AcquisitionState& state,
                            std::string& error);

// Averages the collected baseline into `mean_dark` and marks the state
// calibrated. An empty baseline calibrates to a zero dark level.
DarkCalibrationSummary CompleteCalibration(AcquisitionState& state);

// Drops the baseline and starts over from frame 0.
void ResetCalibration(AcquisitionState& state);

// 1.0 once calibrated, otherwise collected / required baseline frames.
double CalibrationProgress(const AcquisitionState& state);

// One-off conversion of a frame's centered ROI mean to photons per pixel.
bool CalculateRoiPhotons(const frames::ImageFrame& frame, const frames::RoiSize& roi,
                         double dark_adu, double gain, double quantum_efficiency, double& photons,
                         std::string& error);

} // namespace photoncount::acquisition
