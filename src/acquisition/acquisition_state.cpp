#include "acquisition/acquisition_state.hpp"

#include "photon/conversion.hpp"

#include <cmath>

namespace photoncount::acquisition {

bool CreateAcquisitionState(const std::uint32_t baseline_frames,
                            const photon::SensorCalibration& calibration, AcquisitionState& state,
                            std::string& error) {
  if (baseline_frames == 0U) {
    error = "baseline_frames must be at least 1";
    return false;
  }
  if (!photon::ValidateSensorCalibration(calibration, error)) {
    return false;
  }

  state = AcquisitionState{};
  state.baseline_frames = baseline_frames;
  state.baseline_values.reserve(baseline_frames);
  state.gain = calibration.system_gain_e_per_adu;
  state.qe = calibration.quantum_efficiency;
  return true;
}

DarkCalibrationSummary CompleteCalibration(AcquisitionState& state) {
  DarkCalibrationSummary summary;
  summary.sample_count = state.baseline_values.size();

  if (!state.baseline_values.empty()) {
    double sum = 0.0;
    for (const double value : state.baseline_values) {
      sum += value;
    }
    const double count = static_cast<double>(state.baseline_values.size());
    summary.mean_dark_adu = sum / count;

    double squared_deviation = 0.0;
    for (const double value : state.baseline_values) {
      const double deviation = value - summary.mean_dark_adu;
      squared_deviation += deviation * deviation;
    }
    summary.dark_std_adu = std::sqrt(squared_deviation / count);
  }
  summary.dark_std_e = summary.dark_std_adu * state.gain;

  state.mean_dark = summary.mean_dark_adu;
  state.is_calibrated = true;
  return summary;
}

void ResetCalibration(AcquisitionState& state) {
  state.baseline_values.clear();
  state.mean_dark = 0.0;
  state.is_calibrated = false;
  state.frame_idx = 0;
}

double CalibrationProgress(const AcquisitionState& state) {
  if (state.is_calibrated) {
    return 1.0;
  }
  if (state.baseline_frames == 0U) {
    return 0.0;
  }
  return static_cast<double>(state.baseline_values.size()) /
         static_cast<double>(state.baseline_frames);
}

bool CalculateRoiPhotons(const frames::ImageFrame& frame, const frames::RoiSize& roi,
                         const double dark_adu, const double gain,
                         const double quantum_efficiency, double& photons, std::string& error) {
  double mean_adu = 0.0;
  if (!frames::MeanOfCenteredRoi(frame, roi, mean_adu, error)) {
    return false;
  }
  photons = photon::AduToPhotons(mean_adu, dark_adu, gain, quantum_efficiency);
  return true;
}

} // namespace photoncount::acquisition
