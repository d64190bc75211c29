#include "photon/sensor_calibration.hpp"

#include <cmath>

namespace photoncount::photon {

bool ValidateSensorCalibration(const SensorCalibration& calibration, std::string& error) {
  error.clear();

  if (!std::isfinite(calibration.system_gain_e_per_adu) ||
      calibration.system_gain_e_per_adu <= 0.0) {
    error = "system gain must be a positive finite number (e-/ADU)";
    return false;
  }
  if (!std::isfinite(calibration.quantum_efficiency) || calibration.quantum_efficiency <= 0.0 ||
      calibration.quantum_efficiency > 1.0) {
    error = "quantum efficiency must be in range (0, 1]";
    return false;
  }
  if (!std::isfinite(calibration.read_noise_e) || calibration.read_noise_e < 0.0) {
    error = "read noise must be a non-negative finite number (e-)";
    return false;
  }
  if (!std::isfinite(calibration.saturation_capacity_e) ||
      calibration.saturation_capacity_e <= 0.0) {
    error = "saturation capacity must be a positive finite number (e-)";
    return false;
  }
  if (!std::isfinite(calibration.reference_wavelength_nm) ||
      calibration.reference_wavelength_nm <= 0.0) {
    error = "reference wavelength must be a positive finite number (nm)";
    return false;
  }
  return true;
}

QuantumEfficiencyLookup QuantumEfficiencyAt(const double wavelength_nm,
                                            const SensorCalibration& calibration) {
  QuantumEfficiencyLookup lookup;
  lookup.quantum_efficiency = calibration.quantum_efficiency;
  lookup.approximate = !std::isfinite(wavelength_nm) ||
                       std::abs(wavelength_nm - calibration.reference_wavelength_nm) >=
                           kQuantumEfficiencyToleranceNm;
  return lookup;
}

} // namespace photoncount::photon
