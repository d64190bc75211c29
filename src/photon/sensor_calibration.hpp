#pragma once

#include <string>

namespace photoncount::photon {

// EMVA 1288 measurements for the FLIR BFS-U3-04S2M-C (Sony IMX287, mono).
constexpr double kDefaultSystemGainEPerAdu = 0.35;
constexpr double kDefaultQuantumEfficiency = 0.6182;
constexpr double kDefaultSaturationCapacityE = 22'187.0;
constexpr double kDefaultReadNoiseE = 3.71;
constexpr double kDefaultReferenceWavelengthNm = 525.0;

// QE is only measured at the reference wavelength; requests further away than
// this still get the reference value but are flagged as approximate.
constexpr double kQuantumEfficiencyToleranceNm = 50.0;

// Sensor constants used to turn ADU into electrons and photons.
struct SensorCalibration {
  double system_gain_e_per_adu = kDefaultSystemGainEPerAdu;
  double quantum_efficiency = kDefaultQuantumEfficiency;
  double saturation_capacity_e = kDefaultSaturationCapacityE;
  double read_noise_e = kDefaultReadNoiseE;
  double reference_wavelength_nm = kDefaultReferenceWavelengthNm;
};

// Rejects constants that would make the conversion meaningless (zero or
// negative gain, QE outside (0, 1], negative read noise, non-finite values).
bool ValidateSensorCalibration(const SensorCalibration& calibration, std::string& error);

struct QuantumEfficiencyLookup {
  double quantum_efficiency = kDefaultQuantumEfficiency;
  // True when the requested wavelength is outside the measured tolerance and
  // the reference value was substituted.
  bool approximate = false;
};

QuantumEfficiencyLookup QuantumEfficiencyAt(double wavelength_nm,
                                            const SensorCalibration& calibration);

} // namespace photoncount::photon
