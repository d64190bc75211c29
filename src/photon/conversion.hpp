#pragma once

#include "photon/sensor_calibration.hpp"

#include <span>
#include <string>
#include <vector>

namespace photoncount::photon {

// ADU -> electrons -> photons, following EMVA 1288:
//
//   electrons = max(0, signal_adu - dark_adu) * gain
//   photons   = electrons / quantum_efficiency
//
// The result is photons incident on the sensor (not absorbed). Below ~10
// photons/px read noise dominates and single values should not be trusted.
double AduToElectrons(double signal_adu, double dark_adu = 0.0,
                      double gain = kDefaultSystemGainEPerAdu);

double ElectronsToPhotons(double electrons, double quantum_efficiency = kDefaultQuantumEfficiency);

double AduToPhotons(double signal_adu, double dark_adu = 0.0,
                    double gain = kDefaultSystemGainEPerAdu,
                    double quantum_efficiency = kDefaultQuantumEfficiency);

// Shot + read noise limited SNR:
//   e = photons * qe;  snr = e / sqrt(e + read_noise^2)
// Returns 0 when the noise term is zero.
double CalculateSnr(double signal_photons, double quantum_efficiency = kDefaultQuantumEfficiency,
                    double read_noise_e = kDefaultReadNoiseE);

// Element-wise variants for whole ROIs or frames.
std::vector<double> AduToElectrons(std::span<const double> signal_adu, double dark_adu,
                                   double gain);

std::vector<double> ElectronsToPhotons(std::span<const double> electrons,
                                       double quantum_efficiency);

std::vector<double> AduToPhotons(std::span<const double> signal_adu, double dark_adu, double gain,
                                 double quantum_efficiency);

// Per-pixel dark frame variant. Fails when the spans differ in length.
bool AduToPhotons(std::span<const double> signal_adu, std::span<const double> dark_adu,
                  double gain, double quantum_efficiency, std::vector<double>& photons,
                  std::string& error);

std::vector<double> CalculateSnr(std::span<const double> signal_photons,
                                 double quantum_efficiency, double read_noise_e);

} // namespace photoncount::photon
