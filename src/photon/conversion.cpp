#include "photon/conversion.hpp"

#include <algorithm>
#include <cmath>

namespace photoncount::photon {

double AduToElectrons(const double signal_adu, const double dark_adu, const double gain) {
  const double delta_adu = std::max(0.0, signal_adu - dark_adu);
  return delta_adu * gain;
}

double ElectronsToPhotons(const double electrons, const double quantum_efficiency) {
  return electrons / quantum_efficiency;
}

double AduToPhotons(const double signal_adu, const double dark_adu, const double gain,
                    const double quantum_efficiency) {
  return ElectronsToPhotons(AduToElectrons(signal_adu, dark_adu, gain), quantum_efficiency);
}

double CalculateSnr(const double signal_photons, const double quantum_efficiency,
                    const double read_noise_e) {
  const double signal_electrons = signal_photons * quantum_efficiency;
  const double variance = signal_electrons + read_noise_e * read_noise_e;
  if (!(variance > 0.0)) {
    return 0.0;
  }
  return signal_electrons / std::sqrt(variance);
}

std::vector<double> AduToElectrons(std::span<const double> signal_adu, const double dark_adu,
                                   const double gain) {
  std::vector<double> electrons;
  electrons.reserve(signal_adu.size());
  for (const double adu : signal_adu) {
    electrons.push_back(AduToElectrons(adu, dark_adu, gain));
  }
  return electrons;
}

std::vector<double> ElectronsToPhotons(std::span<const double> electrons,
                                       const double quantum_efficiency) {
  std::vector<double> photons;
  photons.reserve(electrons.size());
  for (const double e : electrons) {
    photons.push_back(ElectronsToPhotons(e, quantum_efficiency));
  }
  return photons;
}

std::vector<double> AduToPhotons(std::span<const double> signal_adu, const double dark_adu,
                                 const double gain, const double quantum_efficiency) {
  std::vector<double> photons;
  photons.reserve(signal_adu.size());
  for (const double adu : signal_adu) {
    photons.push_back(AduToPhotons(adu, dark_adu, gain, quantum_efficiency));
  }
  return photons;
}

bool AduToPhotons(std::span<const double> signal_adu, std::span<const double> dark_adu,
                  const double gain, const double quantum_efficiency,
                  std::vector<double>& photons, std::string& error) {
  photons.clear();
  if (signal_adu.size() != dark_adu.size()) {
    error = "dark frame has " + std::to_string(dark_adu.size()) + " values but signal has " +
            std::to_string(signal_adu.size());
    return false;
  }

  photons.reserve(signal_adu.size());
  for (std::size_t i = 0; i < signal_adu.size(); ++i) {
    photons.push_back(AduToPhotons(signal_adu[i], dark_adu[i], gain, quantum_efficiency));
  }
  error.clear();
  return true;
}

std::vector<double> CalculateSnr(std::span<const double> signal_photons,
                                 const double quantum_efficiency, const double read_noise_e) {
  std::vector<double> snr;
  snr.reserve(signal_photons.size());
  for (const double photons : signal_photons) {
    snr.push_back(CalculateSnr(photons, quantum_efficiency, read_noise_e));
  }
  return snr;
}

} // namespace photoncount::photon
