#include "photon/conversion.hpp"
#include "photon/sensor_calibration.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using Catch::Approx;
namespace photon = photoncount::photon;

TEST_CASE("ADU above dark converts to electrons and photons", "[photon][conversion]") {
  REQUIRE(photon::AduToElectrons(1000.0, 100.0) == Approx(315.0));
  REQUIRE(photon::ElectronsToPhotons(315.0) == Approx(315.0 / 0.6182));
  REQUIRE(photon::AduToPhotons(1000.0, 100.0) == Approx(509.5438).epsilon(1e-6));
  REQUIRE(photon::AduToPhotons(1000.0, 100.0, 0.5, 0.5) == Approx(900.0));
}

TEST_CASE("Signal at or below dark clamps to zero photons", "[photon][conversion]") {
  REQUIRE(photon::AduToElectrons(90.0, 100.0) == 0.0);
  REQUIRE(photon::AduToPhotons(100.0, 100.0) == 0.0);
  REQUIRE(photon::AduToPhotons(0.0) == 0.0);
}

TEST_CASE("SNR combines shot and read noise", "[photon][snr]") {
  // e = 100 * 0.6182 = 61.82, noise = sqrt(61.82 + 3.71^2)
  REQUIRE(photon::CalculateSnr(100.0) == Approx(7.1106).epsilon(1e-4));
  REQUIRE(photon::CalculateSnr(0.0) == 0.0);
  REQUIRE(photon::CalculateSnr(0.0, 0.6, 0.0) == 0.0);

  // Read noise free sensor is purely shot-noise limited: snr = sqrt(e).
  REQUIRE(photon::CalculateSnr(400.0, 1.0, 0.0) == Approx(20.0));
}

TEST_CASE("Element-wise conversion matches the scalar form", "[photon][conversion]") {
  const std::vector<double> signal = {100.0, 1000.0, 50.0};
  const std::vector<double> photons = photon::AduToPhotons(signal, 100.0, 0.35, 0.6182);
  REQUIRE(photons.size() == 3U);
  REQUIRE(photons[0] == 0.0);
  REQUIRE(photons[1] == Approx(photon::AduToPhotons(1000.0, 100.0)));
  REQUIRE(photons[2] == 0.0);

  const std::vector<double> snr = photon::CalculateSnr(photons, 0.6182, 3.71);
  REQUIRE(snr.size() == 3U);
  REQUIRE(snr[1] == Approx(photon::CalculateSnr(photons[1])));
}

TEST_CASE("Per-pixel dark frame subtraction requires matching lengths", "[photon][conversion]") {
  const std::vector<double> signal = {200.0, 300.0};
  const std::vector<double> dark = {100.0, 350.0};
  std::vector<double> photons;
  std::string error;

  REQUIRE(photon::AduToPhotons(signal, dark, 1.0, 1.0, photons, error));
  REQUIRE(photons == std::vector<double>{100.0, 0.0});

  const std::vector<double> short_dark = {100.0};
  REQUIRE_FALSE(photon::AduToPhotons(signal, short_dark, 1.0, 1.0, photons, error));
  REQUIRE(error.find("dark frame has 1 values") != std::string::npos);
  REQUIRE(photons.empty());
}

TEST_CASE("Sensor calibration rejects meaningless constants", "[photon][calibration]") {
  std::string error;
  photon::SensorCalibration calibration;
  REQUIRE(photon::ValidateSensorCalibration(calibration, error));

  calibration.system_gain_e_per_adu = 0.0;
  REQUIRE_FALSE(photon::ValidateSensorCalibration(calibration, error));
  REQUIRE(error.find("system gain") != std::string::npos);

  calibration = photon::SensorCalibration{};
  calibration.quantum_efficiency = 1.2;
  REQUIRE_FALSE(photon::ValidateSensorCalibration(calibration, error));

  calibration = photon::SensorCalibration{};
  calibration.read_noise_e = -1.0;
  REQUIRE_FALSE(photon::ValidateSensorCalibration(calibration, error));
}

TEST_CASE("QE lookup flags wavelengths far from the measured point", "[photon][calibration]") {
  const photon::SensorCalibration calibration;

  const photon::QuantumEfficiencyLookup at_reference =
      photon::QuantumEfficiencyAt(525.0, calibration);
  REQUIRE(at_reference.quantum_efficiency == Approx(0.6182));
  REQUIRE_FALSE(at_reference.approximate);

  REQUIRE_FALSE(photon::QuantumEfficiencyAt(550.0, calibration).approximate);

  const photon::QuantumEfficiencyLookup infrared = photon::QuantumEfficiencyAt(850.0, calibration);
  REQUIRE(infrared.quantum_efficiency == Approx(0.6182));
  REQUIRE(infrared.approximate);
}
