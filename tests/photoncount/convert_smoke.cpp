#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"

#include <iostream>
#include <string>

int main() {
  using photoncount::tests::common::AssertContains;
  using photoncount::tests::common::AssertNotContains;
  using photoncount::tests::common::DispatchWithCapturedStreams;
  using photoncount::tests::common::Fail;

  std::string out_text;
  std::string err_text;
  int exit_code = DispatchWithCapturedStreams(
      {"photoncount", "convert", "--adu", "1000", "--dark", "100"}, out_text, err_text);
  if (exit_code != 0) {
    Fail("convert with the default calibration should succeed");
  }
  AssertContains(out_text, "signal_adu: 1000.000");
  AssertContains(out_text, "dark_adu: 100.000");
  AssertContains(out_text, "gain_e_per_adu: 0.3500");
  AssertContains(out_text, "quantum_efficiency: 0.6182");
  AssertContains(out_text, "electrons_per_px: 315.000");
  AssertContains(out_text, "photons_per_px: 509.544");
  AssertContains(out_text, "snr: 17.37");
  AssertNotContains(err_text, "warning:");

  // Signal below the dark level clamps to zero instead of going negative.
  exit_code = DispatchWithCapturedStreams(
      {"photoncount", "convert", "--adu", "90", "--dark", "100"}, out_text, err_text);
  if (exit_code != 0) {
    Fail("convert below the dark level should succeed");
  }
  AssertContains(out_text, "photons_per_px: 0.000");

  exit_code = DispatchWithCapturedStreams(
      {"photoncount", "convert", "--adu", "1000", "--dark", "100", "--gain", "0.5", "--qe", "0.5"},
      out_text, err_text);
  if (exit_code != 0) {
    Fail("convert with explicit gain and QE should succeed");
  }
  AssertContains(out_text, "electrons_per_px: 450.000");
  AssertContains(out_text, "photons_per_px: 900.000");

  exit_code = DispatchWithCapturedStreams(
      {"photoncount", "convert", "--adu", "1000", "--wavelength", "850"}, out_text, err_text);
  if (exit_code != 0) {
    Fail("convert far from the reference wavelength should still succeed");
  }
  AssertContains(err_text, "warning: quantum efficiency is only measured at 525 nm");

  exit_code = DispatchWithCapturedStreams(
      {"photoncount", "convert", "--adu", "110", "--dark", "100"}, out_text, err_text);
  if (exit_code != 0) {
    Fail("low-signal convert should succeed");
  }
  AssertContains(err_text, "read-noise dominated");

  exit_code = DispatchWithCapturedStreams({"photoncount", "convert", "--dark", "100"}, out_text,
                                          err_text);
  if (exit_code != 2) {
    Fail("convert without --adu should be a usage error");
  }
  AssertContains(err_text, "convert requires --adu");

  exit_code = DispatchWithCapturedStreams(
      {"photoncount", "convert", "--adu", "1000", "--qe", "1.5"}, out_text, err_text);
  if (exit_code != 2) {
    Fail("out-of-range QE should be rejected");
  }

  exit_code = DispatchWithCapturedStreams(
      {"photoncount", "convert", "--adu", "1000", "--qe", "0.5", "--wavelength", "850"}, out_text,
      err_text);
  if (exit_code != 2) {
    Fail("--qe together with --wavelength should be a usage error");
  }
  AssertContains(err_text, "--qe and --wavelength cannot be combined");
  AssertNotContains(out_text, "photons_per_px");

  exit_code = DispatchWithCapturedStreams({"photoncount", "convert", "--adu", "lots"}, out_text,
                                          err_text);
  if (exit_code != 2) {
    Fail("non-numeric ADU should be rejected");
  }
  AssertContains(err_text, "expected a number");

  std::cout << "convert_smoke: ok\n";
  return 0;
}
