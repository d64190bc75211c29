#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int main() {
  using photoncount::tests::common::AssertContains;
  using photoncount::tests::common::AssertNotContains;
  using photoncount::tests::common::DispatchWithCapturedStreams;
  using photoncount::tests::common::Fail;
  using photoncount::tests::common::WriteFixtureFile;

  const fs::path temp_root = photoncount::tests::common::CreateUniqueTempDir("photoncount-validate");
  const fs::path invalid_path = temp_root / "invalid.json";
  const fs::path valid_path = temp_root / "valid.json";

  WriteFixtureFile(invalid_path, "{\n"
                                 "  \"backend\": \"usb\",\n"
                                 "  \"exposure_us\": 1,\n"
                                 "  \"roi\": \"64x\",\n"
                                 "  \"calibration\": {\"quantum_efficiency\": 1.5},\n"
                                 "  \"sim\": {\"timeout_percent\": 150},\n"
                                 "  \"colour\": true\n"
                                 "}\n");
  WriteFixtureFile(valid_path, "{\n"
                               "  \"backend\": \"sim\",\n"
                               "  \"exposure_us\": 10000,\n"
                               "  \"roi\": {\"width\": 64, \"height\": 64},\n"
                               "  \"baseline_frames\": 20,\n"
                               "  \"sim\": {\"width\": 160, \"height\": 120}\n"
                               "}\n");

  std::string out_text;
  std::string err_text;
  int exit_code =
      DispatchWithCapturedStreams({"photoncount", "validate", invalid_path.string()}, out_text,
                                  err_text);
  if (exit_code != 10) {
    Fail("validate should exit with the config-invalid code for a broken config");
  }
  AssertContains(err_text, "invalid config:");
  AssertContains(err_text, "  - backend:");
  AssertContains(err_text, "  - exposure_us:");
  AssertContains(err_text, "  - roi:");
  AssertContains(err_text, "calibration.quantum_efficiency");
  AssertContains(err_text, "sim.timeout_percent");
  AssertContains(err_text, "colour");
  AssertNotContains(out_text, "valid:");

  exit_code = DispatchWithCapturedStreams({"photoncount", "validate", valid_path.string()},
                                          out_text, err_text);
  if (exit_code != 0) {
    Fail("validate should accept a well-formed config");
  }
  AssertContains(out_text, "valid: " + valid_path.string());

  exit_code = DispatchWithCapturedStreams(
      {"photoncount", "validate", (temp_root / "missing.json").string()}, out_text, err_text);
  if (exit_code != 1) {
    Fail("validate should fail for a missing config file");
  }
  AssertContains(err_text, "config file not found");

  exit_code = DispatchWithCapturedStreams({"photoncount", "validate"}, out_text, err_text);
  if (exit_code != 2) {
    Fail("validate without a path should be a usage error");
  }

  // monitor shares the loader and refuses to start on the same file.
  exit_code = DispatchWithCapturedStreams(
      {"photoncount", "monitor", "--config", invalid_path.string(), "--no-display"}, out_text,
      err_text);
  if (exit_code != 10) {
    Fail("monitor should refuse an invalid config file");
  }
  AssertContains(err_text, "invalid config:");

  photoncount::tests::common::RemovePathBestEffort(temp_root);
  std::cout << "validate_actionable_smoke: ok\n";
  return 0;
}
