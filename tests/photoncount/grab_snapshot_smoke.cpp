#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "backends/spinnaker/build_status.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int main() {
  using photoncount::tests::common::AssertContains;
  using photoncount::tests::common::DispatchWithCapturedStreams;
  using photoncount::tests::common::Fail;

  const fs::path temp_root = photoncount::tests::common::CreateUniqueTempDir("photoncount-grab");
  const fs::path snapshot = temp_root / "dark.pgm";

  std::string out_text;
  std::string err_text;
  int exit_code = DispatchWithCapturedStreams(
      {"photoncount", "grab", "--exposure-us", "10000", "--out", snapshot.string()}, out_text,
      err_text);
  if (exit_code != 0) {
    Fail("sim grab should succeed");
  }
  AssertContains(out_text, "camera: BFS-U3-04S2M-C (sim) serial=SIM0001");
  AssertContains(out_text, "frame: 720x540 mono16 id=0");
  AssertContains(out_text, "snapshot: " + snapshot.string());

  // Frame 0 precedes the sim signal onset, so the mean sits on the dark level.
  const std::size_t mean_pos = out_text.find("mean_adu: ");
  if (mean_pos == std::string::npos) {
    Fail("grab output is missing mean_adu");
  }
  const double mean_adu = std::strtod(out_text.c_str() + mean_pos + 10, nullptr);
  photoncount::tests::common::AssertNear(mean_adu, 100.0, 1.0, "dark frame mean");

  const std::string pgm = photoncount::tests::common::ReadFileToString(snapshot);
  const std::string header = "P5\n720 540\n65535\n";
  if (pgm.rfind(header, 0) != 0U) {
    Fail("snapshot should be a 16-bit binary PGM");
  }
  if (pgm.size() != header.size() + 720U * 540U * 2U) {
    Fail("snapshot payload should hold two bytes per pixel");
  }

  exit_code = DispatchWithCapturedStreams({"photoncount", "grab", "--exposure-us", "1"}, out_text,
                                          err_text);
  if (exit_code != 10) {
    Fail("out-of-range exposure should be rejected as invalid configuration");
  }

  exit_code = DispatchWithCapturedStreams({"photoncount", "grab", "--gain", "2"}, out_text,
                                          err_text);
  if (exit_code != 2) {
    Fail("unknown grab option should be a usage error");
  }

  if (!photoncount::backends::spinnaker::IsSpinnakerEnabledAtBuild()) {
    exit_code = DispatchWithCapturedStreams({"photoncount", "grab", "--backend", "spinnaker"},
                                            out_text, err_text);
    if (exit_code != 20) {
      Fail("spinnaker grab without the SDK should exit with the connect-failed code");
    }
    AssertContains(err_text, "CAM_SDK_UNAVAILABLE");
  }

  photoncount::tests::common::RemovePathBestEffort(temp_root);
  std::cout << "grab_snapshot_smoke: ok\n";
  return 0;
}
