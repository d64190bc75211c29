#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "backends/backend_factory.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

int main() {
  using photoncount::tests::common::AssertContains;
  using photoncount::tests::common::AssertNotContains;
  using photoncount::tests::common::DispatchWithCapturedStreams;
  using photoncount::tests::common::Fail;
  using photoncount::tests::common::ReadFileToString;
  using photoncount::tests::common::ResolveSingleSessionDir;

  // The factory hands the requested index to the sim, which only has device 0.
  photoncount::backends::BackendOptions options;
  options.kind = photoncount::backends::BackendKind::kSim;
  options.camera_index = 1;
  std::unique_ptr<photoncount::backends::ICameraBackend> backend =
      photoncount::backends::CreateBackend(options);
  std::string error;
  if (backend->Connect(error)) {
    Fail("sim connect at index 1 should fail");
  }
  AssertContains(error, "camera index 1 is out of range for 1 detected camera(s)");
  if (backend->DumpConfig().at("camera_index") != "1") {
    Fail("dump_config should report the requested camera index");
  }

  std::string out_text;
  std::string err_text;
  int exit_code = DispatchWithCapturedStreams(
      {"photoncount", "grab", "--backend", "sim", "--camera-index", "7"}, out_text, err_text);
  if (exit_code != 21) {
    Fail("grab at a missing sim index should exit with the no-camera code");
  }
  AssertContains(err_text, "CAM_NOT_FOUND");
  AssertContains(err_text, "camera index 7 is out of range");
  AssertNotContains(out_text, "frame:");

  exit_code = DispatchWithCapturedStreams(
      {"photoncount", "grab", "--backend", "sim", "--camera-index", "0"}, out_text, err_text);
  if (exit_code != 0) {
    Fail("grab at sim index 0 should succeed: " + err_text);
  }
  AssertContains(out_text, "camera: BFS-U3-04S2M-C (sim) serial=SIM0001");

  const fs::path temp_root = photoncount::tests::common::CreateUniqueTempDir("photoncount-index");
  const fs::path monitor_out = temp_root / "monitor";
  exit_code = DispatchWithCapturedStreams(
      {"photoncount", "monitor", "--backend", "sim", "--camera-index", "3", "--frames", "5",
       "--no-display", "--out", monitor_out.string()},
      out_text, err_text);
  if (exit_code != 21) {
    Fail("monitor at a missing sim index should exit with the no-camera code");
  }
  AssertContains(err_text, "CAM_NOT_FOUND");
  AssertContains(out_text, "stop_reason: connect_failed");
  AssertContains(out_text, "frames_total: 0");

  const fs::path session_dir = ResolveSingleSessionDir(monitor_out);
  const std::string session_json = ReadFileToString(session_dir / "session.json");
  AssertContains(session_json, "\"stop_reason\": \"connect_failed\"");

  photoncount::tests::common::RemovePathBestEffort(temp_root);
  std::cout << "sim_camera_index_smoke: ok\n";
  return 0;
}
