#include "../common/assertions.hpp"
#include "backends/sim/sim_camera_backend.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

using photoncount::backends::sim::SimCameraBackend;
using photoncount::backends::sim::SimSensorOptions;
using photoncount::frames::FrameOutcome;
using photoncount::tests::common::Fail;

struct GrabRecord {
  std::vector<FrameOutcome> outcomes;
  std::vector<std::uint16_t> first_pixels;
};

GrabRecord RunGrabs(const SimSensorOptions& options, int grabs) {
  SimCameraBackend backend(options);
  std::string error;
  if (!backend.Connect(error) || !backend.Start(error)) {
    Fail("sim start failed: " + error);
  }

  GrabRecord record;
  for (int i = 0; i < grabs; ++i) {
    photoncount::frames::ImageFrame frame;
    std::string grab_error;
    const FrameOutcome outcome =
        backend.GrabFrame(std::chrono::milliseconds(50), frame, grab_error);
    record.outcomes.push_back(outcome);
    if (outcome == FrameOutcome::kReceived) {
      record.first_pixels.push_back(frame.pixels.front());
    } else if (grab_error.empty()) {
      Fail("failed grab should explain itself");
    } else if (!frame.empty()) {
      Fail("failed grab should not write the frame");
    }
  }

  if (!backend.Stop(error) || !backend.Disconnect(error)) {
    Fail("sim teardown failed: " + error);
  }
  return record;
}

std::size_t CountOutcome(const GrabRecord& record, FrameOutcome wanted) {
  std::size_t count = 0;
  for (const FrameOutcome outcome : record.outcomes) {
    if (outcome == wanted) {
      ++count;
    }
  }
  return count;
}

} // namespace

int main() {
  SimSensorOptions options;
  options.width = 32;
  options.height = 16;
  options.seed = 1234;
  options.timeout_percent = 20;
  options.incomplete_percent = 10;

  constexpr int kGrabs = 200;
  const GrabRecord run_a = RunGrabs(options, kGrabs);
  const GrabRecord run_b = RunGrabs(options, kGrabs);

  if (run_a.outcomes != run_b.outcomes) {
    Fail("same-seed runs should produce the same fault pattern");
  }
  if (run_a.first_pixels != run_b.first_pixels) {
    Fail("same-seed runs should produce identical pixels");
  }

  const std::size_t timeouts = CountOutcome(run_a, FrameOutcome::kTimeout);
  const std::size_t incomplete = CountOutcome(run_a, FrameOutcome::kIncomplete);
  if (timeouts < 20U || timeouts > 60U) {
    Fail("timeout rate far from the configured percentage");
  }
  if (incomplete == 0U || incomplete > 40U) {
    Fail("incomplete rate far from the configured percentage");
  }

  SimSensorOptions different_seed = options;
  different_seed.seed = 9999;
  const GrabRecord run_c = RunGrabs(different_seed, kGrabs);
  if (run_c.outcomes == run_a.outcomes) {
    Fail("different seed should produce a different fault pattern");
  }

  SimSensorOptions always_timeout = options;
  always_timeout.timeout_percent = 100;
  if (CountOutcome(RunGrabs(always_timeout, 10), FrameOutcome::kTimeout) != 10U) {
    Fail("timeout_percent=100 should time out every grab");
  }

  SimSensorOptions clean = options;
  clean.timeout_percent = 0;
  clean.incomplete_percent = 0;
  if (CountOutcome(RunGrabs(clean, 10), FrameOutcome::kReceived) != 10U) {
    Fail("fault-free sim should deliver every frame");
  }

  std::cout << "sim_fault_injection_smoke: ok\n";
  return 0;
}
