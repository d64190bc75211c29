#include "config/monitor_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

namespace config = photoncount::config;

namespace {

bool HasIssueAt(const config::ValidationReport& report, const std::string& path) {
  for (const auto& issue : report.issues) {
    if (issue.path == path) {
      return true;
    }
  }
  return false;
}

} // namespace

TEST_CASE("Default config reproduces the bench setup", "[config]") {
  const config::MonitorConfig defaults;
  REQUIRE(defaults.backend == photoncount::backends::BackendKind::kSim);
  REQUIRE(defaults.exposure_us == 5'000.0);
  REQUIRE(defaults.roi.width == 200U);
  REQUIRE(defaults.roi.height == 200U);
  REQUIRE(defaults.baseline_frames == 50U);
  REQUIRE(defaults.plot_history == 500U);
  REQUIRE(defaults.timeout == std::chrono::milliseconds(1000));
  REQUIRE(defaults.max_frames == 0U);

  std::string error;
  REQUIRE(config::ValidateMonitorConfig(defaults, error));
}

TEST_CASE("Config JSON populates every section", "[config]") {
  config::MonitorConfig parsed;
  config::ValidationReport report;
  config::ApplyConfigJson(R"({
    "backend": "sim",
    "camera_index": 2,
    "exposure_us": 10000,
    "roi": "100x80",
    "baseline_frames": 20,
    "plot_history": 250,
    "timeout_ms": 500,
    "max_frames": 300,
    "log_every_n_frames": 25,
    "calibration": {"system_gain": 0.4, "quantum_efficiency": 0.5, "wavelength_nm": 600},
    "sim": {"width": 320, "height": 240, "pixel_format": "mono8", "seed": 9,
            "timeout_percent": 5}
  })",
                          parsed, report);

  REQUIRE(report.valid);
  REQUIRE(report.issues.empty());
  REQUIRE(parsed.camera_index == 2U);
  REQUIRE(parsed.exposure_us == 10'000.0);
  REQUIRE(parsed.roi.width == 100U);
  REQUIRE(parsed.roi.height == 80U);
  REQUIRE(parsed.baseline_frames == 20U);
  REQUIRE(parsed.plot_history == 250U);
  REQUIRE(parsed.timeout == std::chrono::milliseconds(500));
  REQUIRE(parsed.max_frames == 300U);
  REQUIRE(parsed.log_every_n_frames == 25U);
  REQUIRE(parsed.calibration.system_gain_e_per_adu == 0.4);
  REQUIRE(parsed.calibration.quantum_efficiency == 0.5);
  REQUIRE(parsed.wavelength_nm == 600.0);
  REQUIRE(parsed.sim.width == 320U);
  REQUIRE(parsed.sim.pixel_format == photoncount::frames::PixelFormat::kMono8);
  REQUIRE(parsed.sim.seed == 9U);
  REQUIRE(parsed.sim.timeout_percent == 5U);
}

TEST_CASE("ROI accepts object form", "[config]") {
  config::MonitorConfig parsed;
  config::ValidationReport report;
  config::ApplyConfigJson(R"({"roi": {"width": 64, "height": 32}})", parsed, report);
  REQUIRE(report.valid);
  REQUIRE(parsed.roi.width == 64U);
  REQUIRE(parsed.roi.height == 32U);
}

TEST_CASE("Invalid fields become path-addressed issues", "[config]") {
  config::MonitorConfig parsed;
  config::ValidationReport report;
  config::ApplyConfigJson(R"({
    "backend": "gige",
    "exposure_us": 1,
    "baseline_frames": 0,
    "roi": "wide",
    "colour": "blue",
    "calibration": {"quantum_efficiency": 1.5},
    "sim": {"pixel_format": "rgb8", "incomplete_percent": 150}
  })",
                          parsed, report);

  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssueAt(report, "backend"));
  REQUIRE(HasIssueAt(report, "exposure_us"));
  REQUIRE(HasIssueAt(report, "baseline_frames"));
  REQUIRE(HasIssueAt(report, "roi"));
  REQUIRE(HasIssueAt(report, "colour"));
  REQUIRE(HasIssueAt(report, "calibration.quantum_efficiency"));
  REQUIRE(HasIssueAt(report, "sim.pixel_format"));
  REQUIRE(HasIssueAt(report, "sim.incomplete_percent"));

  // Rejected fields keep their previous values.
  REQUIRE(parsed.exposure_us == 5'000.0);
  REQUIRE(parsed.baseline_frames == 50U);
  REQUIRE(parsed.calibration.quantum_efficiency == photoncount::photon::kDefaultQuantumEfficiency);
}

TEST_CASE("Integers beyond the uint64 range are rejected", "[config]") {
  config::MonitorConfig parsed;
  config::ValidationReport report;
  config::ApplyConfigJson(R"({"max_frames": 18446744073709551616})", parsed, report);
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssueAt(report, "max_frames"));
  REQUIRE(parsed.max_frames == 0U);

  config::ValidationReport huge_report;
  config::ApplyConfigJson(R"({"max_frames": 1e30, "sim": {"seed": 3.5e19}})", parsed, huge_report);
  REQUIRE(HasIssueAt(huge_report, "max_frames"));
  REQUIRE(HasIssueAt(huge_report, "sim.seed"));
  REQUIRE(parsed.max_frames == 0U);
}

TEST_CASE("Type mismatches name the JSON type that was found", "[config]") {
  config::MonitorConfig parsed;
  config::ValidationReport report;
  config::ApplyConfigJson(R"({"exposure_us": "fast", "sim": [1, 2]})", parsed, report);

  REQUIRE_FALSE(report.valid);
  REQUIRE(report.issues.size() == 2U);
  bool saw_number = false;
  bool saw_object = false;
  for (const auto& issue : report.issues) {
    if (issue.path == "exposure_us") {
      saw_number = issue.message == "must be a number, got string";
    }
    if (issue.path == "sim") {
      saw_object = issue.message == "must be an object, got array";
    }
  }
  REQUIRE(saw_number);
  REQUIRE(saw_object);
}

TEST_CASE("Malformed JSON is reported at the document root", "[config]") {
  config::ValidationReport report;
  REQUIRE_FALSE(config::ValidateConfigText("{\"exposure_us\": ", report));
  REQUIRE(report.issues.size() == 1U);
  REQUIRE(report.issues.front().path == "$");
  REQUIRE(report.issues.front().message.find("photoncount validate") != std::string::npos);

  REQUIRE_FALSE(config::ValidateConfigText("[1, 2]", report));
  REQUIRE(HasIssueAt(report, "$"));
}

TEST_CASE("Merged config range checks", "[config]") {
  std::string error;
  config::MonitorConfig merged;

  merged.exposure_us = 2.0;
  REQUIRE_FALSE(config::ValidateMonitorConfig(merged, error));
  REQUIRE(error.find("exposure_us") != std::string::npos);

  merged = config::MonitorConfig{};
  merged.plot_history = 0;
  REQUIRE_FALSE(config::ValidateMonitorConfig(merged, error));
  REQUIRE(error.find("plot_history") != std::string::npos);

  merged = config::MonitorConfig{};
  merged.timeout = std::chrono::milliseconds(0);
  REQUIRE_FALSE(config::ValidateMonitorConfig(merged, error));

  merged = config::MonitorConfig{};
  merged.sim.timeout_percent = 101;
  REQUIRE_FALSE(config::ValidateMonitorConfig(merged, error));
  REQUIRE(error.find("timeout_percent") != std::string::npos);

  // Sim knobs are irrelevant to the hardware backend.
  merged.backend = photoncount::backends::BackendKind::kSpinnaker;
  REQUIRE(config::ValidateMonitorConfig(merged, error));
}

TEST_CASE("Backend options carry the session calibration into the sim", "[config]") {
  config::MonitorConfig merged;
  merged.calibration.system_gain_e_per_adu = 0.5;
  merged.camera_index = 3;

  const photoncount::backends::BackendOptions options = config::ToBackendOptions(merged);
  REQUIRE(options.kind == photoncount::backends::BackendKind::kSim);
  REQUIRE(options.camera_index == 3U);
  REQUIRE(options.sim.calibration.system_gain_e_per_adu == 0.5);
}
