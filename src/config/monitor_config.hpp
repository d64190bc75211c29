#pragma once

#include "backends/backend_factory.hpp"
#include "backends/sim/sim_camera_backend.hpp"
#include "frames/roi.hpp"
#include "photon/sensor_calibration.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace photoncount::config {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Everything one `monitor` session needs. Defaults reproduce the bench setup
// the tool was built for: centered 200x200 ROI, 5 ms exposure, 50 dark frames.
struct MonitorConfig {
  backends::BackendKind backend = backends::BackendKind::kSim;
  std::uint32_t camera_index = 0;
  double exposure_us = 5'000.0;
  frames::RoiSize roi;
  std::uint32_t baseline_frames = 50;
  std::size_t plot_history = 500;
  std::chrono::milliseconds timeout{1000};
  // 0 runs until interrupted.
  std::uint64_t max_frames = 0;
  std::uint32_t log_every_n_frames = 100;
  photon::SensorCalibration calibration;
  double wavelength_nm = photon::kDefaultReferenceWavelengthNm;
  backends::sim::SimSensorOptions sim;
};

// Populates `config` from a parsed JSON document. Every problem becomes an
// issue; fields with problems keep their previous value.
void ApplyConfigJson(std::string_view json_text, MonitorConfig& config,
                     ValidationReport& report);

// Contract:
// - Returns false only if file I/O fails and sets `error`.
// - Otherwise returns true; `report.valid` says whether `config` was fully
//   applied. Parse errors are reported under path `$`.
bool LoadConfigFile(const std::filesystem::path& config_path, MonitorConfig& config,
                    ValidationReport& report, std::string& error);

bool ValidateConfigText(std::string_view json_text, ValidationReport& report);

bool ValidateConfigFile(const std::filesystem::path& config_path, ValidationReport& report,
                        std::string& error);

// Range checks on the merged (file + CLI) configuration.
bool ValidateMonitorConfig(const MonitorConfig& config, std::string& error);

// Backend options derived from the config; the sim sensor shares the
// session's calibration constants.
backends::BackendOptions ToBackendOptions(const MonitorConfig& config);

} // namespace photoncount::config
