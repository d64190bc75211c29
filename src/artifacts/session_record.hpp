#pragma once

#include "acquisition/acquisition_state.hpp"
#include "backends/camera_backend.hpp"
#include "config/monitor_config.hpp"
#include "monitor/photon_history.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace photoncount::artifacts {

// One measured frame as persisted in `photon_series.csv`.
struct PhotonSeriesRow {
  std::uint64_t frame = 0;
  double mean_adu = 0.0;
  double photons_per_px = 0.0;
  double electrons_per_px = 0.0;
  double snr = 0.0;
};

struct SessionCounters {
  std::uint64_t frames_total = 0;
  std::uint64_t frames_calibrating = 0;
  std::uint64_t frames_measured = 0;
  std::uint64_t frames_failed = 0;
  std::uint64_t frames_timeout = 0;
  std::uint64_t frames_incomplete = 0;
};

// Everything the session artifacts describe. Filled by the monitor command as
// the session runs and handed to the writers once at shutdown.
struct SessionRecord {
  std::string session_id;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
  std::string stop_reason;

  config::MonitorConfig config;
  // QE actually applied (looked up at `config.wavelength_nm`).
  double applied_quantum_efficiency = 0.0;
  bool quantum_efficiency_approximate = false;

  backends::DeviceInfo device;
  backends::BackendConfig backend_params;

  SessionCounters counters;
  std::optional<acquisition::DarkCalibrationSummary> calibration;
  monitor::RunningStats photon_stats;
  monitor::RunningStats snr_stats;
};

} // namespace photoncount::artifacts
