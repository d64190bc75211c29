#pragma once

#include "backends/backend_factory.hpp"
#include "core/logging/logger.hpp"
#include "frames/roi.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace photoncount::cli {

// `photoncount monitor` options. Every override is optional so values from
// `--config` survive unless a flag names them explicitly.
struct MonitorOptions {
  std::optional<std::filesystem::path> config_path;
  std::optional<backends::BackendKind> backend;
  std::optional<std::uint32_t> camera_index;
  std::optional<double> exposure_us;
  std::optional<frames::RoiSize> roi;
  std::optional<std::uint32_t> baseline_frames;
  std::optional<std::size_t> plot_history;
  std::optional<std::uint64_t> max_frames;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<std::filesystem::path> output_dir;
  bool display = true;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  // Live plot target; stdout when unset.
  std::ostream* display_out = nullptr;
};

// Runs one monitor session through the same pipeline as `photoncount monitor`.
// Exposed so tests can drive sessions in-process.
int ExecuteMonitor(const MonitorOptions& options);

// Routes `photoncount` subcommands and returns process exit codes with a
// stable contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => invalid configuration
//   20 => camera connect failed
//   21 => no camera detected
//   30 => acquisition failed
int Dispatch(int argc, char** argv);

} // namespace photoncount::cli
