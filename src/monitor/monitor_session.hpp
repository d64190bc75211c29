#pragma once

#include "acquisition/acquisition_state.hpp"
#include "artifacts/session_record.hpp"
#include "backends/camera_backend.hpp"
#include "config/monitor_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "events/emitter.hpp"
#include "monitor/console_plot.hpp"
#include "monitor/photon_history.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace photoncount::monitor {

struct MonitorSessionOptions {
  config::MonitorConfig config;
  // Artifacts land in `<output_root>/<session_id>/` when set.
  std::optional<std::filesystem::path> output_root;
  bool display = true;
  std::ostream* display_out = nullptr;
  // Minimum time between two redraws of the live plot.
  std::chrono::milliseconds display_interval{100};
};

// One live photon monitoring session from connect to teardown.
//
// Lifecycle:
// - Run() connects, configures exposure, starts acquisition and processes
//   frames until `max_frames` is reached or an interrupt is requested.
// - Finish() stops acquisition, disconnects and writes artifacts. It runs
//   exactly once: Run() calls it on every return path and the destructor
//   covers early exits.
class MonitorSession {
public:
  MonitorSession(MonitorSessionOptions options, std::unique_ptr<backends::ICameraBackend> backend,
                 core::logging::Logger& logger);
  ~MonitorSession();

  MonitorSession(const MonitorSession&) = delete;
  MonitorSession& operator=(const MonitorSession&) = delete;

  core::errors::ExitCode Run();

  bool Finish(std::string& error);

  const artifacts::SessionRecord& record() const {
    return record_;
  }
  const PhotonHistory& history() const {
    return history_;
  }
  const std::vector<artifacts::PhotonSeriesRow>& series() const {
    return series_;
  }
  // Empty when no output root was given.
  const std::filesystem::path& bundle_dir() const {
    return bundle_dir_;
  }
  // Camera-side failure text, mapped to a stable code, when Run() failed.
  const std::string& error() const {
    return error_;
  }
  // Number of times teardown actually executed; stays at 1 however often
  // Finish() is called.
  std::size_t cleanup_runs() const {
    return cleanup_runs_;
  }

private:
  core::errors::ExitCode Fail(core::errors::ExitCode code, std::string stop_reason);
  core::errors::ExitCode FailCamera(std::string_view operation, const std::string& raw_error,
                                    core::errors::ExitCode code, std::string stop_reason);
  void EmitOrWarn(bool emitted, std::string_view event_name, const std::string& error);
  void ProcessLoop();
  void Redraw(bool force);

  MonitorSessionOptions options_;
  std::unique_ptr<backends::ICameraBackend> backend_;
  core::logging::Logger& logger_;

  artifacts::SessionRecord record_;
  acquisition::AcquisitionState state_;
  PhotonHistory history_;
  ConsolePlot plot_;
  std::vector<artifacts::PhotonSeriesRow> series_;
  std::optional<events::Emitter> emitter_;
  std::filesystem::path bundle_dir_;

  std::chrono::steady_clock::time_point last_draw_{};
  bool connected_ = false;
  bool acquiring_ = false;
  bool finished_ = false;
  std::size_t cleanup_runs_ = 0;
  std::string error_;
};

} // namespace photoncount::monitor
