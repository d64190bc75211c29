#include "monitor/monitor_session.hpp"

#include "acquisition/frame_processor.hpp"
#include "artifacts/calibration_writer.hpp"
#include "artifacts/html_report_writer.hpp"
#include "artifacts/series_csv_writer.hpp"
#include "artifacts/session_writer.hpp"
#include "backends/backend_factory.hpp"
#include "backends/spinnaker/error_mapper.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "frames/roi.hpp"
#include "monitor/interrupt.hpp"
#include "photon/conversion.hpp"

#include <utility>

namespace photoncount::monitor {

namespace {

using core::errors::ExitCode;

constexpr std::string_view kStopReasonCompleted = "completed";
constexpr std::string_view kStopReasonMaxFrames = "max_frames";
constexpr std::string_view kStopReasonInterrupted = "interrupted";

} // namespace

MonitorSession::MonitorSession(MonitorSessionOptions options,
                               std::unique_ptr<backends::ICameraBackend> backend,
                               core::logging::Logger& logger)
    : options_(std::move(options)), backend_(std::move(backend)), logger_(logger),
      history_(options_.config.plot_history),
      plot_(PlotHeader{"", options_.config.roi, options_.config.exposure_us}) {
  record_.config = options_.config;
}

MonitorSession::~MonitorSession() {
  std::string error;
  if (!Finish(error)) {
    logger_.Error("session teardown failed", {{"error", error}});
  }
}

ExitCode MonitorSession::Fail(const ExitCode code, std::string stop_reason) {
  record_.stop_reason = std::move(stop_reason);
  std::string finish_error;
  if (!Finish(finish_error)) {
    logger_.Error("session teardown failed", {{"error", finish_error}});
  }
  return code;
}

ExitCode MonitorSession::FailCamera(std::string_view operation, const std::string& raw_error,
                                    const ExitCode code, std::string stop_reason) {
  const backends::spinnaker::CameraErrorMapping mapping =
      backends::spinnaker::MapCameraError(operation, raw_error);
  error_ = backends::spinnaker::FormatCameraError(operation, raw_error);
  logger_.Error("camera operation failed",
                {{"operation", operation},
                 {"code", backends::spinnaker::ToStableErrorCode(mapping.code)},
                 {"error", raw_error}});
  return Fail(code, std::move(stop_reason));
}

void MonitorSession::EmitOrWarn(const bool emitted, std::string_view event_name,
                                const std::string& error) {
  if (!emitted) {
    logger_.Warn("failed to append session event", {{"event", event_name}, {"error", error}});
  }
}

ExitCode MonitorSession::Run() {
  const config::MonitorConfig& config = options_.config;
  const auto now = std::chrono::system_clock::now();
  record_.session_id = core::MakeSessionId(now);
  record_.started_at = now;
  logger_.SetSessionId(record_.session_id);

  const photon::QuantumEfficiencyLookup qe =
      photon::QuantumEfficiencyAt(config.wavelength_nm, config.calibration);
  record_.applied_quantum_efficiency = qe.quantum_efficiency;
  record_.quantum_efficiency_approximate = qe.approximate;
  if (qe.approximate) {
    logger_.Warn("quantum efficiency is only measured at the reference wavelength",
                 {{"wavelength_nm", core::FormatJsonNumber(config.wavelength_nm, 1)},
                  {"reference_nm",
                   core::FormatJsonNumber(config.calibration.reference_wavelength_nm, 1)},
                  {"qe", core::FormatJsonNumber(qe.quantum_efficiency, 4)}});
  }

  photon::SensorCalibration effective = config.calibration;
  effective.quantum_efficiency = qe.quantum_efficiency;
  std::string error;
  if (!acquisition::CreateAcquisitionState(config.baseline_frames, effective, state_, error)) {
    error_ = error;
    logger_.Error("invalid acquisition settings", {{"error", error}});
    return Fail(ExitCode::kConfigInvalid, "invalid_config");
  }

  if (options_.output_root.has_value()) {
    bundle_dir_ = options_.output_root.value() / record_.session_id;
    if (!core::EnsureDirectory(bundle_dir_, error)) {
      error_ = error;
      logger_.Error("failed to create session output directory", {{"error", error}});
      bundle_dir_.clear();
      return Fail(ExitCode::kFailure, "output_dir_failed");
    }
    emitter_.emplace(bundle_dir_, record_.session_id);
  }

  const std::string roi_text = frames::FormatRoiSize(config.roi);
  logger_.Info("session started",
               {{"backend", backends::ToString(config.backend)},
                {"exposure_us", core::FormatJsonNumber(config.exposure_us, 1)},
                {"roi", roi_text},
                {"baseline_frames", std::to_string(config.baseline_frames)},
                {"output_dir", bundle_dir_.string()}});
  if (emitter_.has_value()) {
    EmitOrWarn(emitter_->EmitSessionStarted(
                   {
                       .ts = now,
                       .backend = std::string(backends::ToString(config.backend)),
                       .exposure_us = config.exposure_us,
                       .roi = roi_text,
                       .baseline_frames = config.baseline_frames,
                       .max_frames = config.max_frames,
                   },
                   error),
               "SESSION_STARTED", error);
  }

  if (!backend_->Connect(error)) {
    const backends::spinnaker::CameraErrorMapping mapping =
        backends::spinnaker::MapCameraError("connect", error);
    const ExitCode code = mapping.code == backends::spinnaker::CameraErrorCode::kNotFound
                              ? ExitCode::kNoCameraDetected
                              : ExitCode::kCameraConnectFailed;
    return FailCamera("connect", error, code, "connect_failed");
  }
  connected_ = true;
  record_.device = backend_->Info();
  plot_ = ConsolePlot(PlotHeader{record_.device.model, config.roi, config.exposure_us});
  logger_.Info("camera connected", {{"model", record_.device.model},
                                    {"serial", record_.device.serial},
                                    {"vendor", record_.device.vendor}});
  if (emitter_.has_value()) {
    EmitOrWarn(emitter_->EmitCameraConnected(
                   {
                       .ts = std::chrono::system_clock::now(),
                       .model = record_.device.model,
                       .serial = record_.device.serial,
                       .vendor = record_.device.vendor,
                   },
                   error),
               "CAMERA_CONNECTED", error);
  }

  if (!backend_->ConfigureExposure(config.exposure_us, error)) {
    return FailCamera("configure_exposure", error, ExitCode::kCameraConnectFailed,
                      "configure_failed");
  }
  logger_.Debug("exposure configured",
                {{"exposure_us", core::FormatJsonNumber(config.exposure_us, 1)}});
  if (emitter_.has_value()) {
    EmitOrWarn(emitter_->EmitRaw(events::EventType::kExposureConfigured,
                                 std::chrono::system_clock::now(),
                                 {{"exposure_us", core::FormatJsonNumber(config.exposure_us, 1)}},
                                 error),
               "EXPOSURE_CONFIGURED", error);
  }

  if (!backend_->Start(error)) {
    return FailCamera("start_acquisition", error, ExitCode::kAcquisitionFailed, "start_failed");
  }
  acquiring_ = true;
  if (emitter_.has_value()) {
    EmitOrWarn(emitter_->EmitRaw(events::EventType::kAcquisitionStarted,
                                 std::chrono::system_clock::now(), {}, error),
               "ACQUISITION_STARTED", error);
  }
  logger_.Info("acquiring dark baseline",
               {{"baseline_frames", std::to_string(config.baseline_frames)}});

  {
    ScopedInterruptHandlers interrupt_handlers;
    ProcessLoop();
  }

  const artifacts::SessionCounters& counters = record_.counters;
  const bool all_failed = counters.frames_total > 0U &&
                          counters.frames_failed == counters.frames_total;

  if (!Finish(error)) {
    error_ = error;
    logger_.Error("failed to write session artifacts", {{"error", error}});
    return ExitCode::kFailure;
  }
  if (all_failed) {
    error_ = "every frame of the session failed to acquire";
    return ExitCode::kAcquisitionFailed;
  }
  return ExitCode::kSuccess;
}

void MonitorSession::ProcessLoop() {
  const config::MonitorConfig& config = options_.config;
  acquisition::FrameProcessor processor(*backend_, config.roi, config.timeout,
                                        config.log_every_n_frames, logger_);
  artifacts::SessionCounters& counters = record_.counters;
  std::string error;

  Redraw(true);
  while (true) {
    if (InterruptRequested()) {
      record_.stop_reason = std::string(kStopReasonInterrupted);
      logger_.Info("interrupt received, shutting down gracefully",
                   {{"frame", std::to_string(state_.frame_idx)}});
      break;
    }
    if (config.max_frames > 0U && counters.frames_total >= config.max_frames) {
      record_.stop_reason = std::string(kStopReasonMaxFrames);
      break;
    }

    const acquisition::FrameResult result = processor.ProcessFrame(state_);
    ++counters.frames_total;

    switch (result.status) {
    case acquisition::FrameStatus::kFailed:
      ++counters.frames_failed;
      if (result.outcome == frames::FrameOutcome::kTimeout) {
        ++counters.frames_timeout;
      } else if (result.outcome == frames::FrameOutcome::kIncomplete) {
        ++counters.frames_incomplete;
      }
      if (emitter_.has_value()) {
        EmitOrWarn(emitter_->EmitFrameFailed(
                       {
                           .ts = std::chrono::system_clock::now(),
                           .frame_idx = result.frame_idx,
                           .outcome = std::string(frames::ToString(result.outcome)),
                           .error = result.error,
                       },
                       error),
                   "FRAME_FAILED", error);
      }
      break;
    case acquisition::FrameStatus::kCalibrating:
      ++counters.frames_calibrating;
      if (result.calibration.has_value()) {
        record_.calibration = result.calibration;
        if (emitter_.has_value()) {
          EmitOrWarn(emitter_->EmitCalibrationComplete(
                         {
                             .ts = std::chrono::system_clock::now(),
                             .frame_idx = result.frame_idx,
                             .mean_dark_adu = result.calibration->mean_dark_adu,
                             .dark_std_adu = result.calibration->dark_std_adu,
                             .dark_std_e = result.calibration->dark_std_e,
                             .sample_count = result.calibration->sample_count,
                         },
                         error),
                     "CALIBRATION_COMPLETE", error);
        }
        Redraw(true);
      }
      break;
    case acquisition::FrameStatus::kMeasured: {
      ++counters.frames_measured;
      const double photons = result.photons.value_or(0.0);
      artifacts::PhotonSeriesRow row;
      row.frame = result.frame_idx;
      row.mean_adu = result.mean_adu;
      row.photons_per_px = photons;
      row.electrons_per_px = photon::AduToElectrons(result.mean_adu, state_.mean_dark, state_.gain);
      row.snr = photon::CalculateSnr(photons, state_.qe, config.calibration.read_noise_e);
      series_.push_back(row);
      history_.Add(row.frame, photons);
      record_.photon_stats.Add(photons);
      record_.snr_stats.Add(row.snr);
      break;
    }
    }

    Redraw(false);
  }
  Redraw(true);
}

void MonitorSession::Redraw(const bool force) {
  if (!options_.display || options_.display_out == nullptr) {
    return;
  }
  const auto now = std::chrono::steady_clock::now();
  if (!force && now - last_draw_ < options_.display_interval) {
    return;
  }
  last_draw_ = now;

  const std::string screen =
      state_.is_calibrated
          ? plot_.Render(history_)
          : plot_.RenderCalibration(state_.baseline_values.size(), state_.baseline_frames);
  ConsolePlot::Show(screen, *options_.display_out);
}

bool MonitorSession::Finish(std::string& error) {
  if (finished_) {
    return true;
  }
  finished_ = true;
  ++cleanup_runs_;

  std::string step_error;
  if (acquiring_) {
    if (!backend_->Stop(step_error)) {
      logger_.Warn("acquisition stop failed", {{"error", step_error}});
    } else if (emitter_.has_value()) {
      EmitOrWarn(emitter_->EmitRaw(events::EventType::kAcquisitionStopped,
                                   std::chrono::system_clock::now(),
                                   {{"frames_total", std::to_string(record_.counters.frames_total)}},
                                   step_error),
                 "ACQUISITION_STOPPED", step_error);
    }
    acquiring_ = false;
  }
  if (connected_) {
    record_.backend_params = backend_->DumpConfig();
    step_error.clear();
    if (!backend_->Disconnect(step_error)) {
      logger_.Warn("camera disconnect failed", {{"error", step_error}});
    }
    connected_ = false;
  }

  record_.finished_at = std::chrono::system_clock::now();
  if (record_.stop_reason.empty()) {
    record_.stop_reason = std::string(kStopReasonCompleted);
  }

  const artifacts::SessionCounters& counters = record_.counters;
  logger_.Info("session stopped",
               {{"reason", record_.stop_reason},
                {"frames_total", std::to_string(counters.frames_total)},
                {"frames_measured", std::to_string(counters.frames_measured)},
                {"frames_failed", std::to_string(counters.frames_failed)}});

  if (emitter_.has_value()) {
    step_error.clear();
    EmitOrWarn(emitter_->EmitSessionStopped(
                   {
                       .ts = record_.finished_at,
                       .reason = record_.stop_reason,
                       .frames_total = counters.frames_total,
                       .frames_measured = counters.frames_measured,
                       .frames_failed = counters.frames_failed,
                   },
                   step_error),
               "SESSION_STOPPED", step_error);
  }

  if (bundle_dir_.empty()) {
    return true;
  }

  std::filesystem::path written_path;
  if (!artifacts::WritePhotonSeriesCsv(series_, bundle_dir_, written_path, error) ||
      !artifacts::WriteCalibrationJson(record_, bundle_dir_, written_path, error) ||
      !artifacts::WriteSessionJson(record_, bundle_dir_, written_path, error) ||
      !artifacts::WriteSessionReportHtml(record_, series_, bundle_dir_, written_path, error)) {
    return false;
  }
  logger_.Info("session artifacts written", {{"output_dir", bundle_dir_.string()}});
  return true;
}

} // namespace photoncount::monitor
