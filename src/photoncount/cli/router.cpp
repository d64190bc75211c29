#include "photoncount/cli/router.hpp"

#include "acquisition/frame_processor.hpp"
#include "backends/spinnaker/build_status.hpp"
#include "backends/spinnaker/error_mapper.hpp"
#include "backends/spinnaker/gentl_env.hpp"
#include "backends/spinnaker/spinnaker_backend.hpp"
#include "config/monitor_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_utils.hpp"
#include "frames/pgm_writer.hpp"
#include "monitor/monitor_session.hpp"
#include "photon/conversion.hpp"
#include "photon/sensor_calibration.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace photoncount::cli {

namespace {

constexpr std::string_view kVersionText = "photoncount 0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitCameraConnectFailed =
    core::errors::ToInt(core::errors::ExitCode::kCameraConnectFailed);
constexpr int kExitNoCameraDetected =
    core::errors::ToInt(core::errors::ExitCode::kNoCameraDetected);
constexpr int kExitAcquisitionFailed =
    core::errors::ToInt(core::errors::ExitCode::kAcquisitionFailed);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  photoncount monitor [--config <file.json>] [--backend <sim|spinnaker>] "
         "[--camera-index <n>] [--exposure-us <us>] [--roi <WxH>] [--baseline-frames <n>] "
         "[--history <n>] [--frames <n>] [--timeout-ms <ms>] [--out <dir>] [--no-display] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  photoncount list-devices [--backend <sim|spinnaker>]\n"
      << "  photoncount grab [--backend <sim|spinnaker>] [--camera-index <n>] "
         "[--exposure-us <us>] [--timeout-ms <ms>] [--out <file.pgm>]\n"
      << "  photoncount convert --adu <value> [--dark <value>] [--gain <e-/ADU>] [--qe <0-1> | "
         "--wavelength <nm>] [--read-noise <e->]\n"
      << "  photoncount validate <config.json>\n"
      << "  photoncount version\n";
}

bool ParseUnsigned(std::string_view flag, std::string_view text, std::uint64_t max_value,
                   std::uint64_t& value, std::string& error) {
  std::uint64_t parsed = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (text.empty() || ec != std::errc() || ptr != end || parsed > max_value) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(text) +
            "' (expected a non-negative integer)";
    return false;
  }
  value = parsed;
  return true;
}

template <typename T>
bool ParseUnsignedAs(std::string_view flag, std::string_view text, T& value, std::string& error) {
  std::uint64_t parsed = 0;
  if (!ParseUnsigned(flag, text, std::numeric_limits<T>::max(), parsed, error)) {
    return false;
  }
  value = static_cast<T>(parsed);
  return true;
}

bool ParseDouble(std::string_view flag, std::string_view text, double& value, std::string& error) {
  const std::string value_text(text);
  char* parse_end = nullptr;
  const double parsed = std::strtod(value_text.c_str(), &parse_end);
  if (value_text.empty() || parse_end == nullptr || *parse_end != '\0' || !std::isfinite(parsed)) {
    error = "invalid value for " + std::string(flag) + ": '" + value_text +
            "' (expected a number)";
    return false;
  }
  value = parsed;
  return true;
}

// Shared `--flag <value>` fetch so every option reports a missing value the
// same way.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

bool ParseMonitorOptions(const std::vector<std::string_view>& args, MonitorOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--no-display") {
      options.display = false;
      continue;
    }

    std::string_view value;
    if (token == "--config") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }
    if (token == "--backend") {
      backends::BackendKind kind = backends::BackendKind::kSim;
      if (!TakeValue(args, i, value, error) || !backends::ParseBackendKind(value, kind, error)) {
        return false;
      }
      options.backend = kind;
      continue;
    }
    if (token == "--camera-index") {
      std::uint32_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsignedAs(token, value, parsed, error)) {
        return false;
      }
      options.camera_index = parsed;
      continue;
    }
    if (token == "--exposure-us") {
      double parsed = 0.0;
      if (!TakeValue(args, i, value, error) || !ParseDouble(token, value, parsed, error)) {
        return false;
      }
      options.exposure_us = parsed;
      continue;
    }
    if (token == "--roi") {
      frames::RoiSize parsed;
      if (!TakeValue(args, i, value, error) || !frames::ParseRoiSize(value, parsed, error)) {
        return false;
      }
      options.roi = parsed;
      continue;
    }
    if (token == "--baseline-frames") {
      std::uint32_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsignedAs(token, value, parsed, error)) {
        return false;
      }
      options.baseline_frames = parsed;
      continue;
    }
    if (token == "--history") {
      std::size_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsignedAs(token, value, parsed, error)) {
        return false;
      }
      options.plot_history = parsed;
      continue;
    }
    if (token == "--frames") {
      std::uint64_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsignedAs(token, value, parsed, error)) {
        return false;
      }
      options.max_frames = parsed;
      continue;
    }
    if (token == "--timeout-ms") {
      std::uint32_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsignedAs(token, value, parsed, error)) {
        return false;
      }
      options.timeout = std::chrono::milliseconds(parsed);
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!TakeValue(args, i, value, error) ||
          !core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "monitor does not accept positional arguments: " + std::string(token);
    return false;
  }
  return true;
}

// File values first, then explicit flags.
void ApplyOverrides(const MonitorOptions& options, config::MonitorConfig& config) {
  if (options.backend.has_value()) {
    config.backend = options.backend.value();
  }
  if (options.camera_index.has_value()) {
    config.camera_index = options.camera_index.value();
  }
  if (options.exposure_us.has_value()) {
    config.exposure_us = options.exposure_us.value();
  }
  if (options.roi.has_value()) {
    config.roi = options.roi.value();
  }
  if (options.baseline_frames.has_value()) {
    config.baseline_frames = options.baseline_frames.value();
  }
  if (options.plot_history.has_value()) {
    config.plot_history = options.plot_history.value();
  }
  if (options.max_frames.has_value()) {
    config.max_frames = options.max_frames.value();
  }
  if (options.timeout.has_value()) {
    config.timeout = options.timeout.value();
  }
}

void PrintValidationIssues(std::string_view label, const fs::path& path,
                           const config::ValidationReport& report) {
  std::cerr << label << ": " << path.string() << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

int ConnectFailureExitCode(const std::string& error) {
  const backends::spinnaker::CameraErrorMapping mapping =
      backends::spinnaker::MapCameraError("connect", error);
  return mapping.code == backends::spinnaker::CameraErrorCode::kNotFound
             ? kExitNoCameraDetected
             : kExitCameraConnectFailed;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersionText << '\n';
  std::cout << "spinnaker: " << backends::spinnaker::SpinnakerAvailabilityStatusText() << '\n';
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  std::error_code ec;
  if (!fs::is_regular_file(config_path, ec) || ec) {
    std::cerr << "error: config file not found: " << config_path.string() << '\n';
    return kExitFailure;
  }

  config::ValidationReport report;
  std::string error;
  if (!config::ValidateConfigFile(config_path, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (!report.valid) {
    PrintValidationIssues("invalid config", config_path, report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

int CommandListDevices(const std::vector<std::string_view>& args) {
  backends::BackendKind kind = backends::BackendKind::kSim;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view value;
    if (args[i] == "--backend") {
      if (!TakeValue(args, i, value, error) || !backends::ParseBackendKind(value, kind, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    std::cerr << "error: unknown option: " << args[i] << '\n';
    return kExitUsage;
  }

  const backends::spinnaker::GenTlProducerStatus gentl =
      backends::spinnaker::ProbeGenTlProducer();

  backends::DeviceListing listing;
  if (!backends::ListDevices(kind, listing, error)) {
    std::cerr << "error: " << backends::spinnaker::FormatCameraError("device_discovery", error)
              << '\n';
    std::cerr << "gentl: " << backends::spinnaker::DescribeGenTlProducer(gentl) << '\n';
    return kExitCameraConnectFailed;
  }

  std::cout << "backend: " << backends::ToString(kind) << '\n';
  std::cout << "status: " << backends::BackendAvailabilityText(kind) << '\n';
  std::cout << "sdk_version: " << listing.sdk_version << '\n';
  std::cout << "gentl: " << backends::spinnaker::DescribeGenTlProducer(gentl) << '\n';
  std::cout << "cameras_detected: " << listing.devices.size() << '\n';
  for (std::size_t i = 0; i < listing.devices.size(); ++i) {
    const backends::DeviceInfo& device = listing.devices[i];
    std::cout << "device[" << i << "]: model=" << device.model << " serial=" << device.serial
              << " vendor=" << device.vendor << '\n';
  }

  if (listing.devices.empty()) {
    std::cerr << "error: "
              << backends::spinnaker::FormatCameraError(
                     "device_discovery", backends::spinnaker::kNoCamerasDetectedError)
              << '\n';
    return kExitNoCameraDetected;
  }
  return kExitSuccess;
}

int CommandGrab(const std::vector<std::string_view>& args) {
  config::MonitorConfig config;
  std::optional<fs::path> pgm_path;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    bool ok = true;
    if (token == "--backend") {
      ok = TakeValue(args, i, value, error) &&
           backends::ParseBackendKind(value, config.backend, error);
    } else if (token == "--camera-index") {
      ok = TakeValue(args, i, value, error) &&
           ParseUnsignedAs(token, value, config.camera_index, error);
    } else if (token == "--exposure-us") {
      ok = TakeValue(args, i, value, error) && ParseDouble(token, value, config.exposure_us, error);
    } else if (token == "--timeout-ms") {
      std::uint32_t timeout_ms = 0;
      ok = TakeValue(args, i, value, error) && ParseUnsignedAs(token, value, timeout_ms, error);
      config.timeout = std::chrono::milliseconds(timeout_ms);
    } else if (token == "--out") {
      ok = TakeValue(args, i, value, error);
      pgm_path = fs::path(value);
    } else {
      error = "unknown option: " + std::string(token);
      ok = false;
    }
    if (!ok) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
  }
  if (!config::ValidateMonitorConfig(config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  std::unique_ptr<backends::ICameraBackend> backend =
      backends::CreateBackend(config::ToBackendOptions(config));
  if (!backend->Connect(error)) {
    std::cerr << "error: " << backends::spinnaker::FormatCameraError("connect", error) << '\n';
    return ConnectFailureExitCode(error);
  }

  std::string teardown_error;
  const auto teardown = [&]() {
    if (!backend->Disconnect(teardown_error)) {
      std::cerr << "warning: camera disconnect failed: " << teardown_error << '\n';
    }
  };

  if (!backend->ConfigureExposure(config.exposure_us, error)) {
    std::cerr << "error: "
              << backends::spinnaker::FormatCameraError("configure_exposure", error) << '\n';
    teardown();
    return kExitCameraConnectFailed;
  }
  if (!backend->Start(error)) {
    std::cerr << "error: "
              << backends::spinnaker::FormatCameraError("start_acquisition", error) << '\n';
    teardown();
    return kExitAcquisitionFailed;
  }

  frames::ImageFrame frame;
  const frames::FrameOutcome outcome =
      acquisition::AcquireFrame(*backend, config.timeout, frame, error);
  if (!backend->Stop(teardown_error)) {
    std::cerr << "warning: acquisition stop failed: " << teardown_error << '\n';
  }
  const backends::DeviceInfo device = backend->Info();
  teardown();

  if (outcome != frames::FrameOutcome::kReceived) {
    std::cerr << "error: " << backends::spinnaker::FormatCameraError("grab", error) << '\n';
    return kExitAcquisitionFailed;
  }

  std::cout << "camera: " << device.model << " serial=" << device.serial << '\n';
  std::cout << "frame: " << frame.width << 'x' << frame.height << ' '
            << frames::ToString(frame.pixel_format) << " id=" << frame.frame_id << '\n';
  std::cout << "mean_adu: " << core::FormatJsonNumber(frames::MeanPixelValue(frame), 2) << '\n';

  if (pgm_path.has_value()) {
    if (!frames::WritePgm(frame, pgm_path.value(), error)) {
      std::cerr << "error: failed to write snapshot: " << error << '\n';
      return kExitFailure;
    }
    std::cout << "snapshot: " << pgm_path->string() << '\n';
  }
  return kExitSuccess;
}

int CommandConvert(const std::vector<std::string_view>& args) {
  std::optional<double> signal_adu;
  std::optional<double> quantum_efficiency;
  std::optional<double> requested_wavelength_nm;
  double dark_adu = 0.0;
  photon::SensorCalibration calibration;
  std::string error;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    double parsed = 0.0;
    if (token != "--adu" && token != "--dark" && token != "--gain" && token != "--qe" &&
        token != "--wavelength" && token != "--read-noise") {
      std::cerr << "error: unknown option: " << token << '\n';
      return kExitUsage;
    }
    if (!TakeValue(args, i, value, error) || !ParseDouble(token, value, parsed, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }

    if (token == "--adu") {
      signal_adu = parsed;
    } else if (token == "--dark") {
      dark_adu = parsed;
    } else if (token == "--gain") {
      calibration.system_gain_e_per_adu = parsed;
    } else if (token == "--qe") {
      quantum_efficiency = parsed;
    } else if (token == "--wavelength") {
      requested_wavelength_nm = parsed;
    } else {
      calibration.read_noise_e = parsed;
    }
  }

  if (!signal_adu.has_value()) {
    std::cerr << "error: convert requires --adu <value>\n";
    return kExitUsage;
  }

  // An explicit QE already fixes the wavelength response.
  if (quantum_efficiency.has_value() && requested_wavelength_nm.has_value()) {
    std::cerr << "error: --qe and --wavelength cannot be combined; pass one or the other\n";
    return kExitUsage;
  }

  if (quantum_efficiency.has_value()) {
    calibration.quantum_efficiency = quantum_efficiency.value();
  } else {
    const double wavelength_nm =
        requested_wavelength_nm.value_or(photon::kDefaultReferenceWavelengthNm);
    if (wavelength_nm <= 0.0) {
      std::cerr << "error: --wavelength must be greater than 0\n";
      return kExitUsage;
    }
    const photon::QuantumEfficiencyLookup lookup =
        photon::QuantumEfficiencyAt(wavelength_nm, calibration);
    calibration.quantum_efficiency = lookup.quantum_efficiency;
    if (lookup.approximate) {
      std::cerr << "warning: quantum efficiency is only measured at "
                << core::FormatJsonNumber(calibration.reference_wavelength_nm, 0)
                << " nm; using " << core::FormatJsonNumber(lookup.quantum_efficiency, 4)
                << " for " << core::FormatJsonNumber(wavelength_nm, 0) << " nm\n";
    }
  }
  if (!photon::ValidateSensorCalibration(calibration, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  const double electrons =
      photon::AduToElectrons(signal_adu.value(), dark_adu, calibration.system_gain_e_per_adu);
  const double photons = photon::ElectronsToPhotons(electrons, calibration.quantum_efficiency);
  const double snr =
      photon::CalculateSnr(photons, calibration.quantum_efficiency, calibration.read_noise_e);

  std::cout << "signal_adu: " << core::FormatJsonNumber(signal_adu.value(), 3) << '\n'
            << "dark_adu: " << core::FormatJsonNumber(dark_adu, 3) << '\n'
            << "gain_e_per_adu: " << core::FormatJsonNumber(calibration.system_gain_e_per_adu, 4)
            << '\n'
            << "quantum_efficiency: " << core::FormatJsonNumber(calibration.quantum_efficiency, 4)
            << '\n'
            << "electrons_per_px: " << core::FormatJsonNumber(electrons, 3) << '\n'
            << "photons_per_px: " << core::FormatJsonNumber(photons, 3) << '\n'
            << "snr: " << core::FormatJsonNumber(snr, 4) << '\n';
  if (photons > 0.0 && photons < 10.0) {
    std::cerr << "warning: below ~10 photons/px the value is read-noise dominated\n";
  }
  return kExitSuccess;
}

int CommandMonitor(const std::vector<std::string_view>& args) {
  MonitorOptions options;
  std::string error;
  if (!ParseMonitorOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecuteMonitor(options);
}

} // namespace

int ExecuteMonitor(const MonitorOptions& options) {
  core::logging::Logger logger(options.log_level);
  std::string error;

  config::MonitorConfig config;
  if (options.config_path.has_value()) {
    config::ValidationReport report;
    if (!config::LoadConfigFile(options.config_path.value(), config, report, error)) {
      logger.Error("failed to read config", {{"path", options.config_path->string()},
                                             {"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    if (!report.valid) {
      PrintValidationIssues("invalid config", options.config_path.value(), report);
      return kExitConfigInvalid;
    }
  }
  ApplyOverrides(options, config);
  if (!config::ValidateMonitorConfig(config, error)) {
    logger.Error("invalid monitor configuration", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  monitor::MonitorSessionOptions session_options;
  session_options.config = config;
  session_options.output_root = options.output_dir;
  session_options.display = options.display;
  session_options.display_out = options.display_out != nullptr ? options.display_out : &std::cout;

  monitor::MonitorSession session(std::move(session_options),
                                  backends::CreateBackend(config::ToBackendOptions(config)),
                                  logger);
  const core::errors::ExitCode code = session.Run();
  if (code != core::errors::ExitCode::kSuccess && !session.error().empty()) {
    std::cerr << "error: " << session.error() << '\n';
  }

  const artifacts::SessionRecord& record = session.record();
  std::cout << "session_id: " << record.session_id << '\n'
            << "stop_reason: " << record.stop_reason << '\n'
            << "frames_total: " << record.counters.frames_total << '\n'
            << "frames_measured: " << record.counters.frames_measured << '\n'
            << "frames_failed: " << record.counters.frames_failed << '\n';
  if (record.calibration.has_value()) {
    std::cout << "mean_dark_adu: " << core::FormatJsonNumber(record.calibration->mean_dark_adu, 3)
              << '\n';
  }
  if (record.photon_stats.count() > 0U) {
    std::cout << "mean_photons_per_px: " << core::FormatJsonNumber(record.photon_stats.mean(), 2)
              << '\n';
  }
  if (!session.bundle_dir().empty()) {
    std::cout << "output_dir: " << session.bundle_dir().string() << '\n';
  }
  return core::errors::ToInt(code);
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "monitor") {
    return CommandMonitor(args);
  }

  if (command == "list-devices") {
    return CommandListDevices(args);
  }

  if (command == "grab") {
    return CommandGrab(args);
  }

  if (command == "convert") {
    return CommandConvert(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace photoncount::cli
