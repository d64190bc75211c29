#include "config/monitor_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <cmath>
#include <initializer_list>
#include <limits>
#include <utility>

namespace photoncount::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string JoinPath(std::string_view prefix, std::string_view key) {
  if (prefix.empty()) {
    return std::string(key);
  }
  return std::string(prefix) + "." + std::string(key);
}

void RejectUnknownKeys(const JsonValue& object, std::string_view prefix,
                       std::initializer_list<std::string_view> allowed, ValidationReport& report) {
  for (const auto& [key, value] : object.object_value) {
    bool known = false;
    for (const std::string_view candidate : allowed) {
      if (key == candidate) {
        known = true;
        break;
      }
    }
    if (!known) {
      AddIssue(report, JoinPath(prefix, key), "is not a recognized key");
    }
  }
}

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  if (value.type != JsonValue::Type::kNumber) {
    return false;
  }
  if (!std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  // uint64 max rounds up to 2^64 as a double, so the bound must be exclusive.
  constexpr double kTwoTo64 = 18446744073709551616.0;
  if (floored >= kTwoTo64) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

// Reads an integer in [min_value, max_value] when the key is present.
template <typename T>
void ReadInteger(const JsonValue& object, std::string_view key, std::string_view prefix,
                 std::uint64_t min_value, T& out, ValidationReport& report) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    return;
  }
  const std::string path = JoinPath(prefix, key);
  const auto max_value = static_cast<std::uint64_t>(std::numeric_limits<T>::max());
  std::uint64_t parsed = 0;
  if (!TryGetNonNegativeInteger(*field, parsed)) {
    AddIssue(report, path, min_value > 0U ? "must be a positive integer"
                                          : "must be a non-negative integer");
    return;
  }
  if (parsed < min_value || parsed > max_value) {
    AddIssue(report, path,
             "must be in range [" + std::to_string(min_value) + "," + std::to_string(max_value) +
                 "]");
    return;
  }
  out = static_cast<T>(parsed);
}

// Reads a finite number greater than `lower` (or >= when `inclusive`).
void ReadNumber(const JsonValue& object, std::string_view key, std::string_view prefix,
                double lower, bool inclusive, double& out, ValidationReport& report) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    return;
  }
  const std::string path = JoinPath(prefix, key);
  if (field->type != JsonValue::Type::kNumber) {
    AddIssue(report, path,
             std::string("must be a number, got ") + core::json::TypeName(field->type));
    return;
  }
  if (!std::isfinite(field->number_value)) {
    AddIssue(report, path, "must be a finite number");
    return;
  }
  const double value = field->number_value;
  if (inclusive ? value < lower : value <= lower) {
    AddIssue(report, path, std::string("must be ") + (inclusive ? ">= " : "> ") +
                               core::FormatJsonNumber(lower, 0));
    return;
  }
  out = value;
}

const JsonValue* ReadObject(const JsonValue& root, std::string_view key, ValidationReport& report) {
  const JsonValue* field = core::json::FindMember(root, key);
  if (field == nullptr) {
    return nullptr;
  }
  if (field->type != JsonValue::Type::kObject) {
    AddIssue(report, std::string(key),
             std::string("must be an object, got ") + core::json::TypeName(field->type));
    return nullptr;
  }
  return field;
}

void ApplyRoi(const JsonValue& root, MonitorConfig& config, ValidationReport& report) {
  const JsonValue* roi = core::json::FindMember(root, "roi");
  if (roi == nullptr) {
    return;
  }
  if (roi->type == JsonValue::Type::kString) {
    std::string roi_error;
    if (!frames::ParseRoiSize(roi->string_value, config.roi, roi_error)) {
      AddIssue(report, "roi", roi_error);
    }
    return;
  }
  if (roi->type != JsonValue::Type::kObject) {
    AddIssue(report, "roi", "must be an object {width, height} or a \"WxH\" string");
    return;
  }
  RejectUnknownKeys(*roi, "roi", {"width", "height"}, report);
  ReadInteger(*roi, "width", "roi", 1U, config.roi.width, report);
  ReadInteger(*roi, "height", "roi", 1U, config.roi.height, report);
}

void ApplyCalibration(const JsonValue& root, MonitorConfig& config, ValidationReport& report) {
  const JsonValue* calibration = ReadObject(root, "calibration", report);
  if (calibration == nullptr) {
    return;
  }
  RejectUnknownKeys(*calibration, "calibration",
                    {"system_gain", "quantum_efficiency", "read_noise_e", "saturation_capacity_e",
                     "wavelength_nm"},
                    report);

  photon::SensorCalibration& sensor = config.calibration;
  ReadNumber(*calibration, "system_gain", "calibration", 0.0, false, sensor.system_gain_e_per_adu,
             report);
  ReadNumber(*calibration, "read_noise_e", "calibration", 0.0, true, sensor.read_noise_e, report);
  ReadNumber(*calibration, "saturation_capacity_e", "calibration", 0.0, false,
             sensor.saturation_capacity_e, report);
  ReadNumber(*calibration, "wavelength_nm", "calibration", 0.0, false, config.wavelength_nm,
             report);

  double qe = sensor.quantum_efficiency;
  ReadNumber(*calibration, "quantum_efficiency", "calibration", 0.0, false, qe, report);
  if (qe > 1.0) {
    AddIssue(report, "calibration.quantum_efficiency", "must be in range (0,1]");
  } else {
    sensor.quantum_efficiency = qe;
  }
}

void ApplySim(const JsonValue& root, MonitorConfig& config, ValidationReport& report) {
  const JsonValue* sim = ReadObject(root, "sim", report);
  if (sim == nullptr) {
    return;
  }
  RejectUnknownKeys(*sim, "sim",
                    {"width", "height", "pixel_format", "dark_level_adu", "signal_photons",
                     "signal_start_frame", "seed", "timeout_percent", "incomplete_percent"},
                    report);

  backends::sim::SimSensorOptions& options = config.sim;
  ReadInteger(*sim, "width", "sim", 1U, options.width, report);
  ReadInteger(*sim, "height", "sim", 1U, options.height, report);
  ReadNumber(*sim, "dark_level_adu", "sim", 0.0, true, options.dark_level_adu, report);
  ReadNumber(*sim, "signal_photons", "sim", 0.0, true, options.signal_photons, report);
  ReadInteger(*sim, "signal_start_frame", "sim", 0U, options.signal_start_frame, report);
  ReadInteger(*sim, "seed", "sim", 0U, options.seed, report);

  std::uint32_t timeout_percent = options.timeout_percent;
  ReadInteger(*sim, "timeout_percent", "sim", 0U, timeout_percent, report);
  if (timeout_percent > 100U) {
    AddIssue(report, "sim.timeout_percent", "must be in range [0,100]");
  } else {
    options.timeout_percent = timeout_percent;
  }
  std::uint32_t incomplete_percent = options.incomplete_percent;
  ReadInteger(*sim, "incomplete_percent", "sim", 0U, incomplete_percent, report);
  if (incomplete_percent > 100U) {
    AddIssue(report, "sim.incomplete_percent", "must be in range [0,100]");
  } else {
    options.incomplete_percent = incomplete_percent;
  }

  if (const JsonValue* format = core::json::FindMember(*sim, "pixel_format"); format != nullptr) {
    if (format->type != JsonValue::Type::kString) {
      AddIssue(report, "sim.pixel_format", "must be a string");
    } else if (format->string_value == "mono8") {
      options.pixel_format = frames::PixelFormat::kMono8;
    } else if (format->string_value == "mono16") {
      options.pixel_format = frames::PixelFormat::kMono16;
    } else {
      AddIssue(report, "sim.pixel_format", "must be one of: mono8, mono16");
    }
  }
}

void ApplyConfigObject(const JsonValue& root, MonitorConfig& config, ValidationReport& report) {
  if (root.type != JsonValue::Type::kObject) {
    AddIssue(report, "$", "config root must be a JSON object");
    return;
  }

  RejectUnknownKeys(root, "",
                    {"backend", "camera_index", "exposure_us", "roi", "baseline_frames",
                     "plot_history", "timeout_ms", "max_frames", "log_every_n_frames",
                     "calibration", "sim"},
                    report);

  if (const JsonValue* backend = core::json::FindMember(root, "backend"); backend != nullptr) {
    std::string backend_error;
    if (backend->type != JsonValue::Type::kString) {
      AddIssue(report, "backend", "must be a string");
    } else if (!backends::ParseBackendKind(backend->string_value, config.backend,
                                           backend_error)) {
      AddIssue(report, "backend", "must be one of: sim, spinnaker");
    }
  }

  ReadInteger(root, "camera_index", "", 0U, config.camera_index, report);

  double exposure_us = config.exposure_us;
  ReadNumber(root, "exposure_us", "", 0.0, false, exposure_us, report);
  if (exposure_us < backends::kMinExposureUs || exposure_us > backends::kMaxExposureUs) {
    AddIssue(report, "exposure_us", "must be in range [4,30000000] microseconds");
  } else {
    config.exposure_us = exposure_us;
  }

  ApplyRoi(root, config, report);
  ReadInteger(root, "baseline_frames", "", 1U, config.baseline_frames, report);
  ReadInteger(root, "plot_history", "", 1U, config.plot_history, report);

  std::uint32_t timeout_ms = static_cast<std::uint32_t>(config.timeout.count());
  ReadInteger(root, "timeout_ms", "", 1U, timeout_ms, report);
  config.timeout = std::chrono::milliseconds(timeout_ms);

  ReadInteger(root, "max_frames", "", 0U, config.max_frames, report);
  ReadInteger(root, "log_every_n_frames", "", 0U, config.log_every_n_frames, report);

  ApplyCalibration(root, config, report);
  ApplySim(root, config, report);
}

} // namespace

void ApplyConfigJson(std::string_view json_text, MonitorConfig& config,
                     ValidationReport& report) {
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$",
             parse_error + " (fix JSON syntax and rerun 'photoncount validate <config.json>')");
    report.valid = false;
    return;
  }

  ApplyConfigObject(root, config, report);
  report.valid = report.issues.empty();
}

bool LoadConfigFile(const std::filesystem::path& config_path, MonitorConfig& config,
                    ValidationReport& report, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(config_path, contents, error)) {
    error = "unable to read config file: " + config_path.string();
    return false;
  }
  if (contents.empty()) {
    report = ValidationReport{};
    AddIssue(report, "$", "config file is empty; provide a valid JSON object");
    report.valid = false;
    return true;
  }

  ApplyConfigJson(contents, config, report);
  return true;
}

bool ValidateConfigText(std::string_view json_text, ValidationReport& report) {
  MonitorConfig scratch;
  ApplyConfigJson(json_text, scratch, report);
  return report.valid;
}

bool ValidateConfigFile(const std::filesystem::path& config_path, ValidationReport& report,
                        std::string& error) {
  MonitorConfig scratch;
  return LoadConfigFile(config_path, scratch, report, error);
}

bool ValidateMonitorConfig(const MonitorConfig& config, std::string& error) {
  if (!std::isfinite(config.exposure_us) || config.exposure_us < backends::kMinExposureUs ||
      config.exposure_us > backends::kMaxExposureUs) {
    error = "exposure_us must be in range [4,30000000] microseconds";
    return false;
  }
  if (config.roi.width == 0U || config.roi.height == 0U) {
    error = "roi width and height must be greater than 0";
    return false;
  }
  if (config.baseline_frames == 0U) {
    error = "baseline_frames must be at least 1";
    return false;
  }
  if (config.plot_history == 0U) {
    error = "plot_history must be at least 1";
    return false;
  }
  if (config.timeout <= std::chrono::milliseconds::zero()) {
    error = "timeout_ms must be greater than 0";
    return false;
  }
  if (!std::isfinite(config.wavelength_nm) || config.wavelength_nm <= 0.0) {
    error = "wavelength_nm must be greater than 0";
    return false;
  }
  if (!photon::ValidateSensorCalibration(config.calibration, error)) {
    return false;
  }
  if (config.backend == backends::BackendKind::kSim) {
    backends::sim::SimSensorOptions sim = config.sim;
    sim.calibration = config.calibration;
    return backends::sim::ValidateSimSensorOptions(sim, error);
  }
  return true;
}

backends::BackendOptions ToBackendOptions(const MonitorConfig& config) {
  backends::BackendOptions options;
  options.kind = config.backend;
  options.camera_index = config.camera_index;
  options.sim = config.sim;
  options.sim.calibration = config.calibration;
  return options;
}

} // namespace photoncount::config
