#include "backends/sim/sim_camera_backend.hpp"

#include "core/json_utils.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <numbers>
#include <utility>

namespace photoncount::backends::sim {

namespace {

constexpr std::uint64_t kSplitMixIncrement = 0x9e3779b97f4a7c15ULL;
constexpr std::uint64_t kNoiseSalt = 0xa0761d6478bd642fULL;
constexpr std::uint64_t kTimeoutSalt = 0xe7037ed1a0b428dbULL;
constexpr std::uint64_t kIncompleteSalt = 0x8ebc6af09c88c6e3ULL;

bool ParseUInt32(const std::string& text, std::uint32_t& value) {
  if (text.empty()) {
    return false;
  }

  std::uint32_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }

  value = parsed;
  return true;
}

bool ParseUInt64(const std::string& text, std::uint64_t& value) {
  if (text.empty()) {
    return false;
  }

  std::uint64_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }

  value = parsed;
  return true;
}

bool ParseFiniteDouble(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* parse_end = nullptr;
  const double parsed = std::strtod(text.c_str(), &parse_end);
  if (parse_end == nullptr || *parse_end != '\0' || !std::isfinite(parsed)) {
    return false;
  }
  value = parsed;
  return true;
}

std::uint64_t SplitMix64(std::uint64_t value) {
  std::uint64_t state = value + kSplitMixIncrement;
  state = (state ^ (state >> 30)) * 0xbf58476d1ce4e5b9ULL;
  state = (state ^ (state >> 27)) * 0x94d049bb133111ebULL;
  return state ^ (state >> 31);
}

// Deterministic pseudo-random percentage check used for the fault knobs.
bool DeterministicPercentHit(std::uint64_t seed, std::uint64_t salt, std::uint64_t frame_id,
                             std::uint32_t percent) {
  if (percent == 0U) {
    return false;
  }
  if (percent >= 100U) {
    return true;
  }

  const std::uint64_t mixed = SplitMix64((seed ^ salt) + frame_id * kSplitMixIncrement);
  return (mixed % 100ULL) < static_cast<std::uint64_t>(percent);
}

// Sequential SplitMix64 stream feeding Box-Muller pairs.
class GaussianStream {
public:
  explicit GaussianStream(std::uint64_t state) : state_(state) {}

  double Next() {
    if (has_spare_) {
      has_spare_ = false;
      return spare_;
    }
    // u1 in (0, 1] keeps log() finite.
    const double u1 = 1.0 - NextUnit();
    const double u2 = NextUnit();
    const double radius = std::sqrt(-2.0 * std::log(u1));
    const double theta = 2.0 * std::numbers::pi * u2;
    spare_ = radius * std::sin(theta);
    has_spare_ = true;
    return radius * std::cos(theta);
  }

private:
  double NextUnit() {
    state_ += kSplitMixIncrement;
    std::uint64_t z = state_;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    z ^= z >> 31;
    return static_cast<double>(z >> 11) * 0x1.0p-53;
  }

  std::uint64_t state_ = 0;
  double spare_ = 0.0;
  bool has_spare_ = false;
};

DeviceInfo SimDeviceInfo() {
  return DeviceInfo{
      .model = "BFS-U3-04S2M-C (sim)",
      .serial = "SIM0001",
      .vendor = "photoncount",
  };
}

} // namespace

bool ValidateSimSensorOptions(const SimSensorOptions& options, std::string& error) {
  if (options.width == 0U || options.height == 0U) {
    error = "sim width and height must be greater than 0";
    return false;
  }
  if (!std::isfinite(options.dark_level_adu) || options.dark_level_adu < 0.0) {
    error = "sim dark_level_adu must be a finite value >= 0";
    return false;
  }
  if (!std::isfinite(options.signal_photons) || options.signal_photons < 0.0) {
    error = "sim signal_photons must be a finite value >= 0";
    return false;
  }
  if (options.timeout_percent > 100U) {
    error = "sim timeout_percent must be in range [0,100]";
    return false;
  }
  if (options.incomplete_percent > 100U) {
    error = "sim incomplete_percent must be in range [0,100]";
    return false;
  }
  return photon::ValidateSensorCalibration(options.calibration, error);
}

SimCameraBackend::SimCameraBackend() : SimCameraBackend(SimSensorOptions{}) {}

SimCameraBackend::SimCameraBackend(SimSensorOptions options) : options_(std::move(options)) {}

bool SimCameraBackend::Connect(std::string& error) {
  if (connected_) {
    error = "sim backend is already connected";
    return false;
  }
  if (options_.camera_index >= kSimCameraCount) {
    error = "camera index " + std::to_string(options_.camera_index) + " is out of range for " +
            std::to_string(kSimCameraCount) + " detected camera(s)";
    return false;
  }
  if (!ValidateSimSensorOptions(options_, error)) {
    return false;
  }

  connected_ = true;
  return true;
}

bool SimCameraBackend::ConfigureExposure(const double exposure_us, std::string& error) {
  if (!connected_) {
    error = "sim backend must be connected before configuring exposure";
    return false;
  }
  if (!std::isfinite(exposure_us) || exposure_us < kMinExposureUs ||
      exposure_us > kMaxExposureUs) {
    error = "exposure_us " + core::FormatJsonNumber(exposure_us) + " is out of range [" +
            core::FormatJsonNumber(kMinExposureUs) + ", " + core::FormatJsonNumber(kMaxExposureUs) +
            "]";
    return false;
  }

  exposure_us_ = exposure_us;
  return true;
}

bool SimCameraBackend::Start(std::string& error) {
  if (!connected_) {
    error = "sim backend must be connected before start";
    return false;
  }

  if (running_) {
    error = "sim backend is already running";
    return false;
  }

  running_ = true;
  next_frame_id_ = 0;
  stream_start_ts_ = std::chrono::system_clock::now();
  return true;
}

frames::FrameOutcome SimCameraBackend::GrabFrame(std::chrono::milliseconds timeout,
                                                 frames::ImageFrame& frame, std::string& error) {
  if (!running_) {
    error = "sim backend must be running before grab";
    return frames::FrameOutcome::kError;
  }
  if (timeout <= std::chrono::milliseconds::zero()) {
    error = "grab timeout must be greater than 0 ms";
    return frames::FrameOutcome::kError;
  }

  const std::uint64_t frame_id = next_frame_id_++;
  if (DeterministicPercentHit(options_.seed, kTimeoutSalt, frame_id, options_.timeout_percent)) {
    error = "sim frame " + std::to_string(frame_id) + " timed out after " +
            std::to_string(timeout.count()) + " ms";
    return frames::FrameOutcome::kTimeout;
  }
  if (DeterministicPercentHit(options_.seed, kIncompleteSalt, frame_id,
                              options_.incomplete_percent)) {
    error = "sim frame " + std::to_string(frame_id) + " incomplete: missing packets";
    return frames::FrameOutcome::kIncomplete;
  }

  RenderFrame(frame_id, frame);
  return frames::FrameOutcome::kReceived;
}

bool SimCameraBackend::Stop(std::string& error) {
  error.clear();
  running_ = false;
  return true;
}

bool SimCameraBackend::Disconnect(std::string& error) {
  error.clear();
  running_ = false;
  connected_ = false;
  return true;
}

DeviceInfo SimCameraBackend::Info() const {
  return SimDeviceInfo();
}

bool SimCameraBackend::SetParam(const std::string& key, const std::string& value,
                                std::string& error) {
  if (key.empty()) {
    error = "parameter key cannot be empty";
    return false;
  }

  if (value.empty()) {
    error = "parameter value cannot be empty";
    return false;
  }

  SimSensorOptions updated = options_;
  bool parsed = false;
  if (key == "width") {
    parsed = ParseUInt32(value, updated.width);
  } else if (key == "height") {
    parsed = ParseUInt32(value, updated.height);
  } else if (key == "pixel_format") {
    if (value == "mono8") {
      updated.pixel_format = frames::PixelFormat::kMono8;
      parsed = true;
    } else if (value == "mono16") {
      updated.pixel_format = frames::PixelFormat::kMono16;
      parsed = true;
    }
  } else if (key == "dark_level_adu") {
    parsed = ParseFiniteDouble(value, updated.dark_level_adu);
  } else if (key == "signal_photons") {
    parsed = ParseFiniteDouble(value, updated.signal_photons);
  } else if (key == "signal_start_frame") {
    parsed = ParseUInt64(value, updated.signal_start_frame);
  } else if (key == "seed") {
    parsed = ParseUInt64(value, updated.seed);
  } else if (key == "timeout_percent") {
    parsed = ParseUInt32(value, updated.timeout_percent);
  } else if (key == "incomplete_percent") {
    parsed = ParseUInt32(value, updated.incomplete_percent);
  } else {
    error = "unknown sim parameter: " + key;
    return false;
  }

  if (!parsed) {
    error = "invalid " + key + " parameter value: " + value;
    return false;
  }
  if (running_ && (updated.width != options_.width || updated.height != options_.height ||
                   updated.pixel_format != options_.pixel_format)) {
    error = "sim frame geometry cannot change while the stream is running";
    return false;
  }
  if (!ValidateSimSensorOptions(updated, error)) {
    return false;
  }

  options_ = std::move(updated);
  return true;
}

BackendConfig SimCameraBackend::DumpConfig() const {
  return {
      {"backend", "sim"},
      {"camera_index", std::to_string(options_.camera_index)},
      {"width", std::to_string(options_.width)},
      {"height", std::to_string(options_.height)},
      {"pixel_format", std::string(frames::ToString(options_.pixel_format))},
      {"dark_level_adu", core::FormatJsonNumber(options_.dark_level_adu)},
      {"signal_photons", core::FormatJsonNumber(options_.signal_photons)},
      {"signal_start_frame", std::to_string(options_.signal_start_frame)},
      {"seed", std::to_string(options_.seed)},
      {"timeout_percent", std::to_string(options_.timeout_percent)},
      {"incomplete_percent", std::to_string(options_.incomplete_percent)},
      {"exposure_us", core::FormatJsonNumber(exposure_us_)},
      {"exposure_auto", "Off"},
      {"acquisition_mode", "Continuous"},
      {"connected", connected_ ? "true" : "false"},
      {"running", running_ ? "true" : "false"},
  };
}

void SimCameraBackend::RenderFrame(const std::uint64_t frame_id, frames::ImageFrame& frame) const {
  const photon::SensorCalibration& calibration = options_.calibration;
  const double gain = calibration.system_gain_e_per_adu;
  const double max_value = static_cast<double>(frames::MaxPixelValue(options_.pixel_format));

  double photons = 0.0;
  if (frame_id >= options_.signal_start_frame) {
    photons = options_.signal_photons * (exposure_us_ / kReferenceExposureUs);
  }
  const double electrons =
      std::min(photons * calibration.quantum_efficiency, calibration.saturation_capacity_e);
  const double mean_adu = options_.dark_level_adu + electrons / gain;
  // Read noise plus shot noise, both expressed in ADU.
  const double sigma_adu =
      std::sqrt(calibration.read_noise_e * calibration.read_noise_e + electrons) / gain;

  frame.width = options_.width;
  frame.height = options_.height;
  frame.pixel_format = options_.pixel_format;
  frame.frame_id = frame_id;
  const auto frame_period = std::chrono::microseconds(
      std::max<std::int64_t>(1, static_cast<std::int64_t>(std::llround(exposure_us_))));
  frame.timestamp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      stream_start_ts_ + frame_period * static_cast<std::int64_t>(frame_id));

  const std::size_t pixel_count = static_cast<std::size_t>(frame.width) * frame.height;
  frame.pixels.resize(pixel_count);

  GaussianStream noise(SplitMix64((options_.seed ^ kNoiseSalt) + frame_id * kSplitMixIncrement));
  for (std::size_t i = 0; i < pixel_count; ++i) {
    const double value = std::round(mean_adu + sigma_adu * noise.Next());
    frame.pixels[i] = static_cast<std::uint16_t>(std::clamp(value, 0.0, max_value));
  }
}

} // namespace photoncount::backends::sim
