#pragma once

#include "backends/camera_backend.hpp"
#include "photon/sensor_calibration.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace photoncount::backends::sim {

constexpr double kReferenceExposureUs = 5'000.0;
// The sim enumerates exactly one device, at index 0.
constexpr std::uint32_t kSimCameraCount = 1;

// Knobs for the synthetic IMX287-like sensor.
struct SimSensorOptions {
  std::uint32_t width = 720;
  std::uint32_t height = 540;
  frames::PixelFormat pixel_format = frames::PixelFormat::kMono16;
  double dark_level_adu = 100.0;
  // Photons per pixel at `kReferenceExposureUs`; scales linearly with exposure.
  double signal_photons = 500.0;
  // Frames before this id are dark so the baseline can be collected first.
  std::uint64_t signal_start_frame = 50;
  std::uint64_t seed = 1;
  std::uint32_t timeout_percent = 0;
  std::uint32_t incomplete_percent = 0;
  std::uint32_t camera_index = 0;
  photon::SensorCalibration calibration;
};

bool ValidateSimSensorOptions(const SimSensorOptions& options, std::string& error);

// Deterministic, hardware-free backend implementation.
//
// Every pixel is dark_level + signal * qe / gain plus gaussian noise drawn from
// a SplitMix64 stream keyed on (seed, frame id), so two runs with the same
// options produce byte-identical frames. Fault knobs turn a deterministic
// subset of frame ids into timeouts or incomplete frames.
class SimCameraBackend final : public ICameraBackend {
public:
  SimCameraBackend();
  explicit SimCameraBackend(SimSensorOptions options);

  bool Connect(std::string& error) override;
  bool ConfigureExposure(double exposure_us, std::string& error) override;
  bool Start(std::string& error) override;
  frames::FrameOutcome GrabFrame(std::chrono::milliseconds timeout, frames::ImageFrame& frame,
                                 std::string& error) override;
  bool Stop(std::string& error) override;
  bool Disconnect(std::string& error) override;
  DeviceInfo Info() const override;
  bool SetParam(const std::string& key, const std::string& value, std::string& error) override;
  BackendConfig DumpConfig() const override;

  const SimSensorOptions& options() const {
    return options_;
  }

private:
  void RenderFrame(std::uint64_t frame_id, frames::ImageFrame& frame) const;

  SimSensorOptions options_;
  double exposure_us_ = kReferenceExposureUs;
  bool connected_ = false;
  bool running_ = false;
  std::uint64_t next_frame_id_ = 0;
  std::chrono::system_clock::time_point stream_start_ts_{};
};

} // namespace photoncount::backends::sim
