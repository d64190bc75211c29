#pragma once

#include "frames/image_frame.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace photoncount::backends {

using BackendConfig = std::map<std::string, std::string>;

// Exposure range of the BFS-U3-04S2 family, in microseconds.
constexpr double kMinExposureUs = 4.0;
constexpr double kMaxExposureUs = 30'000'000.0;

// Identity read from the device node map. Fields the device does not expose
// stay empty.
struct DeviceInfo {
  std::string model;
  std::string serial;
  std::string vendor;
};

// Shared camera backend contract used by the monitor, grab and list-devices
// flows.
//
// Lifecycle: Connect -> ConfigureExposure -> Start -> GrabFrame... -> Stop ->
// Disconnect. Disconnect runs every teardown step even when an earlier one
// fails and must be safe to call at any point.
class ICameraBackend {
public:
  virtual ~ICameraBackend() = default;

  // Opens the selected device and reads its identity.
  virtual bool Connect(std::string& error) = 0;

  // Turns auto exposure off and applies a fixed exposure time.
  virtual bool ConfigureExposure(double exposure_us, std::string& error) = 0;

  // Begins continuous acquisition after a successful connect.
  virtual bool Start(std::string& error) = 0;

  // Waits up to `timeout` for the next frame. `frame` is only written when the
  // outcome is `kReceived`; `error` carries a reason for every other outcome.
  virtual frames::FrameOutcome GrabFrame(std::chrono::milliseconds timeout,
                                         frames::ImageFrame& frame, std::string& error) = 0;

  // Ends acquisition. Stopping a stream that is not running succeeds.
  virtual bool Stop(std::string& error) = 0;

  // Releases every device and SDK resource in the order the driver requires.
  // Returns false with the collected step errors when any step failed.
  virtual bool Disconnect(std::string& error) = 0;

  virtual DeviceInfo Info() const = 0;

  virtual bool SetParam(const std::string& key, const std::string& value, std::string& error) = 0;

  // Returns current backend parameter snapshot.
  virtual BackendConfig DumpConfig() const = 0;
};

} // namespace photoncount::backends
