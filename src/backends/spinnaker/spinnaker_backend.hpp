#pragma once

#include "backends/camera_backend.hpp"
#include "backends/spinnaker/sdk_context.hpp"
#include "backends/spinnaker/stream_session.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace photoncount::backends::spinnaker {

inline constexpr std::string_view kNoCamerasDetectedError =
    "No cameras detected. Please check connection.";

// Camera backend over the FLIR Spinnaker C++ SDK.
//
// Owns the whole SDK object graph for one camera (system handle, camera list,
// camera pointer, acquisition session) and tears it down in the order the
// SDK requires: EndAcquisition, DeInit, drop camera, clear list, release
// system. Skipping or reordering those steps leaves the device claimed and
// the next process fails with interface error -1004.
class SpinnakerBackend final : public ICameraBackend {
public:
  explicit SpinnakerBackend(std::uint32_t camera_index = 0);
  ~SpinnakerBackend() override;

  SpinnakerBackend(const SpinnakerBackend&) = delete;
  SpinnakerBackend& operator=(const SpinnakerBackend&) = delete;

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

private:
  struct Impl;

  bool BeginAcquisition(std::string& error);
  bool EndAcquisition(std::string& error);

  std::uint32_t camera_index_ = 0;
  SdkContext sdk_context_;
  std::unique_ptr<Impl> impl_;
  std::unique_ptr<StreamSession> stream_session_;
  DeviceInfo info_;
  BackendConfig params_;
  bool connected_ = false;
};

// Lists every camera the SDK can see without opening any of them.
bool EnumerateDevices(std::vector<DeviceInfo>& devices, LibraryVersion& version,
                      std::string& error);

} // namespace photoncount::backends::spinnaker
