#pragma once

#include "backends/camera_backend.hpp"
#include "backends/sim/sim_camera_backend.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace photoncount::backends {

enum class BackendKind {
  kSim = 0,
  kSpinnaker,
};

std::string_view ToString(BackendKind kind);

// Accepts "sim" or "spinnaker".
bool ParseBackendKind(std::string_view raw, BackendKind& kind, std::string& error);

struct BackendOptions {
  BackendKind kind = BackendKind::kSim;
  std::uint32_t camera_index = 0;
  sim::SimSensorOptions sim;
};

// Whether `kind` can open a camera in this build. The sim backend always can;
// Spinnaker depends on the SDK having been found at configure time.
bool IsBackendAvailable(BackendKind kind);

// "enabled", "disabled (SDK not found)" or "disabled (build option OFF)".
std::string_view BackendAvailabilityText(BackendKind kind);

// Creates the backend object. A Spinnaker backend in a build without the SDK
// is still returned; its Connect fails with an actionable error.
std::unique_ptr<ICameraBackend> CreateBackend(const BackendOptions& options);

struct DeviceListing {
  std::string sdk_version;
  std::vector<DeviceInfo> devices;
};

bool ListDevices(BackendKind kind, DeviceListing& listing, std::string& error);

} // namespace photoncount::backends
