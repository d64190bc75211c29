#include "backends/backend_factory.hpp"

#include "backends/spinnaker/build_status.hpp"
#include "backends/spinnaker/spinnaker_backend.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace photoncount::backends {

std::string_view ToString(const BackendKind kind) {
  switch (kind) {
  case BackendKind::kSim:
    return "sim";
  case BackendKind::kSpinnaker:
    return "spinnaker";
  }
  return "sim";
}

bool ParseBackendKind(std::string_view raw, BackendKind& kind, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (normalized == "sim") {
    kind = BackendKind::kSim;
    return true;
  }
  if (normalized == "spinnaker") {
    kind = BackendKind::kSpinnaker;
    return true;
  }

  error = "invalid backend '" + std::string(raw) + "' (expected sim|spinnaker)";
  return false;
}

bool IsBackendAvailable(const BackendKind kind) {
  if (kind == BackendKind::kSpinnaker) {
    return spinnaker::IsSpinnakerEnabledAtBuild();
  }
  return true;
}

std::string_view BackendAvailabilityText(const BackendKind kind) {
  if (kind == BackendKind::kSpinnaker) {
    return spinnaker::SpinnakerAvailabilityStatusText();
  }
  return "enabled";
}

std::unique_ptr<ICameraBackend> CreateBackend(const BackendOptions& options) {
  switch (options.kind) {
  case BackendKind::kSpinnaker:
    return std::make_unique<spinnaker::SpinnakerBackend>(options.camera_index);
  case BackendKind::kSim:
    break;
  }
  sim::SimSensorOptions sim_options = options.sim;
  sim_options.camera_index = options.camera_index;
  return std::make_unique<sim::SimCameraBackend>(std::move(sim_options));
}

bool ListDevices(const BackendKind kind, DeviceListing& listing, std::string& error) {
  listing = DeviceListing{};
  if (kind == BackendKind::kSim) {
    listing.sdk_version = "sim";
    listing.devices.push_back(sim::SimCameraBackend().Info());
    return true;
  }

  spinnaker::LibraryVersion version;
  if (!spinnaker::EnumerateDevices(listing.devices, version, error)) {
    return false;
  }
  listing.sdk_version = spinnaker::FormatLibraryVersion(version);
  return true;
}

} // namespace photoncount::backends
