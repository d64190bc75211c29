#pragma once

#include <string_view>

#ifndef PHOTONCOUNT_ENABLE_SPINNAKER
#define PHOTONCOUNT_ENABLE_SPINNAKER 0
#endif

#ifndef PHOTONCOUNT_SPINNAKER_REQUESTED
#define PHOTONCOUNT_SPINNAKER_REQUESTED 0
#endif

namespace photoncount::backends::spinnaker {

// True when the Spinnaker SDK was found and linked at configure time.
constexpr bool IsSpinnakerEnabledAtBuild() {
  return PHOTONCOUNT_ENABLE_SPINNAKER != 0;
}

// True when the build option asked for Spinnaker, even if the SDK was missing.
constexpr bool WasSpinnakerRequestedAtBuild() {
  return PHOTONCOUNT_SPINNAKER_REQUESTED != 0;
}

// Human-readable status string for CLI visibility:
// - "enabled"
// - "disabled (SDK not found)"
// - "disabled (build option OFF)"
constexpr std::string_view SpinnakerAvailabilityStatusText() {
  if (IsSpinnakerEnabledAtBuild()) {
    return "enabled";
  }
  if (WasSpinnakerRequestedAtBuild()) {
    return "disabled (SDK not found)";
  }
  return "disabled (build option OFF)";
}

inline constexpr std::string_view kSpinnakerDisabledError =
    "Spinnaker SDK support is disabled at build time (install the SDK and reconfigure with "
    "-DPHOTONCOUNT_ENABLE_SPINNAKER=ON)";

} // namespace photoncount::backends::spinnaker
