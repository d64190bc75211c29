#include "../common/assertions.hpp"
#include "backends/spinnaker/build_status.hpp"
#include "backends/spinnaker/error_mapper.hpp"
#include "backends/spinnaker/spinnaker_backend.hpp"

#include <string>
#include <string_view>

int main() {
  using photoncount::backends::spinnaker::CameraErrorCode;
  using photoncount::backends::spinnaker::FormatCameraError;
  using photoncount::backends::spinnaker::MapCameraError;
  using photoncount::backends::spinnaker::ToStableErrorCode;
  using photoncount::tests::common::AssertContains;
  using photoncount::tests::common::Fail;

  {
    const auto mapped = MapCameraError(
        "connect", photoncount::backends::spinnaker::kNoCamerasDetectedError);
    if (mapped.code != CameraErrorCode::kNotFound) {
      Fail("expected not-found classification for empty camera list");
    }
    if (ToStableErrorCode(mapped.code) != "CAM_NOT_FOUND") {
      Fail("unexpected stable code for not-found classification");
    }
  }

  {
    const auto mapped =
        MapCameraError("grab", "Spinnaker: GetNextImage failed [-1011] timeout after 1000 ms");
    if (mapped.code != CameraErrorCode::kTimeout) {
      Fail("expected timeout classification for timeout error text");
    }
  }

  {
    const auto mapped = MapCameraError("connect", "Spinnaker: Interface error [-1004]");
    if (mapped.code != CameraErrorCode::kInterfaceError) {
      Fail("expected interface classification for -1004");
    }
    AssertContains(mapped.actionable_message, "replug");
  }

  {
    const auto mapped = MapCameraError("connect", "device busy: already open in SpinView");
    if (mapped.code != CameraErrorCode::kBusy) {
      Fail("expected busy classification for busy error text");
    }
  }

  {
    const auto mapped = MapCameraError(
        "connect", photoncount::backends::spinnaker::kSpinnakerDisabledError);
    if (mapped.code != CameraErrorCode::kSdkUnavailable) {
      Fail("expected sdk-unavailable classification when build disables spinnaker");
    }
    if (ToStableErrorCode(mapped.code) != "CAM_SDK_UNAVAILABLE") {
      Fail("unexpected stable code for sdk unavailable classification");
    }
  }

  {
    const auto mapped = MapCameraError("configure_exposure", "exposure_us 1 is out of range");
    if (mapped.code != CameraErrorCode::kInvalidConfiguration) {
      Fail("expected invalid-configuration classification for range text");
    }
  }

  {
    const auto mapped = MapCameraError("grab", "image incomplete with status 3: missing packets");
    if (mapped.code != CameraErrorCode::kIncompleteFrame) {
      Fail("expected incomplete-frame classification");
    }
  }

  {
    const std::string formatted =
        FormatCameraError("start", "spinnaker backend must be connected  before start");
    AssertContains(formatted, "CAM_STATE_CONFLICT");
    AssertContains(formatted, "Backend state conflict during start");
    AssertContains(formatted, "detail: spinnaker backend must be connected before start");
  }

  {
    const std::string formatted = FormatCameraError("stop", "");
    AssertContains(formatted, "CAM_UNKNOWN_ERROR");
    AssertContains(formatted, "Unexpected camera failure during stop");
    if (formatted.find("detail:") != std::string::npos) {
      Fail("empty detail should not add a detail suffix");
    }
  }

  return 0;
}
