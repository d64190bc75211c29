#include "backends/spinnaker/spinnaker_backend.hpp"

#include "core/json_utils.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <utility>

#if PHOTONCOUNT_ENABLE_SPINNAKER
#include <SpinGenApi/SpinnakerGenApi.h>
#include <Spinnaker.h>
#endif

namespace photoncount::backends::spinnaker {

namespace {

std::string JoinFailures(const std::vector<std::string>& failures) {
  std::string joined;
  for (const std::string& failure : failures) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += failure;
  }
  return joined;
}

bool ParseUInt32(std::string_view raw, std::uint32_t& parsed) {
  if (raw.empty()) {
    return false;
  }
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  return ec == std::errc() && ptr == end;
}

#if PHOTONCOUNT_ENABLE_SPINNAKER
namespace GenApi = Spinnaker::GenApi;

std::string DescribeException(std::string_view step, const Spinnaker::Exception& e) {
  return std::string(step) + " failed: " + e.what() + " (code " +
         std::to_string(static_cast<int>(e.GetError())) + ")";
}

std::string ReadStringNode(GenApi::INodeMap& node_map, const char* name) {
  GenApi::CStringPtr node = node_map.GetNode(name);
  if (!GenApi::IsAvailable(node) || !GenApi::IsReadable(node)) {
    return {};
  }
  return std::string(node->GetValue().c_str());
}

DeviceInfo ReadDeviceInfo(GenApi::INodeMap& tl_device_node_map) {
  DeviceInfo info;
  info.model = ReadStringNode(tl_device_node_map, "DeviceModelName");
  info.serial = ReadStringNode(tl_device_node_map, "DeviceSerialNumber");
  info.vendor = ReadStringNode(tl_device_node_map, "DeviceVendorName");
  return info;
}

bool SetEnumerationEntry(GenApi::INodeMap& node_map, const char* node_name, const char* entry_name,
                         std::string& error) {
  GenApi::CEnumerationPtr node = node_map.GetNode(node_name);
  if (!GenApi::IsAvailable(node) || !GenApi::IsWritable(node)) {
    error = std::string(node_name) + " node is not writable";
    return false;
  }
  GenApi::CEnumEntryPtr entry = node->GetEntryByName(entry_name);
  if (!GenApi::IsAvailable(entry) || !GenApi::IsReadable(entry)) {
    error = std::string(node_name) + " entry '" + entry_name + "' is not available";
    return false;
  }
  node->SetIntValue(entry->GetValue());
  return true;
}

bool CopyImage(const Spinnaker::ImagePtr& image, frames::ImageFrame& frame, std::string& error) {
  const Spinnaker::PixelFormatEnums format = image->GetPixelFormat();
  frames::PixelFormat pixel_format = frames::PixelFormat::kMono8;
  std::size_t bytes_per_pixel = 1U;
  if (format == Spinnaker::PixelFormat_Mono8) {
    pixel_format = frames::PixelFormat::kMono8;
  } else if (format == Spinnaker::PixelFormat_Mono16) {
    pixel_format = frames::PixelFormat::kMono16;
    bytes_per_pixel = 2U;
  } else {
    error = "unsupported pixel format " + std::string(image->GetPixelFormatName().c_str()) +
            " (expected Mono8 or Mono16)";
    return false;
  }

  const auto width = static_cast<std::uint32_t>(image->GetWidth());
  const auto height = static_cast<std::uint32_t>(image->GetHeight());
  const auto stride = static_cast<std::size_t>(image->GetStride());
  const auto* data = static_cast<const std::uint8_t*>(image->GetData());
  if (width == 0U || height == 0U || data == nullptr || stride < width * bytes_per_pixel) {
    error = "image buffer is empty or malformed";
    return false;
  }

  frame.width = width;
  frame.height = height;
  frame.pixel_format = pixel_format;
  frame.frame_id = static_cast<std::uint64_t>(image->GetFrameID());
  frame.timestamp = std::chrono::system_clock::now();
  frame.pixels.resize(static_cast<std::size_t>(width) * height);
  for (std::uint32_t y = 0; y < height; ++y) {
    const std::uint8_t* row = data + static_cast<std::size_t>(y) * stride;
    std::uint16_t* out = frame.pixels.data() + static_cast<std::size_t>(y) * width;
    if (bytes_per_pixel == 1U) {
      for (std::uint32_t x = 0; x < width; ++x) {
        out[x] = row[x];
      }
    } else {
      for (std::uint32_t x = 0; x < width; ++x) {
        out[x] = static_cast<std::uint16_t>(row[2U * x] | (row[2U * x + 1U] << 8U));
      }
    }
  }
  return true;
}
#endif

} // namespace

struct SpinnakerBackend::Impl {
#if PHOTONCOUNT_ENABLE_SPINNAKER
  Spinnaker::CameraList camera_list;
  Spinnaker::CameraPtr camera;
#endif
  bool camera_list_held = false;
  bool camera_initialized = false;
};

SpinnakerBackend::SpinnakerBackend(const std::uint32_t camera_index)
    : camera_index_(camera_index), impl_(std::make_unique<Impl>()) {
  stream_session_ = std::make_unique<StreamSession>(
      [this](std::string& error) { return BeginAcquisition(error); },
      [this](std::string& error) { return EndAcquisition(error); });
  params_ = {
      {"backend", "spinnaker"},
      {"camera_index", std::to_string(camera_index_)},
      {"build_spinnaker_enabled", IsSpinnakerEnabledAtBuild() ? "true" : "false"},
  };
}

SpinnakerBackend::~SpinnakerBackend() {
  // Destructors cannot surface errors; owners call Disconnect() on the
  // checked path so teardown warnings reach the log.
  std::string teardown_error;
  (void)Disconnect(teardown_error);
}

bool SpinnakerBackend::Connect(std::string& error) {
  if (connected_) {
    error = "spinnaker backend is already connected";
    return false;
  }
  if (!sdk_context_.Acquire(error)) {
    return false;
  }

#if PHOTONCOUNT_ENABLE_SPINNAKER
  try {
    Spinnaker::SystemPtr system = sdk_context_.System();
    impl_->camera_list = system->GetCameras();
    impl_->camera_list_held = true;
    const unsigned int camera_count = impl_->camera_list.GetSize();
    if (camera_count == 0U) {
      error = std::string(kNoCamerasDetectedError);
    } else if (camera_index_ >= camera_count) {
      error = "camera index " + std::to_string(camera_index_) + " is out of range for " +
              std::to_string(camera_count) + " detected camera(s)";
    } else {
      impl_->camera = impl_->camera_list.GetByIndex(camera_index_);
      info_ = ReadDeviceInfo(impl_->camera->GetTLDeviceNodeMap());
      impl_->camera->Init();
      impl_->camera_initialized = true;
      if (SetEnumerationEntry(impl_->camera->GetNodeMap(), "AcquisitionMode", "Continuous",
                              error)) {
        params_["acquisition_mode"] = "Continuous";
        params_["camera_count"] = std::to_string(camera_count);
        connected_ = true;
        error.clear();
        return true;
      }
    }
  } catch (const Spinnaker::Exception& e) {
    error = DescribeException("connect", e);
  }
#else
  error = std::string(kSpinnakerDisabledError);
#endif

  // Partial connect: unwind whatever was acquired so the device is not left
  // claimed by this process.
  std::string teardown_error;
  if (!Disconnect(teardown_error)) {
    error += "; teardown: " + teardown_error;
  }
  return false;
}

bool SpinnakerBackend::ConfigureExposure(const double exposure_us, std::string& error) {
  if (!connected_) {
    error = "spinnaker backend must be connected before configuring exposure";
    return false;
  }
  if (!std::isfinite(exposure_us) || exposure_us < kMinExposureUs ||
      exposure_us > kMaxExposureUs) {
    error = "exposure_us " + core::FormatJsonNumber(exposure_us) + " is out of range [" +
            core::FormatJsonNumber(kMinExposureUs) + ", " +
            core::FormatJsonNumber(kMaxExposureUs) + "]";
    return false;
  }

#if PHOTONCOUNT_ENABLE_SPINNAKER
  try {
    GenApi::INodeMap& node_map = impl_->camera->GetNodeMap();
    if (!SetEnumerationEntry(node_map, "ExposureAuto", "Off", error)) {
      return false;
    }
    GenApi::CFloatPtr exposure_time = node_map.GetNode("ExposureTime");
    if (!GenApi::IsAvailable(exposure_time) || !GenApi::IsWritable(exposure_time)) {
      error = "ExposureTime node is not writable";
      return false;
    }
    const double min_us = exposure_time->GetMin();
    const double max_us = exposure_time->GetMax();
    if (exposure_us < min_us || exposure_us > max_us) {
      error = "exposure_us " + core::FormatJsonNumber(exposure_us) +
              " is out of range for this camera [" + core::FormatJsonNumber(min_us) + ", " +
              core::FormatJsonNumber(max_us) + "]";
      return false;
    }
    exposure_time->SetValue(exposure_us);
    params_["exposure_auto"] = "Off";
    params_["exposure_us"] = core::FormatJsonNumber(exposure_time->GetValue());
  } catch (const Spinnaker::Exception& e) {
    error = DescribeException("configure exposure", e);
    return false;
  }
  error.clear();
  return true;
#else
  error = std::string(kSpinnakerDisabledError);
  return false;
#endif
}

bool SpinnakerBackend::Start(std::string& error) {
  if (!connected_) {
    error = "spinnaker backend must be connected before start";
    return false;
  }
  return stream_session_->Start(error);
}

frames::FrameOutcome SpinnakerBackend::GrabFrame(std::chrono::milliseconds timeout,
                                                 frames::ImageFrame& frame, std::string& error) {
  if (!stream_session_->running()) {
    error = "spinnaker backend must be running before grab";
    return frames::FrameOutcome::kError;
  }

#if PHOTONCOUNT_ENABLE_SPINNAKER
  Spinnaker::ImagePtr image;
  try {
    image = impl_->camera->GetNextImage(static_cast<std::uint64_t>(timeout.count()));
  } catch (const Spinnaker::Exception& e) {
    error = DescribeException("GetNextImage", e);
    return e.GetError() == Spinnaker::SPINNAKER_ERR_TIMEOUT ? frames::FrameOutcome::kTimeout
                                                            : frames::FrameOutcome::kError;
  }

  frames::FrameOutcome outcome = frames::FrameOutcome::kReceived;
  try {
    if (image->IsIncomplete()) {
      const Spinnaker::ImageStatus status = image->GetImageStatus();
      error = "image incomplete with status " + std::to_string(static_cast<int>(status)) + ": " +
              Spinnaker::Image::GetImageStatusDescription(status);
      outcome = frames::FrameOutcome::kIncomplete;
    } else if (!CopyImage(image, frame, error)) {
      outcome = frames::FrameOutcome::kError;
    }
  } catch (const Spinnaker::Exception& e) {
    error = DescribeException("read image", e);
    outcome = frames::FrameOutcome::kError;
  }

  // The buffer goes back to the stream whatever happened above.
  try {
    image->Release();
  } catch (const Spinnaker::Exception& e) {
    const std::string release_error = DescribeException("image release", e);
    error = error.empty() ? release_error : error + "; " + release_error;
    outcome = frames::FrameOutcome::kError;
  }
  if (outcome == frames::FrameOutcome::kReceived) {
    error.clear();
  }
  return outcome;
#else
  (void)timeout;
  (void)frame;
  error = std::string(kSpinnakerDisabledError);
  return frames::FrameOutcome::kError;
#endif
}

bool SpinnakerBackend::Stop(std::string& error) {
  return stream_session_->Stop(error);
}

bool SpinnakerBackend::Disconnect(std::string& error) {
  std::vector<std::string> failures;
  std::string step_error;

  if (!stream_session_->Stop(step_error)) {
    failures.push_back(step_error);
  }

#if PHOTONCOUNT_ENABLE_SPINNAKER
  if (impl_->camera_initialized) {
    try {
      impl_->camera->DeInit();
    } catch (const Spinnaker::Exception& e) {
      failures.push_back(DescribeException("DeInit", e));
    }
    impl_->camera_initialized = false;
  }

  // The camera pointer must go before the list that produced it.
  impl_->camera = nullptr;
  if (impl_->camera_list_held) {
    try {
      impl_->camera_list.Clear();
    } catch (const Spinnaker::Exception& e) {
      failures.push_back(DescribeException("camera list clear", e));
    }
    impl_->camera_list_held = false;
  }
#endif

  if (!sdk_context_.Release(step_error)) {
    failures.push_back(step_error);
  }
  connected_ = false;

  if (!failures.empty()) {
    error = JoinFailures(failures);
    return false;
  }
  error.clear();
  return true;
}

DeviceInfo SpinnakerBackend::Info() const {
  return info_;
}

bool SpinnakerBackend::SetParam(const std::string& key, const std::string& value,
                                std::string& error) {
  if (key.empty()) {
    error = "parameter key cannot be empty";
    return false;
  }
  if (value.empty()) {
    error = "parameter value cannot be empty";
    return false;
  }

  if (key == "camera_index") {
    if (connected_) {
      error = "camera_index cannot change while connected";
      return false;
    }
    std::uint32_t parsed = 0;
    if (!ParseUInt32(value, parsed)) {
      error = "invalid camera_index parameter value: " + value;
      return false;
    }
    camera_index_ = parsed;
    params_["camera_index"] = value;
    return true;
  }

  if (!connected_) {
    error = "spinnaker backend must be connected before setting " + key;
    return false;
  }

#if PHOTONCOUNT_ENABLE_SPINNAKER
  // Any other key is treated as a GenICam feature name on the camera node map.
  try {
    GenApi::INodeMap& node_map = impl_->camera->GetNodeMap();
    GenApi::CNodePtr node = node_map.GetNode(key.c_str());
    if (!GenApi::IsAvailable(node) || !GenApi::IsWritable(node)) {
      error = "camera node '" + key + "' is not found or not writable";
      return false;
    }
    switch (node->GetPrincipalInterfaceType()) {
    case GenApi::intfIFloat: {
      char* parse_end = nullptr;
      const double parsed = std::strtod(value.c_str(), &parse_end);
      if (parse_end == nullptr || *parse_end != '\0' || !std::isfinite(parsed)) {
        error = "invalid float value for " + key + ": " + value;
        return false;
      }
      GenApi::CFloatPtr(node)->SetValue(parsed);
      break;
    }
    case GenApi::intfIInteger: {
      std::int64_t parsed = 0;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
      if (ec != std::errc() || ptr != value.data() + value.size()) {
        error = "invalid integer value for " + key + ": " + value;
        return false;
      }
      GenApi::CIntegerPtr(node)->SetValue(parsed);
      break;
    }
    case GenApi::intfIBoolean:
      if (value != "true" && value != "false") {
        error = "invalid boolean value for " + key + ": " + value;
        return false;
      }
      GenApi::CBooleanPtr(node)->SetValue(value == "true");
      break;
    case GenApi::intfIEnumeration:
      if (!SetEnumerationEntry(node_map, key.c_str(), value.c_str(), error)) {
        return false;
      }
      break;
    default:
      error = "camera node '" + key + "' has an unsupported type";
      return false;
    }
  } catch (const Spinnaker::Exception& e) {
    error = DescribeException("set " + key, e);
    return false;
  }
  params_[key] = value;
  error.clear();
  return true;
#else
  error = std::string(kSpinnakerDisabledError);
  return false;
#endif
}

BackendConfig SpinnakerBackend::DumpConfig() const {
  BackendConfig config = params_;
  config["connected"] = connected_ ? "true" : "false";
  config["running"] = stream_session_->running() ? "true" : "false";
  return config;
}

bool SpinnakerBackend::BeginAcquisition(std::string& error) {
#if PHOTONCOUNT_ENABLE_SPINNAKER
  try {
    impl_->camera->BeginAcquisition();
  } catch (const Spinnaker::Exception& e) {
    error = DescribeException("BeginAcquisition", e);
    return false;
  }
  error.clear();
  return true;
#else
  error = std::string(kSpinnakerDisabledError);
  return false;
#endif
}

bool SpinnakerBackend::EndAcquisition(std::string& error) {
#if PHOTONCOUNT_ENABLE_SPINNAKER
  try {
    impl_->camera->EndAcquisition();
  } catch (const Spinnaker::Exception& e) {
    error = DescribeException("EndAcquisition", e);
    return false;
  }
#endif
  error.clear();
  return true;
}

bool EnumerateDevices(std::vector<DeviceInfo>& devices, LibraryVersion& version,
                      std::string& error) {
  devices.clear();
  version = LibraryVersion{};

  SdkContext sdk_context;
  if (!sdk_context.Acquire(error)) {
    return false;
  }

#if PHOTONCOUNT_ENABLE_SPINNAKER
  if (!sdk_context.Version(version, error)) {
    std::string release_error;
    if (!sdk_context.Release(release_error)) {
      error += "; " + release_error;
    }
    return false;
  }

  bool listed = true;
  {
    Spinnaker::CameraList camera_list;
    try {
      Spinnaker::SystemPtr system = sdk_context.System();
      camera_list = system->GetCameras();
      for (unsigned int i = 0; i < camera_list.GetSize(); ++i) {
        Spinnaker::CameraPtr camera = camera_list.GetByIndex(i);
        devices.push_back(ReadDeviceInfo(camera->GetTLDeviceNodeMap()));
      }
      camera_list.Clear();
    } catch (const Spinnaker::Exception& e) {
      error = DescribeException("device discovery", e);
      listed = false;
      try {
        camera_list.Clear();
      } catch (const Spinnaker::Exception& clear_error) {
        error += "; " + DescribeException("camera list clear", clear_error);
      }
    }
  }

  std::string release_error;
  if (!sdk_context.Release(release_error)) {
    error = listed ? release_error : error + "; " + release_error;
    return false;
  }
  return listed;
#else
  error = std::string(kSpinnakerDisabledError);
  return false;
#endif
}

} // namespace photoncount::backends::spinnaker
