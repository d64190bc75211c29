#include "backends/spinnaker/sdk_context.hpp"

#include <utility>

namespace photoncount::backends::spinnaker {

std::mutex SdkContext::global_mu_{};
bool SdkContext::initialized_ = false;
std::uint32_t SdkContext::active_handles_ = 0;
std::uint64_t SdkContext::init_calls_ = 0;
std::uint64_t SdkContext::shutdown_calls_ = 0;
#if PHOTONCOUNT_ENABLE_SPINNAKER
Spinnaker::SystemPtr SdkContext::system_{};
#endif

std::string FormatLibraryVersion(const LibraryVersion& version) {
  return std::to_string(version.major) + "." + std::to_string(version.minor) + "." +
         std::to_string(version.type) + "." + std::to_string(version.build);
}

SdkContext::~SdkContext() {
  // Destructors cannot surface errors; explicit Release() is the checked path.
  std::string release_error;
  (void)Release(release_error);
}

SdkContext::SdkContext(SdkContext&& other) noexcept {
  acquired_ = std::exchange(other.acquired_, false);
}

SdkContext& SdkContext::operator=(SdkContext&& other) noexcept {
  if (this == &other) {
    return *this;
  }

  std::string release_error;
  (void)Release(release_error);
  acquired_ = std::exchange(other.acquired_, false);
  return *this;
}

bool SdkContext::Acquire(std::string& error) {
  if (acquired_) {
    return true;
  }

  std::lock_guard<std::mutex> lock(global_mu_);
  if (!initialized_) {
    if (!InitializeSdk(error)) {
      return false;
    }
    initialized_ = true;
    ++init_calls_;
  }

  ++active_handles_;
  acquired_ = true;
  return true;
}

bool SdkContext::Release(std::string& error) {
  error.clear();
  if (!acquired_) {
    return true;
  }

  std::lock_guard<std::mutex> lock(global_mu_);
  if (active_handles_ > 0U) {
    --active_handles_;
  }
  acquired_ = false;

  if (active_handles_ == 0U && initialized_) {
    const bool released = ShutdownSdk(error);
    initialized_ = false;
    ++shutdown_calls_;
    return released;
  }
  return true;
}

bool SdkContext::Version(LibraryVersion& version, std::string& error) const {
  if (!acquired_) {
    error = "Spinnaker system must be acquired before reading its version";
    return false;
  }
#if PHOTONCOUNT_ENABLE_SPINNAKER
  std::lock_guard<std::mutex> lock(global_mu_);
  try {
    const Spinnaker::LibraryVersion sdk_version = system_->GetLibraryVersion();
    version.major = static_cast<std::uint32_t>(sdk_version.major);
    version.minor = static_cast<std::uint32_t>(sdk_version.minor);
    version.type = static_cast<std::uint32_t>(sdk_version.type);
    version.build = static_cast<std::uint32_t>(sdk_version.build);
  } catch (const Spinnaker::Exception& e) {
    error = std::string("failed to read Spinnaker library version: ") + e.what();
    return false;
  }
  error.clear();
  return true;
#else
  version = LibraryVersion{};
  error = std::string(kSpinnakerDisabledError);
  return false;
#endif
}

#if PHOTONCOUNT_ENABLE_SPINNAKER
Spinnaker::SystemPtr SdkContext::System() const {
  std::lock_guard<std::mutex> lock(global_mu_);
  return acquired_ ? system_ : Spinnaker::SystemPtr{};
}
#endif

SdkContext::Snapshot SdkContext::DebugSnapshot() {
  std::lock_guard<std::mutex> lock(global_mu_);
  return Snapshot{
      .initialized = initialized_,
      .active_handles = active_handles_,
      .init_calls = init_calls_,
      .shutdown_calls = shutdown_calls_,
  };
}

bool SdkContext::InitializeSdk(std::string& error) {
#if PHOTONCOUNT_ENABLE_SPINNAKER
  try {
    system_ = Spinnaker::System::GetInstance();
  } catch (const Spinnaker::Exception& e) {
    error = std::string("failed to initialize Spinnaker system: ") + e.what() +
            " (code " + std::to_string(static_cast<int>(e.GetError())) + ")";
    return false;
  }
  error.clear();
  return true;
#else
  error = std::string(kSpinnakerDisabledError);
  return false;
#endif
}

bool SdkContext::ShutdownSdk(std::string& error) {
#if PHOTONCOUNT_ENABLE_SPINNAKER
  if (!system_) {
    return true;
  }
  try {
    system_->ReleaseInstance();
  } catch (const Spinnaker::Exception& e) {
    error = std::string("failed to release Spinnaker system: ") + e.what() + " (code " +
            std::to_string(static_cast<int>(e.GetError())) + ")";
    system_ = nullptr;
    return false;
  }
  system_ = nullptr;
#endif
  error.clear();
  return true;
}

} // namespace photoncount::backends::spinnaker
