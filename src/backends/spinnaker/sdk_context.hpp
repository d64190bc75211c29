#pragma once

#include "backends/spinnaker/build_status.hpp"

#include <cstdint>
#include <mutex>
#include <string>

#if PHOTONCOUNT_ENABLE_SPINNAKER
#include <Spinnaker.h>
#endif

namespace photoncount::backends::spinnaker {

struct LibraryVersion {
  std::uint32_t major = 0;
  std::uint32_t minor = 0;
  std::uint32_t type = 0;
  std::uint32_t build = 0;
};

std::string FormatLibraryVersion(const LibraryVersion& version);

// Process-wide guard around `Spinnaker::System::GetInstance()`.
//
// The SDK hands out one system singleton and requires exactly one matching
// `ReleaseInstance()` after every camera and camera list derived from it has
// been dropped. Handles are reference counted: the first Acquire creates the
// instance, the last Release returns it.
class SdkContext {
public:
  SdkContext() = default;
  ~SdkContext();

  SdkContext(const SdkContext&) = delete;
  SdkContext& operator=(const SdkContext&) = delete;
  SdkContext(SdkContext&& other) noexcept;
  SdkContext& operator=(SdkContext&& other) noexcept;

  // Acquires the global system for this handle. Idempotent per instance.
  bool Acquire(std::string& error);

  // Releases this handle's acquisition if present. Safe to call repeatedly.
  // The last handle releases the system instance; a failure there is reported
  // through `error` but the handle is still considered released.
  bool Release(std::string& error);

  bool acquired() const {
    return acquired_;
  }

  // Version of the loaded Spinnaker library. Requires an acquired handle.
  bool Version(LibraryVersion& version, std::string& error) const;

#if PHOTONCOUNT_ENABLE_SPINNAKER
  // Valid while this handle is acquired.
  Spinnaker::SystemPtr System() const;
#endif

  struct Snapshot {
    bool initialized = false;
    std::uint32_t active_handles = 0;
    std::uint64_t init_calls = 0;
    std::uint64_t shutdown_calls = 0;
  };

  static Snapshot DebugSnapshot();

private:
  static bool InitializeSdk(std::string& error);
  static bool ShutdownSdk(std::string& error);

  bool acquired_ = false;

  static std::mutex global_mu_;
  static bool initialized_;
  static std::uint32_t active_handles_;
  static std::uint64_t init_calls_;
  static std::uint64_t shutdown_calls_;
#if PHOTONCOUNT_ENABLE_SPINNAKER
  static Spinnaker::SystemPtr system_;
#endif
};

} // namespace photoncount::backends::spinnaker
