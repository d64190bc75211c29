#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace photoncount::backends::spinnaker {

inline constexpr std::string_view kGenTlProducerEnvVar = "SPINNAKER_GENTL64_CTI";

// Where the GenTL producer (.cti) the Spinnaker runtime loads is expected to
// live. A missing or dangling path is the most common reason a correctly
// installed SDK reports zero cameras.
struct GenTlProducerStatus {
  bool env_set = false;
  std::filesystem::path producer_path;
  bool producer_exists = false;
};

GenTlProducerStatus ProbeGenTlProducer();

// One-line human summary, for example
//   SPINNAKER_GENTL64_CTI=/opt/spinnaker/lib/spinnaker-gentl/Spinnaker_GenTL.cti (found)
std::string DescribeGenTlProducer(const GenTlProducerStatus& status);

} // namespace photoncount::backends::spinnaker
