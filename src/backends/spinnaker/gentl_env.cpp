#include "backends/spinnaker/gentl_env.hpp"

#include <cstdlib>
#include <system_error>

namespace photoncount::backends::spinnaker {

GenTlProducerStatus ProbeGenTlProducer() {
  GenTlProducerStatus status;
  const std::string env_name(kGenTlProducerEnvVar);
  const char* raw = std::getenv(env_name.c_str());
  if (raw == nullptr || *raw == '\0') {
    return status;
  }

  status.env_set = true;
  status.producer_path = std::filesystem::path(raw);
  std::error_code ec;
  status.producer_exists = std::filesystem::is_regular_file(status.producer_path, ec) && !ec;
  return status;
}

std::string DescribeGenTlProducer(const GenTlProducerStatus& status) {
  const std::string env_name(kGenTlProducerEnvVar);
  if (!status.env_set) {
    return env_name + " is not set (the Spinnaker runtime falls back to its install default)";
  }
  return env_name + "=" + status.producer_path.string() +
         (status.producer_exists ? " (found)" : " (missing)");
}

} // namespace photoncount::backends::spinnaker
