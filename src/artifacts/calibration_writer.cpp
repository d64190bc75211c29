#include "artifacts/calibration_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace photoncount::artifacts {

std::string CalibrationToJson(const SessionRecord& record) {
  const photon::SensorCalibration& sensor = record.config.calibration;

  std::ostringstream out;
  out << "{\n"
      << "  \"session_id\": \"" << core::EscapeJson(record.session_id) << "\",\n"
      << "  \"sensor\": {\n"
      << "    \"model\": \"" << core::EscapeJson(record.device.model) << "\",\n"
      << "    \"system_gain_e_per_adu\": " << core::FormatJsonNumber(sensor.system_gain_e_per_adu)
      << ",\n"
      << "    \"quantum_efficiency\": " << core::FormatJsonNumber(sensor.quantum_efficiency)
      << ",\n"
      << "    \"reference_wavelength_nm\": "
      << core::FormatJsonNumber(sensor.reference_wavelength_nm, 1) << ",\n"
      << "    \"read_noise_e\": " << core::FormatJsonNumber(sensor.read_noise_e, 3) << ",\n"
      << "    \"saturation_capacity_e\": " << core::FormatJsonNumber(sensor.saturation_capacity_e, 1)
      << "\n"
      << "  },\n"
      << "  \"wavelength_nm\": " << core::FormatJsonNumber(record.config.wavelength_nm, 1) << ",\n"
      << "  \"applied_quantum_efficiency\": "
      << core::FormatJsonNumber(record.applied_quantum_efficiency) << ",\n"
      << "  \"quantum_efficiency_approximate\": "
      << (record.quantum_efficiency_approximate ? "true" : "false") << ",\n"
      << "  \"baseline_frames\": " << record.config.baseline_frames << ",\n"
      << "  \"dark_baseline\": ";

  if (record.calibration.has_value()) {
    const acquisition::DarkCalibrationSummary& dark = record.calibration.value();
    out << "{\n"
        << "    \"mean_dark_adu\": " << core::FormatJsonNumber(dark.mean_dark_adu, 4) << ",\n"
        << "    \"dark_std_adu\": " << core::FormatJsonNumber(dark.dark_std_adu, 4) << ",\n"
        << "    \"dark_std_e\": " << core::FormatJsonNumber(dark.dark_std_e, 4) << ",\n"
        << "    \"sample_count\": " << dark.sample_count << "\n"
        << "  }\n";
  } else {
    out << "null\n";
  }
  out << "}\n";
  return out.str();
}

bool WriteCalibrationJson(const SessionRecord& record, const fs::path& output_dir,
                          fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  written_path = output_dir / "calibration.json";
  return core::WriteTextFileAtomic(written_path, CalibrationToJson(record), error);
}

} // namespace photoncount::artifacts
