#pragma once

#include "artifacts/session_record.hpp"

#include <filesystem>
#include <string>

namespace photoncount::artifacts {

// Serializes the dark baseline (when one completed) together with the sensor
// constants the session converted with.
std::string CalibrationToJson(const SessionRecord& record);

// Emits `calibration.json`.
//
// Contract:
// - Creates `output_dir` if needed.
// - `dark_baseline` is `null` when the session stopped before calibration
//   finished.
// - Returns false on failure and populates `error`.
bool WriteCalibrationJson(const SessionRecord& record, const std::filesystem::path& output_dir,
                          std::filesystem::path& written_path, std::string& error);

} // namespace photoncount::artifacts
