#pragma once

#include "artifacts/session_record.hpp"

#include <filesystem>
#include <string>

namespace photoncount::artifacts {

std::string SessionToJson(const SessionRecord& record);

// Emits `session.json`: effective config, device identity, frame counters and
// photon summary statistics.
//
// Contract:
// - Creates `output_dir` if needed.
// - Returns false on failure and populates `error`.
bool WriteSessionJson(const SessionRecord& record, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

} // namespace photoncount::artifacts
