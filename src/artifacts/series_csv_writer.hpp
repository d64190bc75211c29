#pragma once

#include "artifacts/session_record.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace photoncount::artifacts {

// Emits `photon_series.csv`: one row per measured frame, header
// `frame,mean_adu,photons_per_px,electrons_per_px,snr`.
//
// Contract:
// - Creates `output_dir` if needed.
// - Writes the header even when `rows` is empty.
// - Returns false on failure and populates `error`.
bool WritePhotonSeriesCsv(const std::vector<PhotonSeriesRow>& rows,
                          const std::filesystem::path& output_dir,
                          std::filesystem::path& written_path, std::string& error);

} // namespace photoncount::artifacts
