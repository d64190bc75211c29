#pragma once

#include "artifacts/session_record.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace photoncount::artifacts {

// Writes a static HTML report (`report.html`) for a finished session.
//
// - inline SVG plot of photons per pixel against frame number, drawn from a
//   peak-preserving downsample so spikes stay visible on long sessions.
// - session, dark baseline and photon statistics tables.
// - no JavaScript or external assets.
//
// Contract:
// - creates `output_dir` when missing.
// - returns false and sets `error` on failure.
bool WriteSessionReportHtml(const SessionRecord& record,
                            const std::vector<PhotonSeriesRow>& rows,
                            const std::filesystem::path& output_dir,
                            std::filesystem::path& written_path, std::string& error);

} // namespace photoncount::artifacts
