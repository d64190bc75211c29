#include "artifacts/series_csv_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace photoncount::artifacts {

bool WritePhotonSeriesCsv(const std::vector<PhotonSeriesRow>& rows, const fs::path& output_dir,
                          fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  std::ostringstream out;
  out << "frame,mean_adu,photons_per_px,electrons_per_px,snr\n";
  for (const PhotonSeriesRow& row : rows) {
    out << row.frame << ',' << core::FormatJsonNumber(row.mean_adu, 3) << ','
        << core::FormatJsonNumber(row.photons_per_px, 3) << ','
        << core::FormatJsonNumber(row.electrons_per_px, 3) << ','
        << core::FormatJsonNumber(row.snr, 4) << '\n';
  }

  written_path = output_dir / "photon_series.csv";
  return core::WriteTextFileAtomic(written_path, out.str(), error);
}

} // namespace photoncount::artifacts
