#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "artifacts/html_report_writer.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  using photoncount::tests::common::AssertContains;
  using photoncount::tests::common::AssertNotContains;
  using photoncount::tests::common::Fail;
  using photoncount::tests::common::ReadFileToString;

  const auto base_time =
      std::chrono::system_clock::time_point(std::chrono::milliseconds(1'700'000'000'000));

  photoncount::artifacts::SessionRecord record;
  record.session_id = "session-html-smoke";
  record.started_at = base_time;
  record.finished_at = base_time + std::chrono::seconds(30);
  record.stop_reason = "interrupted";
  record.device.model = "BFS-U3-04S2M <sim>";
  record.applied_quantum_efficiency = 0.6182;
  record.counters.frames_total = 2'050;
  record.counters.frames_calibrating = 50;
  record.counters.frames_measured = 2'000;
  record.calibration = photoncount::acquisition::DarkCalibrationSummary{
      .mean_dark_adu = 100.0, .dark_std_adu = 0.1, .dark_std_e = 0.035, .sample_count = 50};

  // Long flat series with one spike: the downsampled plot must keep it.
  std::vector<photoncount::artifacts::PhotonSeriesRow> rows;
  for (std::uint64_t frame = 51; frame <= 2'050; ++frame) {
    const double photons = frame == 1'234U ? 2'500.0 : 500.0;
    rows.push_back({.frame = frame, .mean_adu = 0.0, .photons_per_px = photons});
    record.photon_stats.Add(photons);
    record.snr_stats.Add(17.0);
  }

  const fs::path out_dir = photoncount::tests::common::CreateUniqueTempDir("photoncount-html");
  fs::path written;
  std::string error;
  if (!photoncount::artifacts::WriteSessionReportHtml(record, rows, out_dir, written, error)) {
    Fail("report.html write failed: " + error);
  }
  if (written != out_dir / "report.html") {
    Fail("unexpected report.html path");
  }

  const std::string html = ReadFileToString(written);
  AssertContains(html, "<title>Photon Count Monitor - BFS-U3-04S2M &lt;sim&gt;</title>");
  AssertContains(html, "ROI: 200x200 px | Exposure: 5000 us");
  AssertContains(html, "<svg");
  AssertContains(html, "<polyline");
  AssertContains(html, ">2500.0</text>");
  AssertContains(html, ">51</text>");
  AssertContains(html, ">2050</text>");
  AssertContains(html, "Frame Number");
  AssertContains(html, "Photons / pixel / exposure");
  AssertContains(html, "<td>stop_reason</td><td class=\"numeric\">interrupted</td>");
  AssertContains(html, "<td>sample_count</td><td class=\"numeric\">50</td>");
  AssertContains(html, "<td>max</td><td class=\"numeric\">2500.00</td>");
  AssertNotContains(html, "<script");
  AssertNotContains(html, "no measured frames");

  photoncount::artifacts::SessionRecord empty_record = record;
  empty_record.calibration.reset();
  empty_record.photon_stats = photoncount::monitor::RunningStats{};
  if (!photoncount::artifacts::WriteSessionReportHtml(empty_record, {}, out_dir / "empty", written,
                                                      error)) {
    Fail("empty report.html write failed: " + error);
  }
  const std::string empty_html = ReadFileToString(written);
  AssertContains(empty_html, "no measured frames");
  AssertContains(empty_html, "<td>status</td><td class=\"numeric\">not completed</td>");
  AssertNotContains(empty_html, "<polyline");

  photoncount::tests::common::RemovePathBestEffort(out_dir);
  std::cout << "html_report_writer_smoke: ok\n";
  return 0;
}
