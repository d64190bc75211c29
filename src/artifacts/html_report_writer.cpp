#include "artifacts/html_report_writer.hpp"

#include "backends/backend_factory.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "frames/roi.hpp"
#include "monitor/console_plot.hpp"

#include <algorithm>
#include <deque>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace photoncount::artifacts {

namespace {

constexpr double kSvgWidth = 900.0;
constexpr double kSvgHeight = 320.0;
constexpr double kMarginLeft = 70.0;
constexpr double kMarginRight = 20.0;
constexpr double kMarginTop = 20.0;
constexpr double kMarginBottom = 50.0;
constexpr std::size_t kPlotBuckets = 600;

std::string EscapeHtml(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '&':
      out << "&amp;";
      break;
    case '<':
      out << "&lt;";
      break;
    case '>':
      out << "&gt;";
      break;
    case '"':
      out << "&quot;";
      break;
    case '\'':
      out << "&#39;";
      break;
    default:
      out << ch;
      break;
    }
  }
  return out.str();
}

std::string Fixed(const double value, const int precision) {
  return core::FormatJsonNumber(value, precision);
}

std::string BuildSvgPlot(const std::vector<PhotonSeriesRow>& rows) {
  const double plot_w = kSvgWidth - kMarginLeft - kMarginRight;
  const double plot_h = kSvgHeight - kMarginTop - kMarginBottom;

  std::ostringstream out;
  out << "  <svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << Fixed(kSvgWidth, 0)
      << "\" height=\"" << Fixed(kSvgHeight, 0) << "\" role=\"img\" "
      << "aria-label=\"photons per pixel by frame\">\n"
      << "    <rect x=\"" << Fixed(kMarginLeft, 0) << "\" y=\"" << Fixed(kMarginTop, 0)
      << "\" width=\"" << Fixed(plot_w, 0) << "\" height=\"" << Fixed(plot_h, 0)
      << "\" fill=\"#ffffff\" stroke=\"#9aa5b1\" />\n";

  if (rows.empty()) {
    out << "    <text x=\"" << Fixed(kMarginLeft + plot_w / 2.0, 0) << "\" y=\""
        << Fixed(kMarginTop + plot_h / 2.0, 0)
        << "\" text-anchor=\"middle\" fill=\"#52606d\">no measured frames</text>\n";
  } else {
    std::deque<monitor::PhotonPoint> points;
    for (const PhotonSeriesRow& row : rows) {
      points.push_back(monitor::PhotonPoint{row.frame, row.photons_per_px});
    }
    const std::vector<monitor::PeakBucket> buckets = monitor::DownsamplePeaks(points, kPlotBuckets);

    double lo = buckets.front().min;
    double hi = buckets.front().max;
    for (const monitor::PeakBucket& bucket : buckets) {
      lo = std::min(lo, bucket.min);
      hi = std::max(hi, bucket.max);
    }
    if (hi - lo < 1e-9) {
      lo -= 1.0;
      hi += 1.0;
    }
    const double first_frame = static_cast<double>(buckets.front().first_frame);
    const double last_frame = static_cast<double>(buckets.back().last_frame);
    const double frame_span = last_frame > first_frame ? last_frame - first_frame : 1.0;

    const auto to_x = [&](const double frame) {
      return kMarginLeft + (frame - first_frame) / frame_span * plot_w;
    };
    const auto to_y = [&](const double value) {
      return kMarginTop + (1.0 - (value - lo) / (hi - lo)) * plot_h;
    };

    // Each bucket contributes its min and max so the envelope is drawn.
    out << "    <polyline fill=\"none\" stroke=\"#1f77b4\" stroke-width=\"1.5\" points=\"";
    for (const monitor::PeakBucket& bucket : buckets) {
      const double x = to_x(static_cast<double>(bucket.first_frame));
      out << Fixed(x, 1) << ',' << Fixed(to_y(bucket.min), 1) << ' ' << Fixed(x, 1) << ','
          << Fixed(to_y(bucket.max), 1) << ' ';
    }
    out << "\" />\n";

    out << "    <text x=\"" << Fixed(kMarginLeft - 6.0, 0) << "\" y=\"" << Fixed(kMarginTop + 4.0, 0)
        << "\" text-anchor=\"end\" font-size=\"11\">" << Fixed(hi, 1) << "</text>\n"
        << "    <text x=\"" << Fixed(kMarginLeft - 6.0, 0) << "\" y=\""
        << Fixed(kMarginTop + plot_h, 0) << "\" text-anchor=\"end\" font-size=\"11\">"
        << Fixed(lo, 1) << "</text>\n"
        << "    <text x=\"" << Fixed(kMarginLeft, 0) << "\" y=\""
        << Fixed(kMarginTop + plot_h + 16.0, 0) << "\" font-size=\"11\">"
        << buckets.front().first_frame << "</text>\n"
        << "    <text x=\"" << Fixed(kMarginLeft + plot_w, 0) << "\" y=\""
        << Fixed(kMarginTop + plot_h + 16.0, 0) << "\" text-anchor=\"end\" font-size=\"11\">"
        << buckets.back().last_frame << "</text>\n";
  }

  out << "    <text x=\"" << Fixed(kMarginLeft + plot_w / 2.0, 0) << "\" y=\""
      << Fixed(kSvgHeight - 10.0, 0) << "\" text-anchor=\"middle\">Frame Number</text>\n"
      << "    <text x=\"16\" y=\"" << Fixed(kMarginTop + plot_h / 2.0, 0)
      << "\" text-anchor=\"middle\" transform=\"rotate(-90 16 "
      << Fixed(kMarginTop + plot_h / 2.0, 0) << ")\">Photons / pixel / exposure</text>\n"
      << "  </svg>\n";
  return out.str();
}

void WriteRow(std::ostringstream& out, std::string_view field, std::string_view value) {
  out << "      <tr><td>" << EscapeHtml(field) << "</td><td class=\"numeric\">"
      << EscapeHtml(value) << "</td></tr>\n";
}

} // namespace

bool WriteSessionReportHtml(const SessionRecord& record, const std::vector<PhotonSeriesRow>& rows,
                            const fs::path& output_dir, fs::path& written_path,
                            std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  const config::MonitorConfig& config = record.config;
  const std::string title = "Photon Count Monitor - " + record.device.model;

  std::ostringstream out;
  out << "<!doctype html>\n"
      << "<html lang=\"en\">\n"
      << "<head>\n"
      << "  <meta charset=\"utf-8\" />\n"
      << "  <meta name=\"viewport\" content=\"width=device-width, initial-scale=1\" />\n"
      << "  <title>" << EscapeHtml(title) << "</title>\n"
      << "  <style>\n"
      << "    body { font-family: \"Segoe UI\", \"Helvetica Neue\", Arial, sans-serif; "
         "margin: 24px; color: #1f2933; }\n"
      << "    h1, h2 { margin-bottom: 8px; }\n"
      << "    .meta { color: #52606d; margin-top: 0; }\n"
      << "    table { border-collapse: collapse; margin: 12px 0 20px 0; min-width: 420px; }\n"
      << "    th, td { border: 1px solid #d9e2ec; padding: 6px 10px; text-align: left; }\n"
      << "    th { background: #f5f7fa; }\n"
      << "    td.numeric { text-align: right; font-variant-numeric: tabular-nums; }\n"
      << "  </style>\n"
      << "</head>\n"
      << "<body>\n"
      << "  <h1>" << EscapeHtml(title) << "</h1>\n"
      << "  <p class=\"meta\">ROI: " << EscapeHtml(frames::FormatRoiSize(config.roi))
      << " px | Exposure: " << Fixed(config.exposure_us, 0) << " us</p>\n"
      << BuildSvgPlot(rows) << "\n"
      << "  <h2>Session</h2>\n"
      << "  <table aria-label=\"session\">\n"
      << "    <thead><tr><th>Field</th><th>Value</th></tr></thead>\n"
      << "    <tbody>\n";
  WriteRow(out, "session_id", record.session_id);
  WriteRow(out, "backend", backends::ToString(config.backend));
  WriteRow(out, "serial", record.device.serial);
  WriteRow(out, "started_at_utc", core::FormatUtcTimestamp(record.started_at));
  WriteRow(out, "finished_at_utc", core::FormatUtcTimestamp(record.finished_at));
  WriteRow(out, "stop_reason", record.stop_reason);
  WriteRow(out, "frames_total", std::to_string(record.counters.frames_total));
  WriteRow(out, "frames_calibrating", std::to_string(record.counters.frames_calibrating));
  WriteRow(out, "frames_measured", std::to_string(record.counters.frames_measured));
  WriteRow(out, "frames_failed", std::to_string(record.counters.frames_failed));
  out << "    </tbody>\n"
      << "  </table>\n"
      << "\n"
      << "  <h2>Dark Baseline</h2>\n"
      << "  <table aria-label=\"dark baseline\">\n"
      << "    <thead><tr><th>Field</th><th>Value</th></tr></thead>\n"
      << "    <tbody>\n";
  if (record.calibration.has_value()) {
    WriteRow(out, "mean_dark_adu", Fixed(record.calibration->mean_dark_adu, 3));
    WriteRow(out, "dark_std_adu", Fixed(record.calibration->dark_std_adu, 3));
    WriteRow(out, "dark_std_e", Fixed(record.calibration->dark_std_e, 3));
    WriteRow(out, "sample_count", std::to_string(record.calibration->sample_count));
  } else {
    WriteRow(out, "status", "not completed");
  }
  WriteRow(out, "system_gain_e_per_adu", Fixed(config.calibration.system_gain_e_per_adu, 4));
  WriteRow(out, "quantum_efficiency", Fixed(record.applied_quantum_efficiency, 4));
  WriteRow(out, "read_noise_e", Fixed(config.calibration.read_noise_e, 3));
  out << "    </tbody>\n"
      << "  </table>\n"
      << "\n"
      << "  <h2>Photons per Pixel</h2>\n"
      << "  <table aria-label=\"photon statistics\">\n"
      << "    <thead><tr><th>Statistic</th><th>Value</th></tr></thead>\n"
      << "    <tbody>\n";
  if (record.photon_stats.count() > 0U) {
    WriteRow(out, "mean", Fixed(record.photon_stats.mean(), 2));
    WriteRow(out, "stddev", Fixed(record.photon_stats.stddev(), 2));
    WriteRow(out, "min", Fixed(record.photon_stats.min(), 2));
    WriteRow(out, "max", Fixed(record.photon_stats.max(), 2));
    WriteRow(out, "mean_snr", Fixed(record.snr_stats.mean(), 3));
  } else {
    WriteRow(out, "status", "no measured frames");
  }
  out << "    </tbody>\n"
      << "  </table>\n"
      << "</body>\n"
      << "</html>\n";

  written_path = output_dir / "report.html";
  return core::WriteTextFileAtomic(written_path, out.str(), error);
}

} // namespace photoncount::artifacts
