#include "artifacts/session_writer.hpp"

#include "backends/backend_factory.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <chrono>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace photoncount::artifacts {

namespace {

std::string Quote(std::string_view value) {
  return "\"" + core::EscapeJson(value) + "\"";
}

void WriteStats(std::ostringstream& out, const monitor::RunningStats& stats,
                const char* indent) {
  if (stats.count() == 0U) {
    out << "null";
    return;
  }
  out << "{\n"
      << indent << "  \"count\": " << stats.count() << ",\n"
      << indent << "  \"mean\": " << core::FormatJsonNumber(stats.mean(), 3) << ",\n"
      << indent << "  \"stddev\": " << core::FormatJsonNumber(stats.stddev(), 3) << ",\n"
      << indent << "  \"min\": " << core::FormatJsonNumber(stats.min(), 3) << ",\n"
      << indent << "  \"max\": " << core::FormatJsonNumber(stats.max(), 3) << "\n"
      << indent << "}";
}

} // namespace

std::string SessionToJson(const SessionRecord& record) {
  const config::MonitorConfig& config = record.config;
  const SessionCounters& counters = record.counters;
  const auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               record.finished_at - record.started_at)
                               .count();

  std::ostringstream out;
  out << "{\n"
      << "  \"session_id\": " << Quote(record.session_id) << ",\n"
      << "  \"started_at_utc\": " << Quote(core::FormatUtcTimestamp(record.started_at)) << ",\n"
      << "  \"finished_at_utc\": " << Quote(core::FormatUtcTimestamp(record.finished_at))
      << ",\n"
      << "  \"duration_ms\": " << (duration_ms < 0 ? 0 : duration_ms) << ",\n"
      << "  \"stop_reason\": " << Quote(record.stop_reason) << ",\n"
      << "  \"config\": {\n"
      << "    \"backend\": " << Quote(backends::ToString(config.backend)) << ",\n"
      << "    \"camera_index\": " << config.camera_index << ",\n"
      << "    \"exposure_us\": " << core::FormatJsonNumber(config.exposure_us, 1) << ",\n"
      << "    \"roi\": {\"width\": " << config.roi.width << ", \"height\": " << config.roi.height
      << "},\n"
      << "    \"baseline_frames\": " << config.baseline_frames << ",\n"
      << "    \"plot_history\": " << config.plot_history << ",\n"
      << "    \"timeout_ms\": " << config.timeout.count() << ",\n"
      << "    \"max_frames\": " << config.max_frames << ",\n"
      << "    \"log_every_n_frames\": " << config.log_every_n_frames << ",\n"
      << "    \"wavelength_nm\": " << core::FormatJsonNumber(config.wavelength_nm, 1) << "\n"
      << "  },\n"
      << "  \"device\": {\n"
      << "    \"model\": " << Quote(record.device.model) << ",\n"
      << "    \"serial\": " << Quote(record.device.serial) << ",\n"
      << "    \"vendor\": " << Quote(record.device.vendor) << "\n"
      << "  },\n"
      << "  \"backend_params\": {";

  bool first = true;
  for (const auto& [key, value] : record.backend_params) {
    out << (first ? "\n" : ",\n") << "    " << Quote(key) << ": " << Quote(value);
    first = false;
  }
  out << (first ? "},\n" : "\n  },\n");

  out << "  \"counters\": {\n"
      << "    \"frames_total\": " << counters.frames_total << ",\n"
      << "    \"frames_calibrating\": " << counters.frames_calibrating << ",\n"
      << "    \"frames_measured\": " << counters.frames_measured << ",\n"
      << "    \"frames_failed\": " << counters.frames_failed << ",\n"
      << "    \"frames_timeout\": " << counters.frames_timeout << ",\n"
      << "    \"frames_incomplete\": " << counters.frames_incomplete << "\n"
      << "  },\n"
      << "  \"calibrated\": " << (record.calibration.has_value() ? "true" : "false") << ",\n"
      << "  \"photons_per_px\": ";
  WriteStats(out, record.photon_stats, "  ");
  out << ",\n"
      << "  \"snr\": ";
  WriteStats(out, record.snr_stats, "  ");
  out << "\n}\n";
  return out.str();
}

bool WriteSessionJson(const SessionRecord& record, const fs::path& output_dir,
                      fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  written_path = output_dir / "session.json";
  return core::WriteTextFileAtomic(written_path, SessionToJson(record), error);
}

} // namespace photoncount::artifacts
