#include "monitor/console_plot.hpp"

#include "core/json_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <utility>

namespace photoncount::monitor {

namespace {

constexpr std::string_view kClearScreen = "\x1b[2J\x1b[H";
constexpr std::size_t kAxisLabelWidth = 10;
constexpr std::size_t kProgressBarWidth = 40;

std::string FormatAxisValue(const double value) {
  std::ostringstream out;
  out << std::setw(static_cast<int>(kAxisLabelWidth)) << std::fixed << std::setprecision(1)
      << value;
  return out.str();
}

std::size_t ToRow(const double value, const double lo, const double hi, const std::size_t height) {
  const double scaled = (value - lo) / (hi - lo) * static_cast<double>(height - 1U);
  const double clamped = std::clamp(scaled, 0.0, static_cast<double>(height - 1U));
  return static_cast<std::size_t>(std::lround(clamped));
}

} // namespace

std::vector<PeakBucket> DownsamplePeaks(const std::deque<PhotonPoint>& points,
                                        const std::size_t buckets) {
  std::vector<PeakBucket> result;
  if (points.empty() || buckets == 0U) {
    return result;
  }

  const std::size_t bucket_count = std::min(buckets, points.size());
  result.reserve(bucket_count);
  for (std::size_t b = 0; b < bucket_count; ++b) {
    const std::size_t begin = b * points.size() / bucket_count;
    const std::size_t end = (b + 1U) * points.size() / bucket_count;

    PeakBucket bucket;
    bucket.first_frame = points[begin].frame;
    bucket.last_frame = points[end - 1U].frame;
    bucket.min = points[begin].photons;
    bucket.max = points[begin].photons;
    for (std::size_t i = begin + 1U; i < end; ++i) {
      bucket.min = std::min(bucket.min, points[i].photons);
      bucket.max = std::max(bucket.max, points[i].photons);
    }
    result.push_back(bucket);
  }
  return result;
}

ConsolePlot::ConsolePlot(PlotHeader header, const PlotOptions options)
    : header_(std::move(header)), options_(options) {
  options_.width = std::max<std::size_t>(options_.width, 2U);
  options_.height = std::max<std::size_t>(options_.height, 2U);
}

std::string ConsolePlot::RenderTitle() const {
  std::ostringstream out;
  out << "Photon Count Monitor - " << header_.model << '\n'
      << "ROI: " << frames::FormatRoiSize(header_.roi)
      << " px | Exposure: " << core::FormatJsonNumber(header_.exposure_us, 0) << " us\n";
  return out.str();
}

std::string ConsolePlot::Render(const PhotonHistory& history) const {
  std::ostringstream out;
  out << RenderTitle() << '\n';
  out << "Photons / pixel / exposure\n";

  const std::vector<PeakBucket> buckets = DownsamplePeaks(history.points(), options_.width);
  const std::string blank_label(kAxisLabelWidth, ' ');
  if (buckets.empty()) {
    out << blank_label << " |  (waiting for data)\n";
  } else {
    double lo = buckets.front().min;
    double hi = buckets.front().max;
    for (const PeakBucket& bucket : buckets) {
      lo = std::min(lo, bucket.min);
      hi = std::max(hi, bucket.max);
    }
    if (hi - lo < 1e-9) {
      lo -= 1.0;
      hi += 1.0;
    }

    // Row 0 is the top of the chart.
    std::vector<std::string> grid(options_.height, std::string(buckets.size(), ' '));
    for (std::size_t col = 0; col < buckets.size(); ++col) {
      const std::size_t low_row = ToRow(buckets[col].min, lo, hi, options_.height);
      const std::size_t high_row = ToRow(buckets[col].max, lo, hi, options_.height);
      for (std::size_t row = low_row; row <= high_row; ++row) {
        grid[options_.height - 1U - row][col] = '*';
      }
    }

    for (std::size_t row = 0; row < options_.height; ++row) {
      if (row == 0U) {
        out << FormatAxisValue(hi);
      } else if (row + 1U == options_.height) {
        out << FormatAxisValue(lo);
      } else {
        out << blank_label;
      }
      out << " |" << grid[row] << '\n';
    }
    out << blank_label << " +" << std::string(buckets.size(), '-') << '\n';

    const std::string first = std::to_string(buckets.front().first_frame);
    const std::string last = std::to_string(buckets.back().last_frame);
    const std::size_t gap =
        buckets.size() > first.size() + last.size() ? buckets.size() - first.size() - last.size()
                                                    : 1U;
    out << blank_label << "  " << first << std::string(gap, ' ') << last << '\n';
  }
  out << blank_label << "  Frame Number\n\n";

  out << "Current: " << core::FormatJsonNumber(history.Current(), 1) << " photons/px\n"
      << "Mean: " << core::FormatJsonNumber(history.Mean(), 1) << " photons/px\n";
  return out.str();
}

std::string ConsolePlot::RenderCalibration(const std::size_t collected,
                                           const std::size_t baseline_frames) const {
  const std::size_t shown = std::min(collected, baseline_frames);
  const std::size_t filled =
      baseline_frames == 0U ? kProgressBarWidth : shown * kProgressBarWidth / baseline_frames;

  std::ostringstream out;
  out << RenderTitle() << '\n'
      << "Calibrating dark baseline... keep the sensor covered\n"
      << '[' << std::string(filled, '#') << std::string(kProgressBarWidth - filled, '.') << "] "
      << shown << '/' << baseline_frames << " frames\n";
  return out.str();
}

void ConsolePlot::Show(const std::string& screen, std::ostream& out) {
  out << kClearScreen << screen;
  out.flush();
}

} // namespace photoncount::monitor
