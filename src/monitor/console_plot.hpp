#pragma once

#include "frames/roi.hpp"
#include "monitor/photon_history.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <ostream>
#include <string>
#include <vector>

namespace photoncount::monitor {

struct PlotHeader {
  std::string model;
  frames::RoiSize roi;
  double exposure_us = 0.0;
};

struct PlotOptions {
  std::size_t width = 60;
  std::size_t height = 12;
};

// Min/max envelope of a contiguous run of history points.
struct PeakBucket {
  std::uint64_t first_frame = 0;
  std::uint64_t last_frame = 0;
  double min = 0.0;
  double max = 0.0;
};

// Peak-preserving downsample: splits `points` into at most `buckets` even
// runs and keeps each run's min and max, so single-frame spikes survive.
// Fewer points than buckets yields one bucket per point.
std::vector<PeakBucket> DownsamplePeaks(const std::deque<PhotonPoint>& points,
                                        std::size_t buckets);

// Terminal rendition of the live photon plot.
class ConsolePlot {
public:
  explicit ConsolePlot(PlotHeader header, PlotOptions options = {});

  std::string Render(const PhotonHistory& history) const;

  // Shown while the dark baseline is collected; the chart stays hidden.
  std::string RenderCalibration(std::size_t collected, std::size_t baseline_frames) const;

  // Clears the terminal (ANSI) and writes one rendered screen.
  static void Show(const std::string& screen, std::ostream& out);

private:
  std::string RenderTitle() const;

  PlotHeader header_;
  PlotOptions options_;
};

} // namespace photoncount::monitor
