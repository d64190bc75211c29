#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace photoncount::monitor {

constexpr std::size_t kDefaultPlotHistory = 500;

struct PhotonPoint {
  std::uint64_t frame = 0;
  double photons = 0.0;
};

// Bounded (frame, photons) series backing the live plot. Adding past the limit
// drops the oldest points. Statistics cover the retained window only.
class PhotonHistory {
public:
  explicit PhotonHistory(std::size_t max_points = kDefaultPlotHistory);

  void Add(std::uint64_t frame, double photons);
  void Clear();

  const std::deque<PhotonPoint>& points() const {
    return points_;
  }
  std::size_t size() const {
    return points_.size();
  }
  bool empty() const {
    return points_.empty();
  }
  std::size_t max_points() const {
    return max_points_;
  }

  // All four return 0 on an empty history.
  double Current() const;
  double Mean() const;
  double Min() const;
  double Max() const;

private:
  std::size_t max_points_ = kDefaultPlotHistory;
  std::deque<PhotonPoint> points_;
};

// Whole-session accumulator (Welford) for the summary artifacts, independent
// of the plot window.
class RunningStats {
public:
  void Add(double value);

  std::uint64_t count() const {
    return count_;
  }
  double mean() const {
    return mean_;
  }
  double min() const {
    return min_;
  }
  double max() const {
    return max_;
  }
  // Population standard deviation.
  double stddev() const;

private:
  std::uint64_t count_ = 0;
  double mean_ = 0.0;
  double m2_ = 0.0;
  double min_ = 0.0;
  double max_ = 0.0;
};

} // namespace photoncount::monitor
