#include "monitor/photon_history.hpp"

#include <algorithm>
#include <cmath>

namespace photoncount::monitor {

PhotonHistory::PhotonHistory(const std::size_t max_points)
    : max_points_(max_points == 0U ? 1U : max_points) {}

void PhotonHistory::Add(const std::uint64_t frame, const double photons) {
  points_.push_back(PhotonPoint{frame, photons});
  while (points_.size() > max_points_) {
    points_.pop_front();
  }
}

void PhotonHistory::Clear() {
  points_.clear();
}

double PhotonHistory::Current() const {
  return points_.empty() ? 0.0 : points_.back().photons;
}

double PhotonHistory::Mean() const {
  if (points_.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const PhotonPoint& point : points_) {
    sum += point.photons;
  }
  return sum / static_cast<double>(points_.size());
}

double PhotonHistory::Min() const {
  if (points_.empty()) {
    return 0.0;
  }
  return std::min_element(points_.begin(), points_.end(),
                          [](const PhotonPoint& lhs, const PhotonPoint& rhs) {
                            return lhs.photons < rhs.photons;
                          })
      ->photons;
}

double PhotonHistory::Max() const {
  if (points_.empty()) {
    return 0.0;
  }
  return std::max_element(points_.begin(), points_.end(),
                          [](const PhotonPoint& lhs, const PhotonPoint& rhs) {
                            return lhs.photons < rhs.photons;
                          })
      ->photons;
}

void RunningStats::Add(const double value) {
  ++count_;
  if (count_ == 1U) {
    mean_ = value;
    m2_ = 0.0;
    min_ = value;
    max_ = value;
    return;
  }

  const double delta = value - mean_;
  mean_ += delta / static_cast<double>(count_);
  m2_ += delta * (value - mean_);
  min_ = std::min(min_, value);
  max_ = std::max(max_, value);
}

double RunningStats::stddev() const {
  if (count_ == 0U) {
    return 0.0;
  }
  return std::sqrt(m2_ / static_cast<double>(count_));
}

} // namespace photoncount::monitor
