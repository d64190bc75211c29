#include "monitor/photon_history.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using Catch::Approx;
namespace monitor = photoncount::monitor;

TEST_CASE("Empty history reports zero statistics", "[monitor][history]") {
  const monitor::PhotonHistory history(10);
  REQUIRE(history.empty());
  REQUIRE(history.Current() == 0.0);
  REQUIRE(history.Mean() == 0.0);
  REQUIRE(history.Min() == 0.0);
  REQUIRE(history.Max() == 0.0);
}

TEST_CASE("History keeps only the newest points", "[monitor][history]") {
  monitor::PhotonHistory history(3);
  for (std::uint64_t frame = 1; frame <= 5; ++frame) {
    history.Add(frame, static_cast<double>(frame) * 10.0);
  }

  REQUIRE(history.size() == 3U);
  REQUIRE(history.points().front().frame == 3U);
  REQUIRE(history.points().back().frame == 5U);
  REQUIRE(history.Current() == Approx(50.0));
  REQUIRE(history.Mean() == Approx(40.0));
  REQUIRE(history.Min() == Approx(30.0));
  REQUIRE(history.Max() == Approx(50.0));

  history.Clear();
  REQUIRE(history.empty());
  REQUIRE(history.max_points() == 3U);
}

TEST_CASE("Zero history limit still keeps the latest point", "[monitor][history]") {
  monitor::PhotonHistory history(0);
  REQUIRE(history.max_points() == 1U);
  history.Add(1, 5.0);
  history.Add(2, 7.0);
  REQUIRE(history.size() == 1U);
  REQUIRE(history.Current() == Approx(7.0));
}

TEST_CASE("Running stats track the whole session", "[monitor][history]") {
  monitor::RunningStats stats;
  REQUIRE(stats.count() == 0U);
  REQUIRE(stats.stddev() == 0.0);

  for (const double value : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) {
    stats.Add(value);
  }
  REQUIRE(stats.count() == 8U);
  REQUIRE(stats.mean() == Approx(5.0));
  REQUIRE(stats.stddev() == Approx(2.0));
  REQUIRE(stats.min() == Approx(2.0));
  REQUIRE(stats.max() == Approx(9.0));
}
