#include "frames/image_frame.hpp"
#include "frames/roi.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using Catch::Approx;
namespace frames = photoncount::frames;

namespace {

// Pixel value equals x + y * width so ROI placement is easy to verify.
frames::ImageFrame MakeGradientFrame(std::uint32_t width, std::uint32_t height) {
  frames::ImageFrame frame;
  frame.width = width;
  frame.height = height;
  frame.pixel_format = frames::PixelFormat::kMono16;
  frame.pixels.resize(static_cast<std::size_t>(width) * height);
  for (std::uint32_t y = 0; y < height; ++y) {
    for (std::uint32_t x = 0; x < width; ++x) {
      frame.pixels[static_cast<std::size_t>(y) * width + x] =
          static_cast<std::uint16_t>(x + y * width);
    }
  }
  return frame;
}

} // namespace

TEST_CASE("ROI size parses WxH text", "[frames][roi]") {
  frames::RoiSize roi;
  std::string error;

  REQUIRE(frames::ParseRoiSize("320x240", roi, error));
  REQUIRE(roi.width == 320U);
  REQUIRE(roi.height == 240U);
  REQUIRE(frames::FormatRoiSize(roi) == "320x240");

  REQUIRE(frames::ParseRoiSize("64X32", roi, error));
  REQUIRE(roi.width == 64U);

  REQUIRE_FALSE(frames::ParseRoiSize("200", roi, error));
  REQUIRE(error.find("WxH") != std::string::npos);
  REQUIRE_FALSE(frames::ParseRoiSize("0x10", roi, error));
  REQUIRE_FALSE(frames::ParseRoiSize("10x-1", roi, error));
  REQUIRE(roi.width == 64U);
}

TEST_CASE("Centered ROI uses integer halves of frame and ROI", "[frames][roi]") {
  frames::RoiRect rect;
  std::string error;

  REQUIRE(frames::ComputeCenteredRoi(720, 540, frames::RoiSize{200, 200}, rect, error));
  REQUIRE(rect.x0 == 260U);
  REQUIRE(rect.y0 == 170U);
  REQUIRE(rect.width == 200U);
  REQUIRE(rect.height == 200U);

  REQUIRE(frames::ComputeCenteredRoi(9, 7, frames::RoiSize{3, 3}, rect, error));
  REQUIRE(rect.x0 == 3U);
  REQUIRE(rect.y0 == 2U);
}

TEST_CASE("Oversized ROI is clamped to the frame", "[frames][roi]") {
  frames::RoiRect rect;
  std::string error;

  REQUIRE(frames::ComputeCenteredRoi(100, 50, frames::RoiSize{200, 20}, rect, error));
  REQUIRE(rect.x0 == 0U);
  REQUIRE(rect.width == 100U);
  REQUIRE(rect.y0 == 15U);
  REQUIRE(rect.height == 20U);

  REQUIRE_FALSE(frames::ComputeCenteredRoi(0, 50, frames::RoiSize{10, 10}, rect, error));
  REQUIRE_FALSE(frames::ComputeCenteredRoi(100, 50, frames::RoiSize{0, 10}, rect, error));
}

TEST_CASE("ROI mean averages only the centered window", "[frames][roi]") {
  const frames::ImageFrame frame = MakeGradientFrame(8, 6);
  double mean = 0.0;
  std::string error;

  // 2x2 window at (3, 2): values 19, 20, 27, 28.
  REQUIRE(frames::MeanOfCenteredRoi(frame, frames::RoiSize{2, 2}, mean, error));
  REQUIRE(mean == Approx(23.5));

  REQUIRE(frames::MeanOfCenteredRoi(frame, frames::RoiSize{100, 100}, mean, error));
  REQUIRE(mean == Approx(frames::MeanPixelValue(frame)));
  REQUIRE(mean == Approx(23.5));

  frames::ImageFrame empty;
  REQUIRE_FALSE(frames::MeanOfCenteredRoi(empty, frames::RoiSize{2, 2}, mean, error));
}

TEST_CASE("ROI extraction copies the centered pixels", "[frames][roi]") {
  const frames::ImageFrame frame = MakeGradientFrame(8, 6);
  frames::ImageFrame roi;
  std::string error;

  REQUIRE(frames::ExtractCenteredRoi(frame, frames::RoiSize{2, 2}, roi, error));
  REQUIRE(roi.width == 2U);
  REQUIRE(roi.height == 2U);
  REQUIRE(roi.at(0, 0) == 19U);
  REQUIRE(roi.at(1, 0) == 20U);
  REQUIRE(roi.at(0, 1) == 27U);
  REQUIRE(roi.at(1, 1) == 28U);
}

TEST_CASE("Malformed frames are rejected", "[frames][roi]") {
  frames::ImageFrame frame = MakeGradientFrame(4, 4);
  frame.pixels.pop_back();
  double mean = 0.0;
  std::string error;
  REQUIRE_FALSE(frames::MeanOfCenteredRoi(frame, frames::RoiSize{2, 2}, mean, error));
  REQUIRE(error.find("does not match") != std::string::npos);
}
