#pragma once

#include "frames/image_frame.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace photoncount::frames {

struct RoiSize {
  std::uint32_t width = 200;
  std::uint32_t height = 200;
};

// Pixel rectangle inside a frame. Always fully contained in the frame it was
// computed for.
struct RoiRect {
  std::uint32_t x0 = 0;
  std::uint32_t y0 = 0;
  std::uint32_t width = 0;
  std::uint32_t height = 0;
};

// Parses `WxH` (for example `200x200`). Both sides must be positive integers.
bool ParseRoiSize(std::string_view text, RoiSize& roi, std::string& error);

std::string FormatRoiSize(const RoiSize& roi);

// Centers `roi` in a `image_width x image_height` frame:
//   x0 = w/2 - roi_w/2,  y0 = h/2 - roi_h/2  (integer division)
// An axis where the ROI exceeds the frame is clamped to the full frame extent.
// Fails for zero-sized frames or ROIs.
bool ComputeCenteredRoi(std::uint32_t image_width, std::uint32_t image_height,
                        const RoiSize& roi, RoiRect& rect, std::string& error);

// Mean pixel value of the centered ROI, computed in place.
bool MeanOfCenteredRoi(const ImageFrame& frame, const RoiSize& roi, double& mean_adu,
                       std::string& error);

// Copies the centered ROI into a standalone frame.
bool ExtractCenteredRoi(const ImageFrame& frame, const RoiSize& roi, ImageFrame& out,
                        std::string& error);

// Mean over every pixel of the frame.
double MeanPixelValue(const ImageFrame& frame);

} // namespace photoncount::frames
