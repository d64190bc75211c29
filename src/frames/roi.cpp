#include "frames/roi.hpp"

#include <charconv>
#include <utility>

namespace photoncount::frames {

namespace {

bool ParsePositiveUInt32(std::string_view raw, std::uint32_t& parsed) {
  if (raw.empty()) {
    return false;
  }
  std::uint32_t value = 0;
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || value == 0U) {
    return false;
  }
  parsed = value;
  return true;
}

bool ValidateFrameShape(const ImageFrame& frame, std::string& error) {
  if (frame.empty()) {
    error = "frame has no pixel data";
    return false;
  }
  const std::size_t expected = static_cast<std::size_t>(frame.width) * frame.height;
  if (frame.pixels.size() != expected) {
    error = "frame pixel count " + std::to_string(frame.pixels.size()) + " does not match " +
            std::to_string(frame.width) + "x" + std::to_string(frame.height);
    return false;
  }
  return true;
}

} // namespace

bool ParseRoiSize(std::string_view text, RoiSize& roi, std::string& error) {
  const std::size_t sep = text.find_first_of("xX");
  if (sep == std::string_view::npos) {
    error = "ROI must use WxH format (for example 200x200): " + std::string(text);
    return false;
  }

  RoiSize parsed;
  if (!ParsePositiveUInt32(text.substr(0, sep), parsed.width) ||
      !ParsePositiveUInt32(text.substr(sep + 1), parsed.height)) {
    error = "ROI width and height must be positive integers: " + std::string(text);
    return false;
  }

  roi = parsed;
  error.clear();
  return true;
}

std::string FormatRoiSize(const RoiSize& roi) {
  return std::to_string(roi.width) + "x" + std::to_string(roi.height);
}

bool ComputeCenteredRoi(const std::uint32_t image_width, const std::uint32_t image_height,
                        const RoiSize& roi, RoiRect& rect, std::string& error) {
  if (image_width == 0U || image_height == 0U) {
    error = "cannot place ROI in an empty frame";
    return false;
  }
  if (roi.width == 0U || roi.height == 0U) {
    error = "ROI dimensions must be greater than 0";
    return false;
  }

  rect = RoiRect{};
  if (roi.width >= image_width) {
    rect.x0 = 0U;
    rect.width = image_width;
  } else {
    rect.x0 = image_width / 2U - roi.width / 2U;
    rect.width = roi.width;
  }

  if (roi.height >= image_height) {
    rect.y0 = 0U;
    rect.height = image_height;
  } else {
    rect.y0 = image_height / 2U - roi.height / 2U;
    rect.height = roi.height;
  }

  error.clear();
  return true;
}

bool MeanOfCenteredRoi(const ImageFrame& frame, const RoiSize& roi, double& mean_adu,
                       std::string& error) {
  if (!ValidateFrameShape(frame, error)) {
    return false;
  }
  RoiRect rect;
  if (!ComputeCenteredRoi(frame.width, frame.height, roi, rect, error)) {
    return false;
  }

  std::uint64_t sum = 0;
  for (std::uint32_t y = rect.y0; y < rect.y0 + rect.height; ++y) {
    const std::size_t row_offset = static_cast<std::size_t>(y) * frame.width;
    for (std::uint32_t x = rect.x0; x < rect.x0 + rect.width; ++x) {
      sum += frame.pixels[row_offset + x];
    }
  }

  const auto count = static_cast<std::uint64_t>(rect.width) * rect.height;
  mean_adu = static_cast<double>(sum) / static_cast<double>(count);
  return true;
}

bool ExtractCenteredRoi(const ImageFrame& frame, const RoiSize& roi, ImageFrame& out,
                        std::string& error) {
  if (!ValidateFrameShape(frame, error)) {
    return false;
  }
  RoiRect rect;
  if (!ComputeCenteredRoi(frame.width, frame.height, roi, rect, error)) {
    return false;
  }

  ImageFrame extracted;
  extracted.width = rect.width;
  extracted.height = rect.height;
  extracted.pixel_format = frame.pixel_format;
  extracted.frame_id = frame.frame_id;
  extracted.timestamp = frame.timestamp;
  extracted.pixels.reserve(static_cast<std::size_t>(rect.width) * rect.height);
  for (std::uint32_t y = rect.y0; y < rect.y0 + rect.height; ++y) {
    const auto row_begin =
        frame.pixels.begin() + static_cast<std::ptrdiff_t>(static_cast<std::size_t>(y) * frame.width + rect.x0);
    extracted.pixels.insert(extracted.pixels.end(), row_begin,
                            row_begin + static_cast<std::ptrdiff_t>(rect.width));
  }

  out = std::move(extracted);
  return true;
}

double MeanPixelValue(const ImageFrame& frame) {
  if (frame.pixels.empty()) {
    return 0.0;
  }
  std::uint64_t sum = 0;
  for (const std::uint16_t value : frame.pixels) {
    sum += value;
  }
  return static_cast<double>(sum) / static_cast<double>(frame.pixels.size());
}

} // namespace photoncount::frames
