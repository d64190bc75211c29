#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace photoncount::frames {

enum class PixelFormat {
  kMono8 = 0,
  kMono16,
};

inline std::string_view ToString(PixelFormat format) {
  switch (format) {
  case PixelFormat::kMono8:
    return "mono8";
  case PixelFormat::kMono16:
    return "mono16";
  }
  return "mono8";
}

inline std::uint32_t MaxPixelValue(PixelFormat format) {
  return format == PixelFormat::kMono16 ? 65'535U : 255U;
}

// How one grab attempt ended. Only `kReceived` carries pixel data.
enum class FrameOutcome {
  kReceived = 0,
  kIncomplete,
  kTimeout,
  kError,
};

inline std::string_view ToString(FrameOutcome outcome) {
  switch (outcome) {
  case FrameOutcome::kReceived:
    return "received";
  case FrameOutcome::kIncomplete:
    return "incomplete";
  case FrameOutcome::kTimeout:
    return "timeout";
  case FrameOutcome::kError:
    return "error";
  }
  return "error";
}

// Owned copy of one mono frame. Pixels are row-major and widened to 16 bits so
// mono8 and mono16 sensors share one code path. The SDK buffer the data came
// from has already been released when a frame reaches this type.
struct ImageFrame {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  PixelFormat pixel_format = PixelFormat::kMono8;
  std::vector<std::uint16_t> pixels;
  std::uint64_t frame_id = 0;
  std::chrono::system_clock::time_point timestamp{};

  bool empty() const {
    return width == 0U || height == 0U || pixels.empty();
  }

  std::uint16_t at(std::uint32_t x, std::uint32_t y) const {
    return pixels[static_cast<std::size_t>(y) * width + x];
  }
};

} // namespace photoncount::frames
