#include "frames/pgm_writer.hpp"

#include "core/fs_utils.hpp"

#include <string_view>

namespace photoncount::frames {

bool WritePgm(const ImageFrame& frame, const std::filesystem::path& output_path,
              std::string& error) {
  if (frame.empty() ||
      frame.pixels.size() != static_cast<std::size_t>(frame.width) * frame.height) {
    error = "cannot write PGM for an empty or malformed frame";
    return false;
  }

  const bool wide = frame.pixel_format == PixelFormat::kMono16;
  std::string payload = "P5\n" + std::to_string(frame.width) + " " +
                        std::to_string(frame.height) + "\n" +
                        std::to_string(MaxPixelValue(frame.pixel_format)) + "\n";
  payload.reserve(payload.size() + frame.pixels.size() * (wide ? 2U : 1U));

  for (const std::uint16_t value : frame.pixels) {
    if (wide) {
      payload.push_back(static_cast<char>((value >> 8U) & 0xFFU));
      payload.push_back(static_cast<char>(value & 0xFFU));
    } else {
      payload.push_back(static_cast<char>(value & 0xFFU));
    }
  }

  return core::WriteTextFileAtomic(output_path, std::string_view(payload), error);
}

} // namespace photoncount::frames
