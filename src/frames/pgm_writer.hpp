#pragma once

#include "frames/image_frame.hpp"

#include <filesystem>
#include <string>

namespace photoncount::frames {

// Writes `frame` as a binary PGM (P5) image.
//
// mono8 frames use maxval 255 and one byte per pixel; mono16 frames use
// maxval 65535 and two big-endian bytes per pixel as the format requires.
// Parent directories are created when missing.
bool WritePgm(const ImageFrame& frame, const std::filesystem::path& output_path,
              std::string& error);

} // namespace photoncount::frames
