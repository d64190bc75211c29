#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "frames/pgm_writer.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int main() {
  using photoncount::frames::ImageFrame;
  using photoncount::frames::PixelFormat;
  using photoncount::tests::common::Fail;
  using photoncount::tests::common::ReadFileToString;

  const fs::path out_dir = photoncount::tests::common::CreateUniqueTempDir("photoncount-pgm");
  std::string error;

  ImageFrame wide;
  wide.width = 2;
  wide.height = 1;
  wide.pixel_format = PixelFormat::kMono16;
  wide.pixels = {0x0102, 0xFFEE};

  const fs::path wide_path = out_dir / "snapshots" / "wide.pgm";
  if (!photoncount::frames::WritePgm(wide, wide_path, error)) {
    Fail("mono16 PGM write failed: " + error);
  }
  const std::string wide_bytes = ReadFileToString(wide_path);
  const std::string wide_expected = std::string("P5\n2 1\n65535\n") + '\x01' + '\x02' + '\xFF' + '\xEE';
  if (wide_bytes != wide_expected) {
    Fail("mono16 PGM should be big-endian with maxval 65535");
  }

  ImageFrame narrow;
  narrow.width = 3;
  narrow.height = 1;
  narrow.pixel_format = PixelFormat::kMono8;
  narrow.pixels = {0, 128, 255};

  const fs::path narrow_path = out_dir / "narrow.pgm";
  if (!photoncount::frames::WritePgm(narrow, narrow_path, error)) {
    Fail("mono8 PGM write failed: " + error);
  }
  const std::string narrow_expected = std::string("P5\n3 1\n255\n") + '\x00' + '\x80' + '\xFF';
  if (ReadFileToString(narrow_path) != narrow_expected) {
    Fail("mono8 PGM should use one byte per pixel");
  }

  ImageFrame malformed = narrow;
  malformed.pixels.pop_back();
  if (photoncount::frames::WritePgm(malformed, out_dir / "bad.pgm", error)) {
    Fail("malformed frame should not be written");
  }
  if (fs::exists(out_dir / "bad.pgm")) {
    Fail("failed PGM write should not leave a file behind");
  }

  photoncount::tests::common::RemovePathBestEffort(out_dir);
  std::cout << "pgm_writer_smoke: ok\n";
  return 0;
}
