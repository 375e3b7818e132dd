#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace uhi {

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
};

// 8-bit RGB image, row-major, 3 bytes per pixel.
struct RgbImage {
  int width = 0;
  int height = 0;
  std::vector<std::uint8_t> rgb;

  RgbImage() = default;
  RgbImage(int w, int h, Rgb fill = {});

  void set(int x, int y, Rgb c);
  Rgb get(int x, int y) const;
};

// Truecolor PNG with an uncompressed (stored) zlib stream. Viewers read it fine;
// the files are just larger than deflated ones.
bool WritePng(const std::string& path, const RgbImage& img, std::string& outError);

} // namespace uhi
