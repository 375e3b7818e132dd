#include "uhi/ImageIO.hpp"

#include "uhi/Checksum.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace uhi {

RgbImage::RgbImage(int w, int h, Rgb fill) : width(w), height(h)
{
  const std::size_t n = (w > 0 && h > 0) ? static_cast<std::size_t>(w) * static_cast<std::size_t>(h) : 0u;
  rgb.resize(n * 3u);
  for (std::size_t i = 0; i < n; ++i) {
    rgb[i * 3 + 0] = fill.r;
    rgb[i * 3 + 1] = fill.g;
    rgb[i * 3 + 2] = fill.b;
  }
}

void RgbImage::set(int x, int y, Rgb c)
{
  const std::size_t i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 3u;
  rgb[i + 0] = c.r;
  rgb[i + 1] = c.g;
  rgb[i + 2] = c.b;
}

Rgb RgbImage::get(int x, int y) const
{
  const std::size_t i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 3u;
  return Rgb{rgb[i + 0], rgb[i + 1], rgb[i + 2]};
}

namespace {

void PutU32BE(std::vector<std::uint8_t>& out, std::uint32_t v)
{
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
}

// length | type | data | crc(type + data)
void AppendChunk(std::vector<std::uint8_t>& file, const char (&type)[5], const std::vector<std::uint8_t>& data)
{
  PutU32BE(file, static_cast<std::uint32_t>(data.size()));
  const std::size_t typeAt = file.size();
  file.insert(file.end(), type, type + 4);
  file.insert(file.end(), data.begin(), data.end());
  PutU32BE(file, Crc32(file.data() + typeAt, 4u + data.size()));
}

// zlib header, stored deflate blocks of at most 65535 bytes, Adler32 trailer.
std::vector<std::uint8_t> ZlibStored(const std::vector<std::uint8_t>& raw)
{
  std::vector<std::uint8_t> z;
  z.reserve(raw.size() + raw.size() / 65535u * 5u + 16u);
  z.push_back(0x78u);
  z.push_back(0x01u);

  std::size_t pos = 0;
  do {
    const std::size_t len = std::min<std::size_t>(raw.size() - pos, 65535u);
    const bool last = pos + len >= raw.size();
    z.push_back(last ? 1u : 0u);
    z.push_back(static_cast<std::uint8_t>(len & 0xFFu));
    z.push_back(static_cast<std::uint8_t>((len >> 8) & 0xFFu));
    z.push_back(static_cast<std::uint8_t>(~len & 0xFFu));
    z.push_back(static_cast<std::uint8_t>((~len >> 8) & 0xFFu));
    z.insert(z.end(), raw.begin() + static_cast<std::ptrdiff_t>(pos),
             raw.begin() + static_cast<std::ptrdiff_t>(pos + len));
    pos += len;
  } while (pos < raw.size());

  PutU32BE(z, Adler32(raw.data(), raw.size()));
  return z;
}

} // namespace

bool WritePng(const std::string& path, const RgbImage& img, std::string& outError)
{
  outError.clear();
  if (img.width <= 0 || img.height <= 0) {
    outError = "invalid image dimensions";
    return false;
  }
  const std::size_t stride = static_cast<std::size_t>(img.width) * 3u;
  if (img.rgb.size() != stride * static_cast<std::size_t>(img.height)) {
    std::ostringstream oss;
    oss << "image buffer has " << img.rgb.size() << " bytes, expected " << stride * static_cast<std::size_t>(img.height);
    outError = oss.str();
    return false;
  }

  // Each scanline is prefixed with filter type 0.
  std::vector<std::uint8_t> raw;
  raw.reserve((stride + 1u) * static_cast<std::size_t>(img.height));
  for (int y = 0; y < img.height; ++y) {
    raw.push_back(0u);
    const auto row = img.rgb.begin() + static_cast<std::ptrdiff_t>(stride * static_cast<std::size_t>(y));
    raw.insert(raw.end(), row, row + static_cast<std::ptrdiff_t>(stride));
  }

  std::vector<std::uint8_t> ihdr;
  PutU32BE(ihdr, static_cast<std::uint32_t>(img.width));
  PutU32BE(ihdr, static_cast<std::uint32_t>(img.height));
  ihdr.push_back(8u); // bit depth
  ihdr.push_back(2u); // truecolor
  ihdr.push_back(0u);
  ihdr.push_back(0u);
  ihdr.push_back(0u);

  std::vector<std::uint8_t> file = {0x89u, 'P', 'N', 'G', 0x0Du, 0x0Au, 0x1Au, 0x0Au};
  AppendChunk(file, "IHDR", ihdr);
  AppendChunk(file, "IDAT", ZlibStored(raw));
  AppendChunk(file, "IEND", {});

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open " + path + " for writing";
    return false;
  }
  f.write(reinterpret_cast<const char*>(file.data()), static_cast<std::streamsize>(file.size()));
  if (!f) {
    outError = "failed to write " + path;
    return false;
  }
  return true;
}

} // namespace uhi
