#include "uhi/Checksum.hpp"

#include <array>

namespace uhi {

namespace {

std::array<std::uint32_t, 256> BuildCrcTable()
{
  std::array<std::uint32_t, 256> t{};
  for (std::uint32_t n = 0; n < 256u; ++n) {
    std::uint32_t c = n;
    for (int k = 0; k < 8; ++k) c = (c & 1u) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
    t[n] = c;
  }
  return t;
}

} // namespace

std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size)
{
  static const std::array<std::uint32_t, 256> kTable = BuildCrcTable();
  for (std::size_t i = 0; i < size; ++i) crc = kTable[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
  return crc;
}

std::uint32_t Adler32(const std::uint8_t* data, std::size_t size)
{
  constexpr std::uint32_t kMod = 65521u;
  // 5552 is the largest block for which the sums cannot overflow 32 bits.
  constexpr std::size_t kBlock = 5552u;

  std::uint32_t a = 1u;
  std::uint32_t b = 0u;
  std::size_t pos = 0;
  while (pos < size) {
    const std::size_t end = (size - pos > kBlock) ? pos + kBlock : size;
    for (; pos < end; ++pos) {
      a += data[pos];
      b += a;
    }
    a %= kMod;
    b %= kMod;
  }
  return (b << 16) | a;
}

} // namespace uhi
