#pragma once

#include <cstddef>
#include <cstdint>

namespace uhi {

// CRC32 (IEEE, reflected 0xEDB88320) as used by PNG chunks. Start with
// 0xFFFFFFFF and XOR the result with 0xFFFFFFFF when done.
std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size);

inline std::uint32_t Crc32(const std::uint8_t* data, std::size_t size)
{
  return Crc32Update(0xFFFFFFFFu, data, size) ^ 0xFFFFFFFFu;
}

// zlib Adler32 (RFC 1950), initial value 1.
std::uint32_t Adler32(const std::uint8_t* data, std::size_t size);

} // namespace uhi
