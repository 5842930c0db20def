// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/compression/checksum_p.h>

namespace zf::Compression::Checksum {

// zf::Compression::Checksum - CRC32 Table
// =======================================

struct Crc32TableGen {
  static constexpr uint32_t value(size_t index) noexcept {
    uint32_t c = uint32_t(index);
    for (uint32_t k = 0; k < 8; k++)
      c = (c & 1u) ? (c >> 1) ^ kCrc32Polynomial : (c >> 1);
    return c;
  }
};

const LookupTable<uint32_t, 256> crc32_table = make_lookup_table<uint32_t, 256, Crc32TableGen>();

// zf::Compression::Checksum - CRC32
// =================================

uint32_t crc32_update(uint32_t checksum, const uint8_t* data, size_t size) noexcept {
  for (size_t i = 0; i < size; i++)
    checksum = crc32_update_byte(checksum, data[i]);
  return checksum;
}

uint32_t crc32(const uint8_t* data, size_t size) noexcept {
  return crc32_finalize(crc32_update(kCrc32Initial, data, size));
}

// zf::Compression::Checksum - ADLER32
// ===================================

uint32_t adler32_update(uint32_t checksum, const uint8_t* data, size_t size) noexcept {
  uint32_t s1 = checksum & 0xFFFFu;
  uint32_t s2 = checksum >> 16;

  while (size) {
    size_t n = zf_min<size_t>(size, kAdler32MaxBytesPerChunk);
    size -= n;

    const uint8_t* end = data + n;
    while (data != end) {
      s1 += *data++;
      s2 += s1;
    }

    s1 %= kAdler32Divisor;
    s2 %= kAdler32Divisor;
  }

  return (s2 << 16) | s1;
}

uint32_t adler32(const uint8_t* data, size_t size) noexcept {
  return adler32_update(kAdler32Initial, data, size);
}

} // {zf::Compression::Checksum}
