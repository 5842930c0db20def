// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_COMPRESSION_CHECKSUM_P_H_INCLUDED
#define ZFLATE_COMPRESSION_CHECKSUM_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>
#include <zflate/support/lookuptable_p.h>

//! \cond INTERNAL

namespace zf::Compression::Checksum {

ZF_HIDDEN extern const LookupTable<uint32_t, 256> crc32_table;

// Initial value used by CRC32 checksum.
static constexpr uint32_t kCrc32Initial = 0xFFFFFFFFu;

// Reflected CRC32 polynomial (IEEE 802.3).
static constexpr uint32_t kCrc32Polynomial = 0xEDB88320u;

// Initial value used by ADLER32 checksum.
static constexpr uint32_t kAdler32Initial = 0x00000001u;

// The Adler32 divisor - highest prime that fits into 16 bits.
static constexpr uint32_t kAdler32Divisor = 65521u;

// kAdler32MaxBytesPerChunk is the most bytes that can be processed without the possibility of s2 overflowing when
// it is represented as an unsigned 32-bit integer. To get the correct worst-case value, we must assume that every
// byte in the input equals 0xFF and that s1 and s2 started with the highest possible values modulo the divisor.
static constexpr uint32_t kAdler32MaxBytesPerChunk = 5552u;

static ZF_INLINE uint32_t crc32_update_byte(uint32_t checksum, uint8_t b) noexcept { return (checksum >> 8) ^ crc32_table[(checksum ^ b) & 0xFFu]; }
static ZF_INLINE uint32_t crc32_finalize(uint32_t checksum) noexcept { return ~checksum; }

//! Computes CRC32 checksum of `data` (initial value and final xor included).
ZF_HIDDEN uint32_t crc32(const uint8_t* data, size_t size) noexcept;
//! Updates a non-finalized CRC32 `checksum` with `data`.
ZF_HIDDEN uint32_t crc32_update(uint32_t checksum, const uint8_t* data, size_t size) noexcept;

//! Computes ADLER32 checksum of `data`.
ZF_HIDDEN uint32_t adler32(const uint8_t* data, size_t size) noexcept;
//! Updates ADLER32 `checksum` with `data`.
ZF_HIDDEN uint32_t adler32_update(uint32_t checksum, const uint8_t* data, size_t size) noexcept;

} // {zf::Compression::Checksum}

//! \endcond

#endif // ZFLATE_COMPRESSION_CHECKSUM_P_H_INCLUDED
