// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_COMPRESSION_MATCHFINDER_P_H_INCLUDED
#define ZFLATE_COMPRESSION_MATCHFINDER_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>
#include <zflate/compression/deflatedefs_p.h>

//! \cond INTERNAL

namespace zf::Compression::Deflate {

//! A match found by the match finder, `length == 0` means no match.
struct Match {
  uint32_t length;
  uint32_t offset;

  ZF_INLINE_NODEBUG bool is_valid() const noexcept { return length >= kMinMatchLen; }
};

//! Hash chain match finder.
//!
//! Positions are stored modulo the window size, so a chain link is only a hint - every candidate is verified against
//! the input before it's accepted, which makes the finder produce valid matches regardless of the content of its
//! tables.
class HashChainMatchFinder {
public:
  enum : uint32_t {
    kHashTableSize = 65536,
    kHashMask = kHashTableSize - 1u
  };

  //! Most recent position (masked) of each hash.
  uint16_t head[kHashTableSize];
  //! Previous position (masked) having the same hash as the position used as index.
  uint16_t prev[kMaxWindowSize];

  ZF_INLINE void reset() noexcept {
    memset(head, 0, sizeof(head));
    memset(prev, 0, sizeof(prev));
  }

  //! Hashes 3 bytes at `p`.
  [[nodiscard]]
  static ZF_INLINE uint32_t hash3(const uint8_t* p) noexcept {
    return ((uint32_t(p[0]) << 8 | uint32_t(p[1])) + (uint32_t(p[2]) << 4)) & kHashMask;
  }

  //! Links `pos` having the given `hash` to the chain.
  ZF_INLINE void insert(uint32_t hash, size_t pos) noexcept {
    uint32_t masked = uint32_t(pos) & kWindowMask;
    prev[masked] = head[hash];
    head[hash] = uint16_t(masked);
  }

  //! Returns the length of a match of `data[pos]` and `data[pos - offset]`, which is zero if the first 3 bytes
  //! differ, otherwise it's the number of equal bytes limited to `kMaxMatchLen` and the end of `data`.
  [[nodiscard]]
  static uint32_t match_length(const uint8_t* data, size_t size, size_t pos, uint32_t offset) noexcept;

  //! Finds the longest match of `data[pos]`, which must have been hashed to `hash`.
  //!
  //! The search stops when a match of `nice_length` is found or after `max_chain` steps. The caller must ensure
  //! that `pos + 3 <= size`.
  [[nodiscard]]
  Match find(const uint8_t* data, size_t size, size_t pos, uint32_t hash, uint32_t nice_length, uint32_t max_chain) const noexcept;
};

} // {zf::Compression::Deflate}

//! \endcond

#endif // ZFLATE_COMPRESSION_MATCHFINDER_P_H_INCLUDED
