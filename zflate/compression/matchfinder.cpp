// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/compression/matchfinder_p.h>

namespace zf::Compression::Deflate {

// zf::Compression::Deflate - HashChainMatchFinder
// ===============================================

uint32_t HashChainMatchFinder::match_length(const uint8_t* data, size_t size, size_t pos, uint32_t offset) noexcept {
  const uint8_t* a = data + pos;
  const uint8_t* b = a - offset;

  if (a[0] != b[0] || a[1] != b[1] || a[2] != b[2])
    return 0;

  uint32_t limit = uint32_t(zf_min<size_t>(size - pos, kMaxMatchLen));
  uint32_t n = 3;

  while (n < limit && a[n] == b[n])
    n++;
  return n;
}

Match HashChainMatchFinder::find(const uint8_t* data, size_t size, size_t pos, uint32_t hash, uint32_t nice_length, uint32_t max_chain) const noexcept {
  ZF_ASSERT(pos + 3u <= size);

  uint32_t ci = uint32_t(pos) & kWindowMask;
  uint32_t pi = prev[ci];
  uint32_t offset = (ci - pi) & kWindowMask;

  // The first link must lead to a position that has the same hash, otherwise the chain is stale.
  if (pi == ci || offset > pos || hash != hash3(data + pos - offset))
    return Match{};

  uint32_t best_length = 0;
  uint32_t best_offset = 0;
  uint32_t max_offset = uint32_t(zf_min<size_t>(kMaxMatchOffset, pos));
  uint32_t chain = max_chain;

  while (offset <= max_offset && --chain != 0 && pi != ci) {
    // Only a candidate that could extend the best match is worth comparing.
    if (best_length == 0 || data[pos + best_length] == data[pos + best_length - offset]) {
      uint32_t length = match_length(data, size, pos, offset);

      if (length > best_length) {
        best_length = length;
        best_offset = offset;

        if (best_length >= nice_length)
          break;

        // Continue from the position inside the current match that has the longest chain link, which skips
        // candidates that cannot produce a longer match.
        if (offset + 2u < length)
          length = offset + 2u;

        uint32_t max_step = 0;
        for (uint32_t j = 0; j < length - 2u; j++) {
          uint32_t ei = uint32_t(pos - offset + j) & kWindowMask;
          uint32_t step = (ei - prev[ei]) & kWindowMask;

          if (step > max_step) {
            max_step = step;
            pi = ei;
          }
        }
      }
    }

    ci = pi;
    pi = prev[ci];
    offset += (ci - pi) & kWindowMask;
  }

  return Match{best_length, best_offset};
}

} // {zf::Compression::Deflate}
