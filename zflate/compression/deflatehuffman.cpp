// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/compression/deflatehuffman_p.h>
#include <zflate/support/algorithm_p.h>
#include <zflate/support/intops_p.h>

namespace zf::Compression::Deflate {

// zf::Compression::Deflate - Huffman - Tree Building
// ==================================================

static ZF_INLINE uint32_t ref_freq(const HuffmanArena& arena, uint32_t ref) noexcept {
  return (ref & HuffmanNode::kNodeFlag) ? arena.nodes[ref & ~uint32_t(HuffmanNode::kNodeFlag)].freq : arena.leaves[ref].freq;
}

static ZF_INLINE void ref_set_depth(HuffmanArena& arena, uint32_t ref, uint32_t depth) noexcept {
  if (ref & HuffmanNode::kNodeFlag)
    arena.nodes[ref & ~uint32_t(HuffmanNode::kNodeFlag)].depth = uint16_t(depth);
  else
    arena.leaves[ref].depth = uint16_t(depth);
}

// Leaves sorted by frequency, ties broken by symbol so the resulting code doesn't depend on the sort algorithm.
struct LeafByFreqCompare {
  ZF_INLINE int operator()(const HuffmanLeaf& a, const HuffmanLeaf& b) const noexcept {
    if (a.freq != b.freq)
      return a.freq < b.freq ? -1 : 1;
    return int(a.symbol) - int(b.symbol);
  }
};

// Deepest leaves first, then the least frequent, then by symbol.
struct LeafByDepthCompare {
  ZF_INLINE int operator()(const HuffmanLeaf& a, const HuffmanLeaf& b) const noexcept {
    if (a.depth != b.depth)
      return a.depth > b.depth ? -1 : 1;
    if (a.freq != b.freq)
      return a.freq < b.freq ? -1 : 1;
    return int(a.symbol) - int(b.symbol);
  }
};

// Two-queue Huffman construction - leaves are sorted by frequency and internal nodes are created in a non-decreasing
// order of their frequencies, so the cheapest two items are always at the front of one of the two queues.
static uint32_t build_tree(HuffmanArena& arena, uint32_t n) noexcept {
  HuffmanLeaf* leaves = arena.leaves;
  HuffmanNode* nodes = arena.nodes;

  nodes[0].freq = leaves[0].freq + leaves[1].freq;
  nodes[0].children[0] = 0;
  nodes[0].children[1] = 1;

  uint32_t i0 = 0; // Next internal node to consume.
  uint32_t i1 = 1; // Next internal node to create.
  uint32_t i2 = 2; // Next leaf to consume.

  while (i1 != n - 1u) {
    uint32_t refs[2];
    for (uint32_t k = 0; k < 2; k++) {
      if (i0 != i1 && (i2 == n || nodes[i0].freq < leaves[i2].freq))
        refs[k] = (i0++) | HuffmanNode::kNodeFlag;
      else
        refs[k] = i2++;
    }

    nodes[i1].freq = ref_freq(arena, refs[0]) + ref_freq(arena, refs[1]);
    nodes[i1].children[0] = uint16_t(refs[0]);
    nodes[i1].children[1] = uint16_t(refs[1]);
    i1++;
  }

  // Children are always created before their parent, so walking from the root down assigns all depths.
  uint32_t root = n - 2u;
  nodes[root].depth = 0;

  uint32_t max_depth = 0;
  for (uint32_t i = root + 1u; i-- > 0;) {
    uint32_t depth = nodes[i].depth + 1u;
    ref_set_depth(arena, nodes[i].children[0], depth);
    ref_set_depth(arena, nodes[i].children[1], depth);
  }

  for (uint32_t i = 0; i < n; i++)
    max_depth = zf_max<uint32_t>(max_depth, leaves[i].depth);

  return max_depth;
}

// Clamps all leaves deeper than `max_length` and repays the Kraft debt by pushing the shallowest of the remaining
// leaves deeper. Leaves are processed from the deepest and least frequent ones.
static void restrict_depth(HuffmanArena& arena, uint32_t n, uint32_t max_length, uint32_t max_depth) noexcept {
  HuffmanLeaf* leaves = arena.leaves;
  quick_sort(leaves, n, LeafByDepthCompare());

  uint32_t excess = max_depth - max_length;
  int64_t debt = 0;
  uint32_t i = 0;

  while (i < n) {
    uint32_t depth = leaves[i].depth;
    if (depth <= max_length)
      break;

    debt += (int64_t(1) << excess) - (int64_t(1) << (max_depth - depth));
    leaves[i].depth = uint16_t(max_length);
    i++;
  }

  // Debt is now in units of `2^-max_length`.
  debt >>= excess;

  while (debt > 0 && i < n) {
    uint32_t depth = leaves[i].depth;
    if (depth < max_length) {
      leaves[i].depth = uint16_t(depth + 1u);
      debt -= int64_t(1) << (max_length - depth - 1u);
    }
    else {
      i++;
    }
  }

  // Overpaid debt is returned to the leaves at the maximum depth.
  for (uint32_t j = zf_min(i, n - 1u) + 1u; j-- > 0;) {
    if (debt >= 0)
      break;

    if (leaves[j].depth == max_length) {
      leaves[j].depth = uint16_t(max_length - 1u);
      debt++;
    }
  }
}

uint32_t build_huffman_lengths(HuffmanArena& arena, const uint32_t* freqs, uint32_t symbol_count, uint32_t max_length, uint8_t* lens_out) noexcept {
  ZF_ASSERT(symbol_count >= 2u && symbol_count <= kNumLitLenSymbols);

  memset(lens_out, 0, symbol_count);

  uint32_t n = 0;
  for (uint32_t sym = 0; sym < symbol_count; sym++) {
    if (freqs[sym]) {
      arena.leaves[n].freq = freqs[sym];
      arena.leaves[n].symbol = uint16_t(sym);
      arena.leaves[n].depth = 0;
      n++;
    }
  }

  if (n == 0)
    return 0;

  if (n == 1) {
    uint32_t sym = arena.leaves[0].symbol;
    lens_out[sym] = 1;
    lens_out[sym == 0 ? 1u : 0u] = 1;
    return 1;
  }

  quick_sort(arena.leaves, n, LeafByFreqCompare());

  uint32_t max_depth = build_tree(arena, n);
  if (max_depth > max_length) {
    restrict_depth(arena, n, max_length, max_depth);
    max_depth = max_length;
  }

  for (uint32_t i = 0; i < n; i++)
    lens_out[arena.leaves[i].symbol] = uint8_t(arena.leaves[i].depth);

  return max_depth;
}

// zf::Compression::Deflate - Huffman - Canonical Codes
// ====================================================

void build_huffman_codes(const uint8_t* lens, uint32_t symbol_count, uint16_t* codes_out) noexcept {
  uint32_t len_counts[kMaxCodeWordLen + 1] {};
  uint32_t next_code[kMaxCodeWordLen + 1] {};

  for (uint32_t sym = 0; sym < symbol_count; sym++)
    len_counts[lens[sym]]++;
  len_counts[0] = 0;

  uint32_t code = 0;
  for (uint32_t len = 1; len <= kMaxCodeWordLen; len++) {
    code = (code + len_counts[len - 1u]) << 1;
    next_code[len] = code;
  }

  for (uint32_t sym = 0; sym < symbol_count; sym++) {
    uint32_t len = lens[sym];
    codes_out[sym] = len ? uint16_t(IntOps::reverse_bits(next_code[len]++, len)) : uint16_t(0);
  }
}

// zf::Compression::Deflate - Huffman - Code Lengths RLE
// =====================================================

uint32_t compute_length_items(const uint8_t* lens, uint32_t symbol_count, uint16_t* items, uint32_t* item_count_out) noexcept {
  uint32_t count = symbol_count;
  while (count > 1u && lens[count - 1u] == 0)
    count--;

  uint32_t item_count = 0;
  for (uint32_t i = 0; i < count; i++) {
    uint32_t len = lens[i];
    bool next_two_equal = i + 2u < count && lens[i + 1u] == len && lens[i + 2u] == len;

    if (len == 0 && next_two_equal) {
      uint32_t last = i + 2u;
      while (last + 1u < count && lens[last + 1u] == 0)
        last++;

      uint32_t run = zf_min<uint32_t>(last + 1u - i, 138u);
      if (run < 11u)
        items[item_count++] = make_precode_item(kPrecodeRepeatZeroShort, run - 3u);
      else
        items[item_count++] = make_precode_item(kPrecodeRepeatZeroLong, run - 11u);
      i += run - 1u;
    }
    else if (i != 0 && lens[i - 1u] == len && next_two_equal) {
      uint32_t last = i + 2u;
      while (last + 1u < count && lens[last + 1u] == len)
        last++;

      uint32_t run = zf_min<uint32_t>(last + 1u - i, 6u);
      items[item_count++] = make_precode_item(kPrecodeRepeatPrevious, run - 3u);
      i += run - 1u;
    }
    else {
      items[item_count++] = make_precode_item(len, 0);
    }
  }

  *item_count_out = item_count;
  return count;
}

} // {zf::Compression::Deflate}
