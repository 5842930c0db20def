// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_COMPRESSION_DEFLATEHUFFMAN_P_H_INCLUDED
#define ZFLATE_COMPRESSION_DEFLATEHUFFMAN_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>
#include <zflate/compression/deflatedefs_p.h>

//! \cond INTERNAL

namespace zf::Compression::Deflate {

//! A leaf of a Huffman tree, represents a used symbol.
struct HuffmanLeaf {
  uint32_t freq;
  uint16_t symbol;
  uint16_t depth;
};

//! An internal node of a Huffman tree.
//!
//! Children are references, which are either leaf indexes or node indexes combined with `kNodeFlag`.
struct HuffmanNode {
  enum : uint32_t { kNodeFlag = 0x8000u };

  uint32_t freq;
  uint16_t children[2];
  uint16_t depth;
};

//! Working memory of the Huffman tree builder.
//!
//! Nodes never point to memory, all references are indexes into `leaves` and `nodes`, which makes the arena
//! trivially reusable for each tree the encoder builds.
struct HuffmanArena {
  HuffmanLeaf leaves[kNumLitLenSymbols];
  HuffmanNode nodes[kNumLitLenSymbols];
};

//! Builds length-limited Huffman code lengths from symbol frequencies.
//!
//! Lengths of all `symbol_count` symbols are written to `lens_out`, unused symbols get zero length. Returns the
//! longest code length, which is zero if no symbol is used. A code having a single used symbol gets a second
//! (dummy) symbol of length 1, which is symbol 1 if the used symbol is 0, otherwise symbol 0.
[[nodiscard]]
ZF_HIDDEN uint32_t build_huffman_lengths(HuffmanArena& arena, const uint32_t* freqs, uint32_t symbol_count, uint32_t max_length, uint8_t* lens_out) noexcept;

//! Assigns canonical codes to `lens` and stores them bit-reversed (ready to be written LSB first) to `codes_out`.
ZF_HIDDEN void build_huffman_codes(const uint8_t* lens, uint32_t symbol_count, uint16_t* codes_out) noexcept;

//! Makes a precode item from a precode symbol and its extra bits.
static ZF_INLINE_CONSTEXPR uint16_t make_precode_item(uint32_t sym, uint32_t extra) noexcept {
  return uint16_t(sym | (extra << 5));
}

//! Run-length encodes code lengths into precode items (`symbol | extra << 5`).
//!
//! Trailing zero lengths are dropped (at least one length is always kept), the number of lengths actually encoded
//! is returned and the number of items written to `items` is stored in `item_count_out`. The `items` buffer must
//! have space for `symbol_count` entries.
[[nodiscard]]
ZF_HIDDEN uint32_t compute_length_items(const uint8_t* lens, uint32_t symbol_count, uint16_t* items, uint32_t* item_count_out) noexcept;

} // {zf::Compression::Deflate}

//! \endcond

#endif // ZFLATE_COMPRESSION_DEFLATEHUFFMAN_P_H_INCLUDED
