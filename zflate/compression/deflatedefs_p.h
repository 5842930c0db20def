// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_COMPRESSION_DEFLATEDEFS_P_H_INCLUDED
#define ZFLATE_COMPRESSION_DEFLATEDEFS_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>

//! \cond INTERNAL

namespace zf::Compression::Deflate {

//! Container format of a compressed stream.
enum class FormatType : uint32_t {
  //! Raw DEFLATE stream (RFC 1951).
  kRaw = 0,
  //! ZLIB container (RFC 1950) - 2 byte header, DEFLATE stream, and ADLER32 trailer.
  kZlib = 1,

  kMaxValue = kZlib
};

//! DEFLATE block type (BTYPE).
enum class BlockType : uint32_t {
  kUncompressed = 0,
  kStaticHuffman = 1,
  kDynamicHuffman = 2,
  kReserved = 3
};

static constexpr uint32_t kMaxCompressionLevel = 9;

static constexpr uint32_t kMinMatchLen = 3;
static constexpr uint32_t kMaxMatchLen = 258;

static constexpr uint32_t kMinMatchOffset = 1;
static constexpr uint32_t kMaxMatchOffset = 32767;

static constexpr uint32_t kMaxWindowSize = 32768;
static constexpr uint32_t kWindowMask = kMaxWindowSize - 1u;

//! Maximum number of bytes a single stored block can hold (LEN is 16-bit).
static constexpr uint32_t kMaxUncompressedBlockSize = 0xFFFFu;

static constexpr uint32_t kNumPrecodeSymbols = 19;
static constexpr uint32_t kNumLitLenSymbols = 288;
static constexpr uint32_t kNumOffsetSymbols = 32;

//! Number of literal/length symbols that can appear in a valid stream (286 and 287 are reserved).
static constexpr uint32_t kNumUsedLitLenSymbols = 286;
//! Number of offset symbols that can appear in a valid stream (30 and 31 are reserved).
static constexpr uint32_t kNumUsedOffsetSymbols = 30;

static constexpr uint32_t kNumLiterals = 256;
static constexpr uint32_t kEndOfBlock = 256;
static constexpr uint32_t kFirstLengthSymbol = 257;

static constexpr uint32_t kNumLengthSlots = 29;
static constexpr uint32_t kNumOffsetSlots = 30;

static constexpr uint32_t kMaxPreCodeWordLen = 7;
static constexpr uint32_t kMaxLitLenCodeWordLen = 15;
static constexpr uint32_t kMaxOffsetCodeWordLen = 15;
static constexpr uint32_t kMaxCodeWordLen = 15;

static constexpr uint32_t kMaxExtraLengthBits = 5;
static constexpr uint32_t kMaxExtraOffsetBits = 13;

//! Precode symbols 16, 17, and 18 repeat a length (or zero) for the number of times stored in their extra bits.
static constexpr uint32_t kPrecodeRepeatPrevious = 16;
static constexpr uint32_t kPrecodeRepeatZeroShort = 17;
static constexpr uint32_t kPrecodeRepeatZeroLong = 18;

//! Order in which precode lengths are stored in a dynamic block header.
extern const uint8_t kPrecodeLensPermutation[kNumPrecodeSymbols];

//! Number of extra bits of each precode symbol (only 16, 17, and 18 have extra bits).
static constexpr uint8_t kPrecodeExtraBits[kNumPrecodeSymbols] = {
  0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 2, 3, 7
};

//! Base match length of each length slot (slot `i` is encoded as symbol `257 + i`).
static constexpr uint16_t kLengthSlotBase[kNumLengthSlots] = {
  3  , 4  , 5  , 6  , 7  , 8  , 9  , 10 ,
  11 , 13 , 15 , 17 , 19 , 23 , 27 , 31 ,
  35 , 43 , 51 , 59 , 67 , 83 , 99 , 115,
  131, 163, 195, 227, 258
};

//! Number of extra bits of each length slot.
static constexpr uint8_t kLengthSlotExtraBits[kNumLengthSlots] = {
  0, 0, 0, 0, 0, 0, 0, 0,
  1, 1, 1, 1, 2, 2, 2, 2,
  3, 3, 3, 3, 4, 4, 4, 4,
  5, 5, 5, 5, 0
};

//! Base match offset of each offset slot.
static constexpr uint16_t kOffsetSlotBase[kNumOffsetSlots] = {
  1    , 2    , 3    , 4    , 5    , 7    , 9    , 13   ,
  17   , 25   , 33   , 49   , 65   , 97   , 129  , 193  ,
  257  , 385  , 513  , 769  , 1025 , 1537 , 2049 , 3073 ,
  4097 , 6145 , 8193 , 12289, 16385, 24577
};

//! Number of extra bits of each offset slot.
static constexpr uint8_t kOffsetSlotExtraBits[kNumOffsetSlots] = {
  0 , 0 , 0 , 0 , 1 , 1 , 2 , 2 ,
  3 , 3 , 4 , 4 , 5 , 5 , 6 , 6 ,
  7 , 7 , 8 , 8 , 9 , 9 , 10, 10,
  11, 11, 12, 12, 13, 13
};

//! Parameters of a single compression level, which drive the match finder.
struct LevelParams {
  //! Match length considered good enough to shorten the search (kept to describe the level).
  uint16_t good_length;
  //! Match length after which lazy evaluation would stop (kept to describe the level).
  uint16_t lazy_length;
  //! Match length that terminates the search immediately.
  uint16_t nice_length;
  //! Maximum number of hash chain steps.
  uint16_t max_chain;
};

//! Parameters of compression levels 0 to 9, level 0 means no compression (stored blocks only).
extern const LevelParams kLevelParams[kMaxCompressionLevel + 1];

//! Returns the code length of `sym` in the fixed literal/length code (BTYPE=01).
[[nodiscard]]
static ZF_INLINE_CONSTEXPR uint32_t fixed_litlen_length(uint32_t sym) noexcept {
  return sym < 144u ? 8u : sym < 256u ? 9u : sym < 280u ? 7u : 8u;
}

//! Code length of all symbols in the fixed offset code (BTYPE=01).
static constexpr uint32_t kFixedOffsetLength = 5;

} // {zf::Compression::Deflate}

//! \endcond

#endif // ZFLATE_COMPRESSION_DEFLATEDEFS_P_H_INCLUDED
