// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_COMPRESSION_DEFLATEDECODER_P_H_INCLUDED
#define ZFLATE_COMPRESSION_DEFLATEDECODER_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>
#include <zflate/core/bytearray.h>
#include <zflate/compression/deflatedefs_p.h>

//! \cond INTERNAL

namespace zf::Compression::Deflate {

enum class DecoderState : uint32_t {
  kZlibHeader = 0,
  kBlockHeader,
  kUncompressedHeader,
  kCopyUncompressedBlock,
  kStaticHuffmanHeader,
  kDynamicHuffmanHeader,
  kDynamicHuffmanPreCodeLens,
  kDynamicHuffmanLitLenOffsetCodes,
  kDecompressHuffmanBlock,
  kZlibTrailer,
  kDone,
  kInvalid
};

enum class DecoderFlags : uint32_t {
  kNone = 0x00u,
  kFinalBlock = 0x01u,
  kStaticTableActive = 0x02u
};
ZF_DEFINE_ENUM_FLAGS(DecoderFlags)

enum class DecoderOptions : uint32_t {
  kNone = 0x00u,
  //! The output buffer is never reallocated, decoding fails with `ZF_ERROR_DATA_TOO_LARGE` when it's full.
  kNeverReallocOutputBuffer = 0x01u,
  //! Verifies the Adler-32 trailer of a zlib stream.
  kVerifyChecksum = 0x02u
};
ZF_DEFINE_ENUM_FLAGS(DecoderOptions)

//! Entry of a decode table.
//!
//! Layout:
//!
//!   - [ 3: 0] - Number of bits of the code word (the number of bits to index a sub-table if this is a link).
//!   - [ 7: 4] - Number of extra bits that follow the code word (the number of sub-table bits if this is a link).
//!   - [15: 8] - Flags, see `DecodeEntry::k...Flag` constants.
//!   - [31:16] - Payload - literal, base length, base offset, precode symbol, or index of a sub-table.
struct DecodeEntry {
  enum : uint32_t {
    kCodeLengthOffset = 0,
    kCodeLengthNBits = 4,

    kExtraBitsOffset = 4,
    kExtraBitsNBits = 4,

    kLiteralFlag = 0x0100u,
    kMatchFlag = 0x0200u,
    kEndOfBlockFlag = 0x0400u,
    kSubTableFlag = 0x0800u,
    kInvalidFlag = 0x1000u,

    kPayloadOffset = 16
  };

  uint32_t value;
};

//! Number of bits used to index the main part of each decode table.
static constexpr uint32_t kPrecodeTableBits = 7;
static constexpr uint32_t kLitLenTableBits = 10;
static constexpr uint32_t kOffsetTableBits = 8;

//! Maximum sizes of decode tables, which include the worst case of sub-tables (one per symbol, each of maximum size).
static constexpr uint32_t kPrecodeTableSize = 1u << kPrecodeTableBits;
static constexpr uint32_t kLitLenTableSize = (1u << kLitLenTableBits) + kNumLitLenSymbols * (1u << (kMaxLitLenCodeWordLen - kLitLenTableBits));
static constexpr uint32_t kOffsetTableSize = (1u << kOffsetTableBits) + kNumOffsetSymbols * (1u << (kMaxOffsetCodeWordLen - kOffsetTableBits));

//! DEFLATE and ZLIB decoder that decodes a whole compressed buffer at once.
//!
//! The decoder is large because of its decode tables, so it should be allocated on the heap.
class Decoder {
public:
  ZF_NONCOPYABLE(Decoder)

  //! \name Members
  //! \{

  DecoderState _state {};
  DecoderFlags _flags {};
  DecoderOptions _options {};
  FormatType _format {};

  //! Remaining bytes of the current uncompressed block.
  uint32_t _copy_remaining {};

  //! Number of literal/length, offset, and precode lengths of the current dynamic block.
  uint32_t _hlit {};
  uint32_t _hdist {};
  uint32_t _hclen {};

  //! Code lengths of the current dynamic block (literal/length lengths followed by offset lengths).
  uint8_t _lens[kNumLitLenSymbols + kNumOffsetSymbols] {};

  DecodeEntry _precode_table[kPrecodeTableSize];
  DecodeEntry _litlen_table[kLitLenTableSize];
  DecodeEntry _offset_table[kOffsetTableSize];

  //! \}

  ZF_INLINE Decoder() noexcept {}

  //! Initializes the decoder to decode a new stream of the given `format`.
  void init(FormatType format, DecoderOptions options) noexcept;

  //! Decodes the whole compressed `input` and appends the decompressed data to `dst`.
  //!
  //! The decoder only accepts complete streams - if the input ends before the final block (or before the zlib
  //! trailer) the stream is considered malformed. Bytes that follow the end of the stream are ignored.
  ZFResult decode(ZFByteArray& dst, ZFDataView input) noexcept;
};

//! Builds a decode table from the given code `lens` of `count` symbols by using `results` as a template for each
//! symbol. Fails with `ZF_ERROR_MALFORMED_INPUT` if the code is over-subscribed.
ZFResult build_decode_table(DecodeEntry* table, uint32_t table_bits, uint32_t table_capacity, const uint8_t* lens, uint32_t count, const uint32_t* results) noexcept;

} // {zf::Compression::Deflate}

//! \endcond

#endif // ZFLATE_COMPRESSION_DEFLATEDECODER_P_H_INCLUDED
