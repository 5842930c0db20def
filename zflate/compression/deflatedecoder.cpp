// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/core/bytearray_p.h>
#include <zflate/core/trace_p.h>
#include <zflate/compression/checksum_p.h>
#include <zflate/compression/deflatedecoder_p.h>
#include <zflate/compression/deflatedecoderutils_p.h>
#include <zflate/compression/deflatedefs_p.h>
#include <zflate/support/intops_p.h>
#include <zflate/support/lookuptable_p.h>

namespace zf::Compression::Deflate {

// zf::Compression::Deflate::Decoder - Trace
// =========================================

#if defined(ZF_TRACE_INFLATE)
#define Trace ZFDebugTrace
#else
#define Trace ZFDummyTrace
#endif

// zf::Compression::Deflate::Decoder - Decode Results
// ==================================================

// Each symbol of a code has a result template, which is combined with the length of its code word when a decode
// table is built. A result template contains everything except the code length.

struct PrecodeResultGen {
  static constexpr uint32_t value(size_t sym) noexcept {
    return (uint32_t(sym) << DecodeEntry::kPayloadOffset) |
           (uint32_t(kPrecodeExtraBits[sym]) << DecodeEntry::kExtraBitsOffset);
  }
};

struct LitLenResultGen {
  static constexpr uint32_t value(size_t sym) noexcept {
    return sym < kNumLiterals
      ? (uint32_t(sym) << DecodeEntry::kPayloadOffset) | DecodeEntry::kLiteralFlag
      : sym == kEndOfBlock
        ? uint32_t(DecodeEntry::kEndOfBlockFlag)
        : sym < kNumUsedLitLenSymbols
          ? (uint32_t(kLengthSlotBase[sym - kFirstLengthSymbol]) << DecodeEntry::kPayloadOffset) |
            (uint32_t(kLengthSlotExtraBits[sym - kFirstLengthSymbol]) << DecodeEntry::kExtraBitsOffset) |
            DecodeEntry::kMatchFlag
          : uint32_t(DecodeEntry::kInvalidFlag);
  }
};

struct OffsetResultGen {
  static constexpr uint32_t value(size_t sym) noexcept {
    return sym < kNumUsedOffsetSymbols
      ? (uint32_t(kOffsetSlotBase[sym]) << DecodeEntry::kPayloadOffset) |
        (uint32_t(kOffsetSlotExtraBits[sym]) << DecodeEntry::kExtraBitsOffset) |
        DecodeEntry::kMatchFlag
      : uint32_t(DecodeEntry::kInvalidFlag);
  }
};

static constexpr LookupTable<uint32_t, kNumPrecodeSymbols> kPrecodeDecodeResults = make_lookup_table<uint32_t, kNumPrecodeSymbols, PrecodeResultGen>();
static constexpr LookupTable<uint32_t, kNumLitLenSymbols> kLitLenDecodeResults = make_lookup_table<uint32_t, kNumLitLenSymbols, LitLenResultGen>();
static constexpr LookupTable<uint32_t, kNumOffsetSymbols> kOffsetDecodeResults = make_lookup_table<uint32_t, kNumOffsetSymbols, OffsetResultGen>();

// zf::Compression::Deflate::Decoder - Build Decode Table
// ======================================================

// The main table is indexed by `table_bits` of the input. A code word that is not longer than `table_bits` has its
// entry replicated in every slot that shares its bits. Longer code words are moved into sub-tables - code words
// that share the same first `table_bits` bits share a sub-table, which is linked from the main table and indexed
// by the bits that follow. Slots that no code word reaches (the code is incomplete) decode as invalid entries.
ZFResult build_decode_table(DecodeEntry* table, uint32_t table_bits, uint32_t table_capacity, const uint8_t* lens, uint32_t count, const uint32_t* results) noexcept {
  using namespace DecoderUtils;

  uint32_t len_counts[kMaxCodeWordLen + 1] {};
  for (uint32_t sym = 0; sym < count; sym++)
    len_counts[lens[sym]]++;
  len_counts[0] = 0;

  int32_t remaining = 1;
  uint32_t max_len = 0;

  for (uint32_t len = 1; len <= kMaxCodeWordLen; len++) {
    remaining = (remaining << 1) - int32_t(len_counts[len]);
    if (remaining < 0)
      return zf_make_error(ZF_ERROR_MALFORMED_INPUT);

    if (len_counts[len])
      max_len = len;
  }

  uint32_t next_code[kMaxCodeWordLen + 1];
  uint32_t code = 0;

  next_code[0] = 0;
  for (uint32_t len = 1; len <= kMaxCodeWordLen; len++) {
    code = (code + len_counts[len - 1]) << 1;
    next_code[len] = code;
  }

  uint32_t main_size = 1u << table_bits;
  uint32_t sub_bits = max_len > table_bits ? max_len - table_bits : 0u;
  uint32_t sub_size = 1u << sub_bits;
  uint32_t sub_index = main_size;

  for (uint32_t i = 0; i < main_size; i++)
    table[i] = kInvalidEntry;

  for (uint32_t sym = 0; sym < count; sym++) {
    uint32_t len = lens[sym];
    if (!len)
      continue;

    uint32_t reversed = IntOps::reverse_bits(next_code[len]++, len);
    DecodeEntry entry = make_entry(results[sym], len);

    if (len <= table_bits) {
      for (uint32_t i = reversed; i < main_size; i += 1u << len)
        table[i] = entry;
    }
    else {
      uint32_t prefix = reversed & mask32(table_bits);
      DecodeEntry link = table[prefix];

      if (!is_sub_table(link)) {
        if (ZF_UNLIKELY(sub_index + sub_size > table_capacity))
          return zf_make_error(ZF_ERROR_MALFORMED_INPUT);

        link = make_sub_table_link(sub_index, table_bits, sub_bits);
        table[prefix] = link;

        for (uint32_t i = 0; i < sub_size; i++)
          table[sub_index + i] = kInvalidEntry;
        sub_index += sub_size;
      }

      DecodeEntry* sub_table = table + payload(link);
      for (uint32_t i = reversed >> table_bits; i < sub_size; i += 1u << (len - table_bits))
        sub_table[i] = entry;
    }
  }

  return ZF_SUCCESS;
}

static ZF_INLINE DecodeEntry decode_entry(const DecodeEntry* table, uint32_t table_bits, ZFBitWord bits) noexcept {
  using namespace DecoderUtils;

  DecodeEntry entry = table[uint32_t(bits) & mask32(table_bits)];
  if (is_sub_table(entry)) {
    uint32_t index = uint32_t(bits >> table_bits) & mask32(extra_bits(entry));
    entry = table[payload(entry) + index];
  }
  return entry;
}

// zf::Compression::Deflate::Decoder - Output
// ==========================================

static ZF_NOINLINE ZFResult grow_output(ZFByteArray& dst, size_t written, size_t n, DecoderOptions options) noexcept {
  if (zf_test_flag(options, DecoderOptions::kNeverReallocOutputBuffer))
    return zf_make_error(ZF_ERROR_DATA_TOO_LARGE);

  size_t required = written + n;
  if (ZF_UNLIKELY(required < written))
    return zf_make_error(ZF_ERROR_DATA_TOO_LARGE);

  ByteArrayInternal::set_size(&dst, written);
  return dst.reserve(ByteArrayInternal::expand_capacity(required));
}

// Makes sure that at least `N` bytes can be written to `dst_ptr`, pointers are recalculated after a reallocation.
#define ZF_DECODER_ENSURE_OUTPUT(N)                                           \
  do {                                                                        \
    size_t n_required_ = size_t(N);                                           \
    if (ZF_UNLIKELY(size_t(dst_end - dst_ptr) < n_required_)) {               \
      size_t written_ = size_t(dst_ptr - dst_start);                          \
      result = grow_output(dst, written_, n_required_, _options);             \
      if (result != ZF_SUCCESS)                                               \
        goto Failed;                                                          \
                                                                              \
      dst_start = dst.data();                                                 \
      dst_ptr = dst_start + written_;                                         \
      dst_end = dst_start + dst.capacity();                                   \
    }                                                                         \
  } while (0)

// zf::Compression::Deflate::Decoder - Init
// ========================================

void Decoder::init(FormatType format, DecoderOptions options) noexcept {
  _state = format == FormatType::kZlib ? DecoderState::kZlibHeader : DecoderState::kBlockHeader;
  _flags = DecoderFlags::kNone;
  _options = options;
  _format = format;
  _copy_remaining = 0;
  _hlit = 0;
  _hdist = 0;
  _hclen = 0;
}

// zf::Compression::Deflate::Decoder - Decode
// ==========================================

ZFResult Decoder::decode(ZFByteArray& dst, ZFDataView input) noexcept {
  using namespace DecoderUtils;

  Trace trace;
  ZFResult result = ZF_SUCCESS;

  const uint8_t* in_ptr = input.data;
  const uint8_t* in_end = input.data + input.size;

  size_t dst_initial = dst.size();
  uint8_t* dst_start = dst.data();
  uint8_t* dst_ptr = dst_start + dst_initial;
  uint8_t* dst_end = dst_start + dst.capacity();

  DecoderBits bits;

  for (;;) {
    switch (_state) {
      case DecoderState::kZlibHeader: {
        bits.refill(in_ptr, in_end);
        if (bits.length() < 16u)
          goto ErrorTruncated;

        uint32_t cmf = bits.extract(8);
        uint32_t flg = bits.extract<8>(8);
        bits.consumed(16);

        trace.info("zf::Compression::Deflate::Decoder::ZlibHeader [CMF=0x%02X FLG=0x%02X]\n", cmf, flg);

        // CM must be 8 (DEFLATE), window size must not exceed 32KB, and a preset dictionary is not supported.
        if ((cmf * 256u + flg) % 31u != 0u || (cmf & 0xFu) != 8u || (cmf >> 4) > 7u || (flg & 0x20u) != 0u) {
          trace.fail("Invalid zlib header\n");
          goto ErrorInvalidData;
        }

        _state = DecoderState::kBlockHeader;
        continue;
      }

      case DecoderState::kBlockHeader: {
        bits.refill(in_ptr, in_end);
        if (bits.length() < 3u)
          goto ErrorTruncated;

        uint32_t header = bits.extract(3);
        bits.consumed(3);

        if (header & 0x1u)
          _flags |= DecoderFlags::kFinalBlock;

        BlockType block_type = BlockType(header >> 1);
        trace.info("zf::Compression::Deflate::Decoder::BlockHeader [Type=%u Final=%u]\n", uint32_t(block_type), header & 0x1u);

        switch (block_type) {
          case BlockType::kUncompressed:
            _state = DecoderState::kUncompressedHeader;
            break;

          case BlockType::kStaticHuffman:
            _state = DecoderState::kStaticHuffmanHeader;
            break;

          case BlockType::kDynamicHuffman:
            _state = DecoderState::kDynamicHuffmanHeader;
            break;

          default:
            trace.fail("Reserved block type\n");
            result = zf_make_error(ZF_ERROR_UNSUPPORTED_BLOCK_TYPE);
            goto Failed;
        }
        continue;
      }

      case DecoderState::kUncompressedHeader: {
        bits.make_byte_aligned();
        bits.refill(in_ptr, in_end);

        if (bits.length() < 32u)
          goto ErrorTruncated;

        uint32_t len = bits.extract(16);
        bits.consumed(16);

        uint32_t nlen = bits.extract(16);
        bits.consumed(16);

        if ((len ^ nlen) != 0xFFFFu) {
          trace.fail("Uncompressed block length mismatch [LEN=%u NLEN=%u]\n", len, nlen);
          goto ErrorInvalidData;
        }

        _copy_remaining = len;
        _state = DecoderState::kCopyUncompressedBlock;
        continue;
      }

      case DecoderState::kCopyUncompressedBlock: {
        size_t available = (bits.length() >> 3) + size_t(in_end - in_ptr);
        ZF_DECODER_ENSURE_OUTPUT(zf_min<size_t>(available, _copy_remaining));

        // The bit buffer is byte aligned here, bytes it already holds precede the rest of the input.
        while (_copy_remaining && !bits.is_empty()) {
          *dst_ptr++ = uint8_t(bits.extract(8));
          bits.consumed(8);
          _copy_remaining--;
        }

        size_t n = zf_min<size_t>(size_t(in_end - in_ptr), _copy_remaining);
        if (n) {
          memcpy(dst_ptr, in_ptr, n);
          dst_ptr += n;
          in_ptr += n;
          _copy_remaining -= uint32_t(n);
        }

        if (_copy_remaining)
          goto ErrorTruncated;

        goto BlockDone;
      }

      case DecoderState::kStaticHuffmanHeader: {
        if (!zf_test_flag(_flags, DecoderFlags::kStaticTableActive)) {
          uint8_t static_lens[kNumLitLenSymbols + kNumOffsetSymbols];

          for (uint32_t i = 0; i < kNumLitLenSymbols; i++)
            static_lens[i] = uint8_t(fixed_litlen_length(i));

          for (uint32_t i = 0; i < kNumOffsetSymbols; i++)
            static_lens[kNumLitLenSymbols + i] = uint8_t(kFixedOffsetLength);

          result = build_decode_table(_litlen_table, kLitLenTableBits, kLitLenTableSize, static_lens, kNumLitLenSymbols, kLitLenDecodeResults.data);
          if (result != ZF_SUCCESS)
            goto Failed;

          result = build_decode_table(_offset_table, kOffsetTableBits, kOffsetTableSize, static_lens + kNumLitLenSymbols, kNumOffsetSymbols, kOffsetDecodeResults.data);
          if (result != ZF_SUCCESS)
            goto Failed;

          _flags |= DecoderFlags::kStaticTableActive;
        }

        _state = DecoderState::kDecompressHuffmanBlock;
        continue;
      }

      case DecoderState::kDynamicHuffmanHeader: {
        bits.refill(in_ptr, in_end);
        if (bits.length() < 14u)
          goto ErrorTruncated;

        _hlit = bits.extract(5) + 257u;
        _hdist = bits.extract<5>(5) + 1u;
        _hclen = bits.extract<10>(4) + 4u;
        bits.consumed(14);

        trace.info("zf::Compression::Deflate::Decoder::DynamicHeader [HLIT=%u HDIST=%u HCLEN=%u]\n", _hlit, _hdist, _hclen);

        if (_hlit > kNumUsedLitLenSymbols || _hdist > kNumUsedOffsetSymbols) {
          trace.fail("Too many literal/length or offset codes\n");
          goto ErrorInvalidData;
        }

        _flags &= ~DecoderFlags::kStaticTableActive;
        _state = DecoderState::kDynamicHuffmanPreCodeLens;
        continue;
      }

      case DecoderState::kDynamicHuffmanPreCodeLens: {
        uint8_t precode_lens[kNumPrecodeSymbols] {};

        for (uint32_t i = 0; i < _hclen; i++) {
          bits.refill(in_ptr, in_end);
          if (bits.length() < 3u)
            goto ErrorTruncated;

          precode_lens[kPrecodeLensPermutation[i]] = uint8_t(bits.extract(3));
          bits.consumed(3);
        }

        result = build_decode_table(_precode_table, kPrecodeTableBits, kPrecodeTableSize, precode_lens, kNumPrecodeSymbols, kPrecodeDecodeResults.data);
        if (result != ZF_SUCCESS) {
          trace.fail("Invalid precode\n");
          goto Failed;
        }

        _state = DecoderState::kDynamicHuffmanLitLenOffsetCodes;
        continue;
      }

      case DecoderState::kDynamicHuffmanLitLenOffsetCodes: {
        uint32_t total = _hlit + _hdist;
        uint32_t i = 0;

        while (i < total) {
          bits.refill(in_ptr, in_end);

          DecodeEntry entry = _precode_table[bits.extract(kPrecodeTableBits)];
          if (is_invalid(entry))
            goto ErrorInvalidData;

          uint32_t len = code_length(entry);
          uint32_t n_extra = extra_bits(entry);

          if (len + n_extra > bits.length())
            goto ErrorTruncated;

          uint32_t sym = payload(entry);
          uint32_t extra = uint32_t(bits.all() >> len) & mask32(n_extra);
          bits.consumed(len + n_extra);

          if (sym < kPrecodeRepeatPrevious) {
            _lens[i++] = uint8_t(sym);
            continue;
          }

          uint8_t value = 0;
          uint32_t repeat = 0;

          if (sym == kPrecodeRepeatPrevious) {
            if (i == 0) {
              trace.fail("Repeat of a previous length without a previous length\n");
              goto ErrorInvalidData;
            }
            value = _lens[i - 1];
            repeat = 3u + extra;
          }
          else if (sym == kPrecodeRepeatZeroShort) {
            repeat = 3u + extra;
          }
          else {
            repeat = 11u + extra;
          }

          if (repeat > total - i) {
            trace.fail("Repeat overruns the number of code lengths\n");
            goto ErrorInvalidData;
          }

          memset(_lens + i, value, repeat);
          i += repeat;
        }

        if (_lens[kEndOfBlock] == 0) {
          trace.fail("Missing end-of-block code\n");
          goto ErrorInvalidData;
        }

        result = build_decode_table(_offset_table, kOffsetTableBits, kOffsetTableSize, _lens + _hlit, _hdist, kOffsetDecodeResults.data);
        if (result != ZF_SUCCESS) {
          trace.fail("Invalid offset code\n");
          goto Failed;
        }

        result = build_decode_table(_litlen_table, kLitLenTableBits, kLitLenTableSize, _lens, _hlit, kLitLenDecodeResults.data);
        if (result != ZF_SUCCESS) {
          trace.fail("Invalid literal/length code\n");
          goto Failed;
        }

        _state = DecoderState::kDecompressHuffmanBlock;
        continue;
      }

      case DecoderState::kDecompressHuffmanBlock: {
        for (;;) {
          bits.refill(in_ptr, in_end);

          DecodeEntry entry = decode_entry(_litlen_table, kLitLenTableBits, bits.all());
          if (is_invalid(entry))
            goto ErrorInvalidData;

          uint32_t len = code_length(entry);
          if (len > bits.length())
            goto ErrorTruncated;

          if (is_literal(entry)) {
            ZF_DECODER_ENSURE_OUTPUT(1);
            bits.consumed(len);
            *dst_ptr++ = uint8_t(payload(entry));
            continue;
          }

          if (is_end_of_block(entry)) {
            bits.consumed(len);
            break;
          }

          ZF_ASSERT(is_match(entry));

          uint32_t n_extra = extra_bits(entry);
          if (len + n_extra > bits.length())
            goto ErrorTruncated;

          uint32_t length = payload(entry) + (uint32_t(bits.all() >> len) & mask32(n_extra));
          bits.consumed(len + n_extra);

          bits.refill(in_ptr, in_end);
          DecodeEntry offset_entry = decode_entry(_offset_table, kOffsetTableBits, bits.all());
          if (is_invalid(offset_entry))
            goto ErrorInvalidData;

          uint32_t offset_len = code_length(offset_entry);
          if (offset_len > bits.length())
            goto ErrorTruncated;
          bits.consumed(offset_len);

          // Offset extra bits can be up to 13, refill again so a 32-bit bit-word has enough of them.
          bits.refill(in_ptr, in_end);
          uint32_t offset_extra = extra_bits(offset_entry);
          if (offset_extra > bits.length())
            goto ErrorTruncated;

          uint32_t offset = payload(offset_entry) + bits.extract(offset_extra);
          bits.consumed(offset_extra);

          if (offset > size_t(dst_ptr - dst_start) - dst_initial) {
            trace.fail("Match offset %u is out of range\n", offset);
            goto ErrorInvalidData;
          }

          ZF_DECODER_ENSURE_OUTPUT(length);

          // Source and destination can overlap when offset < length, which repeats the last `offset` bytes.
          const uint8_t* src = dst_ptr - offset;
          for (uint32_t i = 0; i < length; i++)
            dst_ptr[i] = src[i];
          dst_ptr += length;
        }

        goto BlockDone;
      }

      case DecoderState::kZlibTrailer: {
        bits.make_byte_aligned();
        bits.refill(in_ptr, in_end);

        if (bits.length() < 32u)
          goto ErrorTruncated;

        uint32_t stored_checksum = 0;
        for (uint32_t i = 0; i < 4; i++) {
          stored_checksum = (stored_checksum << 8) | bits.extract(8);
          bits.consumed(8);
        }

        if (zf_test_flag(_options, DecoderOptions::kVerifyChecksum)) {
          size_t produced = size_t(dst_ptr - dst_start) - dst_initial;
          uint32_t actual_checksum = Checksum::adler32(dst_start + dst_initial, produced);

          if (actual_checksum != stored_checksum) {
            trace.fail("Checksum mismatch [Stored=0x%08X Actual=0x%08X]\n", stored_checksum, actual_checksum);
            result = zf_make_error(ZF_ERROR_CHECKSUM_MISMATCH);
            goto Failed;
          }
        }

        _state = DecoderState::kDone;
        continue;
      }

      case DecoderState::kDone: {
        ByteArrayInternal::set_size(&dst, size_t(dst_ptr - dst_start));
        trace.info("zf::Compression::Deflate::Decoder::Done [Produced=%zu]\n", dst.size() - dst_initial);
        return ZF_SUCCESS;
      }

      default:
        return zf_make_error(ZF_ERROR_INVALID_STATE);
    }

BlockDone:
    if (zf_test_flag(_flags, DecoderFlags::kFinalBlock))
      _state = _format == FormatType::kZlib ? DecoderState::kZlibTrailer : DecoderState::kDone;
    else
      _state = DecoderState::kBlockHeader;
  }

ErrorTruncated:
  trace.fail("Unexpected end of input\n");
  result = zf_make_error(ZF_ERROR_MALFORMED_INPUT);
  goto Failed;

ErrorInvalidData:
  result = zf_make_error(ZF_ERROR_MALFORMED_INPUT);

Failed:
  _state = DecoderState::kInvalid;
  ByteArrayInternal::set_size(&dst, dst_initial);
  return result;
}

} // {zf::Compression::Deflate}
