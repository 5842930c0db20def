// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/core/bytearray_p.h>
#include <zflate/core/trace_p.h>
#include <zflate/compression/checksum_p.h>
#include <zflate/compression/deflatedefs_p.h>
#include <zflate/compression/deflateencoder_p.h>
#include <zflate/compression/deflateencoderutils_p.h>
#include <zflate/compression/deflatehuffman_p.h>
#include <zflate/compression/matchfinder_p.h>
#include <zflate/support/algorithm_p.h>
#include <zflate/support/memops_p.h>

namespace zf::Compression::Deflate {

// zf::Compression::Deflate::Encoder - Trace
// =========================================

#if defined(ZF_TRACE_DEFLATE)
#define Trace ZFDebugTrace
#else
#define Trace ZFDummyTrace
#endif

// zf::Compression::Deflate::Encoder - Options & Settings
// ======================================================

//! A block is ended when it has more sequences than this...
static constexpr uint32_t kEncoderMaxBlockSequences = 7000u;
//! ...or when it has more symbols (literals and matches) than this...
static constexpr uint32_t kEncoderMaxBlockSymbols = 26697u;
//! ...but only when there are more than this number of bytes left in the input.
static constexpr uint32_t kEncoderMinTailToSplit = 100u;

//! Sequences are only limited by the split check, which is skipped for the last `kEncoderMinTailToSplit` bytes.
static constexpr uint32_t kEncoderSequenceCapacity = kEncoderMaxBlockSequences + kEncoderMinTailToSplit + 8u;

//! Size of a zlib header (CMF and FLG) and the size of zlib trailer (ADLER32).
static constexpr uint32_t kZlibHeaderSize = 2;
static constexpr uint32_t kZlibTrailerSize = 4;

//! Codewords and lengths of DEFLATE Huffman codes.
struct Codes {
  uint16_t litlen_codewords[kNumLitLenSymbols];
  uint16_t offset_codewords[kNumOffsetSymbols];
  uint8_t litlen_lens[kNumLitLenSymbols];
  uint8_t offset_lens[kNumOffsetSymbols];
};

//! Symbol frequency counters of the current block.
struct Freqs {
  uint32_t litlen[kNumLitLenSymbols];
  uint32_t offset[kNumOffsetSymbols];
};

//! Represents a run of literals optionally followed by a match.
//!
//! Literals are not stored, they are read from the input when the block is written.
struct Sequence {
  //! Bits 0..22: the number of literals in this run (can be zero).
  //!
  //! Bits 23..31: the length of the match which follows the literals, or zero if the run is not followed by a match.
  uint32_t litrunlen_and_length;

  //! Offset of the match which follows the literals.
  uint16_t offset;
  //! Offset slot of the match which follows the literals.
  uint8_t offset_slot;
  //! Length slot of the match which follows the literals.
  uint8_t length_slot;
};

// zf::Compression::Deflate::Encoder - Encoder Impl
// ================================================

struct EncoderImpl {
  //! Format type.
  FormatType format;
  //! Compression level the encoder was initialized with.
  uint32_t compression_level;
  //! Match finder parameters of `compression_level`.
  LevelParams params;

  //! Frequency counters of the current block.
  Freqs freqs;
  //! Number of extra bits (length and offset) of all matches in the current block.
  uint32_t extra_bits;
  //! Number of sequences in the current block.
  uint32_t sequence_count;

  //! Dynamic Huffman codes of the current block.
  Codes codes;
  //! Fixed Huffman codes (BTYPE=01), built once by `init()`.
  Codes static_codes;

  //! Precode of the current block.
  struct Precode {
    uint32_t freqs[kNumPrecodeSymbols];
    uint8_t lens[kNumPrecodeSymbols];
    uint16_t codewords[kNumPrecodeSymbols];
    uint16_t items[kNumLitLenSymbols + kNumOffsetSymbols];
    uint32_t litlen_symbol_count;
    uint32_t offset_symbol_count;
    uint32_t explicit_len_count;
    uint32_t item_count;
  };

  Precode precode;

  //! Working memory used to build Huffman trees.
  HuffmanArena arena;

  //! Sequences chosen for the current block.
  Sequence sequences[kEncoderSequenceCapacity];

  //! Hash chains match finder.
  HashChainMatchFinder mf;
};

// zf::Compression::Deflate::Encoder - Huffman Codes
// =================================================

static void init_static_codes(EncoderImpl* impl) noexcept {
  Codes& codes = impl->static_codes;

  for (uint32_t sym = 0; sym < kNumLitLenSymbols; sym++)
    codes.litlen_lens[sym] = uint8_t(fixed_litlen_length(sym));

  for (uint32_t sym = 0; sym < kNumOffsetSymbols; sym++)
    codes.offset_lens[sym] = uint8_t(kFixedOffsetLength);

  build_huffman_codes(codes.litlen_lens, kNumLitLenSymbols, codes.litlen_codewords);
  build_huffman_codes(codes.offset_lens, kNumOffsetSymbols, codes.offset_codewords);
}

static void reset_block_stats(EncoderImpl* impl) noexcept {
  memset(&impl->freqs, 0, sizeof(impl->freqs));
  impl->extra_bits = 0;
  impl->sequence_count = 0;
}

// Builds dynamic Huffman codes of the current block and the precode that describes them.
static void make_dynamic_codes(EncoderImpl* impl) noexcept {
  Codes& codes = impl->codes;
  EncoderImpl::Precode& precode = impl->precode;

  zf_unused(build_huffman_lengths(impl->arena, impl->freqs.litlen, kNumLitLenSymbols, kMaxLitLenCodeWordLen, codes.litlen_lens));
  zf_unused(build_huffman_lengths(impl->arena, impl->freqs.offset, kNumOffsetSymbols, kMaxOffsetCodeWordLen, codes.offset_lens));

  build_huffman_codes(codes.litlen_lens, kNumLitLenSymbols, codes.litlen_codewords);
  build_huffman_codes(codes.offset_lens, kNumOffsetSymbols, codes.offset_codewords);

  // Run-length encode both code length sequences, each of them separately.
  uint32_t litlen_item_count;
  uint32_t offset_item_count;

  precode.litlen_symbol_count = compute_length_items(codes.litlen_lens, kNumUsedLitLenSymbols, precode.items, &litlen_item_count);
  precode.offset_symbol_count = compute_length_items(codes.offset_lens, kNumUsedOffsetSymbols, precode.items + litlen_item_count, &offset_item_count);
  precode.item_count = litlen_item_count + offset_item_count;

  // The end-of-block symbol is always used, so at least 257 literal/length codes are always sent.
  ZF_ASSERT(precode.litlen_symbol_count >= kFirstLengthSymbol);

  memset(precode.freqs, 0, sizeof(precode.freqs));
  for (uint32_t i = 0; i < precode.item_count; i++)
    precode.freqs[precode.items[i] & 0x1Fu]++;

  zf_unused(build_huffman_lengths(impl->arena, precode.freqs, kNumPrecodeSymbols, kMaxPreCodeWordLen, precode.lens));
  build_huffman_codes(precode.lens, kNumPrecodeSymbols, precode.codewords);

  uint32_t explicit_len_count = kNumPrecodeSymbols;
  while (explicit_len_count > 4u && precode.lens[kPrecodeLensPermutation[explicit_len_count - 1u]] == 0)
    explicit_len_count--;
  precode.explicit_len_count = explicit_len_count;
}

// zf::Compression::Deflate::Encoder - Uncompressed Blocks
// =======================================================

static void write_uncompressed_blocks(OutputStream& os, const uint8_t* data, size_t data_size, bool is_final) noexcept {
  ZF_ASSERT(os.bits.was_properly_flushed());

  OutputBits bits = os.bits;
  OutputBuffer buf = os.buffer;

  size_t block_size = zf_min<size_t>(data_size, kMaxUncompressedBlockSize);
  uint32_t block_is_final = uint32_t(is_final && data_size == block_size);

  // The first header shares its byte with the preceding block, all other headers start at a byte boundary.
  bits.add(block_is_final, 1);
  bits.add(uint32_t(BlockType::kUncompressed), 2);
  bits.align_to_bytes();
  bits.flush(buf);

  ZF_ASSERT(bits.length() == 0);
  ZF_ASSERT(buf.remaining_bytes() >= 4u + block_size);

  os.bits = bits;

  for (;;) {
    MemOps::writeU16uLE(buf.ptr, uint32_t(block_size));
    MemOps::writeU16uLE(buf.ptr + 2, uint32_t(block_size) ^ 0xFFFFu);
    buf.ptr += 4;

    if (block_size)
      memcpy(buf.ptr, data, block_size);

    data += block_size;
    buf.ptr += block_size;

    data_size -= block_size;
    if (data_size == 0)
      break;

    block_size = zf_min<size_t>(data_size, kMaxUncompressedBlockSize);
    block_is_final = uint32_t(is_final && data_size == block_size);

    ZF_ASSERT(buf.remaining_bytes() >= 5u + block_size);
    buf.ptr[0] = uint8_t(block_is_final | (uint32_t(BlockType::kUncompressed) << 1));
    buf.ptr++;
  }

  os.buffer.ptr = buf.ptr;
}

// zf::Compression::Deflate::Encoder - Block Writing
// =================================================

static const char* block_type_name(BlockType block_type) noexcept {
  static const char names[] = "Stored\0\0\0\0\0Fixed\0\0\0\0\0\0Dynamic\0\0\0\0";
  return names + uint32_t(block_type) * 11u;
}

static void write_huffman_block_data(EncoderImpl* impl, OutputStream& os, const Codes& codes, const uint8_t* in_next) noexcept {
  OutputBits bits = os.bits;
  OutputBuffer buf = os.buffer;

  const Sequence* seq = impl->sequences;
  const Sequence* seq_end = seq + impl->sequence_count;

  for (; seq != seq_end; seq++) {
    uint32_t litrunlen = seq->litrunlen_and_length & 0x7FFFFFu;
    uint32_t length = seq->litrunlen_and_length >> 23;

    while (litrunlen >= 3) {
      uint32_t lit0 = in_next[0];
      uint32_t lit1 = in_next[1];
      uint32_t lit2 = in_next[2];

      bits.add(codes.litlen_codewords[lit0], codes.litlen_lens[lit0]);
      bits.flush_if_cannot_buffer_n<2 * kMaxLitLenCodeWordLen>(buf);

      bits.add(codes.litlen_codewords[lit1], codes.litlen_lens[lit1]);
      bits.flush_if_cannot_buffer_n<3 * kMaxLitLenCodeWordLen>(buf);

      bits.add(codes.litlen_codewords[lit2], codes.litlen_lens[lit2]);
      bits.flush(buf);

      in_next += 3;
      litrunlen -= 3;
    }

    while (litrunlen) {
      uint32_t lit = *in_next++;
      bits.add(codes.litlen_codewords[lit], codes.litlen_lens[lit]);
      bits.flush(buf);
      litrunlen--;
    }

    if (length) {
      uint32_t length_slot = seq->length_slot;
      uint32_t length_sym = kFirstLengthSymbol + length_slot;

      bits.add(codes.litlen_codewords[length_sym], codes.litlen_lens[length_sym]);
      bits.add(length - kLengthSlotBase[length_slot], kLengthSlotExtraBits[length_slot]);
      bits.flush_if_cannot_buffer_n<kMaxLitLenCodeWordLen + kMaxExtraLengthBits + kMaxOffsetCodeWordLen>(buf);

      uint32_t offset = seq->offset;
      uint32_t offset_slot = seq->offset_slot;

      bits.add(codes.offset_codewords[offset_slot], codes.offset_lens[offset_slot]);
      bits.flush_if_cannot_buffer_n<kMaxLitLenCodeWordLen + kMaxExtraLengthBits + kMaxOffsetCodeWordLen + kMaxExtraOffsetBits>(buf);

      bits.add(offset - kOffsetSlotBase[offset_slot], kOffsetSlotExtraBits[offset_slot]);
      bits.flush(buf);

      in_next += length;
    }
  }

  bits.add(codes.litlen_codewords[kEndOfBlock], codes.litlen_lens[kEndOfBlock]);
  bits.flush(buf);

  os.bits = bits;
  os.buffer = buf;
}

static void write_dynamic_huffman_header(EncoderImpl* impl, OutputStream& os) noexcept {
  const EncoderImpl::Precode& precode = impl->precode;

  OutputBits bits = os.bits;
  OutputBuffer buf = os.buffer;

  bits.add(precode.litlen_symbol_count - 257u, 5);
  bits.add(precode.offset_symbol_count - 1u, 5);
  bits.add(precode.explicit_len_count - 4u, 4);
  bits.flush(buf);

  for (uint32_t i = 0; i < precode.explicit_len_count; i++) {
    bits.add(precode.lens[kPrecodeLensPermutation[i]], 3);
    bits.flush(buf);
  }

  for (uint32_t i = 0; i < precode.item_count; i++) {
    uint32_t item = precode.items[i];
    uint32_t sym = item & 0x1Fu;

    bits.add(precode.codewords[sym], precode.lens[sym]);
    bits.add(item >> 5, kPrecodeExtraBits[sym]);
    bits.flush(buf);
  }

  os.bits = bits;
  os.buffer = buf;
}

// Chooses the cheapest type of block (uncompressed, static Huffman, or dynamic Huffman) and writes it.
static void flush_block(EncoderImpl* impl, OutputStream& os, const uint8_t* block_begin, size_t block_length, bool is_final_block) noexcept {
  ZF_ASSERT(os.bits.was_properly_flushed());

  Trace trace;

  // Tally the end-of-block symbol.
  impl->freqs.litlen[kEndOfBlock]++;
  make_dynamic_codes(impl);

  const Freqs& freqs = impl->freqs;
  const Codes& codes = impl->codes;
  const EncoderImpl::Precode& precode = impl->precode;

  // Costs are measured in bits, all of them exclude the 3-bit block header.
  uint64_t static_cost = impl->extra_bits;
  uint64_t dynamic_cost = impl->extra_bits;

  for (uint32_t sym = 0; sym < kNumUsedLitLenSymbols; sym++) {
    static_cost += uint64_t(freqs.litlen[sym]) * fixed_litlen_length(sym);
    dynamic_cost += uint64_t(freqs.litlen[sym]) * codes.litlen_lens[sym];
  }

  for (uint32_t sym = 0; sym < kNumUsedOffsetSymbols; sym++) {
    static_cost += uint64_t(freqs.offset[sym]) * kFixedOffsetLength;
    dynamic_cost += uint64_t(freqs.offset[sym]) * codes.offset_lens[sym];
  }

  dynamic_cost += 5u + 5u + 4u + 3u * precode.explicit_len_count;
  for (uint32_t sym = 0; sym < kNumPrecodeSymbols; sym++)
    dynamic_cost += uint64_t(precode.freqs[sym]) * (precode.lens[sym] + kPrecodeExtraBits[sym]);

  uint32_t header_end = uint32_t(os.bits.length() + 3u) & 7u;
  uint64_t uncompressed_cost = uint64_t(header_end ? 8u - header_end : 0u) + 32u + 8u * uint64_t(block_length);

  BlockType block_type = BlockType::kDynamicHuffman;
  if (uncompressed_cost < static_cost && uncompressed_cost < dynamic_cost)
    block_type = BlockType::kUncompressed;
  else if (static_cost < dynamic_cost)
    block_type = BlockType::kStaticHuffman;

  trace.info("zf::Compression::Deflate::FlushBlock [Length=%zu Final=%u Type=%s Cost={Stored=%llu Fixed=%llu Dynamic=%llu}]\n",
    block_length,
    unsigned(is_final_block),
    block_type_name(block_type),
    (unsigned long long)uncompressed_cost,
    (unsigned long long)static_cost,
    (unsigned long long)dynamic_cost);

  if (block_type == BlockType::kUncompressed) {
    write_uncompressed_blocks(os, block_begin, block_length, is_final_block);
  }
  else {
    os.bits.add(uint32_t(is_final_block), 1);
    os.bits.add(uint32_t(block_type), 2);
    os.bits.flush(os.buffer);

    if (block_type == BlockType::kDynamicHuffman) {
      write_dynamic_huffman_header(impl, os);
      write_huffman_block_data(impl, os, impl->codes, block_begin);
    }
    else {
      write_huffman_block_data(impl, os, impl->static_codes, block_begin);
    }
  }

  reset_block_stats(impl);
}

// zf::Compression::Deflate::Encoder - Parsing
// ===========================================

static ZF_INLINE void choose_match(EncoderImpl* impl, const Match& match, uint32_t litrunlen) noexcept {
  ZF_ASSERT(impl->sequence_count < kEncoderSequenceCapacity);

  uint32_t length_slot = uint32_t(binary_search_closest_last(kLengthSlotBase, kNumLengthSlots, match.length));
  uint32_t offset_slot = uint32_t(binary_search_closest_last(kOffsetSlotBase, kNumOffsetSlots, match.offset));

  Sequence& seq = impl->sequences[impl->sequence_count++];
  seq.litrunlen_and_length = (match.length << 23) | litrunlen;
  seq.offset = uint16_t(match.offset);
  seq.offset_slot = uint8_t(offset_slot);
  seq.length_slot = uint8_t(length_slot);

  impl->freqs.litlen[kFirstLengthSymbol + length_slot]++;
  impl->freqs.offset[offset_slot]++;
  impl->extra_bits += uint32_t(kLengthSlotExtraBits[length_slot]) + kOffsetSlotExtraBits[offset_slot];
}

static ZF_INLINE void finish_literal_run(EncoderImpl* impl, uint32_t litrunlen) noexcept {
  ZF_ASSERT(impl->sequence_count < kEncoderSequenceCapacity);

  Sequence& seq = impl->sequences[impl->sequence_count++];
  seq.litrunlen_and_length = litrunlen;
  seq.offset = 0;
  seq.offset_slot = 0;
  seq.length_slot = 0;
}

// Greedy parser - at each position not covered by a previous match the longest match found by the match finder is
// taken, otherwise the position becomes a literal.
static void compress_greedy(EncoderImpl* impl, OutputStream& os, const uint8_t* data, size_t size) noexcept {
  const LevelParams& params = impl->params;
  HashChainMatchFinder& mf = impl->mf;

  mf.reset();
  reset_block_stats(impl);

  size_t block_start = 0;
  size_t covered = 0;
  uint32_t symbol_count = 0;
  uint32_t next_hash = 0;

  if (size > 2u) {
    next_hash = HashChainMatchFinder::hash3(data);
    mf.insert(next_hash, 0);
  }

  size_t i = 0;
  for (; i < size; i++) {
    uint32_t hash = next_hash;

    if (i + 3u < size) {
      next_hash = HashChainMatchFinder::hash3(data + i + 1u);
      mf.insert(next_hash, i + 1u);
    }

    if (covered > i)
      continue;

    if ((impl->sequence_count > kEncoderMaxBlockSequences || symbol_count > kEncoderMaxBlockSymbols) && size - i > kEncoderMinTailToSplit) {
      if (covered < i) {
        finish_literal_run(impl, uint32_t(i - covered));
        covered = i;
      }

      flush_block(impl, os, data + block_start, i - block_start, false);
      block_start = i;
      symbol_count = 0;
    }

    Match match {};
    if (i + 2u < size) {
      uint32_t nice_length = uint32_t(zf_min<size_t>(params.nice_length, size - i));
      match = mf.find(data, size, i, hash, nice_length, params.max_chain);
    }

    if (match.is_valid()) {
      choose_match(impl, match, uint32_t(i - covered));
      covered = i + match.length;
    }
    else {
      impl->freqs.litlen[data[i]]++;
    }

    symbol_count++;
  }

  if (covered < i)
    finish_literal_run(impl, uint32_t(i - covered));

  flush_block(impl, os, data + block_start, i - block_start, true);
}

// zf::Compression::Deflate::Encoder - Public API
// ==============================================

ZFResult Encoder::init(FormatType format, uint32_t compression_level) noexcept {
  if (ZF_UNLIKELY(compression_level > kMaxCompressionLevel || format > FormatType::kMaxValue))
    return zf_make_error(ZF_ERROR_INVALID_VALUE);

  void* allocated_ptr = malloc(sizeof(EncoderImpl));
  if (ZF_UNLIKELY(!allocated_ptr))
    return zf_make_error(ZF_ERROR_OUT_OF_MEMORY);

  EncoderImpl* new_impl = static_cast<EncoderImpl*>(allocated_ptr);
  new_impl->format = format;
  new_impl->compression_level = compression_level;
  new_impl->params = kLevelParams[compression_level];

  if (compression_level != 0)
    init_static_codes(new_impl);

  reset();
  impl = new_impl;

  return ZF_SUCCESS;
}

void Encoder::reset() noexcept {
  if (impl) {
    free(impl);
    impl = nullptr;
  }
}

// Huffman blocks are only written when they are not larger than an uncompressed block would be, so the worst case
// is all uncompressed blocks. Each block covers at least `kEncoderMaxBlockSequences * kMinMatchLen` bytes except
// the last one, and each uncompressed block has 5 bytes of overhead (header, LEN, and NLEN).
size_t Encoder::minimum_output_buffer_size(size_t input_size) const noexcept {
  size_t extra_bytes = size_t(kMinOutputBufferPadding) + 64u;
  if (impl->format == FormatType::kZlib)
    extra_bytes += kZlibHeaderSize + kZlibTrailerSize;

  return input_size + (input_size >> 10) + extra_bytes;
}

static size_t compress_deflate(EncoderImpl* impl, uint8_t* output, size_t output_size, const uint8_t* input, size_t input_size) noexcept {
  OutputStream os {};
  os.buffer.init(output, output_size);

  if (impl->compression_level == 0u)
    write_uncompressed_blocks(os, input, input_size, true);
  else
    compress_greedy(impl, os, input, input_size);

  os.bits.flush_final_byte(os.buffer);
  return os.buffer.byte_offset();
}

size_t Encoder::compress_to(uint8_t* output, size_t output_size, const uint8_t* input, size_t input_size) noexcept {
  if (ZF_UNLIKELY(output_size < minimum_output_buffer_size(input_size)))
    return 0;

  switch (impl->format) {
    case FormatType::kRaw: {
      return compress_deflate(impl, output, output_size, input, input_size);
    }

    case FormatType::kZlib: {
      static constexpr uint32_t kZlibCompressionMethodDeflate = 8;
      static constexpr uint32_t kZlibCompressionWindow32KiB = 7;

      size_t compressed_size = compress_deflate(impl, output + kZlibHeaderSize, output_size - kZlibHeaderSize - kZlibTrailerSize, input, input_size);

      // Zlib header - 2 bytes (CMF and FLG), FCHECK makes the header a multiple of 31.
      uint32_t hdr = (zlib_compression_level_hint(impl->compression_level) << 6) |
                     (kZlibCompressionMethodDeflate << 8) |
                     (kZlibCompressionWindow32KiB << 12);

      hdr |= 31u - (hdr % 31u);
      MemOps::writeU16uBE(output, hdr);

      // Zlib trailer - ADLER32 of the uncompressed data (4 bytes).
      uint32_t checksum = Checksum::adler32(input, input_size);
      MemOps::writeU32uBE(output + kZlibHeaderSize + compressed_size, checksum);

      return compressed_size + kZlibHeaderSize + kZlibTrailerSize;
    }

    default:
      return 0;
  }
}

ZFResult Encoder::compress(ZFByteArray& dst, ZFModifyOp modify_op, ZFDataView input) noexcept {
  if (ZF_UNLIKELY(!impl))
    return zf_make_error(ZF_ERROR_NOT_INITIALIZED);

  size_t prev_size = dst.size();
  size_t min_output_size = minimum_output_buffer_size(input.size);
  uint8_t* output_buffer;

  ZF_PROPAGATE(dst.modify_op(modify_op, min_output_size, &output_buffer));

  size_t output_size = compress_to(output_buffer, min_output_size, input.data, input.size);
  size_t base_size = ByteArrayInternal::is_append_op(modify_op) ? prev_size : size_t(0);

  dst.truncate(base_size + output_size);
  return ZF_SUCCESS;
}

} // {zf::Compression::Deflate}
