// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_COMPRESSION_DEFLATEDECODERUTILS_P_H_INCLUDED
#define ZFLATE_COMPRESSION_DEFLATEDECODERUTILS_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>
#include <zflate/compression/deflatedecoder_p.h>
#include <zflate/support/intops_p.h>

//! \cond INTERNAL

namespace zf::Compression::Deflate::DecoderUtils {
namespace {

template<typename T>
ZF_INLINE_NODEBUG uint32_t mask32(const T& n) noexcept { return (1u << n) - 1u; }

ZF_INLINE_NODEBUG uint32_t extract_n(ZFBitWord src, size_t n) noexcept { return uint32_t(src) & mask32(uint32_t(n)); }

template<uint32_t kOffset, uint32_t kNBits>
ZF_INLINE_NODEBUG uint32_t extract_field(DecodeEntry e) noexcept { return (e.value >> kOffset) & mask32(kNBits); }

ZF_INLINE_NODEBUG uint32_t code_length(DecodeEntry e) noexcept { return extract_field<DecodeEntry::kCodeLengthOffset, DecodeEntry::kCodeLengthNBits>(e); }
ZF_INLINE_NODEBUG uint32_t extra_bits(DecodeEntry e) noexcept { return extract_field<DecodeEntry::kExtraBitsOffset, DecodeEntry::kExtraBitsNBits>(e); }
ZF_INLINE_NODEBUG uint32_t payload(DecodeEntry e) noexcept { return e.value >> DecodeEntry::kPayloadOffset; }

ZF_INLINE_NODEBUG bool is_literal(DecodeEntry e) noexcept { return (e.value & DecodeEntry::kLiteralFlag) != 0u; }
ZF_INLINE_NODEBUG bool is_match(DecodeEntry e) noexcept { return (e.value & DecodeEntry::kMatchFlag) != 0u; }
ZF_INLINE_NODEBUG bool is_end_of_block(DecodeEntry e) noexcept { return (e.value & DecodeEntry::kEndOfBlockFlag) != 0u; }
ZF_INLINE_NODEBUG bool is_sub_table(DecodeEntry e) noexcept { return (e.value & DecodeEntry::kSubTableFlag) != 0u; }
ZF_INLINE_NODEBUG bool is_invalid(DecodeEntry e) noexcept { return (e.value & DecodeEntry::kInvalidFlag) != 0u; }

static constexpr DecodeEntry kInvalidEntry = DecodeEntry{DecodeEntry::kInvalidFlag};

//! Makes an entry from a symbol template `result` and the number of bits of its code word.
ZF_INLINE_NODEBUG DecodeEntry make_entry(uint32_t result, uint32_t code_len) noexcept {
  return DecodeEntry{result | (code_len << DecodeEntry::kCodeLengthOffset)};
}

//! Makes a link from the main table to a sub-table that starts at `index` and is indexed by `sub_bits`.
ZF_INLINE_NODEBUG DecodeEntry make_sub_table_link(uint32_t index, uint32_t table_bits, uint32_t sub_bits) noexcept {
  return DecodeEntry{(index << DecodeEntry::kPayloadOffset) |
                     DecodeEntry::kSubTableFlag |
                     (sub_bits << DecodeEntry::kExtraBitsOffset) |
                     (table_bits << DecodeEntry::kCodeLengthOffset)};
}

} // {anonymous}
} // {zf::Compression::Deflate::DecoderUtils}

// zf::Compression::Deflate - Decoder Bits
// =======================================

namespace zf::Compression::Deflate {
namespace {

struct DecoderBits {
  ZFBitWord bit_word {};
  size_t bit_length {};

  ZF_INLINE_NODEBUG ZFBitWord all() const noexcept { return bit_word; }
  ZF_INLINE_NODEBUG size_t length() const noexcept { return bit_length; }

  ZF_INLINE_NODEBUG bool is_empty() const noexcept { return bit_length == 0; }

  ZF_INLINE_NODEBUG bool can_refill_byte() const noexcept {
    if constexpr (sizeof(ZFBitWord) >= 8)
      return bit_length < (IntOps::bit_size_of<ZFBitWord>() - 8u);
    else
      return bit_length <= (IntOps::bit_size_of<ZFBitWord>() - 8u);
  }

  ZF_INLINE_NODEBUG void refill_byte(uint8_t b) noexcept {
    ZF_ASSERT(can_refill_byte());

    bit_word |= ZFBitWord(b) << bit_length;
    bit_length += 8;
  }

  //! Refills as many whole bytes from `ptr` as fit into the bit-word, never reads past `end`.
  ZF_INLINE void refill(const uint8_t*& ptr, const uint8_t* end) noexcept {
    while (can_refill_byte() && ptr != end)
      refill_byte(*ptr++);
  }

  template<size_t Index = 0>
  ZF_INLINE_NODEBUG uint32_t extract(size_t n) const noexcept {
    return DecoderUtils::extract_n(bit_word >> Index, n);
  }

  ZF_INLINE_NODEBUG void consumed(size_t n) noexcept {
    ZF_ASSERT(n <= bit_length);

    bit_word >>= n;
    bit_length -= n;
  }

  ZF_INLINE_NODEBUG void make_byte_aligned() noexcept { consumed(bit_length & 0x7u); }
};

} // {anonymous}
} // {zf::Compression::Deflate}

//! \endcond

#endif // ZFLATE_COMPRESSION_DEFLATEDECODERUTILS_P_H_INCLUDED
