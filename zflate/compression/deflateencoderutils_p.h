// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_COMPRESSION_DEFLATEENCODERUTILS_P_H_INCLUDED
#define ZFLATE_COMPRESSION_DEFLATEENCODERUTILS_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>
#include <zflate/support/intops_p.h>
#include <zflate/support/memops_p.h>

//! \cond INTERNAL

namespace zf::Compression::Deflate {

//! Number of bytes the output buffer must have after its logical end, because the bit-buffer is always flushed as
//! a whole machine word.
static constexpr uint32_t kMinOutputBufferPadding = sizeof(ZFBitWord);

namespace {

static constexpr bool can_buffer_n(size_t n) noexcept { return n + 7 < IntOps::bit_size_of<ZFBitWord>(); }

struct OutputBuffer {
  //! Pointer to the beginning of the output buffer.
  uint8_t* begin;
  //! Current pointer in the output buffer (points to the position where a next byte will be written).
  uint8_t* ptr;
  //! End of the output buffer, excluding the padding.
  uint8_t* end;

  ZF_INLINE_NODEBUG void init(uint8_t* output, size_t size) noexcept {
    ZF_ASSERT(size >= kMinOutputBufferPadding);
    begin = output;
    ptr = output;
    end = output + size - kMinOutputBufferPadding;
  }

  ZF_INLINE_NODEBUG size_t byte_offset() const noexcept { return size_t(ptr - begin); }
  ZF_INLINE_NODEBUG size_t remaining_bytes() const noexcept { return ptr < end ? size_t(end - ptr) : size_t(0); }
};

//! Bit-buffer used by the output stream.
//!
//! Bits are packed LSB first as required by DEFLATE. The buffer never holds `bit_size_of<ZFBitWord>()` bits as
//! shifting by the whole width of a machine word is undefined.
struct OutputBits {
  //! Bits to flush.
  ZFBitWord bit_word;
  //! Number of bits in `bit_word`.
  size_t bit_length;

  ZF_INLINE_NODEBUG bool is_empty() const noexcept { return bit_length == 0; }
  ZF_INLINE_NODEBUG size_t length() const noexcept { return bit_length; }
  ZF_INLINE_NODEBUG bool was_properly_flushed() const noexcept { return bit_length <= 7 && (bit_word >> bit_length) == 0; }

  template<typename T>
  ZF_INLINE_NODEBUG void add(const T& bits, size_t count) noexcept {
    ZF_ASSERT(bit_length + count < IntOps::bit_size_of<ZFBitWord>());

    bit_word |= ZFBitWord(bits) << bit_length;
    bit_length += count;
  }

  ZF_INLINE_NODEBUG void align_to_bytes() noexcept {
    bit_length = (bit_length + 7u) & ~size_t(7);
  }

  //! Flushes all complete bytes to `buffer`, at most 7 bits stay in the bit-buffer.
  ZF_INLINE_NODEBUG void flush(OutputBuffer& buffer) noexcept {
    size_t n = bit_length / 8u;

    ZF_ASSERT(n < sizeof(ZFBitWord));
    ZF_ASSERT(buffer.ptr + n <= buffer.end + kMinOutputBufferPadding);

    MemOps::storeu_le(buffer.ptr, bit_word);
    buffer.ptr += n;

    bit_word >>= n * 8u;
    bit_length &= 7;
  }

  template<size_t kN>
  ZF_INLINE_NODEBUG void flush_if_cannot_buffer_n(OutputBuffer& buffer) noexcept {
    if constexpr (!can_buffer_n(kN)) {
      flush(buffer);
    }
  }

  ZF_INLINE_NODEBUG void flush_final_byte(OutputBuffer& buffer) noexcept {
    if (!is_empty()) {
      ZF_ASSERT(length() <= 7u);
      buffer.ptr[0] = uint8_t(bit_word & 0xFFu);
      buffer.ptr++;

      bit_word = 0;
      bit_length = 0;
    }
  }
};

//! Output stream combines `OutputBits` and `OutputBuffer`, so it offers both bit and byte granularity.
struct OutputStream {
  OutputBits bits;
  OutputBuffer buffer;
};

} // {anonymous}
} // {zf::Compression::Deflate}

//! \endcond

#endif // ZFLATE_COMPRESSION_DEFLATEENCODERUTILS_P_H_INCLUDED
