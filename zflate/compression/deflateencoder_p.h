// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_COMPRESSION_DEFLATEENCODER_P_H_INCLUDED
#define ZFLATE_COMPRESSION_DEFLATEENCODER_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>
#include <zflate/core/bytearray.h>
#include <zflate/compression/deflatedefs_p.h>

//! \cond INTERNAL

namespace zf::Compression::Deflate {

struct EncoderImpl;

class Encoder {
public:
  EncoderImpl* impl;

  ZF_INLINE Encoder() noexcept : impl(nullptr) {}
  ZF_INLINE ~Encoder() noexcept { reset(); }

  ZF_NONCOPYABLE(Encoder)

  ZF_INLINE bool is_initialized() const noexcept { return impl != nullptr; }

  //! Initializes the encoder, `compression_level` must be within [0, kMaxCompressionLevel] range.
  ZFResult init(FormatType format, uint32_t compression_level) noexcept;
  void reset() noexcept;

  //! Returns the size of an output buffer that is guaranteed to hold the compressed `input_size` bytes.
  size_t minimum_output_buffer_size(size_t input_size) const noexcept;

  //! Compresses `input` into `output` and returns the number of bytes written, or zero if `output_size` is smaller
  //! than the size returned by `minimum_output_buffer_size()`.
  size_t compress_to(uint8_t* output, size_t output_size, const uint8_t* input, size_t input_size) noexcept;

  //! Compresses `input` and stores the result into `dst` according to `modify_op`.
  ZFResult compress(ZFByteArray& dst, ZFModifyOp modify_op, ZFDataView input) noexcept;
};

//! Maps a compression level to the 2-bit FLEVEL hint stored in a zlib header.
[[nodiscard]]
static ZF_INLINE_CONSTEXPR uint32_t zlib_compression_level_hint(uint32_t compression_level) noexcept {
  return compression_level < 2u ? 0u :
         compression_level < 6u ? 1u :
         compression_level < 7u ? 2u : 3u;
}

} // {zf::Compression::Deflate}

//! \endcond

#endif // ZFLATE_COMPRESSION_DEFLATEENCODER_P_H_INCLUDED
