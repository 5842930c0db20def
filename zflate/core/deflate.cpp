// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/core/deflate.h>
#include <zflate/compression/checksum_p.h>
#include <zflate/compression/deflatedecoder_p.h>
#include <zflate/compression/deflateencoder_p.h>

#include <new>

namespace zf {
namespace {

static ZF_INLINE bool is_valid_view(const ZFDataView& view) noexcept {
  return view.data != nullptr || view.size == 0;
}

static ZF_INLINE size_t initial_inflate_capacity(size_t input_size) noexcept {
  // Twice the input is a reasonable first guess, the output grows when the guess is too small.
  size_t capacity = input_size <= (SIZE_MAX >> 1) ? input_size * 2u : input_size;
  return zf_max<size_t>(capacity, 64u);
}

} // {anonymous}
} // {zf}

// zf_deflate()
// ============

ZFResult zf_deflate(ZFByteArray* dst, ZFDataView input, uint32_t level, ZFDeflateFormat format) noexcept {
  using namespace zf::Compression;

  if (ZF_UNLIKELY(!dst || !zf::is_valid_view(input)))
    return zf_make_error(ZF_ERROR_INVALID_VALUE);

  if (ZF_UNLIKELY(level > ZF_DEFLATE_MAX_LEVEL || uint32_t(format) > ZF_DEFLATE_FORMAT_MAX_VALUE))
    return zf_make_error(ZF_ERROR_INVALID_VALUE);

  Deflate::Encoder encoder;
  ZF_PROPAGATE(encoder.init(Deflate::FormatType(format), level));

  return encoder.compress(*dst, ZF_MODIFY_OP_ASSIGN_FIT, input);
}

// zf_inflate()
// ============

ZFResult zf_inflate(ZFByteArray* dst, ZFDataView input, ZFDeflateFormat format, uint32_t flags) noexcept {
  using namespace zf::Compression;

  if (ZF_UNLIKELY(!dst || !zf::is_valid_view(input)))
    return zf_make_error(ZF_ERROR_INVALID_VALUE);

  if (ZF_UNLIKELY(uint32_t(format) > ZF_DEFLATE_FORMAT_MAX_VALUE || (flags & ~uint32_t(ZF_INFLATE_FLAG_ALL)) != 0u))
    return zf_make_error(ZF_ERROR_INVALID_VALUE);

  Deflate::DecoderOptions options = Deflate::DecoderOptions::kNone;
  if (flags & ZF_INFLATE_FLAG_VERIFY_CHECKSUM)
    options |= Deflate::DecoderOptions::kVerifyChecksum;

  dst->clear();

  if (flags & ZF_INFLATE_FLAG_NEVER_REALLOC)
    options |= Deflate::DecoderOptions::kNeverReallocOutputBuffer;
  else
    ZF_PROPAGATE(dst->reserve(zf::initial_inflate_capacity(input.size)));

  void* decoder_storage = malloc(sizeof(Deflate::Decoder));
  ZF_RETURN_ERROR_IF_NULL(decoder_storage);

  Deflate::Decoder* decoder = new(decoder_storage) Deflate::Decoder();
  decoder->init(Deflate::FormatType(format), options);

  ZFResult result = decoder->decode(*dst, input);

  decoder->~Decoder();
  free(decoder_storage);

  if (result != ZF_SUCCESS)
    dst->clear();
  return result;
}

// zf_adler32() & zf_crc32()
// =========================

uint32_t zf_adler32(const void* data, size_t size) noexcept {
  return zf::Compression::Checksum::adler32(static_cast<const uint8_t*>(data), size);
}

uint32_t zf_crc32(const void* data, size_t size) noexcept {
  return zf::Compression::Checksum::crc32(static_cast<const uint8_t*>(data), size);
}
