// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_CORE_DEFLATE_H_INCLUDED
#define ZFLATE_CORE_DEFLATE_H_INCLUDED

#include <zflate/core/api.h>
#include <zflate/core/bytearray.h>

//! \addtogroup zf_deflate
//! \{

//! Container format of a compressed stream.
enum ZFDeflateFormat : uint32_t {
  //! Raw DEFLATE stream as specified by RFC 1951.
  ZF_DEFLATE_FORMAT_RAW = 0,
  //! ZLIB stream as specified by RFC 1950 - DEFLATE stream wrapped by a 2 byte header and Adler-32 trailer.
  ZF_DEFLATE_FORMAT_ZLIB = 1,

  //! Maximum value of `ZFDeflateFormat`.
  ZF_DEFLATE_FORMAT_MAX_VALUE = 1
};

//! Flags that can be passed to `zf_inflate()`.
enum ZFInflateFlags : uint32_t {
  //! No flags.
  ZF_INFLATE_NO_FLAGS = 0u,
  //! Verifies the Adler-32 trailer of a ZLIB stream and fails with `ZF_ERROR_CHECKSUM_MISMATCH` on mismatch.
  ZF_INFLATE_FLAG_VERIFY_CHECKSUM = 0x00000001u,
  //! Never reallocates the destination buffer - the decompressed data must fit its current capacity, otherwise
  //! `zf_inflate()` fails with `ZF_ERROR_DATA_TOO_LARGE`.
  ZF_INFLATE_FLAG_NEVER_REALLOC = 0x00000002u,

  //! All valid flags.
  ZF_INFLATE_FLAG_ALL = 0x00000003u
};

//! Default compression level used by tools when no level is given.
static constexpr uint32_t ZF_DEFLATE_DEFAULT_LEVEL = 6u;
//! Highest compression level accepted by `zf_deflate()`.
static constexpr uint32_t ZF_DEFLATE_MAX_LEVEL = 9u;

//! Compresses `input` and replaces the content of `dst` with the compressed stream of the given `format`.
//!
//! The `level` must be within [0, 9] range. Level 0 stores the input in uncompressed blocks, higher levels search
//! longer for matches. The output is deterministic - the same input, level, and format always produce the same
//! bytes.
ZF_API ZFResult zf_deflate(ZFByteArray* dst, ZFDataView input, uint32_t level, ZFDeflateFormat format) noexcept;

//! Decompresses a complete compressed stream of the given `format` and replaces the content of `dst` with it.
//!
//! The `flags` is a combination of \ref ZFInflateFlags. If decompression fails `dst` is left empty and the
//! returned error describes the failure:
//!
//!   - `ZF_ERROR_MALFORMED_INPUT` - the stream is truncated or contains invalid data.
//!   - `ZF_ERROR_UNSUPPORTED_BLOCK_TYPE` - the stream uses the reserved block type.
//!   - `ZF_ERROR_CHECKSUM_MISMATCH` - the Adler-32 trailer doesn't match (only with verification enabled).
//!   - `ZF_ERROR_DATA_TOO_LARGE` - decompressed data doesn't fit `dst` and reallocation is not allowed.
ZF_API ZFResult zf_inflate(ZFByteArray* dst, ZFDataView input, ZFDeflateFormat format, uint32_t flags) noexcept;

//! Computes Adler-32 checksum of `size` bytes of `data`, empty input gives 1.
ZF_API uint32_t zf_adler32(const void* data, size_t size) noexcept;

//! Computes CRC-32 checksum (IEEE 802.3, reflected) of `size` bytes of `data`, empty input gives 0.
ZF_API uint32_t zf_crc32(const void* data, size_t size) noexcept;

//! \}

#endif // ZFLATE_CORE_DEFLATE_H_INCLUDED
