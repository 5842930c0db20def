// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_CORE_RUNTIME_H_INCLUDED
#define ZFLATE_CORE_RUNTIME_H_INCLUDED

#include <zflate/core/api.h>

#include <stdarg.h>

//! \addtogroup zf_runtime
//! \{

//! zflate build type.
enum ZFRuntimeBuildType : uint32_t {
  //! Describes a zflate debug build.
  ZF_RUNTIME_BUILD_TYPE_DEBUG = 0,
  //! Describes a zflate release build.
  ZF_RUNTIME_BUILD_TYPE_RELEASE = 1
};

//! zflate build information.
struct ZFRuntimeBuildInfo {
  //! Major version number.
  uint32_t major_version;
  //! Minor version number.
  uint32_t minor_version;
  //! Patch version number.
  uint32_t patch_version;

  //! zflate build type, see \ref ZFRuntimeBuildType.
  uint32_t build_type;

  //! Size of the sliding window used by the compressor and accepted by the decompressor.
  uint32_t window_size;

  //! Highest compression level accepted by `zf_deflate()`.
  uint32_t max_compression_level;

  //! Identification of the C++ compiler used to build zflate.
  char compiler_info[32];

  ZF_INLINE_NODEBUG void reset() noexcept { *this = ZFRuntimeBuildInfo{}; }
};

//! Queries build information of the zflate library.
ZF_API ZFResult zf_runtime_query_build_info(ZFRuntimeBuildInfo* info_out) noexcept;

//! Converts `errno` value to `ZFResult`.
ZF_API ZFResult zf_result_from_posix_error(int e) noexcept;

//! Writes `msg` to the message output (stderr).
ZF_API ZFResult zf_runtime_message_out(const char* msg) noexcept;
//! Formats a message through `vsnprintf()` and writes it to the message output.
ZF_API ZFResult zf_runtime_message_fmt(const char* fmt, ...) noexcept;
//! Formats a message through `vsnprintf()` and writes it to the message output.
ZF_API ZFResult zf_runtime_message_vfmt(const char* fmt, va_list ap) noexcept;

//! \}

#endif // ZFLATE_CORE_RUNTIME_H_INCLUDED
