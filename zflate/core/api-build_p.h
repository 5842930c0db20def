// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each zflate source file. This means that any
// macros we might need to define to build 'zflate' can be defined here instead of passing them to the compiler
// through command line.

#ifndef ZFLATE_CORE_API_BUILD_P_H_INCLUDED
#define ZFLATE_CORE_API_BUILD_P_H_INCLUDED

// Build - Export
// ==============

//! \cond INTERNAL

//! Export mode is on when `ZF_BUILD_EXPORT` is defined - this MUST be defined before including any other header
//! as "api.h" uses `ZF_BUILD_EXPORT` to define a proper `ZF_API` decorator that is used by all exported functions
//! and variables.
#define ZF_BUILD_EXPORT

//! \endcond

// Build - Configuration
// =====================

// #define ZF_BUILD_NO_INTRINSICS
// ------------------------------
//
// Disable compiler intrinsics used by zflate (byte swapping, bit scanning). Disabling them is only useful for
// testing fallback functions as otherwise there is no other way to test them.

// #define ZF_TRACE_DEFLATE         // Trace block decisions made by the deflate encoder.
// #define ZF_TRACE_INFLATE         // Trace block headers and failures of the inflate decoder.
//
// zflate provides traces that can be enabled during development. Traces can help to understand how certain
// things work and can be used to track bugs.

// Build - Sanitizers
// ==================

#if defined(__clang__)
  #if __has_feature(memory_sanitizer) || defined(__SANITIZE_MEMORY__)
    #define ZF_SANITIZE_MEMORY
  #endif
#elif defined(__GNUC__)
  #if defined(__SANITIZE_MEMORY__)
    #define ZF_SANITIZE_MEMORY
  #endif
#endif

// Build - Requirements
// ====================

//! \cond NEVER

// Turn off deprecation warnings when building 'zflate'. Required as some essential C headers could in some cases
// warn about using functions such as `snprintf()`, which we use correctly.
#ifdef _MSC_VER
  #if !defined(_CRT_SECURE_NO_DEPRECATE)
    #define _CRT_SECURE_NO_DEPRECATE
  #endif
  #if !defined(_CRT_SECURE_NO_WARNINGS)
    #define _CRT_SECURE_NO_WARNINGS
  #endif
#endif

// The file-system helpers work fully with 64-bit file sizes and offsets, however, this feature must be enabled
// before including any header.
#if !defined(_WIN32) && !defined(_LARGEFILE64_SOURCE)
  #define _LARGEFILE64_SOURCE 1

  // These OSes use 64-bit offsets by default.
  #if defined(__APPLE__    ) || \
      defined(__HAIKU__    ) || \
      defined(__bsdi__     ) || \
      defined(__DragonFly__) || \
      defined(__FreeBSD__  ) || \
      defined(__NetBSD__   ) || \
      defined(__OpenBSD__  )
    #define ZF_FILE64_API(NAME) NAME
  #else
    #define ZF_FILE64_API(NAME) NAME##64
  #endif
#endif

//! \endcond

// Build - Compiler Diagnostics
// ============================

//! \cond NEVER

#if defined(__clang__)
  #pragma clang diagnostic warning "-Wattributes"
  #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
  #pragma GCC diagnostic warning "-Wattributes"
  #pragma GCC diagnostic ignored "-Wmaybe-uninitialized" // Unfortunately GCC emits lots of false positives.
  #pragma GCC diagnostic ignored "-Wunused-function"
#elif defined(_MSC_VER)
  #pragma warning(disable: 4102) // Unreferenced label.
  #pragma warning(disable: 4127) // Conditional expression is constant.
  #pragma warning(disable: 4201) // Nameless struct/union.
  #pragma warning(disable: 4324) // Structure was padded due to alignment specifier.
  #pragma warning(disable: 4505) // Unreferenced local function has been removed.
  #pragma warning(disable: 4800) // Forcing value to bool true or false.
#endif

//! \endcond

// Build - Include API
// ===================

#include <zflate/core/api.h>
#include <zflate/core/api-internal_p.h>

#endif // ZFLATE_CORE_API_BUILD_P_H_INCLUDED
