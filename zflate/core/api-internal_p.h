// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_CORE_API_INTERNAL_P_H_INCLUDED
#define ZFLATE_CORE_API_INTERNAL_P_H_INCLUDED

#include <zflate/core/api.h>

// C Headers
// =========

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

// C++ Headers
// ===========

#include <limits>
#include <type_traits>
#include <utility>

// Some intrinsics defined by MSVC compiler are useful and used across the library.
#ifdef _MSC_VER
  #include <intrin.h>
#endif

//! \cond INTERNAL
//! \addtogroup zflate_internal
//! \{

// Build - Target Architecture
// ===========================

#if defined(_M_X64) || defined(__x86_64__)
  #define ZF_TARGET_ARCH_X86 64
#elif defined(_M_IX86) || defined(__X86__) || defined(__i386__)
  #define ZF_TARGET_ARCH_X86 32
#else
  #define ZF_TARGET_ARCH_X86 0
#endif

#if defined(_M_ARM64) || defined(__arm64__) || defined(__aarch64__)
  #define ZF_TARGET_ARCH_ARM 64
#elif defined(_M_ARM) || defined(_M_ARMT) || defined(__arm__) || defined(__thumb__) || defined(__thumb2__)
  #define ZF_TARGET_ARCH_ARM 32
#else
  #define ZF_TARGET_ARCH_ARM 0
#endif

#define ZF_TARGET_ARCH_BITS (ZF_TARGET_ARCH_X86 | ZF_TARGET_ARCH_ARM)
#if ZF_TARGET_ARCH_BITS == 0
  #undef ZF_TARGET_ARCH_BITS
  #if defined(__LP64__) || defined(_LP64)
    #define ZF_TARGET_ARCH_BITS 64
  #else
    #define ZF_TARGET_ARCH_BITS 32
  #endif
#endif

// Build - Byte Order
// ==================

#define ZF_BYTE_ORDER_LE 1234
#define ZF_BYTE_ORDER_BE 4321

#if (defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__) || \
    (defined(__BIG_ENDIAN__) && !defined(__LITTLE_ENDIAN__))
  #define ZF_BYTE_ORDER_NATIVE ZF_BYTE_ORDER_BE
#else
  #define ZF_BYTE_ORDER_NATIVE ZF_BYTE_ORDER_LE
#endif

// Internal Function Attributes
// ============================

//! \def ZF_HIDDEN
//!
//! Decorates a function that is used across more than one source file, but should never be exported.
#if defined(__GNUC__) && !defined(_WIN32)
  #define ZF_HIDDEN __attribute__((__visibility__("hidden")))
#else
  #define ZF_HIDDEN
#endif

//! \def ZF_NOINLINE
//!
//! Decorates a function that should never be inlined. Used to decorate functions that are called rarely or that
//! are called from other code in corner cases - like buffer reallocation, etc...
#if defined(__GNUC__)
  #define ZF_NOINLINE __attribute__((__noinline__))
#elif defined(_MSC_VER)
  #define ZF_NOINLINE __declspec(noinline)
#else
  #define ZF_NOINLINE
#endif

//! \def ZF_UNALIGNED_TYPE
//!
//! Defines a type that can be used to access memory that is not aligned to the natural alignment of `TYPE`.
#if defined(__GNUC__)
  #define ZF_UNALIGNED_TYPE(TYPE, ALIGNMENT) __attribute__((__aligned__(ALIGNMENT))) __attribute__((__may_alias__)) TYPE
#elif defined(_MSC_VER)
  #define ZF_UNALIGNED_TYPE(TYPE, ALIGNMENT) __declspec(align(ALIGNMENT)) TYPE
#else
  #define ZF_UNALIGNED_TYPE(TYPE, ALIGNMENT) TYPE
#endif

// Internal Macros
// ===============

#define ZF_STRINGIFY_WRAP(N) #N
#define ZF_STRINGIFY(N) ZF_STRINGIFY_WRAP(N)

#define ZF_STATIC_ASSERT(...) static_assert(__VA_ARGS__, "Failed ZF_STATIC_ASSERT(" #__VA_ARGS__ ")")

//! \def ZF_NONCOPYABLE
//!
//! Makes a class noncopyable by making its copy constructor and copy assignment operator deleted.
#define ZF_NONCOPYABLE(...)                                                   \
  __VA_ARGS__(const __VA_ARGS__& other) = delete;                             \
  __VA_ARGS__& operator=(const __VA_ARGS__& other) = delete;

//! \def ZF_NOT_REACHED()
//!
//! Run-time assertion used in code that should never be reached.
#ifdef ZF_BUILD_DEBUG
  #define ZF_NOT_REACHED() zf_runtime_assertion_failure(__FILE__, __LINE__, "ZF_NOT_REACHED()")
#elif defined(__GNUC__)
  #define ZF_NOT_REACHED() __builtin_unreachable()
#else
  #define ZF_NOT_REACHED() ((void)0)
#endif

#if defined(_MSC_VER)
  #define ZF_RESTRICT __restrict
#elif defined(__GNUC__)
  #define ZF_RESTRICT __restrict__
#else
  #define ZF_RESTRICT
#endif

#define ZF_ARRAY_SIZE(X) uint32_t(sizeof(X) / sizeof(X[0]))

#define ZF_PROPAGATE_(exp, cleanup)                                           \
  do {                                                                        \
    ZFResult _result_to_propagate = (exp);                                    \
    if (ZF_UNLIKELY(_result_to_propagate != ZF_SUCCESS)) {                    \
      cleanup                                                                 \
      return _result_to_propagate;                                            \
    }                                                                         \
  } while (0)

#define ZF_RETURN_ERROR_IF_NULL(ptr)                \
  do {                                              \
    if (!(ptr))                                     \
      return zf_make_error(ZF_ERROR_OUT_OF_MEMORY); \
  } while (0)

//! \def ZF_DEFINE_ENUM_FLAGS(T)
//!
//! Defines operations for enumeration flags.
#define ZF_DEFINE_ENUM_FLAGS(T)                                               \
  static ZF_INLINE_CONSTEXPR T operator~(T a) noexcept {                      \
    return T(~std::underlying_type_t<T>(a));                                  \
  }                                                                           \
                                                                              \
  static ZF_INLINE_CONSTEXPR T operator|(T a, T b) noexcept {                 \
    return T(std::underlying_type_t<T>(a) | std::underlying_type_t<T>(b));    \
  }                                                                           \
  static ZF_INLINE_CONSTEXPR T operator&(T a, T b) noexcept {                 \
    return T(std::underlying_type_t<T>(a) & std::underlying_type_t<T>(b));    \
  }                                                                           \
                                                                              \
  static ZF_INLINE_CONSTEXPR T& operator|=(T& a, T b) noexcept {              \
    a = T(std::underlying_type_t<T>(a) | std::underlying_type_t<T>(b));       \
    return a;                                                                 \
  }                                                                           \
  static ZF_INLINE_CONSTEXPR T& operator&=(T& a, T b) noexcept {              \
    a = T(std::underlying_type_t<T>(a) & std::underlying_type_t<T>(b));       \
    return a;                                                                 \
  }

// Internal Types
// ==============

//! A type used to store a pack of bits (typedef to `uintptr_t`).
//!
//! BitWord should be equal in size to a machine word.
using ZFBitWord = uintptr_t;

// Internal Constants
// ==================

//! Host memory allocator overhead (estimated).
static constexpr uint32_t ZF_ALLOC_OVERHEAD = uint32_t(sizeof(void*)) * 4u;

//! Limits doubling of a container size after the limit size [in bytes] has reached 8MB. The container will
//! use a more conservative approach after the threshold has been reached.
static constexpr uint32_t ZF_ALLOC_GROW_LIMIT = 1u << 23;

// Internal C++ Structs
// ====================

template<typename ValueT>
struct ZFResultT {
  ZFResult code;
  ValueT value;
};

// Internal C++ Functions
// ======================

//! Used to silence warnings about unused arguments or variables.
template<typename... Args>
static ZF_INLINE_NODEBUG void zf_unused(Args&&...) noexcept {}

template<typename T>
static ZF_INLINE_CONSTEXPR bool zf_test_flag(const T& x, const T& y) noexcept {
  return (std::underlying_type_t<T>(x) & std::underlying_type_t<T>(y)) != std::underlying_type_t<T>(0);
}

template<typename T>
static ZF_INLINE_CONSTEXPR T zf_min(const T& a, const T& b) noexcept { return b < a ? b : a; }

template<typename T>
static ZF_INLINE_CONSTEXPR T zf_max(const T& a, const T& b) noexcept { return a < b ? b : a; }

//! \}
//! \endcond

#endif // ZFLATE_CORE_API_INTERNAL_P_H_INCLUDED
