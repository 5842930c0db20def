// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_SUPPORT_INTOPS_P_H_INCLUDED
#define ZFLATE_SUPPORT_INTOPS_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup zflate_internal
//! \{

namespace zf {
namespace IntOps {

//! \name Type Utilities
//! \{

template<typename T>
using UIntByType = std::make_unsigned_t<T>;

template<typename T>
[[nodiscard]]
static ZF_INLINE_CONSTEXPR UIntByType<T> as_uint(T x) noexcept { return UIntByType<T>(x); }

template<typename T>
[[nodiscard]]
ZF_INLINE_CONSTEXPR uint32_t bit_size_of() noexcept { return uint32_t(sizeof(T) * 8u); }

//! \}

//! \name Byte Swap
//! \{

[[nodiscard]]
static ZF_INLINE uint16_t byte_swap16(uint16_t x) noexcept {
#if defined(__GNUC__) && !defined(ZF_BUILD_NO_INTRINSICS)
  return __builtin_bswap16(x);
#else
  return uint16_t((x << 8) | (x >> 8));
#endif
}

[[nodiscard]]
static ZF_INLINE uint32_t byte_swap32(uint32_t x) noexcept {
#if defined(__GNUC__) && !defined(ZF_BUILD_NO_INTRINSICS)
  return __builtin_bswap32(x);
#elif defined(_MSC_VER) && !defined(ZF_BUILD_NO_INTRINSICS)
  return uint32_t(_byteswap_ulong(x));
#else
  return (x << 24) | (x >> 24) | ((x << 8) & 0x00FF0000u) | ((x >> 8) & 0x0000FF00u);
#endif
}

[[nodiscard]]
static ZF_INLINE uint64_t byte_swap64(uint64_t x) noexcept {
#if defined(__GNUC__) && !defined(ZF_BUILD_NO_INTRINSICS)
  return __builtin_bswap64(x);
#elif defined(_MSC_VER) && !defined(ZF_BUILD_NO_INTRINSICS)
  return uint64_t(_byteswap_uint64(x));
#else
  return (uint64_t(byte_swap32(uint32_t(x >> 32        ))))
       | (uint64_t(byte_swap32(uint32_t(x & 0xFFFFFFFFu))) << 32);
#endif
}

template<typename T>
[[nodiscard]]
static ZF_INLINE T byte_swap(const T& x) noexcept {
  if constexpr (sizeof(T) == 1)
    return x;
  else if constexpr (sizeof(T) == 2)
    return T(byte_swap16(uint16_t(x)));
  else if constexpr (sizeof(T) == 4)
    return T(byte_swap32(uint32_t(x)));
  else
    return T(byte_swap64(uint64_t(x)));
}

template<typename T> [[nodiscard]] static ZF_INLINE T byte_swap_le(T x) noexcept { return ZF_BYTE_ORDER_NATIVE == ZF_BYTE_ORDER_LE ? T(x) : byte_swap(x); }
template<typename T> [[nodiscard]] static ZF_INLINE T byte_swap_be(T x) noexcept { return ZF_BYTE_ORDER_NATIVE == ZF_BYTE_ORDER_BE ? T(x) : byte_swap(x); }

//! \}

//! \name Bit Scan
//! \{

template<typename T>
[[nodiscard]]
static ZF_INLINE_CONSTEXPR uint32_t clz_fallback(T x) noexcept {
  uint32_t n = 0;
  for (T mask = T(T(1) << (bit_size_of<T>() - 1u)); mask && !(x & mask); mask >>= 1)
    n++;
  return n;
}

template<typename T> [[nodiscard]] ZF_INLINE_NODEBUG uint32_t clz_impl(const T& x) noexcept { return clz_fallback(x); }

#if defined(__GNUC__) && !defined(ZF_BUILD_NO_INTRINSICS)
template<> [[nodiscard]] ZF_INLINE_NODEBUG uint32_t clz_impl(const uint32_t& x) noexcept { return uint32_t(__builtin_clz(x)); }
template<> [[nodiscard]] ZF_INLINE_NODEBUG uint32_t clz_impl(const unsigned long& x) noexcept { return uint32_t(__builtin_clzl(x)); }
template<> [[nodiscard]] ZF_INLINE_NODEBUG uint32_t clz_impl(const unsigned long long& x) noexcept { return uint32_t(__builtin_clzll(x)); }
#endif

//! Counts leading zeros in `x`, which must be non-zero.
template<typename T>
[[nodiscard]]
static ZF_INLINE_NODEBUG uint32_t clz(T x) noexcept { return clz_impl(as_uint(x)); }

//! \}

//! \name Bit Reversal
//! \{

//! Reverses the low `n` bits of `code`, higher bits are expected to be zero.
[[nodiscard]]
static ZF_INLINE uint32_t reverse_bits(uint32_t code, uint32_t n) noexcept {
  code = ((code & 0x5555u) << 1) | ((code & 0xAAAAu) >> 1);
  code = ((code & 0x3333u) << 2) | ((code & 0xCCCCu) >> 2);
  code = ((code & 0x0F0Fu) << 4) | ((code & 0xF0F0u) >> 4);
  code = ((code & 0x00FFu) << 8) | ((code & 0xFF00u) >> 8);
  return code >> (16u - n);
}

//! \}

} // {IntOps}
} // {zf}

//! \}
//! \endcond

#endif // ZFLATE_SUPPORT_INTOPS_P_H_INCLUDED
