// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_SUPPORT_MEMOPS_P_H_INCLUDED
#define ZFLATE_SUPPORT_MEMOPS_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>
#include <zflate/support/intops_p.h>

//! \cond INTERNAL
//! \addtogroup zflate_internal
//! \{

namespace zf {
namespace MemOps {

//! \name Memory Write
//! \{

template<typename T>
static ZF_INLINE_NODEBUG void storeu(void* p, const T& x) noexcept { memcpy(p, &x, sizeof(T)); }

template<typename T>
static ZF_INLINE_NODEBUG void storeu_le(void* p, const T& x) noexcept { storeu(p, IntOps::byte_swap_le(x)); }

template<typename T>
static ZF_INLINE_NODEBUG void storeu_be(void* p, const T& x) noexcept { storeu(p, IntOps::byte_swap_be(x)); }

static ZF_INLINE_NODEBUG void writeU16uLE(void* p, uint32_t x) noexcept { storeu_le(p, uint16_t(x & 0xFFFFu)); }
static ZF_INLINE_NODEBUG void writeU16uBE(void* p, uint32_t x) noexcept { storeu_be(p, uint16_t(x & 0xFFFFu)); }
static ZF_INLINE_NODEBUG void writeU32uBE(void* p, uint32_t x) noexcept { storeu_be(p, x); }

//! \}

} // {MemOps}
} // {zf}

//! \}
//! \endcond

#endif // ZFLATE_SUPPORT_MEMOPS_P_H_INCLUDED
