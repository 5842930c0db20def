// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_CORE_BYTEARRAY_P_H_INCLUDED
#define ZFLATE_CORE_BYTEARRAY_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>
#include <zflate/core/bytearray.h>

//! \cond INTERNAL
//! \addtogroup zflate_internal
//! \{

namespace zf {
namespace ByteArrayInternal {

static ZF_INLINE_CONSTEXPR bool is_append_op(ZFModifyOp op) noexcept { return op >= ZF_MODIFY_OP_APPEND_FIT; }
static ZF_INLINE_CONSTEXPR bool does_grow_op(ZFModifyOp op) noexcept { return (op & 1u) != 0; }

//! Returns a capacity that should be used when growing a container to hold at least `n` bytes.
ZF_HIDDEN size_t expand_capacity(size_t n) noexcept;

//! Sets the size of `self` to `n` bytes, which must not exceed its capacity. Used by code that writes directly
//! into the reserved storage of a byte array.
static ZF_INLINE void set_size(ZFByteArray* self, size_t n) noexcept {
  ZF_ASSERT(n <= self->_capacity);
  self->_size = n;
}

} // {ByteArrayInternal}
} // {zf}

//! \}
//! \endcond

#endif // ZFLATE_CORE_BYTEARRAY_P_H_INCLUDED
