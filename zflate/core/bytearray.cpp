// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/core/bytearray_p.h>
#include <zflate/support/intops_p.h>

namespace zf {
namespace ByteArrayInternal {

// zf::ByteArray - Internals
// =========================

static ZF_INLINE size_t grow_capacity_to_power_of_2(size_t x) noexcept {
  return size_t(1u) << (IntOps::bit_size_of<size_t>() - IntOps::clz(x | 1u));
}

size_t expand_capacity(size_t n) noexcept {
  size_t capacity = n;

  if (capacity >= ZF_ALLOC_GROW_LIMIT)
    capacity = capacity + (capacity >> 2) + (capacity >> 3); // Makes the capacity 37.5% greater.
  else
    capacity = grow_capacity_to_power_of_2(capacity - 1u); // Rounds the capacity up to a power of 2.

  // If an overflow happened during any of the computation above `zf_max()` would cancel it and make it fitting.
  return zf_max(capacity, n);
}

static ZFResult realloc_to(ZFByteArray* self, size_t capacity) noexcept {
  uint8_t* new_data = static_cast<uint8_t*>(realloc(self->_data, capacity));
  ZF_RETURN_ERROR_IF_NULL(new_data);

  self->_data = new_data;
  self->_capacity = capacity;
  return ZF_SUCCESS;
}

} // {ByteArrayInternal}
} // {zf}

// ZFByteArray - API - Common Functionality
// ========================================

void ZFByteArray::reset() noexcept {
  free(_data);

  _data = nullptr;
  _size = 0;
  _capacity = 0;
}

bool ZFByteArray::equals(const void* data, size_t size) const noexcept {
  if (_size != size)
    return false;

  return size == 0 || memcmp(_data, data, size) == 0;
}

// ZFByteArray - API - Data Manipulation
// =====================================

ZFResult ZFByteArray::reserve(size_t n) noexcept {
  if (n <= _capacity)
    return ZF_SUCCESS;

  return zf::ByteArrayInternal::realloc_to(this, n);
}

ZFResult ZFByteArray::resize(size_t n, uint8_t fill) noexcept {
  if (n <= _size) {
    _size = n;
    return ZF_SUCCESS;
  }

  size_t old_size = _size;

  uint8_t* dst;
  ZF_PROPAGATE(modify_op(ZF_MODIFY_OP_APPEND_FIT, n - old_size, &dst));

  memset(dst, fill, n - old_size);
  return ZF_SUCCESS;
}

ZFResult ZFByteArray::modify_op(ZFModifyOp op, size_t n, uint8_t** data_out) noexcept {
  using namespace zf::ByteArrayInternal;

  size_t index = is_append_op(op) ? _size : size_t(0);
  size_t size_after = index + n;

  if (ZF_UNLIKELY(size_after < index))
    return zf_make_error(ZF_ERROR_OUT_OF_MEMORY);

  if (size_after > _capacity) {
    size_t capacity = does_grow_op(op) ? expand_capacity(size_after) : size_after;
    ZF_PROPAGATE(realloc_to(this, capacity));
  }

  _size = size_after;
  *data_out = _data + index;
  return ZF_SUCCESS;
}

ZFResult ZFByteArray::assign_data(const void* data, size_t size) noexcept {
  uint8_t* dst;
  ZF_PROPAGATE(modify_op(ZF_MODIFY_OP_ASSIGN_FIT, size, &dst));

  if (size)
    memcpy(dst, data, size);
  return ZF_SUCCESS;
}

ZFResult ZFByteArray::append_data(const void* data, size_t size) noexcept {
  uint8_t* dst;
  ZF_PROPAGATE(modify_op(ZF_MODIFY_OP_APPEND_GROW, size, &dst));

  if (size)
    memcpy(dst, data, size);
  return ZF_SUCCESS;
}
