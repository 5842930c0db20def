// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_CORE_BYTEARRAY_H_INCLUDED
#define ZFLATE_CORE_BYTEARRAY_H_INCLUDED

#include <zflate/core/api.h>

//! \addtogroup zf_containers
//! \{

//! Modify operation used by `ZFByteArray::modify_op()`.
enum ZFModifyOp : uint32_t {
  //! Assign operation, which reserves space only to fit the requested input.
  ZF_MODIFY_OP_ASSIGN_FIT = 0,
  //! Assign operation, which takes into consideration successive appends.
  ZF_MODIFY_OP_ASSIGN_GROW = 1,
  //! Append operation, which reserves space only to fit the current and appended content.
  ZF_MODIFY_OP_APPEND_FIT = 2,
  //! Append operation, which takes into consideration successive appends.
  ZF_MODIFY_OP_APPEND_GROW = 3
};

//! Byte array - a move-only container of bytes that owns its memory.
//!
//! Used as an input and output buffer of all compression and decompression functions. All functions that can fail
//! return `ZFResult` and keep the content unchanged on failure.
class ZF_API ZFByteArray {
public:
  //! \name Members
  //! \{

  uint8_t* _data {};
  size_t _size {};
  size_t _capacity {};

  //! \}

  //! \name Construction & Destruction
  //! \{

  ZF_INLINE_NODEBUG ZFByteArray() noexcept = default;

  ZF_INLINE_NODEBUG ZFByteArray(ZFByteArray&& other) noexcept
    : _data(other._data),
      _size(other._size),
      _capacity(other._capacity) {
    other._data = nullptr;
    other._size = 0;
    other._capacity = 0;
  }

  ZFByteArray(const ZFByteArray& other) = delete;
  ZFByteArray& operator=(const ZFByteArray& other) = delete;

  ZF_INLINE_NODEBUG ~ZFByteArray() noexcept { reset(); }

  ZF_INLINE_NODEBUG ZFByteArray& operator=(ZFByteArray&& other) noexcept {
    ZFByteArray tmp(static_cast<ZFByteArray&&>(other));
    swap(tmp);
    return *this;
  }

  //! \}

  //! \name Common Functionality
  //! \{

  //! Releases the memory held by the array and makes it empty.
  void reset() noexcept;

  //! Swaps the content of this array with the `other` array.
  ZF_INLINE_NODEBUG void swap(ZFByteArray& other) noexcept {
    uint8_t* data = _data;
    size_t size = _size;
    size_t capacity = _capacity;

    _data = other._data;
    _size = other._size;
    _capacity = other._capacity;

    other._data = data;
    other._size = size;
    other._capacity = capacity;
  }

  //! Tests whether the content of the array is equal to `data` of `size` bytes.
  [[nodiscard]]
  bool equals(const void* data, size_t size) const noexcept;

  //! \}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  ZF_INLINE_NODEBUG bool is_empty() const noexcept { return _size == 0; }

  [[nodiscard]]
  ZF_INLINE_NODEBUG size_t size() const noexcept { return _size; }

  [[nodiscard]]
  ZF_INLINE_NODEBUG size_t capacity() const noexcept { return _capacity; }

  [[nodiscard]]
  ZF_INLINE_NODEBUG uint8_t* data() noexcept { return _data; }

  [[nodiscard]]
  ZF_INLINE_NODEBUG const uint8_t* data() const noexcept { return _data; }

  [[nodiscard]]
  ZF_INLINE_NODEBUG const uint8_t* begin() const noexcept { return _data; }

  [[nodiscard]]
  ZF_INLINE_NODEBUG const uint8_t* end() const noexcept { return _data + _size; }

  //! Returns the content as `ZFDataView`.
  [[nodiscard]]
  ZF_INLINE_NODEBUG ZFDataView view() const noexcept { return ZFDataView{_data, _size}; }

  [[nodiscard]]
  ZF_INLINE_NODEBUG uint8_t operator[](size_t index) const noexcept { return _data[index]; }

  //! \}

  //! \name Data Manipulation
  //! \{

  //! Clears the content of the array without releasing its memory.
  ZF_INLINE_NODEBUG void clear() noexcept { _size = 0; }

  //! Reserves the array capacity to hold at least `n` bytes.
  ZFResult reserve(size_t n) noexcept;

  //! Truncates the size of the array to maximum `n` bytes.
  ZF_INLINE_NODEBUG void truncate(size_t n) noexcept { _size = n < _size ? n : _size; }

  //! Resizes the array to `n` bytes, new bytes are initialized to `fill`.
  ZFResult resize(size_t n, uint8_t fill) noexcept;

  //! Modify operation assigns or appends `n` uninitialized bytes and stores the pointer to the first of them in
  //! `data_out`, see \ref ZFModifyOp. The caller is responsible for initializing the data returned in `data_out`.
  ZFResult modify_op(ZFModifyOp op, size_t n, uint8_t** data_out) noexcept;

  //! Replaces the content of the array by `size` bytes of `data`.
  ZFResult assign_data(const void* data, size_t size) noexcept;

  //! Appends `size` bytes of `data` to the array.
  ZFResult append_data(const void* data, size_t size) noexcept;

  //! \}
};

//! \}

#endif // ZFLATE_CORE_BYTEARRAY_H_INCLUDED
