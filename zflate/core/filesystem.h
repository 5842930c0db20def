// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_CORE_FILESYSTEM_H_INCLUDED
#define ZFLATE_CORE_FILESYSTEM_H_INCLUDED

#include <zflate/core/api.h>
#include <zflate/core/bytearray.h>

//! \addtogroup zf_filesystem
//! \{

//! File open flags, see \ref ZFFile::open().
enum ZFFileOpenFlags : uint32_t {
  //! No flags.
  ZF_FILE_OPEN_NO_FLAGS = 0u,

  //! Opens the file for reading.
  ZF_FILE_OPEN_READ = 0x00000001u,
  //! Opens the file for writing.
  ZF_FILE_OPEN_WRITE = 0x00000002u,
  //! Opens the file for reading & writing.
  ZF_FILE_OPEN_RW = 0x00000003u,

  //! Creates the file if it doesn't exist (requires \ref ZF_FILE_OPEN_WRITE).
  ZF_FILE_OPEN_CREATE = 0x00000004u,
  //! Truncates the file to zero size when opened (requires \ref ZF_FILE_OPEN_WRITE).
  ZF_FILE_OPEN_TRUNCATE = 0x00000008u
};

//! A thin abstraction over a native OS file handle, the file is closed when the object is destroyed.
class ZF_API ZFFile {
public:
  //! \name Members
  //! \{

  //! A native file descriptor, -1 if the file is not open.
  intptr_t handle = -1;

  //! \}

  //! \name Construction & Destruction
  //! \{

  ZF_INLINE_NODEBUG ZFFile() noexcept = default;

  ZF_INLINE_NODEBUG ZFFile(ZFFile&& other) noexcept
    : handle(other.handle) { other.handle = -1; }

  ZFFile(const ZFFile& other) = delete;
  ZFFile& operator=(const ZFFile& other) = delete;

  ZF_INLINE_NODEBUG ~ZFFile() noexcept { close(); }

  //! \}

  //! \name Common Functionality
  //! \{

  [[nodiscard]]
  ZF_INLINE_NODEBUG bool is_open() const noexcept { return handle != -1; }

  //! Opens a file `file_name` with the given `open_flags`, closes a previously opened file on success.
  ZFResult open(const char* file_name, uint32_t open_flags) noexcept;

  //! Closes the file, it's fine to close a file that is not open.
  ZFResult close() noexcept;

  //! \}

  //! \name File Operations
  //! \{

  //! Queries the size of the file.
  ZFResult get_size(uint64_t* file_size_out) noexcept;

  //! Reads up to `n` bytes into `buffer`, stops early only at the end of the file.
  ZFResult read(void* buffer, size_t n, size_t* bytes_read_out) noexcept;

  //! Writes `n` bytes of `buffer`.
  ZFResult write(const void* buffer, size_t n, size_t* bytes_written_out) noexcept;

  //! \}
};

//! Reads the whole content of the file `file_name` into `dst`, replacing its content.
ZF_API ZFResult zf_file_system_read_file(const char* file_name, ZFByteArray* dst) noexcept;

//! Creates or truncates the file `file_name` and writes `size` bytes of `data` to it.
ZF_API ZFResult zf_file_system_write_file(const char* file_name, const void* data, size_t size, size_t* bytes_written_out) noexcept;

//! \}

#endif // ZFLATE_CORE_FILESYSTEM_H_INCLUDED
