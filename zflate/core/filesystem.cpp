// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/core/bytearray_p.h>
#include <zflate/core/filesystem.h>
#include <zflate/core/runtime.h>

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

// ZFFile - API - POSIX Implementation
// ===================================

ZFResult ZFFile::open(const char* file_name, uint32_t open_flags) noexcept {
  int of = 0;

  switch (open_flags & ZF_FILE_OPEN_RW) {
    case ZF_FILE_OPEN_READ : of |= O_RDONLY; break;
    case ZF_FILE_OPEN_WRITE: of |= O_WRONLY; break;
    case ZF_FILE_OPEN_RW   : of |= O_RDWR  ; break;

    default:
      return zf_make_error(ZF_ERROR_INVALID_VALUE);
  }

  uint32_t kExtFlags = ZF_FILE_OPEN_CREATE | ZF_FILE_OPEN_TRUNCATE;
  if ((open_flags & kExtFlags) && !(open_flags & ZF_FILE_OPEN_WRITE))
    return zf_make_error(ZF_ERROR_INVALID_VALUE);

  if (open_flags & ZF_FILE_OPEN_CREATE  ) of |= O_CREAT;
  if (open_flags & ZF_FILE_OPEN_TRUNCATE) of |= O_TRUNC;

  mode_t om = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH;

  // The previous file stays open if `open()` fails.
  int fd = ::open(file_name, of, om);
  if (fd < 0)
    return zf_make_error(zf_result_from_posix_error(errno));

  close();
  handle = intptr_t(fd);
  return ZF_SUCCESS;
}

ZFResult ZFFile::close() noexcept {
  if (is_open()) {
    int result = ::close(int(handle));

    // The descriptor is invalid after `close()` even when it fails.
    handle = -1;

    if (ZF_UNLIKELY(result != 0))
      return zf_make_error(zf_result_from_posix_error(errno));
  }

  return ZF_SUCCESS;
}

ZFResult ZFFile::get_size(uint64_t* file_size_out) noexcept {
  *file_size_out = 0;

  if (!is_open())
    return zf_make_error(ZF_ERROR_INVALID_HANDLE);

  struct stat s;
  if (fstat(int(handle), &s) != 0)
    return zf_make_error(zf_result_from_posix_error(errno));

  *file_size_out = uint64_t(s.st_size);
  return ZF_SUCCESS;
}

ZFResult ZFFile::read(void* buffer, size_t n, size_t* bytes_read_out) noexcept {
  *bytes_read_out = 0;

  if (!is_open())
    return zf_make_error(ZF_ERROR_INVALID_HANDLE);

  size_t bytes_read = 0;
  while (bytes_read < n) {
    ssize_t result = ::read(int(handle), static_cast<uint8_t*>(buffer) + bytes_read, n - bytes_read);
    if (result < 0) {
      int e = errno;
      if (e == EINTR)
        continue;

      *bytes_read_out = bytes_read;

      // Returned when the file was not open for reading.
      if (e == EBADF)
        return zf_make_error(ZF_ERROR_NOT_PERMITTED);

      return zf_make_error(zf_result_from_posix_error(e));
    }

    if (result == 0)
      break;

    bytes_read += size_t(result);
  }

  *bytes_read_out = bytes_read;
  return ZF_SUCCESS;
}

ZFResult ZFFile::write(const void* buffer, size_t n, size_t* bytes_written_out) noexcept {
  *bytes_written_out = 0;

  if (!is_open())
    return zf_make_error(ZF_ERROR_INVALID_HANDLE);

  size_t bytes_written = 0;
  while (bytes_written < n) {
    ssize_t result = ::write(int(handle), static_cast<const uint8_t*>(buffer) + bytes_written, n - bytes_written);
    if (result < 0) {
      int e = errno;
      if (e == EINTR)
        continue;

      *bytes_written_out = bytes_written;

      // These are the two errors that would be returned if the file was open for read-only.
      if (e == EBADF || e == EINVAL)
        return zf_make_error(ZF_ERROR_NOT_PERMITTED);

      return zf_make_error(zf_result_from_posix_error(e));
    }

    if (result == 0)
      break;

    bytes_written += size_t(result);
  }

  *bytes_written_out = bytes_written;
  return bytes_written == n ? ZF_SUCCESS : zf_make_error(ZF_ERROR_IO);
}

// ZFFileSystem - API
// ==================

ZFResult zf_file_system_read_file(const char* file_name, ZFByteArray* dst) noexcept {
  if (ZF_UNLIKELY(!file_name || !dst))
    return zf_make_error(ZF_ERROR_INVALID_VALUE);

  dst->clear();

  ZFFile file;
  ZF_PROPAGATE(file.open(file_name, ZF_FILE_OPEN_READ));

  uint64_t size64;
  ZF_PROPAGATE(file.get_size(&size64));

  if (size64 == 0)
    return ZF_SUCCESS;

  if (ZF_UNLIKELY(size64 >= uint64_t(SIZE_MAX)))
    return zf_make_error(ZF_ERROR_FILE_TOO_LARGE);

  size_t size = size_t(size64);

  uint8_t* data;
  ZF_PROPAGATE(dst->modify_op(ZF_MODIFY_OP_ASSIGN_FIT, size, &data));

  size_t bytes_read;
  ZFResult result = file.read(data, size, &bytes_read);

  // The file could have been truncated between `get_size()` and `read()`.
  dst->truncate(bytes_read);
  return result;
}

ZFResult zf_file_system_write_file(const char* file_name, const void* data, size_t size, size_t* bytes_written_out) noexcept {
  *bytes_written_out = 0;

  if (ZF_UNLIKELY(!file_name || (!data && size)))
    return zf_make_error(ZF_ERROR_INVALID_VALUE);

  ZFFile file;
  ZF_PROPAGATE(file.open(file_name, ZF_FILE_OPEN_WRITE | ZF_FILE_OPEN_CREATE | ZF_FILE_OPEN_TRUNCATE));

  if (size)
    ZF_PROPAGATE(file.write(data, size, bytes_written_out));

  return file.close();
}
