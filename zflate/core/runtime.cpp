// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/core/runtime.h>

#include <errno.h>
#include <stdio.h>

// ZFRuntime - Build Information
// =============================

static const ZFRuntimeBuildInfo zf_runtime_build_info = {
  // zflate major version.
  (ZF_VERSION >> 16),
  // zflate minor version.
  (ZF_VERSION >> 8) & 0xFF,
  // zflate patch version.
  (ZF_VERSION >> 0) & 0xFF,

  // Build Type.
#ifdef ZF_BUILD_DEBUG
  ZF_RUNTIME_BUILD_TYPE_DEBUG,
#else
  ZF_RUNTIME_BUILD_TYPE_RELEASE,
#endif

  // Window size.
  32768u,

  // Maximum compression level.
  9u,

  // Compiler Info.
#if defined(__clang_minor__)
  "Clang " ZF_STRINGIFY(__clang_major__) "." ZF_STRINGIFY(__clang_minor__)
#elif defined(__GNUC_MINOR__)
  "GCC "  ZF_STRINGIFY(__GNUC__) "." ZF_STRINGIFY(__GNUC_MINOR__)
#elif defined(_MSC_VER)
  "MSC"
#else
  "Unknown"
#endif
};

ZFResult zf_runtime_query_build_info(ZFRuntimeBuildInfo* info_out) noexcept {
  if (!info_out)
    return zf_make_error(ZF_ERROR_INVALID_VALUE);

  memcpy(info_out, &zf_runtime_build_info, sizeof(ZFRuntimeBuildInfo));
  return ZF_SUCCESS;
}

// ZFRuntime - Message
// ===================

ZFResult zf_runtime_message_out(const char* msg) noexcept {
  fputs(msg, stderr);
  return ZF_SUCCESS;
}

ZFResult zf_runtime_message_fmt(const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  ZFResult result = zf_runtime_message_vfmt(fmt, ap);
  va_end(ap);

  return result;
}

ZFResult zf_runtime_message_vfmt(const char* fmt, va_list ap) noexcept {
  char buf[1024];
  vsnprintf(buf, ZF_ARRAY_SIZE(buf), fmt, ap);
  return zf_runtime_message_out(buf);
}

// ZFRuntime - Failure
// ===================

void zf_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept {
  zf_runtime_message_fmt("[zflate] ASSERTION FAILURE: '%s' at '%s' [line %d]\n", msg, file, line);
  abort();
}

// ZFRuntime - Result To String
// ============================

const char* zf_result_to_string(ZFResult code) noexcept {
  #define MAP(ZF_RESULT, NAME) case ZF_RESULT: return NAME

  switch (code) {
    MAP(ZF_SUCCESS, "Success");
    MAP(ZF_ERROR_OUT_OF_MEMORY, "OutOfMemory");
    MAP(ZF_ERROR_INVALID_VALUE, "InvalidValue");
    MAP(ZF_ERROR_INVALID_STATE, "InvalidState");
    MAP(ZF_ERROR_INVALID_HANDLE, "InvalidHandle");
    MAP(ZF_ERROR_VALUE_TOO_LARGE, "ValueTooLarge");
    MAP(ZF_ERROR_NOT_INITIALIZED, "NotInitialized");
    MAP(ZF_ERROR_NOT_IMPLEMENTED, "NotImplemented");
    MAP(ZF_ERROR_NOT_PERMITTED, "NotPermitted");
    MAP(ZF_ERROR_IO, "IOError");
    MAP(ZF_ERROR_BUSY, "Busy");
    MAP(ZF_ERROR_INTERRUPTED, "Interrupted");
    MAP(ZF_ERROR_TRY_AGAIN, "TryAgain");
    MAP(ZF_ERROR_BROKEN_PIPE, "BrokenPipe");
    MAP(ZF_ERROR_INVALID_SEEK, "InvalidSeek");
    MAP(ZF_ERROR_SYMLINK_LOOP, "SymlinkLoop");
    MAP(ZF_ERROR_FILE_TOO_LARGE, "FileTooLarge");
    MAP(ZF_ERROR_ALREADY_EXISTS, "AlreadyExists");
    MAP(ZF_ERROR_ACCESS_DENIED, "AccessDenied");
    MAP(ZF_ERROR_MEDIA_CHANGED, "MediaChanged");
    MAP(ZF_ERROR_READ_ONLY_FS, "ReadOnlyFS");
    MAP(ZF_ERROR_NO_DEVICE, "NoDevice");
    MAP(ZF_ERROR_NO_ENTRY, "NoEntry");
    MAP(ZF_ERROR_NO_MEDIA, "NoMedia");
    MAP(ZF_ERROR_NO_MORE_DATA, "NoMoreData");
    MAP(ZF_ERROR_NO_MORE_FILES, "NoMoreFiles");
    MAP(ZF_ERROR_NO_SPACE_LEFT, "NoSpaceLeft");
    MAP(ZF_ERROR_NOT_EMPTY, "NotEmpty");
    MAP(ZF_ERROR_NOT_FILE, "NotFile");
    MAP(ZF_ERROR_NOT_DIRECTORY, "NotDirectory");
    MAP(ZF_ERROR_NOT_SAME_DEVICE, "NotSameDevice");
    MAP(ZF_ERROR_NOT_BLOCK_DEVICE, "NotBlockDevice");
    MAP(ZF_ERROR_INVALID_FILE_NAME, "InvalidFileName");
    MAP(ZF_ERROR_FILE_NAME_TOO_LONG, "FileNameTooLong");
    MAP(ZF_ERROR_TOO_MANY_OPEN_FILES, "TooManyOpenFiles");
    MAP(ZF_ERROR_TOO_MANY_OPEN_FILES_BY_OS, "TooManyOpenFilesByOS");
    MAP(ZF_ERROR_TOO_MANY_LINKS, "TooManyLinks");
    MAP(ZF_ERROR_FILE_EMPTY, "FileEmpty");
    MAP(ZF_ERROR_DATA_TOO_LARGE, "DataTooLarge");
    MAP(ZF_ERROR_MALFORMED_INPUT, "MalformedInput");
    MAP(ZF_ERROR_UNSUPPORTED_BLOCK_TYPE, "UnsupportedBlockType");
    MAP(ZF_ERROR_CHECKSUM_MISMATCH, "ChecksumMismatch");
  }

  #undef MAP

  return "Unknown";
}

// ZFRuntime - ResultFromPosixError
// ================================

ZFResult zf_result_from_posix_error(int e) noexcept {
  #define MAP(C_ERROR, ZF_ERROR) case C_ERROR: return ZF_ERROR

  switch (e) {
  #ifdef EACCES
    MAP(EACCES, ZF_ERROR_ACCESS_DENIED);
  #endif
  #ifdef EAGAIN
    MAP(EAGAIN, ZF_ERROR_TRY_AGAIN);
  #endif
  #ifdef EBADF
    MAP(EBADF, ZF_ERROR_INVALID_HANDLE);
  #endif
  #ifdef EBUSY
    MAP(EBUSY, ZF_ERROR_BUSY);
  #endif
  #ifdef EDQUOT
    MAP(EDQUOT, ZF_ERROR_NO_SPACE_LEFT);
  #endif
  #ifdef EEXIST
    MAP(EEXIST, ZF_ERROR_ALREADY_EXISTS);
  #endif
  #ifdef EFAULT
    MAP(EFAULT, ZF_ERROR_INVALID_STATE);
  #endif
  #ifdef EFBIG
    MAP(EFBIG, ZF_ERROR_FILE_TOO_LARGE);
  #endif
  #ifdef EINTR
    MAP(EINTR, ZF_ERROR_INTERRUPTED);
  #endif
  #ifdef EINVAL
    MAP(EINVAL, ZF_ERROR_INVALID_VALUE);
  #endif
  #ifdef EIO
    MAP(EIO, ZF_ERROR_IO);
  #endif
  #ifdef EISDIR
    MAP(EISDIR, ZF_ERROR_NOT_FILE);
  #endif
  #ifdef ELOOP
    MAP(ELOOP, ZF_ERROR_SYMLINK_LOOP);
  #endif
  #ifdef EMFILE
    MAP(EMFILE, ZF_ERROR_TOO_MANY_OPEN_FILES);
  #endif
  #ifdef EMLINK
    MAP(EMLINK, ZF_ERROR_TOO_MANY_LINKS);
  #endif
  #ifdef ENAMETOOLONG
    MAP(ENAMETOOLONG, ZF_ERROR_FILE_NAME_TOO_LONG);
  #endif
  #ifdef ENFILE
    MAP(ENFILE, ZF_ERROR_TOO_MANY_OPEN_FILES_BY_OS);
  #endif
  #ifdef ENODATA
    MAP(ENODATA, ZF_ERROR_NO_MORE_DATA);
  #endif
  #ifdef ENODEV
    MAP(ENODEV, ZF_ERROR_NO_DEVICE);
  #endif
  #ifdef ENOENT
    MAP(ENOENT, ZF_ERROR_NO_ENTRY);
  #endif
  #ifdef ENOMEDIUM
    MAP(ENOMEDIUM, ZF_ERROR_NO_MEDIA);
  #endif
  #ifdef ENOMEM
    MAP(ENOMEM, ZF_ERROR_OUT_OF_MEMORY);
  #endif
  #ifdef ENOSPC
    MAP(ENOSPC, ZF_ERROR_NO_SPACE_LEFT);
  #endif
  #ifdef ENOSYS
    MAP(ENOSYS, ZF_ERROR_NOT_IMPLEMENTED);
  #endif
  #ifdef ENOTBLK
    MAP(ENOTBLK, ZF_ERROR_NOT_BLOCK_DEVICE);
  #endif
  #ifdef ENOTDIR
    MAP(ENOTDIR, ZF_ERROR_NOT_DIRECTORY);
  #endif
  #ifdef ENOTEMPTY
    MAP(ENOTEMPTY, ZF_ERROR_NOT_EMPTY);
  #endif
  #ifdef ENXIO
    MAP(ENXIO, ZF_ERROR_NO_DEVICE);
  #endif
  #ifdef EOVERFLOW
    MAP(EOVERFLOW, ZF_ERROR_VALUE_TOO_LARGE);
  #endif
  #ifdef EPERM
    MAP(EPERM, ZF_ERROR_NOT_PERMITTED);
  #endif
  #ifdef EPIPE
    MAP(EPIPE, ZF_ERROR_BROKEN_PIPE);
  #endif
  #ifdef EROFS
    MAP(EROFS, ZF_ERROR_READ_ONLY_FS);
  #endif
  #ifdef ESPIPE
    MAP(ESPIPE, ZF_ERROR_INVALID_SEEK);
  #endif
  #ifdef EXDEV
    MAP(EXDEV, ZF_ERROR_NOT_SAME_DEVICE);
  #endif
  }

  #undef MAP

  return ZF_ERROR_IO;
}
