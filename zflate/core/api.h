// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_CORE_API_H_INCLUDED
#define ZFLATE_CORE_API_H_INCLUDED

#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

//! \addtogroup zf_globals
//! \{

// Version
// =======

//! Makes a version number representing a `MAJOR.MINOR.PATCH` combination.
#define ZF_MAKE_VERSION(MAJOR, MINOR, PATCH) (((MAJOR) << 16) | ((MINOR) << 8) | (PATCH))

//! zflate library version.
#define ZF_VERSION ZF_MAKE_VERSION(0, 9, 0)

// Build Type
// ==========

//! \cond INTERNAL
#if !defined(ZF_BUILD_DEBUG) && !defined(ZF_BUILD_RELEASE)
  #if !defined(NDEBUG)
    #define ZF_BUILD_DEBUG
  #else
    #define ZF_BUILD_RELEASE
  #endif
#endif
//! \endcond

// Public Macros
// =============

//! \def ZF_API
//!
//! A base API decorator that marks functions and variables exported by zflate.
#if !defined(ZF_STATIC)
  #if defined(_WIN32) && (defined(_MSC_VER) || defined(__MINGW32__))
    #if defined(ZF_BUILD_EXPORT)
      #define ZF_API __declspec(dllexport)
    #else
      #define ZF_API __declspec(dllimport)
    #endif
  #elif defined(_WIN32) && defined(__GNUC__)
    #if defined(ZF_BUILD_EXPORT)
      #define ZF_API __attribute__((__dllexport__))
    #else
      #define ZF_API __attribute__((__dllimport__))
    #endif
  #elif defined(__GNUC__)
    #define ZF_API __attribute__((__visibility__("default")))
  #endif
#endif

#if !defined(ZF_API)
  #define ZF_API
#endif

//! \def ZF_INLINE
//!
//! Marks functions that should always be inlined.
#if defined(__GNUC__) && !defined(ZF_BUILD_DEBUG)
  #define ZF_INLINE inline __attribute__((__always_inline__))
#elif defined(_MSC_VER) && !defined(ZF_BUILD_DEBUG)
  #define ZF_INLINE __forceinline
#else
  #define ZF_INLINE inline
#endif

//! \def ZF_INLINE_NODEBUG
//!
//! The same as `ZF_INLINE` combined with `__attribute__((artificial))`.
#if defined(__clang__)
  #define ZF_INLINE_NODEBUG inline __attribute__((__always_inline__, __nodebug__))
#elif defined(__GNUC__)
  #define ZF_INLINE_NODEBUG inline __attribute__((__always_inline__, __artificial__))
#else
  #define ZF_INLINE_NODEBUG ZF_INLINE
#endif

//! \def ZF_INLINE_CONSTEXPR
//!
//! The same as `ZF_INLINE_NODEBUG`, but having also `constexpr` attribute.
#define ZF_INLINE_CONSTEXPR constexpr ZF_INLINE_NODEBUG

//! \def ZF_NORETURN
//!
//! Function attribute used by functions that never return (that terminate the process).
#if defined(__GNUC__)
  #define ZF_NORETURN __attribute__((__noreturn__))
#elif defined(_MSC_VER)
  #define ZF_NORETURN __declspec(noreturn)
#else
  #define ZF_NORETURN
#endif

//! \def ZF_LIKELY(EXP)
//!
//! A condition is likely.
//!
//! \def ZF_UNLIKELY(EXP)
//!
//! A condition is unlikely.
#if defined(__GNUC__)
  #define ZF_LIKELY(...) __builtin_expect(!!(__VA_ARGS__), 1)
  #define ZF_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), 0)
#else
  #define ZF_LIKELY(...) (__VA_ARGS__)
  #define ZF_UNLIKELY(...) (__VA_ARGS__)
#endif

//! \def ZF_ASSERT(EXP)
//!
//! Run-time assertion executed in debug builds.
#ifdef ZF_BUILD_DEBUG
  #define ZF_ASSERT(EXP)                                                      \
    do {                                                                      \
      if (ZF_UNLIKELY(!(EXP))) {                                              \
        zf_runtime_assertion_failure(__FILE__, __LINE__, #EXP);               \
      }                                                                       \
    } while (0)
#else
  #define ZF_ASSERT(EXP) ((void)0)
#endif

//! \def ZF_PROPAGATE(...)
//!
//! Propagates a possible `ZFResult` error code returned by a function to the caller.
#define ZF_PROPAGATE(...)                                                     \
  do {                                                                        \
    ZFResult result_to_propagate = (__VA_ARGS__);                             \
    if (ZF_UNLIKELY(result_to_propagate != ZF_SUCCESS)) {                     \
      return result_to_propagate;                                             \
    }                                                                         \
  } while (0)

// Result Code
// ===========

//! Result code used by most zflate functions (32-bit unsigned integer).
//!
//! The `ZFResultCode` enumeration contains zflate result codes that contain zflate specific set of errors and
//! errors mapped from the operating system (file-system access).
typedef uint32_t ZFResult;

//! Result codes.
enum ZFResultCode : uint32_t {
  //! Successful result code.
  ZF_SUCCESS = 0,

  ZF_ERROR_START_INDEX = 0x00010000u,

  ZF_ERROR_OUT_OF_MEMORY = 0x00010000u,  //!< Out of memory                 [ENOMEM].
  ZF_ERROR_INVALID_VALUE,                //!< Invalid value/argument        [EINVAL].
  ZF_ERROR_INVALID_STATE,                //!< Invalid state                 [EFAULT].
  ZF_ERROR_INVALID_HANDLE,               //!< Invalid handle or file.       [EBADF].
  ZF_ERROR_VALUE_TOO_LARGE,              //!< Value too large               [EOVERFLOW].
  ZF_ERROR_NOT_INITIALIZED,              //!< Object not initialized.
  ZF_ERROR_NOT_IMPLEMENTED,              //!< Not implemented               [ENOSYS].
  ZF_ERROR_NOT_PERMITTED,                //!< Operation not permitted       [EPERM].

  ZF_ERROR_IO,                           //!< IO error                      [EIO].
  ZF_ERROR_BUSY,                         //!< Device or resource busy       [EBUSY].
  ZF_ERROR_INTERRUPTED,                  //!< Operation interrupted         [EINTR].
  ZF_ERROR_TRY_AGAIN,                    //!< Try again                     [EAGAIN].
  ZF_ERROR_BROKEN_PIPE,                  //!< Broken pipe                   [EPIPE].
  ZF_ERROR_INVALID_SEEK,                 //!< File is not seekable          [ESPIPE].
  ZF_ERROR_SYMLINK_LOOP,                 //!< Too many levels of symlinks   [ELOOP].
  ZF_ERROR_FILE_TOO_LARGE,               //!< File is too large             [EFBIG].
  ZF_ERROR_ALREADY_EXISTS,               //!< File/directory already exists [EEXIST].
  ZF_ERROR_ACCESS_DENIED,                //!< Access denied                 [EACCES].
  ZF_ERROR_MEDIA_CHANGED,                //!< Media changed                 [Windows::ERROR_MEDIA_CHANGED].
  ZF_ERROR_READ_ONLY_FS,                 //!< The file/FS is read-only      [EROFS].
  ZF_ERROR_NO_DEVICE,                    //!< Device doesn't exist          [ENXIO].
  ZF_ERROR_NO_ENTRY,                     //!< Not found, no entry (fs)      [ENOENT].
  ZF_ERROR_NO_MEDIA,                     //!< No media in drive/device      [ENOMEDIUM].
  ZF_ERROR_NO_MORE_DATA,                 //!< No more data / end of file    [ENODATA].
  ZF_ERROR_NO_MORE_FILES,                //!< No more files                 [ENMFILE].
  ZF_ERROR_NO_SPACE_LEFT,                //!< No space left on device       [ENOSPC].
  ZF_ERROR_NOT_EMPTY,                    //!< Directory is not empty        [ENOTEMPTY].
  ZF_ERROR_NOT_FILE,                     //!< Not a file                    [EISDIR].
  ZF_ERROR_NOT_DIRECTORY,                //!< Not a directory               [ENOTDIR].
  ZF_ERROR_NOT_SAME_DEVICE,              //!< Not same device               [EXDEV].
  ZF_ERROR_NOT_BLOCK_DEVICE,             //!< Not a block device            [ENOTBLK].

  ZF_ERROR_INVALID_FILE_NAME,            //!< File/path name is invalid     [n/a].
  ZF_ERROR_FILE_NAME_TOO_LONG,           //!< File/path name is too long    [ENAMETOOLONG].

  ZF_ERROR_TOO_MANY_OPEN_FILES,          //!< Too many open files           [EMFILE].
  ZF_ERROR_TOO_MANY_OPEN_FILES_BY_OS,    //!< Too many open files by OS     [ENFILE].
  ZF_ERROR_TOO_MANY_LINKS,               //!< Too many symbolic links on FS [EMLINK].

  ZF_ERROR_FILE_EMPTY,                   //!< File is empty (not specific to any OS error).

  ZF_ERROR_DATA_TOO_LARGE,               //!< Decompressed data doesn't fit into the output buffer.
  ZF_ERROR_MALFORMED_INPUT,              //!< Compressed stream is malformed (invalid code, truncated, ...).
  ZF_ERROR_UNSUPPORTED_BLOCK_TYPE,       //!< Compressed stream uses the reserved block type.
  ZF_ERROR_CHECKSUM_MISMATCH,            //!< Adler-32 trailer doesn't match decompressed data.

  //! Maximum value of `ZFResultCode`.
  ZF_RESULT_CODE_MAX_VALUE = ZF_ERROR_CHECKSUM_MISMATCH
};

// Data View
// =========

//! Data view provides a view of an external byte buffer (pointer and size).
struct ZFDataView {
  //! \name Members
  //! \{

  const uint8_t* data;
  size_t size;

  //! \}

  //! \name Common Functionality
  //! \{

  ZF_INLINE_NODEBUG void reset() noexcept {
    data = nullptr;
    size = 0;
  }

  ZF_INLINE_NODEBUG void reset(const uint8_t* data_in, size_t size_in) noexcept {
    data = data_in;
    size = size_in;
  }

  //! \}
};

// Public Functions
// ================

//! Returns a human readable name of the given result `code`.
ZF_API const char* zf_result_to_string(ZFResult code) noexcept;

//! Called by `ZF_ASSERT()` when the asserted expression is false; prints the message and aborts the process.
ZF_API ZF_NORETURN void zf_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept;

//! Returns `result` and provides a single place where all errors are created so a break-point can be set there.
static ZF_INLINE_NODEBUG ZFResult zf_make_error(ZFResult result) noexcept { return result; }

//! \}

#endif // ZFLATE_CORE_API_H_INCLUDED
