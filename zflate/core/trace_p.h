// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_CORE_TRACE_P_H_INCLUDED
#define ZFLATE_CORE_TRACE_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup zflate_internal
//! \{

// ZFDummyTrace
// ============

//! Dummy trace - no tracing, no runtime overhead.
class ZFDummyTrace {
public:
  ZF_INLINE_NODEBUG bool enabled() const noexcept { return false; };
  ZF_INLINE_NODEBUG void indent() noexcept {}
  ZF_INLINE_NODEBUG void deindent() noexcept {}

  template<typename... Args>
  ZF_INLINE_NODEBUG void out(Args&&...) noexcept {}

  template<typename... Args>
  ZF_INLINE_NODEBUG void info(Args&&...) noexcept {}

  template<typename... Args>
  ZF_INLINE_NODEBUG bool warn(Args&&...) noexcept { return false; }

  template<typename... Args>
  ZF_INLINE_NODEBUG bool fail(Args&&...) noexcept { return false; }
};

// ZFDebugTrace
// ============

//! Debug trace - active / enabled trace that can be useful during debugging.
class ZFDebugTrace {
public:
  ZF_INLINE_NODEBUG ZFDebugTrace() noexcept
    : indentation(0) {}
  ZF_INLINE_NODEBUG ZFDebugTrace(const ZFDebugTrace& other) noexcept
    : indentation(other.indentation) {}

  ZF_INLINE_NODEBUG bool enabled() const noexcept { return true; };
  ZF_INLINE_NODEBUG void indent() noexcept { indentation++; }
  ZF_INLINE_NODEBUG void deindent() noexcept { indentation--; }

  template<typename... Args>
  ZF_INLINE void out(Args&&... args) noexcept { log(0, 0xFFFFFFFFu, std::forward<Args>(args)...); }

  template<typename... Args>
  ZF_INLINE void info(Args&&... args) noexcept { log(0, indentation, std::forward<Args>(args)...); }

  template<typename... Args>
  ZF_INLINE bool warn(Args&&... args) noexcept { log(1, indentation, std::forward<Args>(args)...); return false; }

  template<typename... Args>
  ZF_INLINE bool fail(Args&&... args) noexcept { log(2, indentation, std::forward<Args>(args)...); return false; }

  ZF_HIDDEN static void log(uint32_t severity, uint32_t indentation, const char* fmt, ...) noexcept;

  uint32_t indentation;
};

//! \}
//! \endcond

#endif // ZFLATE_CORE_TRACE_P_H_INCLUDED
