// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/core/runtime.h>
#include <zflate/core/trace_p.h>

// ZFDebugTrace - Log
// ==================

void ZFDebugTrace::log(uint32_t severity, uint32_t indentation, const char* fmt, ...) noexcept {
  const char* prefix = "";
  if (indentation < 0xFFFFFFFFu) {
    switch (severity) {
      case 1: prefix = "[WARN] "; break;
      case 2: prefix = "[FAIL] "; break;
    }
    zf_runtime_message_fmt("%*s%s", int(indentation * 2), "", prefix);
  }

  va_list ap;
  va_start(ap, fmt);
  zf_runtime_message_vfmt(fmt, ap);
  va_end(ap);
}
