// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_p.h>
#include <zflate/compression/deflatedefs_p.h>

namespace zf::Compression::Deflate {

// zf::Compression::Deflate - Tables
// =================================

const uint8_t kPrecodeLensPermutation[kNumPrecodeSymbols] = {
  16, 17, 18, 0, 8, 7, 9, 6, 10, 5, 11, 4, 12, 3, 13, 2, 14, 1, 15
};

// zf::Compression::Deflate - Compression Levels
// =============================================

const LevelParams kLevelParams[kMaxCompressionLevel + 1] = {
  //  Good | Lazy | Nice | Chain
  {      0 ,    0 ,    0 ,     0 }, // Level 0 (stored)
  {      4 ,    4 ,    8 ,     4 }, // Level 1
  {      4 ,    5 ,   16 ,     8 }, // Level 2
  {      4 ,    6 ,   16 ,    16 }, // Level 3
  {      4 ,   10 ,   16 ,    32 }, // Level 4
  {      8 ,   16 ,   32 ,    32 }, // Level 5
  {      8 ,   16 ,  128 ,   128 }, // Level 6
  {      8 ,   32 ,  128 ,   256 }, // Level 7
  {     32 ,  128 ,  258 ,  1024 }, // Level 8
  {     32 ,  258 ,  258 ,  4096 }  // Level 9
};

} // {zf::Compression::Deflate}
