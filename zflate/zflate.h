// This file is part of zflate project
//
// SPDX-License-Identifier: Zlib
//
// Copyright (c) 2024 The zflate Authors
//
// This software is provided 'as-is', without any express or implied
// warranty. In no event will the authors be held liable for any damages
// arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose,
// including commercial applications, and to alter it and redistribute it
// freely, subject to the following restrictions:
//
// 1. The origin of this software must not be misrepresented; you must not
//    claim that you wrote the original software. If you use this software
//    in a product, an acknowledgment in the product documentation would be
//    appreciated but is not required.
// 2. Altered source versions must be plainly marked as such, and must not be
//    misrepresented as being the original software.
// 3. This notice may not be removed or altered from any source distribution.

// ----------------------------------------------------------------------------
// This is a public header file designed to be used by zflate users. It
// includes all the files required to use zflate library and it's the only
// header that is guaranteed to always be provided.
//
// Headers that end with "_p" suffix are private and should never be included,
// they are not part of the public API.
// ----------------------------------------------------------------------------

#ifndef ZFLATE_H_INCLUDED
#define ZFLATE_H_INCLUDED

#include <zflate/core/api.h>
#include <zflate/core/bytearray.h>
#include <zflate/core/deflate.h>
#include <zflate/core/filesystem.h>
#include <zflate/core/runtime.h>

#endif // ZFLATE_H_INCLUDED
