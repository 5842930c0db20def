// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each zflate test file.

#ifndef ZFLATE_CORE_API_BUILD_TEST_P_H_INCLUDED
#define ZFLATE_CORE_API_BUILD_TEST_P_H_INCLUDED

#include <zflate/core/api-build_p.h>

// zf::Build - Tests
// =================

//! \cond NEVER
// Make sure '#ifdef'ed unit tests are not disabled by IDE.
#if !defined(ZF_TEST) && defined(__INTELLISENSE__)
  #define ZF_TEST
#endif
//! \endcond

// Include a unit testing package if this is a `zflate_test` build.
#if defined(ZF_TEST)

#include <catch2/catch.hpp>

//! \cond INTERNAL
#define EXPECT_SUCCESS(...) REQUIRE((__VA_ARGS__) == ZF_SUCCESS)
//! \endcond

#endif // ZF_TEST

#endif // ZFLATE_CORE_API_BUILD_TEST_P_H_INCLUDED
