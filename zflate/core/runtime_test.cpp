// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_test_p.h>
#if defined(ZF_TEST)

#include <zflate/core/deflate.h>
#include <zflate/core/runtime.h>

#include <errno.h>

// zf::Runtime - Tests
// ===================

namespace zf::Tests {

TEST_CASE("core_runtime_build_info", "[core][runtime]") {
  ZFRuntimeBuildInfo info;
  EXPECT_SUCCESS(zf_runtime_query_build_info(&info));

  REQUIRE(ZF_MAKE_VERSION(info.major_version, info.minor_version, info.patch_version) == ZF_VERSION);
  REQUIRE(info.max_compression_level == ZF_DEFLATE_MAX_LEVEL);
  REQUIRE(info.compiler_info[0] != '\0');
}

TEST_CASE("core_runtime_result_to_string", "[core][runtime]") {
  REQUIRE(strcmp(zf_result_to_string(ZF_ERROR_MALFORMED_INPUT), "MalformedInput") == 0);
  REQUIRE(strcmp(zf_result_to_string(ZF_ERROR_CHECKSUM_MISMATCH), "ChecksumMismatch") == 0);
  REQUIRE(strcmp(zf_result_to_string(ZF_ERROR_UNSUPPORTED_BLOCK_TYPE), "UnsupportedBlockType") == 0);

  REQUIRE(zf_result_from_posix_error(ENOENT) == ZF_ERROR_NO_ENTRY);
  REQUIRE(zf_result_from_posix_error(EACCES) == ZF_ERROR_ACCESS_DENIED);
}

} // {zf::Tests}

#endif // ZF_TEST
