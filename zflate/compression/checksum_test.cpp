// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_test_p.h>
#if defined(ZF_TEST)

#include <zflate/core/bytearray.h>
#include <zflate/core/deflate.h>
#include <zflate/compression/checksum_p.h>

namespace zf::Compression::Checksum::Tests {

// zf::Compression - CheckSum - Tests
// ==================================

static constexpr uint32_t kCheckSumInputSize = 1024u * 64u;

static void fill_array_for_checksum(ZFByteArray& arr, size_t n) noexcept {
  for (uint32_t i = 0; i < n; i++) {
    uint8_t b = uint8_t((i * 17u) & 0xFFu);
    EXPECT_SUCCESS(arr.append_data(&b, 1));
  }
}

static void fill_array_with_same_value(ZFByteArray& arr, uint8_t b, size_t n) noexcept {
  EXPECT_SUCCESS(arr.resize(n, b));
}

// Reference implementation, which reduces after each byte.
static uint32_t adler32_update_ref(uint32_t checksum, const uint8_t* data, size_t size) noexcept {
  uint32_t s1 = checksum & 0xFFFFu;
  uint32_t s2 = checksum >> 16;

  for (size_t i = 0; i < size; i++) {
    s1 = (s1 + data[i]) % kAdler32Divisor;
    s2 = (s2 + s1) % kAdler32Divisor;
  }

  return (s2 << 16) | s1;
}

TEST_CASE("compression_checksum_adler32", "[compression][checksum]") {
  const uint8_t* lowercase_letters = reinterpret_cast<const uint8_t*>("abcdefghijklmnopqrstuvwxyz");

  CHECK(adler32(nullptr          ,  0) == 0x00000001u);
  CHECK(adler32(lowercase_letters,  1) == 0x00620062u);
  CHECK(adler32(lowercase_letters,  2) == 0x012600C4u);
  CHECK(adler32(lowercase_letters,  3) == 0x024D0127u);
  CHECK(adler32(lowercase_letters,  8) == 0x0E000325u);
  CHECK(adler32(lowercase_letters, 16) == 0x36400689u);
  CHECK(adler32(lowercase_letters, 26) == 0x90860B20u);

  ZFByteArray input;
  fill_array_for_checksum(input, kCheckSumInputSize);

  for (uint32_t i = 1; i < kCheckSumInputSize; i += (i >> 8) + 1u) {
    uint32_t checksum = adler32(input.data(), i);
    uint32_t expected = adler32_update_ref(kAdler32Initial, input.data(), i);

    INFO("ADLER32 of " << i << " bytes");
    REQUIRE(checksum == expected);
  }

  // All 0xFF bytes are the worst case of the deferred modulo reduction.
  input.clear();
  fill_array_with_same_value(input, 0xFFu, kCheckSumInputSize);

  for (uint32_t i = 1; i < kCheckSumInputSize; i += (i >> 8) + 1u) {
    uint32_t checksum = adler32(input.data(), i);
    uint32_t expected = adler32_update_ref(kAdler32Initial, input.data(), i);

    INFO("ADLER32 of " << i << " 0xFF bytes");
    REQUIRE(checksum == expected);
  }
}

TEST_CASE("compression_checksum_adler32_update", "[compression][checksum]") {
  ZFByteArray input;
  fill_array_for_checksum(input, 20000);

  uint32_t whole = adler32(input.data(), input.size());

  for (size_t split : {size_t(0), size_t(1), size_t(5552), size_t(12345), input.size()}) {
    uint32_t checksum = adler32_update(kAdler32Initial, input.data(), split);
    checksum = adler32_update(checksum, input.data() + split, input.size() - split);

    INFO("Split at " << split);
    REQUIRE(checksum == whole);
  }
}

TEST_CASE("compression_checksum_crc32", "[compression][checksum]") {
  const uint8_t* digits = reinterpret_cast<const uint8_t*>("123456789");
  const uint8_t* fox = reinterpret_cast<const uint8_t*>("The quick brown fox jumps over the lazy dog");

  CHECK(crc32(nullptr, 0) == 0x00000000u);
  CHECK(crc32(digits, 9) == 0xCBF43926u);
  CHECK(crc32(fox, 43) == 0x414FA339u);

  // Incremental update of a non-finalized checksum must match the single-shot result.
  uint32_t checksum = crc32_update(kCrc32Initial, digits, 4);
  checksum = crc32_update(checksum, digits + 4, 5);
  CHECK(crc32_finalize(checksum) == 0xCBF43926u);
}

TEST_CASE("compression_checksum_public_api", "[compression][checksum]") {
  CHECK(zf_adler32("a", 1) == 0x00620062u);
  CHECK(zf_adler32(nullptr, 0) == 1u);
  CHECK(zf_crc32("123456789", 9) == 0xCBF43926u);
}

} // {zf::Compression::Checksum::Tests}

#endif // ZF_TEST
