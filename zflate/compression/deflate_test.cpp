// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_test_p.h>
#if defined(ZF_TEST)

#include <zflate/core/bytearray.h>
#include <zflate/core/deflate.h>
#include <zflate/compression/checksum_p.h>
#include <zflate/compression/deflatedecoder_p.h>
#include <zflate/compression/deflatedefs_p.h>
#include <zflate/compression/deflateencoder_p.h>
#include <zflate/support/intops_p.h>

#include <memory>

// zf::Compression - Deflate - Tests
// =================================

namespace zf::Compression::Tests {

enum class TestDataMode {
  //! Random data where there are repeat sequences, to test both literals and lengths.
  kRandomDataWithRepeats = 0,
  //! Random data that only uses nibbles, but doesn't have repeat sequences - to test Huffman literals.
  kRandomDataWithNibbles = 1,
  //! Random bytes, which are not compressible.
  kRandomBytes = 2,
  //! The whole input data contains zeros.
  kAllZeros = 3,

  kMaxValue = kAllZeros
};

static const char* stringify_data_mode(TestDataMode mode) noexcept {
  switch (mode) {
    case TestDataMode::kRandomDataWithRepeats: return "repeats";
    case TestDataMode::kRandomDataWithNibbles: return "nibbles";
    case TestDataMode::kRandomBytes: return "random";
    case TestDataMode::kAllZeros: return "zeros";
    default:
      return "unknown";
  }
}

static const char* stringify_format(ZFDeflateFormat format) noexcept {
  return format == ZF_DEFLATE_FORMAT_ZLIB ? "zlib" : "raw";
}

// Xorshift generator, tests must be reproducible.
class TestRandom {
public:
  uint32_t state;

  explicit TestRandom(uint32_t seed) noexcept : state(seed ? seed : 1u) {}

  uint32_t next_uint32() noexcept {
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
  }
};

// Writes bits LSB first, the same way a DEFLATE stream is packed.
class SimpleBitWriter {
public:
  ZFByteArray& dst;
  ZFBitWord bit_word {};
  size_t bit_length {};

  explicit SimpleBitWriter(ZFByteArray& dst) noexcept : dst(dst) {}

  void flush() noexcept {
    while (bit_length >= 8) {
      uint8_t b = uint8_t(bit_word & 0xFFu);
      EXPECT_SUCCESS(dst.append_data(&b, 1));
      bit_word >>= 8;
      bit_length -= 8;
    }
  }

  void finalize() noexcept {
    bit_length = (bit_length + 7u) & ~size_t(7);
    flush();
  }

  void append(size_t bits, size_t n) noexcept {
    bit_word |= ZFBitWord(bits) << bit_length;
    bit_length += n;
    flush();
  }

  // Huffman codes are packed starting from their most significant bit.
  void append_code(uint32_t code, uint32_t n) noexcept {
    append(IntOps::reverse_bits(code, n), n);
  }

  // Appends a symbol of the fixed literal/length code.
  void append_fixed_litlen(uint32_t sym) noexcept {
    if (sym < 144u)
      append_code(0x30u + sym, 8);
    else if (sym < 256u)
      append_code(0x190u + (sym - 144u), 9);
    else if (sym < 280u)
      append_code(sym - 256u, 7);
    else
      append_code(0xC0u + (sym - 280u), 8);
  }

  void append_fixed_offset(uint32_t sym) noexcept {
    append_code(sym, 5);
  }
};

static ZFResult append_test_data(ZFByteArray& array, TestRandom& rnd, size_t n, TestDataMode mode) noexcept {
  uint8_t* dst_data;
  ZF_PROPAGATE(array.modify_op(ZF_MODIFY_OP_APPEND_GROW, n, &dst_data));

  uint8_t* dst_ptr = dst_data;
  size_t i = n;

  switch (mode) {
    case TestDataMode::kRandomDataWithRepeats: {
      while (i >= 4) {
        uint32_t cat = rnd.next_uint32();
        size_t pos = size_t(dst_ptr - dst_data);

        if ((cat & 0x7) == 0x7 && pos > 16) {
          // Repeat sequence of some past bytes.
          size_t offset = (size_t((cat >> 16)) % zf_min<size_t>(pos, 32767)) + 1;
          size_t length = zf_max<size_t>((((cat >> 8) & 0xFF) + 3) % i, 3u);
          size_t end = i - length;

          while (i != end) {
            dst_ptr[0] = dst_ptr[-intptr_t(offset)];
            dst_ptr++;
            i--;
          }
          continue;
        }

        uint32_t val = rnd.next_uint32();
        if (cat & 0x80000000u) {
          // Repeat sequence of a single byte.
          val = (val & 0xFFu) * 0x01010101u;
        }

        memcpy(dst_ptr, &val, 4);
        dst_ptr += 4;
        i -= 4;
      }

      while (i) {
        *dst_ptr++ = uint8_t(rnd.next_uint32() & 0xFFu);
        i--;
      }
      break;
    }

    case TestDataMode::kRandomDataWithNibbles: {
      while (i) {
        *dst_ptr++ = uint8_t(rnd.next_uint32() & 0x0Fu);
        i--;
      }
      break;
    }

    case TestDataMode::kRandomBytes: {
      while (i) {
        *dst_ptr++ = uint8_t(rnd.next_uint32() >> 24);
        i--;
      }
      break;
    }

    case TestDataMode::kAllZeros: {
      memset(dst_ptr, 0, i);
      break;
    }
  }

  return ZF_SUCCESS;
}

static void append_string(ZFByteArray& dst, const char* s) noexcept {
  EXPECT_SUCCESS(dst.append_data(s, strlen(s)));
}

static ZFDataView bytes_view(const uint8_t* data, size_t size) noexcept {
  return ZFDataView{data, size};
}

static void check_round_trip(const ZFByteArray& input, uint32_t level, ZFDeflateFormat format) noexcept {
  ZFByteArray compressed;
  ZFByteArray decompressed;

  INFO("Level=" << level << " Format=" << stringify_format(format) << " Size=" << input.size());

  EXPECT_SUCCESS(zf_deflate(&compressed, input.view(), level, format));
  EXPECT_SUCCESS(zf_inflate(&decompressed, compressed.view(), format, ZF_INFLATE_FLAG_VERIFY_CHECKSUM));

  REQUIRE(decompressed.size() == input.size());
  REQUIRE(decompressed.equals(input.data(), input.size()));

  // Compression must be deterministic.
  ZFByteArray compressed_again;
  EXPECT_SUCCESS(zf_deflate(&compressed_again, input.view(), level, format));
  REQUIRE(compressed_again.equals(compressed.data(), compressed.size()));
}

// zf::Compression - Deflate - Round Trip Tests
// ============================================

TEST_CASE("compression_deflate_round_trip_small", "[compression][deflate]") {
  static const char* const strings[] = {
    "",
    "a",
    "ab",
    "abc",
    "aaaa",
    "Hello, World!",
    "abcabcabcabcabcabcabcabcabcabcabcabcabcabcabcabcabc",
    "The quick brown fox jumps over the lazy dog. The quick brown fox jumps over the lazy dog."
  };

  for (const char* s : strings) {
    ZFByteArray input;
    append_string(input, s);

    for (uint32_t level = 0; level <= ZF_DEFLATE_MAX_LEVEL; level++) {
      check_round_trip(input, level, ZF_DEFLATE_FORMAT_RAW);
      check_round_trip(input, level, ZF_DEFLATE_FORMAT_ZLIB);
    }
  }
}

TEST_CASE("compression_deflate_round_trip_generated", "[compression][deflate]") {
  // Sizes around the window size and the maximum size of an uncompressed block.
  static const size_t sizes[] = { 1000, 32768, 40000, 70000 };

  for (uint32_t mode_index = 0; mode_index <= uint32_t(TestDataMode::kMaxValue); mode_index++) {
    TestDataMode mode = TestDataMode(mode_index);

    for (size_t size : sizes) {
      ZFByteArray input;
      TestRandom rnd(0x1234u + uint32_t(size));
      EXPECT_SUCCESS(append_test_data(input, rnd, size, mode));

      INFO("Mode=" << stringify_data_mode(mode));
      for (uint32_t level : {0u, 1u, 4u, 6u, 9u}) {
        check_round_trip(input, level, ZF_DEFLATE_FORMAT_RAW);
        check_round_trip(input, level, ZF_DEFLATE_FORMAT_ZLIB);
      }
    }
  }
}

TEST_CASE("compression_deflate_round_trip_text", "[compression][deflate]") {
  // Text-like data with a skewed distribution, which makes the encoder use dynamic blocks.
  static const char* const words[] = {
    "the", "of", "and", "a", "to", "in", "is", "you", "that", "it", "he", "was", "for", "on", "are", "as",
    "with", "his", "they", "I", "at", "be", "this", "have", "from", "or", "one", "had", "by", "word", "but",
    "not", "what", "all", "were", "we", "when", "your", "can", "said", "there", "use", "an", "each", "which"
  };

  ZFByteArray input;
  TestRandom rnd(42);

  while (input.size() < 200000u) {
    uint32_t r = rnd.next_uint32();
    append_string(input, words[(r >> 8) % ZF_ARRAY_SIZE(words)]);
    append_string(input, (r & 0xFu) == 0 ? ".\n" : " ");
  }

  for (uint32_t level = 1; level <= ZF_DEFLATE_MAX_LEVEL; level++) {
    check_round_trip(input, level, ZF_DEFLATE_FORMAT_ZLIB);
  }

  ZFByteArray compressed;
  EXPECT_SUCCESS(zf_deflate(&compressed, input.view(), 6, ZF_DEFLATE_FORMAT_RAW));
  REQUIRE(compressed.size() < input.size() / 2u);
}

// zf::Compression - Deflate - Output Format Tests
// ===============================================

TEST_CASE("compression_deflate_empty_input", "[compression][deflate]") {
  ZFByteArray compressed;
  ZFByteArray decompressed;

  SECTION("Compressed level uses a single fixed block") {
    static const uint8_t expected[] = { 0x03, 0x00 };

    EXPECT_SUCCESS(zf_deflate(&compressed, ZFDataView{nullptr, 0}, 6, ZF_DEFLATE_FORMAT_RAW));
    REQUIRE(compressed.equals(expected, sizeof(expected)));
  }

  SECTION("Level 0 uses a single empty stored block") {
    static const uint8_t expected[] = { 0x01, 0x00, 0x00, 0xFF, 0xFF };

    EXPECT_SUCCESS(zf_deflate(&compressed, ZFDataView{nullptr, 0}, 0, ZF_DEFLATE_FORMAT_RAW));
    REQUIRE(compressed.equals(expected, sizeof(expected)));
  }

  SECTION("ZLIB stream has a header and the Adler-32 of no data") {
    static const uint8_t expected[] = { 0x78, 0x9C, 0x03, 0x00, 0x00, 0x00, 0x00, 0x01 };

    EXPECT_SUCCESS(zf_deflate(&compressed, ZFDataView{nullptr, 0}, 6, ZF_DEFLATE_FORMAT_ZLIB));
    REQUIRE(compressed.equals(expected, sizeof(expected)));
  }

  EXPECT_SUCCESS(zf_inflate(&decompressed, compressed.view(), compressed.size() > 5 ? ZF_DEFLATE_FORMAT_ZLIB : ZF_DEFLATE_FORMAT_RAW, ZF_INFLATE_FLAG_VERIFY_CHECKSUM));
  REQUIRE(decompressed.is_empty());
}

TEST_CASE("compression_deflate_zlib_header", "[compression][deflate]") {
  ZFByteArray input;
  append_string(input, "zlib header test");

  struct LevelHeader { uint32_t level; uint8_t flg; };
  static const LevelHeader headers[] = {
    { 0, 0x01 }, { 1, 0x01 }, { 2, 0x5E }, { 5, 0x5E }, { 6, 0x9C }, { 7, 0xDA }, { 9, 0xDA }
  };

  for (const LevelHeader& h : headers) {
    ZFByteArray compressed;
    EXPECT_SUCCESS(zf_deflate(&compressed, input.view(), h.level, ZF_DEFLATE_FORMAT_ZLIB));

    INFO("Level=" << h.level);
    REQUIRE(compressed.size() >= 6u);
    REQUIRE(compressed[0] == 0x78u);
    REQUIRE(compressed[1] == h.flg);
    REQUIRE(((uint32_t(compressed[0]) << 8) | compressed[1]) % 31u == 0u);

    uint32_t trailer = (uint32_t(compressed[compressed.size() - 4]) << 24) |
                       (uint32_t(compressed[compressed.size() - 3]) << 16) |
                       (uint32_t(compressed[compressed.size() - 2]) <<  8) |
                       (uint32_t(compressed[compressed.size() - 1])      ) ;
    REQUIRE(trailer == Checksum::adler32(input.data(), input.size()));
  }
}

TEST_CASE("compression_deflate_repetitive_input", "[compression][deflate]") {
  ZFByteArray input;
  for (uint32_t i = 0; i < 100; i++)
    append_string(input, "abc");

  ZFByteArray compressed;
  EXPECT_SUCCESS(zf_deflate(&compressed, input.view(), 6, ZF_DEFLATE_FORMAT_RAW));
  REQUIRE(compressed.size() < 64u);

  ZFByteArray decompressed;
  EXPECT_SUCCESS(zf_inflate(&decompressed, compressed.view(), ZF_DEFLATE_FORMAT_RAW, ZF_INFLATE_NO_FLAGS));
  REQUIRE(decompressed.equals(input.data(), input.size()));
}

TEST_CASE("compression_deflate_incompressible_bound", "[compression][deflate]") {
  ZFByteArray input;
  TestRandom rnd(0xBADC0DEu);
  EXPECT_SUCCESS(append_test_data(input, rnd, 100000, TestDataMode::kRandomBytes));

  size_t n = input.size();
  size_t bound = n + 5u * (n / 16384u + 1u) + 16u;

  for (uint32_t level = 0; level <= ZF_DEFLATE_MAX_LEVEL; level++) {
    ZFByteArray compressed;
    EXPECT_SUCCESS(zf_deflate(&compressed, input.view(), level, ZF_DEFLATE_FORMAT_RAW));

    INFO("Level=" << level);
    REQUIRE(compressed.size() <= bound);
  }
}

TEST_CASE("compression_deflate_invalid_arguments", "[compression][deflate]") {
  ZFByteArray dst;
  ZFByteArray input;
  append_string(input, "abc");

  REQUIRE(zf_deflate(&dst, input.view(), 10, ZF_DEFLATE_FORMAT_RAW) == ZF_ERROR_INVALID_VALUE);
  REQUIRE(zf_deflate(&dst, input.view(), 6, ZFDeflateFormat(2)) == ZF_ERROR_INVALID_VALUE);
  REQUIRE(zf_deflate(nullptr, input.view(), 6, ZF_DEFLATE_FORMAT_RAW) == ZF_ERROR_INVALID_VALUE);
  REQUIRE(zf_deflate(&dst, ZFDataView{nullptr, 3}, 6, ZF_DEFLATE_FORMAT_RAW) == ZF_ERROR_INVALID_VALUE);

  REQUIRE(zf_inflate(&dst, input.view(), ZFDeflateFormat(2), 0) == ZF_ERROR_INVALID_VALUE);
  REQUIRE(zf_inflate(&dst, input.view(), ZF_DEFLATE_FORMAT_RAW, 0x100u) == ZF_ERROR_INVALID_VALUE);
}

// zf::Compression - Deflate - Encoder Tests
// =========================================

TEST_CASE("compression_deflate_encoder_buffer", "[compression][deflate]") {
  Deflate::Encoder encoder;
  REQUIRE(encoder.init(Deflate::FormatType::kRaw, 10) == ZF_ERROR_INVALID_VALUE);
  EXPECT_SUCCESS(encoder.init(Deflate::FormatType::kRaw, 6));

  ZFByteArray input;
  TestRandom rnd(7);
  EXPECT_SUCCESS(append_test_data(input, rnd, 5000, TestDataMode::kRandomDataWithRepeats));

  size_t min_size = encoder.minimum_output_buffer_size(input.size());
  std::unique_ptr<uint8_t[]> output(new uint8_t[min_size]);

  // A buffer smaller than the minimum is rejected without writing anything.
  REQUIRE(encoder.compress_to(output.get(), min_size - 1u, input.data(), input.size()) == 0u);

  size_t written = encoder.compress_to(output.get(), min_size, input.data(), input.size());
  REQUIRE(written != 0u);
  REQUIRE(written <= min_size);

  ZFByteArray decompressed;
  EXPECT_SUCCESS(zf_inflate(&decompressed, bytes_view(output.get(), written), ZF_DEFLATE_FORMAT_RAW, 0));
  REQUIRE(decompressed.equals(input.data(), input.size()));

  // Append mode keeps the existing content of the destination.
  ZFByteArray dst;
  append_string(dst, "prefix");
  EXPECT_SUCCESS(encoder.compress(dst, ZF_MODIFY_OP_APPEND_GROW, input.view()));
  REQUIRE(dst.size() == 6u + written);
  REQUIRE(memcmp(dst.data(), "prefix", 6) == 0);
  REQUIRE(memcmp(dst.data() + 6, output.get(), written) == 0);
}

// zf::Compression - Deflate - Decoder Tests
// =========================================

static ZFResult inflate_raw(ZFByteArray& dst, const ZFByteArray& src, uint32_t flags = 0) noexcept {
  return zf_inflate(&dst, src.view(), ZF_DEFLATE_FORMAT_RAW, flags);
}

TEST_CASE("compression_deflate_decoder_stored_blocks", "[compression][deflate]") {
  ZFByteArray src;
  ZFByteArray dst;

  SECTION("Single stored block") {
    static const uint8_t stream[] = { 0x01, 0x03, 0x00, 0xFC, 0xFF, 'a', 'b', 'c' };
    EXPECT_SUCCESS(src.assign_data(stream, sizeof(stream)));

    EXPECT_SUCCESS(inflate_raw(dst, src));
    REQUIRE(dst.equals("abc", 3));
  }

  SECTION("Two stored blocks") {
    static const uint8_t stream[] = {
      0x00, 0x02, 0x00, 0xFD, 0xFF, 'a', 'b',
      0x01, 0x01, 0x00, 0xFE, 0xFF, 'c'
    };
    EXPECT_SUCCESS(src.assign_data(stream, sizeof(stream)));

    EXPECT_SUCCESS(inflate_raw(dst, src));
    REQUIRE(dst.equals("abc", 3));
  }

  SECTION("Data after the end of the stream is ignored") {
    static const uint8_t stream[] = { 0x01, 0x01, 0x00, 0xFE, 0xFF, 'x', 0xAA, 0xBB };
    EXPECT_SUCCESS(src.assign_data(stream, sizeof(stream)));

    EXPECT_SUCCESS(inflate_raw(dst, src));
    REQUIRE(dst.equals("x", 1));
  }

  SECTION("LEN and NLEN mismatch") {
    static const uint8_t stream[] = { 0x01, 0x03, 0x00, 0x00, 0x00, 'a', 'b', 'c' };
    EXPECT_SUCCESS(src.assign_data(stream, sizeof(stream)));

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
    REQUIRE(dst.is_empty());
  }

  SECTION("Truncated block") {
    static const uint8_t stream[] = { 0x01, 0x03, 0x00, 0xFC, 0xFF, 'a' };
    EXPECT_SUCCESS(src.assign_data(stream, sizeof(stream)));

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
    REQUIRE(dst.is_empty());
  }

  SECTION("Missing final block") {
    static const uint8_t stream[] = { 0x00, 0x01, 0x00, 0xFE, 0xFF, 'a' };
    EXPECT_SUCCESS(src.assign_data(stream, sizeof(stream)));

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
  }

  SECTION("Empty input") {
    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
  }
}

TEST_CASE("compression_deflate_decoder_fixed_blocks", "[compression][deflate]") {
  ZFByteArray src;
  ZFByteArray dst;

  SECTION("Literal followed by an overlapping match") {
    SimpleBitWriter writer(src);
    writer.append(1, 1);                // BFINAL
    writer.append(1, 2);                // BTYPE = fixed Huffman
    writer.append_fixed_litlen('a');
    writer.append_fixed_litlen(258);    // Length 4.
    writer.append_fixed_offset(0);      // Offset 1.
    writer.append_fixed_litlen('b');
    writer.append_fixed_litlen(265);    // Length 11 + 1 extra bit.
    writer.append(1, 1);                // Length 12.
    writer.append_fixed_offset(4);      // Offset 5 + 1 extra bit.
    writer.append(0, 1);                // Offset 5.
    writer.append_fixed_litlen(256);
    writer.finalize();

    EXPECT_SUCCESS(inflate_raw(dst, src));
    REQUIRE(dst.equals("aaaaabaaaabaaaabaa", 18));
  }

  SECTION("Offset larger than the produced output") {
    SimpleBitWriter writer(src);
    writer.append(1, 1);
    writer.append(1, 2);
    writer.append_fixed_litlen('a');
    writer.append_fixed_litlen(257);    // Length 3.
    writer.append_fixed_offset(1);      // Offset 2.
    writer.append_fixed_litlen(256);
    writer.finalize();

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
    REQUIRE(dst.is_empty());
  }

  SECTION("Reserved offset symbol") {
    SimpleBitWriter writer(src);
    writer.append(1, 1);
    writer.append(1, 2);
    writer.append_fixed_litlen('a');
    writer.append_fixed_litlen(257);
    writer.append_fixed_offset(30);
    writer.append_fixed_litlen(256);
    writer.finalize();

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
  }

  SECTION("Reserved literal/length symbol") {
    SimpleBitWriter writer(src);
    writer.append(1, 1);
    writer.append(1, 2);
    writer.append_fixed_litlen(286);
    writer.append_fixed_litlen(256);
    writer.finalize();

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
  }

  SECTION("Missing end of block") {
    SimpleBitWriter writer(src);
    writer.append(1, 1);
    writer.append(1, 2);
    writer.append_fixed_litlen('a');
    writer.finalize();

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
  }
}

TEST_CASE("compression_deflate_decoder_invalid_streams", "[compression][deflate]") {
  ZFByteArray src;
  ZFByteArray dst;

  SECTION("Reserved block type") {
    static const uint8_t stream[] = { 0x07, 0x00, 0x00, 0x00 };
    EXPECT_SUCCESS(src.assign_data(stream, sizeof(stream)));

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_UNSUPPORTED_BLOCK_TYPE);
    REQUIRE(dst.is_empty());
  }

  SECTION("Too many literal/length codes") {
    SimpleBitWriter writer(src);
    writer.append(1, 1);
    writer.append(2, 2);                // BTYPE = dynamic Huffman
    writer.append(30, 5);               // HLIT = 287
    writer.append(0, 5);
    writer.append(0, 4);
    writer.append(0, 32);
    writer.finalize();

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
  }

  SECTION("Over-subscribed precode") {
    SimpleBitWriter writer(src);
    writer.append(1, 1);
    writer.append(2, 2);
    writer.append(0, 5);
    writer.append(0, 5);
    writer.append(15, 4);               // HCLEN = 19
    for (uint32_t i = 0; i < Deflate::kNumPrecodeSymbols; i++)
      writer.append(1, 3);              // 19 codes of length 1.
    writer.append(0, 32);
    writer.finalize();

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
  }

  SECTION("Repeat of a previous length at the beginning") {
    SimpleBitWriter writer(src);
    writer.append(1, 1);
    writer.append(2, 2);
    writer.append(0, 5);
    writer.append(0, 5);
    writer.append(0, 4);                // HCLEN = 4 - lengths of symbols 16, 17, 18, and 0.
    writer.append(1, 3);                // Symbol 16 has length 1.
    writer.append(0, 3);
    writer.append(0, 3);
    writer.append(1, 3);                // Symbol 0 has length 1.
    writer.append_code(1, 1);           // Symbol 16 (symbol 0 has code 0).
    writer.append(0, 32);
    writer.finalize();

    REQUIRE(inflate_raw(dst, src) == ZF_ERROR_MALFORMED_INPUT);
  }

  SECTION("Bad zlib header") {
    static const uint8_t bad_check[] = { 0x78, 0x9D, 0x03, 0x00, 0x00, 0x00, 0x00, 0x01 };
    static const uint8_t bad_method[] = { 0x79, 0x9C, 0x03, 0x00, 0x00, 0x00, 0x00, 0x01 };
    static const uint8_t preset_dict[] = { 0x78, 0xBB, 0x03, 0x00, 0x00, 0x00, 0x00, 0x01 };

    REQUIRE(zf_inflate(&dst, bytes_view(bad_check, sizeof(bad_check)), ZF_DEFLATE_FORMAT_ZLIB, 0) == ZF_ERROR_MALFORMED_INPUT);
    REQUIRE(zf_inflate(&dst, bytes_view(bad_method, sizeof(bad_method)), ZF_DEFLATE_FORMAT_ZLIB, 0) == ZF_ERROR_MALFORMED_INPUT);
    REQUIRE(zf_inflate(&dst, bytes_view(preset_dict, sizeof(preset_dict)), ZF_DEFLATE_FORMAT_ZLIB, 0) == ZF_ERROR_MALFORMED_INPUT);
  }

  SECTION("Missing zlib trailer") {
    static const uint8_t stream[] = { 0x78, 0x9C, 0x03, 0x00, 0x00, 0x00 };
    REQUIRE(zf_inflate(&dst, bytes_view(stream, sizeof(stream)), ZF_DEFLATE_FORMAT_ZLIB, 0) == ZF_ERROR_MALFORMED_INPUT);
  }
}

TEST_CASE("compression_deflate_decoder_checksum", "[compression][deflate]") {
  ZFByteArray input;
  append_string(input, "Checksum of this text is stored in the zlib trailer.");

  ZFByteArray compressed;
  EXPECT_SUCCESS(zf_deflate(&compressed, input.view(), 6, ZF_DEFLATE_FORMAT_ZLIB));

  // Corrupt the last byte of the trailer.
  compressed.data()[compressed.size() - 1] ^= 0x01u;

  ZFByteArray dst;
  REQUIRE(zf_inflate(&dst, compressed.view(), ZF_DEFLATE_FORMAT_ZLIB, ZF_INFLATE_FLAG_VERIFY_CHECKSUM) == ZF_ERROR_CHECKSUM_MISMATCH);
  REQUIRE(dst.is_empty());

  // Without verification the trailer is only required to be present.
  EXPECT_SUCCESS(zf_inflate(&dst, compressed.view(), ZF_DEFLATE_FORMAT_ZLIB, ZF_INFLATE_NO_FLAGS));
  REQUIRE(dst.equals(input.data(), input.size()));
}

TEST_CASE("compression_deflate_decoder_corrupted_stream", "[compression][deflate]") {
  ZFByteArray input;
  TestRandom rnd(99);
  EXPECT_SUCCESS(append_test_data(input, rnd, 4000, TestDataMode::kRandomDataWithRepeats));

  ZFByteArray compressed;
  EXPECT_SUCCESS(zf_deflate(&compressed, input.view(), 6, ZF_DEFLATE_FORMAT_ZLIB));

  // Flipping any bit must never produce wrong data silently - it either fails or decodes to the same data (flipped
  // padding bits don't change anything).
  for (size_t i = 2; i < compressed.size() - 4u; i += 7u) {
    for (uint32_t bit = 0; bit < 8; bit += 3) {
      ZFByteArray corrupted;
      EXPECT_SUCCESS(corrupted.assign_data(compressed.data(), compressed.size()));
      corrupted.data()[i] ^= uint8_t(1u << bit);

      ZFByteArray dst;
      ZFResult result = zf_inflate(&dst, corrupted.view(), ZF_DEFLATE_FORMAT_ZLIB, ZF_INFLATE_FLAG_VERIFY_CHECKSUM);

      INFO("Byte=" << i << " Bit=" << bit << " Result=" << zf_result_to_string(result));
      if (result == ZF_SUCCESS) {
        REQUIRE(dst.equals(input.data(), input.size()));
      }
      else {
        REQUIRE((result == ZF_ERROR_MALFORMED_INPUT ||
                 result == ZF_ERROR_CHECKSUM_MISMATCH ||
                 result == ZF_ERROR_UNSUPPORTED_BLOCK_TYPE));
        REQUIRE(dst.is_empty());
      }
    }
  }
}

TEST_CASE("compression_deflate_decoder_output_limit", "[compression][deflate]") {
  ZFByteArray input;
  TestRandom rnd(3);
  EXPECT_SUCCESS(append_test_data(input, rnd, 1000, TestDataMode::kRandomDataWithNibbles));

  ZFByteArray compressed;
  EXPECT_SUCCESS(zf_deflate(&compressed, input.view(), 6, ZF_DEFLATE_FORMAT_RAW));

  ZFByteArray dst;
  EXPECT_SUCCESS(dst.reserve(100));
  REQUIRE(zf_inflate(&dst, compressed.view(), ZF_DEFLATE_FORMAT_RAW, ZF_INFLATE_FLAG_NEVER_REALLOC) == ZF_ERROR_DATA_TOO_LARGE);
  REQUIRE(dst.is_empty());

  EXPECT_SUCCESS(dst.reserve(1000));
  uint8_t* data_before = dst.data();

  EXPECT_SUCCESS(zf_inflate(&dst, compressed.view(), ZF_DEFLATE_FORMAT_RAW, ZF_INFLATE_FLAG_NEVER_REALLOC));
  REQUIRE(dst.data() == data_before);
  REQUIRE(dst.equals(input.data(), input.size()));
}

TEST_CASE("compression_deflate_decoder_appends", "[compression][deflate]") {
  static const uint8_t stream[] = { 0x01, 0x03, 0x00, 0xFC, 0xFF, 'a', 'b', 'c' };

  std::unique_ptr<Deflate::Decoder> decoder(new Deflate::Decoder());
  decoder->init(Deflate::FormatType::kRaw, Deflate::DecoderOptions::kNone);

  ZFByteArray dst;
  append_string(dst, "xyz");

  EXPECT_SUCCESS(decoder->decode(dst, bytes_view(stream, sizeof(stream))));
  REQUIRE(dst.equals("xyzabc", 6));

  // A finished decoder must be initialized again before it decodes another stream.
  REQUIRE(decoder->decode(dst, bytes_view(stream, sizeof(stream))) == ZF_SUCCESS);
  REQUIRE(dst.equals("xyzabc", 6));

  decoder->init(Deflate::FormatType::kRaw, Deflate::DecoderOptions::kNone);
  EXPECT_SUCCESS(decoder->decode(dst, bytes_view(stream, sizeof(stream))));
  REQUIRE(dst.equals("xyzabcabc", 9));
}

} // {zf::Compression::Tests}

#endif // ZF_TEST
