// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zflate/core/api-build_test_p.h>
#if defined(ZF_TEST)

#include <zflate/compression/matchfinder_p.h>

#include <memory>
#include <vector>

// zf::Compression - Deflate - Match Finder - Tests
// ================================================

namespace zf::Compression::Deflate::Tests {

static const uint8_t* as_bytes(const char* s) noexcept { return reinterpret_cast<const uint8_t*>(s); }

// Hashes and links all positions up to and including `pos`, the same way the encoder does before searching.
static void insert_up_to(HashChainMatchFinder& mf, const uint8_t* data, size_t size, size_t pos) noexcept {
  for (size_t i = 0; i <= pos && i + 3u <= size; i++)
    mf.insert(HashChainMatchFinder::hash3(data + i), i);
}

TEST_CASE("compression_deflate_match_length", "[compression][deflate]") {
  const uint8_t* data = as_bytes("abcabcabcX");

  REQUIRE(HashChainMatchFinder::match_length(data, 10, 3, 3) == 6u);
  REQUIRE(HashChainMatchFinder::match_length(data, 10, 6, 3) == 3u);
  REQUIRE(HashChainMatchFinder::match_length(data, 10, 4, 3) == 5u);
  REQUIRE(HashChainMatchFinder::match_length(data, 10, 4, 1) == 0u);

  // Overlapping match is limited by the maximum match length.
  std::vector<uint8_t> zeros(1000, 0);
  REQUIRE(HashChainMatchFinder::match_length(zeros.data(), zeros.size(), 1, 1) == kMaxMatchLen);
}

TEST_CASE("compression_deflate_match_finder_find", "[compression][deflate]") {
  std::unique_ptr<HashChainMatchFinder> mf(new HashChainMatchFinder());
  mf->reset();

  SECTION("Repeated block") {
    const uint8_t* data = as_bytes("abcdefabcdef");
    insert_up_to(*mf, data, 12, 6);

    Match match = mf->find(data, 12, 6, HashChainMatchFinder::hash3(data + 6), 6, 128);
    REQUIRE(match.is_valid());
    REQUIRE(match.length == 6u);
    REQUIRE(match.offset == 6u);
  }

  SECTION("No previous occurrence") {
    const uint8_t* data = as_bytes("abcdefghijkl");
    insert_up_to(*mf, data, 12, 6);

    Match match = mf->find(data, 12, 6, HashChainMatchFinder::hash3(data + 6), 6, 128);
    REQUIRE_FALSE(match.is_valid());
  }

  SECTION("Nice length stops the search") {
    std::vector<uint8_t> data(600, uint8_t('z'));
    insert_up_to(*mf, data.data(), data.size(), 300);

    Match match = mf->find(data.data(), data.size(), 300, HashChainMatchFinder::hash3(data.data() + 300), 16, 128);
    REQUIRE(match.is_valid());
    REQUIRE(match.length >= 16u);
  }
}

TEST_CASE("compression_deflate_match_finder_validity", "[compression][deflate]") {
  std::unique_ptr<HashChainMatchFinder> mf(new HashChainMatchFinder());
  mf->reset();

  // Pseudo-random data built from a small alphabet, which has plenty of matches and hash collisions.
  std::vector<uint8_t> data(70000);
  uint32_t seed = 0xC0FFEEu;
  for (size_t i = 0; i < data.size(); i++) {
    seed ^= seed << 13;
    seed ^= seed >> 17;
    seed ^= seed << 5;
    data[i] = uint8_t('a' + seed % 4u);
  }

  size_t size = data.size();
  mf->insert(HashChainMatchFinder::hash3(data.data()), 0);

  for (size_t pos = 0; pos + 3u <= size; pos++) {
    if (pos != 0)
      mf->insert(HashChainMatchFinder::hash3(data.data() + pos), pos);

    uint32_t nice_length = uint32_t(zf_min<size_t>(kMaxMatchLen, size - pos));
    Match match = mf->find(data.data(), size, pos, HashChainMatchFinder::hash3(data.data() + pos), nice_length, 32);
    if (!match.is_valid())
      continue;

    INFO("Position " << pos << " length " << match.length << " offset " << match.offset);
    REQUIRE(match.length <= kMaxMatchLen);
    REQUIRE(match.length <= size - pos);
    REQUIRE(match.offset >= kMinMatchOffset);
    REQUIRE(match.offset <= kMaxMatchOffset);
    REQUIRE(match.offset <= pos);
    REQUIRE(memcmp(data.data() + pos, data.data() + pos - match.offset, match.length) == 0);
  }
}

} // {zf::Compression::Deflate::Tests}

#endif // ZF_TEST
