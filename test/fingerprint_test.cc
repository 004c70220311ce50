#include "test_fixture.hh"

#include <stdexcept>

using namespace imdupe_test;

TEST(FingerprintTest, BitStringRoundTrip) {
  auto fp = fingerprint_t::from_bits("00000001");
  ASSERT_EQ(fp.size(), 8U);
  ASSERT_FALSE(fp.test(0));
  ASSERT_TRUE(fp.test(7));
  ASSERT_EQ(fp.to_bits(), "00000001");
}

TEST(FingerprintTest, FromBitsRejectsGarbage) {
  ASSERT_THROW(fingerprint_t::from_bits(""), std::invalid_argument);
  ASSERT_THROW(fingerprint_t::from_bits("0102"), std::invalid_argument);
}

TEST(FingerprintTest, HexIsLeastSignificantBitFirstPerByte) {
  fingerprint_t fp(64);
  fp.set(0);
  fp.set(9);
  fp.set(63);
  ASSERT_EQ(fp.to_hex(), "0102000000000080");
  ASSERT_EQ(fingerprint_t::from_hex("0102000000000080", 64), fp);
}

TEST(FingerprintTest, HexOfShortFingerprint) {
  auto fp = fingerprint_t::from_bits("1000");
  ASSERT_EQ(fp.to_hex(), "01");
  ASSERT_EQ(fingerprint_t::from_hex("01", 4), fp);
  // bit 4 does not exist in a 4-bit fingerprint
  ASSERT_THROW(fingerprint_t::from_hex("10", 4), std::invalid_argument);
  ASSERT_THROW(fingerprint_t::from_hex("0g", 8), std::invalid_argument);
  ASSERT_THROW(fingerprint_t::from_hex("0102", 8), std::invalid_argument);
}

TEST(FingerprintTest, SliceAcrossWordBoundary) {
  fingerprint_t fp(128);
  for (auto i = 60U; i < 68U; ++i) {
    fp.set(i);
  }
  ASSERT_EQ(fp.slice(60, 8), 0xffUL);
  ASSERT_EQ(fp.slice(56, 16), 0x0ff0UL);
  ASSERT_EQ(fp.slice(64, 64), 0x0fUL);
  ASSERT_EQ(fp.slice(0, 60), 0UL);
}

TEST(FingerprintTest, ScenarioDistances) {
  auto a = fingerprint_t::from_bits("00000000");
  auto b = fingerprint_t::from_bits("00000001");
  auto c = fingerprint_t::from_bits("11111111");
  ASSERT_EQ(hamming_distance(a, b), 1U);
  ASSERT_EQ(hamming_distance(b, c), 7U);
  ASSERT_EQ(hamming_distance(a, c), 8U);
}

TEST(FingerprintTest, SelfDistanceIsZero) {
  for (const auto &fp : clustered_fingerprints(10, 2, 256, 20, 7)) {
    ASSERT_EQ(hamming_distance(fp, fp), 0U);
  }
}

TEST(FingerprintTest, DistanceIsSymmetricAndTriangular) {
  const auto fps = clustered_fingerprints(6, 3, 200, 30, 11);
  for (const auto &a : fps) {
    for (const auto &b : fps) {
      const auto ab = hamming_distance(a, b);
      ASSERT_EQ(ab, hamming_distance(b, a));
      for (const auto &c : fps) {
        ASSERT_LE(hamming_distance(a, c), ab + hamming_distance(b, c));
      }
    }
  }
}

TEST(FingerprintTest, UnequalLengthsThrow) {
  ASSERT_THROW(hamming_distance(fingerprint_t(64), fingerprint_t(256)),
               std::invalid_argument);
}
