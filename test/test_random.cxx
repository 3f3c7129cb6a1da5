#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "util/random.hpp"

TEST(RandomTests, SystemBits) {
  BitString a = SystemRandom::getInstance().bits(LAMBDA);
  BitString b = SystemRandom::getInstance().bits(LAMBDA);
  EXPECT_EQ(a.size(), LAMBDA);
  EXPECT_NE(a, b);
  EXPECT_EQ(SystemRandom::getInstance().bits(0).size(), 0);
}

TEST(RandomTests, SystemLessThan) {
  for (int i = 0; i < 1000; i++) {
    EXPECT_LT(SystemRandom::getInstance().lessThan(15), 15);
  }
  EXPECT_EQ(SystemRandom::getInstance().lessThan(1), 0);
  EXPECT_THROW(SystemRandom::getInstance().lessThan(0), std::invalid_argument);
}

TEST(RandomTests, SeededIsDeterministic) {
  BitString seed = SeededRandom::sampleSeed();
  SeededRandom a(seed);
  SeededRandom b(seed);

  EXPECT_EQ(a.seed(), seed);
  for (size_t size : {1, 7, 128, 3000, 9}) {
    EXPECT_EQ(a.bits(size), b.bits(size));
  }
  EXPECT_EQ(a.lessThan(1000), b.lessThan(1000));
}

TEST(RandomTests, SeedsDiffer) {
  SeededRandom a(BitString::fromUInt(1, 32));
  SeededRandom b(BitString::fromUInt(2, 32));
  EXPECT_NE(a.bits(LAMBDA), b.bits(LAMBDA));
}

TEST(RandomTests, SeedTooLarge) {
  EXPECT_THROW(SeededRandom(BitString(LAMBDA + 1)), std::invalid_argument);
}

TEST(RandomTests, SeededLessThanCoversRange) {
  SeededRandom rng(BitString::fromUInt(42, 32));
  std::set<uint32_t> seen;
  for (int i = 0; i < 1000; i++) {
    uint32_t value = rng.lessThan(15);
    ASSERT_LT(value, 15);
    seen.insert(value);
  }
  EXPECT_EQ(seen.size(), 15);
}

TEST(RandomTests, SampleDistinct) {
  SeededRandom rng(BitString::fromUInt(7, 32));
  for (int i = 0; i < 100; i++) {
    std::vector<uint32_t> values = sampleDistinct(2, 15, rng);
    ASSERT_EQ(values.size(), 2);
    EXPECT_NE(values[0], values[1]);
    EXPECT_LT(values[0], 15);
    EXPECT_LT(values[1], 15);
  }

  std::vector<uint32_t> all = sampleDistinct(15, 15, rng);
  EXPECT_EQ(std::set<uint32_t>(all.begin(), all.end()).size(), 15);

  EXPECT_TRUE(sampleDistinct(0, 15, rng).empty());
  EXPECT_THROW(sampleDistinct(16, 15, rng), std::invalid_argument);
}

TEST(RandomTests, SamplePermutation) {
  SeededRandom rng(BitString::fromUInt(9, 32));
  std::vector<uint32_t> perm = samplePermutation(15, rng);
  ASSERT_EQ(perm.size(), 15);

  std::vector<uint32_t> sorted(perm);
  std::sort(sorted.begin(), sorted.end());
  for (uint32_t i = 0; i < 15; i++) {
    EXPECT_EQ(sorted[i], i);
  }

  // not stuck on the identity
  bool moved = false;
  for (int i = 0; i < 10 && !moved; i++) {
    perm = samplePermutation(15, rng);
    for (uint32_t j = 0; j < 15; j++) { moved |= perm[j] != j; }
  }
  EXPECT_TRUE(moved);
}
