#include <gtest/gtest.h>

#include <set>

#include "util/bitstring.hpp"
#include "util/random.hpp"

// fixed seed so that failures can be replayed
#define TEST_SEED 0x5eed5eed

// test fixture with a deterministic random source
class SeededTest : public testing::Test {
protected:
  SeededTest() : rng(BitString::fromUInt(TEST_SEED, 32)) { }

  SeededRandom rng;
};

// flip the bits of `word` at `positions`
inline BitString flip(BitString word, const std::set<size_t>& positions) {
  for (size_t pos : positions) { word[pos] ^= true; }
  return word;
}
