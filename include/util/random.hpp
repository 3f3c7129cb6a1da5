#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <openssl/evp.h>

#include "util/bitstring.hpp"
#include "util/defines.hpp"

/**
 * source of uniform randomness; every sampling routine takes one explicitly so
 * that tests can replay a run from a seed
 */
class RandomSource {
public:
  virtual ~RandomSource() { }

  // uniformly sample `size` bits
  virtual BitString bits(size_t size) = 0;

  // uniformly sample a value less than `max`
  virtual uint32_t lessThan(uint32_t max);
};

// operating system randomness through openssl
class SystemRandom : public RandomSource {
public:
  // using a singleton since the source carries no state of its own
  static SystemRandom& getInstance() {
    static SystemRandom instance;
    return instance;
  }

  BitString bits(size_t size) override;
  uint32_t lessThan(uint32_t max) override;

private:
  SystemRandom() { }
};

// deterministic stream: aes-128 in counter mode keyed by the seed
class SeededRandom : public RandomSource {
public:
  explicit SeededRandom(const BitString& seed);

  SeededRandom(const SeededRandom&) = delete;
  SeededRandom& operator=(const SeededRandom&) = delete;

  // fresh seed from the system source
  static BitString sampleSeed() { return SystemRandom::getInstance().bits(LAMBDA); }

  BitString bits(size_t size) override;

  const BitString& seed() const { return seed_; }

private:
  // next keystream byte, refilling the buffer when it runs out
  unsigned char next();

  BitString seed_;
  std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx;

  std::vector<unsigned char> buffer;
  size_t idx;

  // aes block size
  static constexpr size_t BLOCK_SIZE = 16;

  // keystream bytes produced per refill
  static constexpr size_t BUFFER_SIZE = 64 * BLOCK_SIZE;
};

// uniformly sample `size` distinct values less than `max`
std::vector<uint32_t> sampleDistinct(size_t size, uint32_t max, RandomSource& rng);

// uniformly sample a permutation of {0, ..., n - 1}
std::vector<uint32_t> samplePermutation(size_t n, RandomSource& rng);
