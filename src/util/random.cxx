#include "util/random.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include <openssl/bn.h>
#include <openssl/rand.h>

////////////////////////////////////////////////////////////////////////////////
// RANDOM SOURCE
////////////////////////////////////////////////////////////////////////////////

uint32_t RandomSource::lessThan(uint32_t max) {
  if (max == 0) {
    throw std::invalid_argument("[RandomSource::lessThan] cannot sample below 0");
  }

  // largest multiple of max within uint32_t
  uint64_t max_multiple = ((uint64_t) UINT32_MAX + 1) - (((uint64_t) UINT32_MAX + 1) % max);

  // sample until you get value below max_multiple (to ensure a uniform distribution)
  uint32_t output;
  do {
    output = this->bits(32).toUInt();
  } while (output >= max_multiple);

  return output % max;
}

////////////////////////////////////////////////////////////////////////////////
// SYSTEM RANDOMNESS
////////////////////////////////////////////////////////////////////////////////

BitString SystemRandom::bits(size_t size) {
  std::vector<unsigned char> bytes((size + 7) / 8);
  if (!bytes.empty() && RAND_bytes(bytes.data(), bytes.size()) != 1) {
    throw std::runtime_error("[SystemRandom::bits] RAND_bytes error");
  }
  return BitString(bytes, size);
}

uint32_t SystemRandom::lessThan(uint32_t max) {
  if (max == 0) {
    throw std::invalid_argument("[SystemRandom::lessThan] cannot sample below 0");
  }

  // convert max to an OpenSSL BIGNUM
  BIGNUM* bn_max = BN_new();
  BIGNUM* bn_out = BN_new();
  if (bn_max == nullptr || bn_out == nullptr) {
    BN_free(bn_max);
    BN_free(bn_out);
    throw std::runtime_error("[SystemRandom::lessThan] BN_new error");
  }

  // generate the output
  bool ok = BN_set_word(bn_max, max) == 1 && BN_rand_range(bn_out, bn_max) == 1;
  uint32_t out = ok ? (uint32_t) BN_get_word(bn_out) : 0;

  // free used memory
  BN_clear_free(bn_max);
  BN_clear_free(bn_out);

  if (!ok) {
    throw std::runtime_error("[SystemRandom::lessThan] BN_rand_range error");
  }
  return out;
}

////////////////////////////////////////////////////////////////////////////////
// SEEDED RANDOMNESS
////////////////////////////////////////////////////////////////////////////////

SeededRandom::SeededRandom(const BitString& seed)
  : seed_(seed), ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free), idx(BUFFER_SIZE)
{
  if (seed.size() > 8 * BLOCK_SIZE) {
    throw std::invalid_argument(
      "[SeededRandom] seed of " + std::to_string(seed.size()) + " bits is too large"
    );
  }
  if (ctx == nullptr) {
    throw std::runtime_error("[SeededRandom] EVP_CIPHER_CTX_new error");
  }

  // ensure the key is large enough
  std::vector<unsigned char> key = seed.toBytes();
  key.resize(BLOCK_SIZE);

  // counter starts at zero
  std::vector<unsigned char> iv(BLOCK_SIZE, 0);

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_ctr(), nullptr, key.data(), iv.data()) != 1) {
    throw std::runtime_error("[SeededRandom] EVP_EncryptInit_ex error");
  }
  buffer.resize(BUFFER_SIZE);
}

unsigned char SeededRandom::next() {
  if (idx == buffer.size()) {
    // encrypting zeros in counter mode yields the raw keystream
    std::vector<unsigned char> input(BUFFER_SIZE, 0);
    int outl = 0;
    if (EVP_EncryptUpdate(ctx.get(), buffer.data(), &outl, input.data(), input.size()) != 1
        || (size_t) outl != BUFFER_SIZE) {
      throw std::runtime_error("[SeededRandom::next] EVP_EncryptUpdate error");
    }
    idx = 0;
  }
  return buffer[idx++];
}

BitString SeededRandom::bits(size_t size) {
  std::vector<unsigned char> bytes((size + 7) / 8);
  for (unsigned char& byte : bytes) { byte = this->next(); }
  return BitString(bytes, size);
}

////////////////////////////////////////////////////////////////////////////////
// SAMPLING HELPERS
////////////////////////////////////////////////////////////////////////////////

std::vector<uint32_t> sampleDistinct(size_t size, uint32_t max, RandomSource& rng) {
  if (size > max) {
    throw std::invalid_argument(
      "[sampleDistinct] cannot draw " + std::to_string(size) + " distinct values below "
      + std::to_string(max)
    );
  }

  std::vector<uint32_t> out;
  while (out.size() < size) {
    uint32_t sampled = rng.lessThan(max);
    if (std::find(out.begin(), out.end(), sampled) == out.end()) {
      out.push_back(sampled);
    }
  }
  return out;
}

std::vector<uint32_t> samplePermutation(size_t n, RandomSource& rng) {
  std::vector<uint32_t> perm(n);
  for (uint32_t i = 0; i < n; i++) { perm[i] = i; }

  // fisher-yates: position i is swapped with a uniform position in [0, i]
  for (size_t i = n; i > 1; i--) {
    std::swap(perm[i - 1], perm[rng.lessThan(i)]);
  }
  return perm;
}
