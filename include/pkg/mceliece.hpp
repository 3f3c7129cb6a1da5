#pragma once

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "code/code.hpp"
#include "gf2/matrix.hpp"
#include "util/bitstring.hpp"
#include "util/random.hpp"

namespace McEliece {

class Params {
public:
  Params(Code::Variant variant, size_t blocks);

  Code::Variant variant;

  // number of independent blocks in one message
  size_t blocks;

  const Code::BlockCode& code() const { return Code::BlockCode::get(variant); }

  // L * k
  size_t messageSize() const { return blocks * code().params().k; }

  // L * n
  size_t ciphertextSize() const { return blocks * code().params().n; }

  // ciphertext size over message size (n / k)
  double expansion() const { return code().params().expansion(); }

  // dimensions of the public key laid out block diagonally over all L blocks
  std::pair<size_t, size_t> publicKeyDim() const {
    return std::make_pair(messageSize(), ciphertextSize());
  }

  size_t publicKeyBytes() const { return (messageSize() * ciphertextSize() + 7) / 8; }

  std::string toString() const;
};

class PublicKey {
public:
  PublicKey(const Params& params, const GF2::Matrix& matrix);

  const Params& params() const { return params_; }

  // the scrambled k x n generator S * G * P shared by every block
  const GF2::Matrix& matrix() const { return G_pub; }

  // number of errors added per block
  size_t t() const { return params_.code().params().t; }

  // the (L * k) x (L * n) block diagonal matrix acting on a whole message
  GF2::Matrix expanded() const { return G_pub.blockDiagonal(params_.blocks); }
  std::pair<size_t, size_t> dim() const { return params_.publicKeyDim(); }

private:
  Params params_;
  GF2::Matrix G_pub;
};

class PrivateKey {
public:
  PrivateKey(
    const Params& params,
    const GF2::Matrix& S, const GF2::Matrix& S_inv,
    const GF2::Matrix& P, const GF2::Matrix& P_inv
  );

  const Params& params() const { return params_; }
  const Code::BlockCode& code() const { return params_.code(); }

  // k x k scrambling matrix and its inverse
  const GF2::Matrix& S() const { return S_; }
  const GF2::Matrix& S_inv() const { return S_inv_; }

  // n x n permutation matrix and its inverse
  const GF2::Matrix& P() const { return P_; }
  const GF2::Matrix& P_inv() const { return P_inv_; }

  // S * G * P
  PublicKey publicKey() const;

private:
  Params params_;
  GF2::Matrix S_, S_inv_, P_, P_inv_;
};

struct KeyPair {
  PublicKey publicKey;
  PrivateKey privateKey;
};

// sample S, P and derive the public key for `blocks` blocks of `variant`
KeyPair generateKeyPair(
  Code::Variant variant, size_t blocks, RandomSource& rng = SystemRandom::getInstance()
);

// `weight` distinct uniformly chosen positions out of `n`
BitString sampleError(size_t n, size_t weight, RandomSource& rng);

// encode each k-bit block with the public key and add exactly t errors per block
BitString encrypt(
  const PublicKey& key, const BitString& message, RandomSource& rng = SystemRandom::getInstance()
);

// as above with `weight` errors per block, 0 <= weight <= t
BitString encrypt(
  const PublicKey& key, const BitString& message, RandomSource& rng, size_t weight
);

// what to do when a block cannot be decoded
enum class DecodePolicy {
  // stop at the first failing block
  FailFast,
  // decode every block and report all failures together
  CollectAll
};

struct BlockResult {
  size_t index;
  bool ok;

  // recovered k-bit block (empty if decoding failed)
  BitString message;

  // ciphertext positions (relative to the whole ciphertext) the decoder flipped
  std::set<size_t> corrected;

  // decoder message when `ok` is false
  std::string error;
};

// decrypt every block independently without raising on decoder failure
std::vector<BlockResult> decryptBlocks(const PrivateKey& key, const BitString& ciphertext);

// decrypt a whole ciphertext; decoder failures raise UncorrectableError naming the blocks
BitString decrypt(
  const PrivateKey& key, const BitString& ciphertext,
  DecodePolicy policy = DecodePolicy::FailFast
);

}
