#include "pkg/mceliece.hpp"

#include <stdexcept>

#include "util/concurrency.hpp"
#include "util/defines.hpp"
#include "util/errors.hpp"

namespace McEliece {

////////////////////////////////////////////////////////////////////////////////
// PARAMETERS & KEYS
////////////////////////////////////////////////////////////////////////////////

Params::Params(Code::Variant variant, size_t blocks) : variant(variant), blocks(blocks) {
  if (blocks == 0) {
    throw std::invalid_argument("[McEliece::Params] need at least one block");
  }
  if (blocks > MAX_BLOCKS) {
    throw std::invalid_argument(
      "[McEliece::Params] " + std::to_string(blocks) + " blocks exceeds the limit of "
      + std::to_string(MAX_BLOCKS)
    );
  }
}

std::string Params::toString() const {
  return "[" + Code::toString(variant) + "] " + code().params().toString()
    + ", L = " + std::to_string(blocks);
}

PublicKey::PublicKey(const Params& params, const GF2::Matrix& matrix)
  : params_(params), G_pub(matrix)
{
  const Code::Params& code = params.code().params();
  if (matrix.dim() != std::make_pair(code.k, code.n)) {
    throw DimensionMismatch("[McEliece::PublicKey] matrix is not k x n");
  }
}

PrivateKey::PrivateKey(
  const Params& params,
  const GF2::Matrix& S, const GF2::Matrix& S_inv,
  const GF2::Matrix& P, const GF2::Matrix& P_inv
) : params_(params), S_(S), S_inv_(S_inv), P_(P), P_inv_(P_inv)
{
  const Code::Params& code = params.code().params();
  if (S.dim() != std::make_pair(code.k, code.k) || S_inv.dim() != S.dim()) {
    throw DimensionMismatch("[McEliece::PrivateKey] scrambling matrix is not k x k");
  }
  if (P.dim() != std::make_pair(code.n, code.n) || P_inv.dim() != P.dim()) {
    throw DimensionMismatch("[McEliece::PrivateKey] permutation matrix is not n x n");
  }

  // decryption reads error positions off the rows of P
  for (size_t i = 0; i < code.n; i++) {
    if (P[i].weight() != 1 || P.column(i).weight() != 1) {
      throw std::invalid_argument("[McEliece::PrivateKey] P is not a permutation matrix");
    }
  }
  if (!(S * S_inv).isIdentity()) {
    throw std::invalid_argument("[McEliece::PrivateKey] S_inv is not the inverse of S");
  }
  if (!(P * P_inv).isIdentity()) {
    throw std::invalid_argument("[McEliece::PrivateKey] P_inv is not the inverse of P");
  }
}

PublicKey PrivateKey::publicKey() const {
  return PublicKey(params_, S_ * code().generator() * P_);
}

////////////////////////////////////////////////////////////////////////////////
// KEY GENERATION
////////////////////////////////////////////////////////////////////////////////

KeyPair generateKeyPair(Code::Variant variant, size_t blocks, RandomSource& rng) {
  Params params(variant, blocks);
  const Code::Params& code = params.code().params();

  auto [S, S_inv] = GF2::Matrix::sampleInvertible(code.k, rng);
  GF2::Matrix P = GF2::Matrix::samplePermutation(code.n, rng);

  // permutation matrices are orthogonal
  PrivateKey privateKey(params, S, S_inv, P, P.transpose());
  return KeyPair{privateKey.publicKey(), privateKey};
}

////////////////////////////////////////////////////////////////////////////////
// ENCRYPTION
////////////////////////////////////////////////////////////////////////////////

BitString sampleError(size_t n, size_t weight, RandomSource& rng) {
  BitString error(n);
  for (uint32_t pos : sampleDistinct(weight, n, rng)) { error[pos] = true; }
  return error;
}

BitString encrypt(const PublicKey& key, const BitString& message, RandomSource& rng) {
  return encrypt(key, message, rng, key.t());
}

BitString encrypt(
  const PublicKey& key, const BitString& message, RandomSource& rng, size_t weight
) {
  const Params& params = key.params();
  const size_t n = params.code().params().n, k = params.code().params().k;

  if (weight > key.t()) {
    throw std::invalid_argument(
      "[McEliece::encrypt] " + std::to_string(weight) + " errors per block exceeds t = "
      + std::to_string(key.t())
    );
  }
  if (message.size() != params.messageSize()) {
    throw InvalidMessageLength(
      "[McEliece::encrypt] message of " + std::to_string(message.size()) + " bits, expected "
      + std::to_string(params.blocks) + " x " + std::to_string(k)
    );
  }

  std::vector<BitString> ciphertext;
  for (const BitString& block : message.split(k)) {
    ciphertext.push_back(key.matrix().leftMultiply(block) ^ sampleError(n, weight, rng));
  }
  return BitString::concat(ciphertext);
}

////////////////////////////////////////////////////////////////////////////////
// DECRYPTION
////////////////////////////////////////////////////////////////////////////////

namespace {

void checkCiphertext(const PrivateKey& key, const BitString& ciphertext, const char* where) {
  const Params& params = key.params();
  if (ciphertext.size() != params.ciphertextSize()) {
    throw InvalidMessageLength(
      std::string("[McEliece::") + where + "] ciphertext of " + std::to_string(ciphertext.size())
      + " bits, expected " + std::to_string(params.blocks) + " x "
      + std::to_string(params.code().params().n)
    );
  }
}

// un-permute, decode, drop the redundancy and unscramble one block
BlockResult decryptBlock(const PrivateKey& key, const BitString& block, size_t index) {
  const Code::BlockCode& code = key.code();
  BlockResult result{index, false, BitString(), {}, ""};

  BitString unpermuted = key.P_inv().leftMultiply(block);
  try {
    Code::Decoded decoded = code.decode(unpermuted);
    result.message = key.S_inv().leftMultiply(code.extract(decoded.codeword));

    // code position j came from ciphertext position perm(j), the 1 in row j of P
    for (size_t pos : decoded.errors) {
      result.corrected.insert(index * code.params().n + *key.P()[pos].support().begin());
    }
    result.ok = true;
  } catch (const UncorrectableError& ex) {
    result.error = ex.what();
  }
  return result;
}

}

std::vector<BlockResult> decryptBlocks(const PrivateKey& key, const BitString& ciphertext) {
  checkCiphertext(key, ciphertext, "decryptBlocks");

  std::vector<BitString> blocks = ciphertext.split(key.code().params().n);
  std::vector<BlockResult> results(blocks.size());

  // blocks are independent; each task only writes its own slots
  MULTI_TASK([&](size_t start, size_t end) {
    for (size_t i = start; i < end; i++) {
      results[i] = decryptBlock(key, blocks[i], i);
    }
  }, blocks.size());

  return results;
}

BitString decrypt(const PrivateKey& key, const BitString& ciphertext, DecodePolicy policy) {
  checkCiphertext(key, ciphertext, "decrypt");

  std::vector<BitString> message;
  if (policy == DecodePolicy::FailFast) {
    std::vector<BitString> blocks = ciphertext.split(key.code().params().n);
    for (size_t i = 0; i < blocks.size(); i++) {
      BlockResult result = decryptBlock(key, blocks[i], i);
      if (!result.ok) {
        throw UncorrectableError(
          "[McEliece::decrypt] block " + std::to_string(i) + ": " + result.error, {i}
        );
      }
      message.push_back(result.message);
    }
    return BitString::concat(message);
  }

  std::vector<size_t> failed;
  for (const BlockResult& result : decryptBlocks(key, ciphertext)) {
    if (result.ok) {
      message.push_back(result.message);
    } else {
      failed.push_back(result.index);
    }
  }

  if (!failed.empty()) {
    std::string list;
    for (size_t i : failed) { list += (list.empty() ? "" : ", ") + std::to_string(i); }
    throw UncorrectableError(
      "[McEliece::decrypt] " + std::to_string(failed.size()) + " of "
      + std::to_string(key.params().blocks) + " blocks failed (" + list + ")", failed
    );
  }
  return BitString::concat(message);
}

}
