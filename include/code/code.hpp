#pragma once

#include <set>
#include <stdexcept>
#include <string>

#include "gf2/matrix.hpp"
#include "util/bitstring.hpp"

namespace Code {

// the two codes the cryptosystem can be instantiated with
enum class Variant { Hamming, BCH };

std::string toString(Variant variant);

// parses "hamming" or "bch" (case insensitive)
Variant parseVariant(const std::string& name);

class Params {
public:
  Params(size_t n, size_t k, size_t t) : n(n), k(k), t(t) {
    if (k == 0 || n <= k) {
      throw std::invalid_argument("[Code::Params] need 0 < k < n");
    }
  }

  // codeword length
  size_t n;

  // message length
  size_t k;

  // number of errors the decoder is guaranteed to correct
  size_t t;

  // ciphertext size over plaintext size
  double expansion() const { return (double) n / k; }

  std::string toString() const {
    return "n = " + std::to_string(n) + ", k = " + std::to_string(k)
      + ", t = " + std::to_string(t);
  }
};

// output of syndrome decoding
struct Decoded {
  BitString codeword;

  // positions that were flipped to reach `codeword`
  std::set<size_t> errors;
};

// abstract binary linear block code with a syndrome decoder
class BlockCode {
public:
  virtual ~BlockCode() { }

  // the fixed instance of each variant
  static const BlockCode& get(Variant variant);

  virtual Variant variant() const = 0;
  virtual const Params& params() const = 0;

  // k x n generator matrix
  virtual const GF2::Matrix& generator() const = 0;

  // (n - k) x n parity-check matrix
  virtual const GF2::Matrix& parityCheck() const = 0;

  // message * G
  BitString encode(const BitString& message) const;

  // H * received^T
  BitString syndrome(const BitString& received) const;

  // correct up to t errors; throws UncorrectableError when no correction is found
  virtual Decoded decode(const BitString& received) const = 0;

  // recover the message from a codeword (the inverse of `encode` on the code)
  virtual BitString extract(const BitString& codeword) const = 0;
};

}
