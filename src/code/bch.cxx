#include "code/bch.hpp"

#include <stdexcept>
#include <tuple>

#include "util/errors.hpp"

namespace Code {

BCH::BCH() : field(GF2::Field::GF16()), params_(15, 7, 2) {
  const size_t n = params_.n, k = params_.k;

  g = GF2::Poly::multiply(field.minimalPolynomial(1), field.minimalPolynomial(3));
  if ((size_t) GF2::Poly::degree(g) != n - k) {
    throw std::logic_error("[Code::BCH] generator polynomial has the wrong degree");
  }

  // row i encodes x^(n - 1 - i): the monomial itself plus its remainder mod g
  G = GF2::Matrix(k, n);
  for (size_t i = 0; i < k; i++) {
    uint32_t monomial = uint32_t(1) << (n - 1 - i);
    uint32_t codeword = monomial | GF2::Poly::mod(monomial, g);
    for (size_t j = 0; j < n; j++) {
      G.set({i, j}, (codeword >> (n - 1 - j)) & 0x01);
    }
  }

  // G = [I | P] so H = [P^T | I]
  H = GF2::Matrix(n - k, n);
  for (size_t row = 0; row < n - k; row++) {
    for (size_t col = 0; col < k; col++) {
      H.set({row, col}, G[{col, k + row}]);
    }
    H.set({row, k + row}, true);
  }
}

uint32_t BCH::toPolynomial(const BitString& word) const {
  if (word.size() != params_.n) {
    throw DimensionMismatch(
      "[Code::BCH] word of size " + std::to_string(word.size()) + " (expected "
      + std::to_string(params_.n) + ")"
    );
  }
  uint32_t poly = 0;
  for (size_t j = 0; j < params_.n; j++) {
    if (word[j]) { poly |= uint32_t(1) << (params_.n - 1 - j); }
  }
  return poly;
}

std::pair<uint16_t, uint16_t> BCH::syndromes(const BitString& received) const {
  uint32_t r = toPolynomial(received);
  return std::make_pair(field.evaluate(r, field.exp(1)), field.evaluate(r, field.exp(3)));
}

std::set<size_t> BCH::chienSearch(uint16_t sigma1, uint16_t sigma2) const {
  std::set<size_t> positions;

  // sigma(x) = 1 + sigma1 x + sigma2 x^2 vanishes at the inverse of each error locator
  for (size_t d = 0; d < params_.n; d++) {
    uint16_t x = field.exp(-(int) d);
    uint16_t value = 1 ^ field.multiply(sigma1, x) ^ field.multiply(sigma2, field.multiply(x, x));
    if (value == 0) { positions.insert(params_.n - 1 - d); }
  }
  return positions;
}

Decoded BCH::decode(const BitString& received) const {
  uint16_t s1, s3;
  std::tie(s1, s3) = this->syndromes(received);

  Decoded out{received, {}};
  if (s1 == 0 && s3 == 0) { return out; }

  if (s1 == 0) {
    throw UncorrectableError("[Code::BCH::decode] S1 = 0 with S3 != 0, more than 2 errors");
  }

  uint16_t s1_cubed = field.pow(s1, 3);
  if (s3 == s1_cubed) {
    // a single error with locator S1
    out.errors.insert(params_.n - 1 - field.log(s1));
  } else {
    uint16_t sigma2 = field.divide(s3 ^ s1_cubed, s1);
    out.errors = this->chienSearch(s1, sigma2);
    if (out.errors.size() != 2) {
      throw UncorrectableError(
        "[Code::BCH::decode] locator polynomial has " + std::to_string(out.errors.size())
        + " roots, expected 2"
      );
    }
  }

  for (size_t pos : out.errors) { out.codeword[pos] ^= true; }

  // the correction has to land on a codeword
  std::pair<uint16_t, uint16_t> check = this->syndromes(out.codeword);
  if (check.first != 0 || check.second != 0) {
    throw UncorrectableError("[Code::BCH::decode] correction does not yield a codeword");
  }
  return out;
}

BitString BCH::extract(const BitString& codeword) const {
  if (codeword.size() != params_.n) {
    throw DimensionMismatch(
      "[Code::BCH::extract] codeword of size " + std::to_string(codeword.size())
    );
  }
  return codeword[{0, params_.k}];
}

}
