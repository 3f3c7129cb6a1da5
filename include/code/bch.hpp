#pragma once

#include <cstdint>
#include <utility>

#include "code/code.hpp"
#include "gf2/field.hpp"

namespace Code {

/**
 * the binary (15, 7) BCH code with designed distance 5
 *
 * g(x) is the product of the minimal polynomials of alpha and alpha^3 over
 * GF(16) = GF(2)[x] / (x^4 + x + 1), which gives x^8 + x^7 + x^6 + x^4 + 1.
 * bit j of a codeword is the coefficient of x^(14 - j); encoding is systematic
 * with the message in positions 0..6 followed by the remainder of m(x) x^8 mod
 * g(x).
 *
 * decoding computes S1 = r(alpha) and S3 = r(alpha^3), solves the two-error
 * locator polynomial and finds its roots by chien search. three or more errors
 * either decode to a wrong codeword or raise UncorrectableError.
 */
class BCH : public BlockCode {
public:
  static const BCH& getInstance() {
    static const BCH instance;
    return instance;
  }

  Variant variant() const override { return Variant::BCH; }
  const Params& params() const override { return params_; }
  const GF2::Matrix& generator() const override { return G; }
  const GF2::Matrix& parityCheck() const override { return H; }

  Decoded decode(const BitString& received) const override;
  BitString extract(const BitString& codeword) const override;

  // g(x) packed as a GF(2) polynomial
  uint32_t generatorPolynomial() const { return g; }

  // (S1, S3) over GF(16)
  std::pair<uint16_t, uint16_t> syndromes(const BitString& received) const;

private:
  BCH();

  // word as a GF(2) polynomial, bit j becomes the coefficient of x^(n - 1 - j)
  uint32_t toPolynomial(const BitString& word) const;

  // codeword positions of the roots of the locator polynomial
  std::set<size_t> chienSearch(uint16_t sigma1, uint16_t sigma2) const;

  const GF2::Field& field;
  Params params_;
  uint32_t g;
  GF2::Matrix G;
  GF2::Matrix H;
};

}
