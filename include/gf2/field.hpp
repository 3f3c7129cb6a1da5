#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace GF2 {

// polynomials over GF(2) packed into a word: bit d is the coefficient of x^d
namespace Poly {

// degree of `a`, -1 for the zero polynomial
int degree(uint32_t a);

uint32_t multiply(uint32_t a, uint32_t b);

// remainder of `a` divided by `modulus`
uint32_t mod(uint32_t a, uint32_t modulus);

}

/**
 * the extension field GF(2^m) built from a primitive polynomial of degree m
 *
 * elements are polynomials in alpha of degree < m packed like `Poly` values, so
 * addition is xor; multiplication goes through exp/log tables of alpha
 */
class Field {
public:
  // throws std::invalid_argument unless `modulus` is primitive of degree 2..15
  explicit Field(uint32_t modulus);

  // GF(16) with x^4 + x + 1
  static const Field& GF16() {
    static const Field instance(0x13);
    return instance;
  }

  size_t m() const { return m_; }

  // number of non-zero elements
  size_t order() const { return exp_.size(); }

  uint32_t modulus() const { return modulus_; }

  uint16_t multiply(uint16_t a, uint16_t b) const;
  uint16_t divide(uint16_t a, uint16_t b) const;
  uint16_t inverse(uint16_t a) const;
  uint16_t pow(uint16_t a, int e) const;

  // alpha^i, any integer i
  uint16_t exp(int i) const;

  // i such that alpha^i = a, a != 0
  size_t log(uint16_t a) const;

  // evaluate a GF(2) polynomial at `x`
  uint16_t evaluate(uint32_t poly, uint16_t x) const;

  // minimal polynomial of alpha^i over GF(2)
  uint32_t minimalPolynomial(size_t i) const;

private:
  uint32_t modulus_;
  size_t m_;
  std::vector<uint16_t> exp_;
  std::vector<size_t> log_;

  // throws for elements outside the field
  void check(uint16_t a, const char* where) const;
};

}
