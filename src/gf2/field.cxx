#include "gf2/field.hpp"

#include <set>
#include <stdexcept>
#include <string>

namespace GF2 {

////////////////////////////////////////////////////////////////////////////////
// BINARY POLYNOMIALS
////////////////////////////////////////////////////////////////////////////////

int Poly::degree(uint32_t a) {
  int d = -1;
  for (; a; a >>= 1) { d++; }
  return d;
}

uint32_t Poly::multiply(uint32_t a, uint32_t b) {
  if (a == 0 || b == 0) { return 0; }
  if (degree(a) + degree(b) > 31) {
    throw std::overflow_error("[GF2::Poly::multiply] product does not fit in 32 bits");
  }

  uint32_t out = 0;
  for (int i = 0; i <= degree(b); i++) {
    if ((b >> i) & 0x01) { out ^= (a << i); }
  }
  return out;
}

uint32_t Poly::mod(uint32_t a, uint32_t modulus) {
  if (modulus == 0) {
    throw std::domain_error("[GF2::Poly::mod] division by the zero polynomial");
  }
  const int d = degree(modulus);
  for (int da = degree(a); da >= d; da = degree(a)) {
    a ^= (modulus << (da - d));
  }
  return a;
}

////////////////////////////////////////////////////////////////////////////////
// EXTENSION FIELD
////////////////////////////////////////////////////////////////////////////////

Field::Field(uint32_t modulus) : modulus_(modulus), m_(0) {
  int d = Poly::degree(modulus);
  if (d < 2 || d > 15) {
    throw std::invalid_argument(
      "[GF2::Field] modulus degree " + std::to_string(d) + " outside of [2, 15]"
    );
  }
  m_ = d;

  const size_t order = (size_t(1) << m_) - 1;
  exp_.resize(order);
  log_.assign(order + 1, order);

  // walk the powers of alpha; a primitive modulus visits every non-zero element once
  uint32_t a = 1;
  for (size_t i = 0; i < order; i++) {
    if (log_[a] != order) {
      throw std::invalid_argument("[GF2::Field] modulus is not primitive");
    }
    exp_[i] = a;
    log_[a] = i;

    a <<= 1;
    if (a & (uint32_t(1) << m_)) { a ^= modulus; }
  }
  if (a != 1) {
    throw std::invalid_argument("[GF2::Field] modulus is not primitive");
  }
}

void Field::check(uint16_t a, const char* where) const {
  if (a > this->order()) {
    throw std::out_of_range(
      std::string("[GF2::Field::") + where + "] " + std::to_string(a) + " is not in GF(2^"
      + std::to_string(m_) + ")"
    );
  }
}

uint16_t Field::multiply(uint16_t a, uint16_t b) const {
  check(a, "multiply");
  check(b, "multiply");
  if (a == 0 || b == 0) { return 0; }
  return exp_[(log_[a] + log_[b]) % order()];
}

uint16_t Field::divide(uint16_t a, uint16_t b) const {
  check(a, "divide");
  check(b, "divide");
  if (b == 0) {
    throw std::domain_error("[GF2::Field::divide] division by zero");
  }
  if (a == 0) { return 0; }
  return exp_[(log_[a] + order() - log_[b]) % order()];
}

uint16_t Field::inverse(uint16_t a) const {
  return divide(1, a);
}

uint16_t Field::pow(uint16_t a, int e) const {
  check(a, "pow");
  if (a == 0) {
    if (e < 0) { throw std::domain_error("[GF2::Field::pow] zero to a negative power"); }
    return e == 0 ? 1 : 0;
  }
  return exp((long long) log_[a] * e % (long long) order());
}

uint16_t Field::exp(int i) const {
  const int n = (int) order();
  return exp_[((i % n) + n) % n];
}

size_t Field::log(uint16_t a) const {
  check(a, "log");
  if (a == 0) {
    throw std::domain_error("[GF2::Field::log] log of zero");
  }
  return log_[a];
}

uint16_t Field::evaluate(uint32_t poly, uint16_t x) const {
  uint16_t result = 0;
  for (int d = Poly::degree(poly); d >= 0; d--) {
    result = multiply(result, x) ^ ((poly >> d) & 0x01);
  }
  return result;
}

uint32_t Field::minimalPolynomial(size_t i) const {
  // the conjugates of alpha^i are alpha^(i * 2^s)
  std::set<size_t> coset;
  for (size_t j = i % order(); coset.insert(j).second; j = (2 * j) % order()) { }

  // multiply out the product of (x + beta) with coefficients in the field
  std::vector<uint16_t> coeffs = {1};
  for (size_t j : coset) {
    uint16_t beta = exp_[j];
    std::vector<uint16_t> next(coeffs.size() + 1, 0);
    for (size_t d = 0; d < coeffs.size(); d++) {
      next[d + 1] ^= coeffs[d];
      next[d] ^= multiply(beta, coeffs[d]);
    }
    coeffs = next;
  }

  uint32_t out = 0;
  for (size_t d = 0; d < coeffs.size(); d++) {
    if (coeffs[d] > 1) {
      throw std::logic_error("[GF2::Field::minimalPolynomial] coefficient outside GF(2)");
    }
    out |= (uint32_t) coeffs[d] << d;
  }
  return out;
}

}
