#include <gtest/gtest.h>

#include "gf2/field.hpp"

using namespace GF2;

TEST(PolyTests, Degree) {
  EXPECT_EQ(Poly::degree(0), -1);
  EXPECT_EQ(Poly::degree(1), 0);
  EXPECT_EQ(Poly::degree(0x13), 4);
  EXPECT_EQ(Poly::degree(0x1D1), 8);
}

TEST(PolyTests, MultiplyAndMod) {
  EXPECT_EQ(Poly::multiply(0x13, 0x1F), 0x1D1);
  EXPECT_EQ(Poly::multiply(0x3, 0x3), 0x5);
  EXPECT_EQ(Poly::multiply(0x13, 0), 0);

  EXPECT_EQ(Poly::mod(0x1D1, 0x13), 0);
  EXPECT_EQ(Poly::mod(0x1D1, 0x1F), 0);
  EXPECT_EQ(Poly::mod(0x10, 0x13), 0x3);
  EXPECT_THROW(Poly::mod(0x10, 0), std::domain_error);
  EXPECT_THROW(Poly::multiply(1u << 20, 1u << 20), std::overflow_error);
}

TEST(FieldTests, GF16Tables) {
  const Field& field = Field::GF16();
  EXPECT_EQ(field.m(), 4);
  EXPECT_EQ(field.order(), 15);
  EXPECT_EQ(field.modulus(), 0x13);

  // alpha^4 = alpha + 1
  EXPECT_EQ(field.exp(0), 1);
  EXPECT_EQ(field.exp(1), 2);
  EXPECT_EQ(field.exp(4), 3);
  EXPECT_EQ(field.exp(15), 1);
  EXPECT_EQ(field.exp(-1), 9);

  for (uint16_t a = 1; a < 16; a++) {
    EXPECT_EQ(field.exp(field.log(a)), a);
  }
  EXPECT_THROW(field.log(0), std::domain_error);
  EXPECT_THROW(field.log(16), std::out_of_range);
}

TEST(FieldTests, Arithmetic) {
  const Field& field = Field::GF16();
  for (uint16_t a = 1; a < 16; a++) {
    EXPECT_EQ(field.multiply(a, field.inverse(a)), 1);
    EXPECT_EQ(field.pow(a, 15), 1);
    EXPECT_EQ(field.pow(a, -1), field.inverse(a));
    EXPECT_EQ(field.multiply(a, 0), 0);
    for (uint16_t b = 1; b < 16; b++) {
      EXPECT_EQ(field.divide(field.multiply(a, b), b), a);
    }
  }
  EXPECT_EQ(field.pow(0, 0), 1);
  EXPECT_EQ(field.pow(0, 3), 0);
  EXPECT_THROW(field.inverse(0), std::domain_error);
}

TEST(FieldTests, Evaluate) {
  const Field& field = Field::GF16();
  // alpha is a root of its own modulus
  EXPECT_EQ(field.evaluate(0x13, field.exp(1)), 0);
  EXPECT_NE(field.evaluate(0x13, 1), 0);
  EXPECT_EQ(field.evaluate(0x1, field.exp(7)), 1);
}

TEST(FieldTests, MinimalPolynomials) {
  const Field& field = Field::GF16();
  EXPECT_EQ(field.minimalPolynomial(0), 0x3);
  EXPECT_EQ(field.minimalPolynomial(1), 0x13);
  EXPECT_EQ(field.minimalPolynomial(2), 0x13);
  EXPECT_EQ(field.minimalPolynomial(3), 0x1F);
  EXPECT_EQ(field.minimalPolynomial(5), 0x7);
  EXPECT_EQ(Poly::multiply(field.minimalPolynomial(1), field.minimalPolynomial(3)), 0x1D1);
}

TEST(FieldTests, RejectsNonPrimitive) {
  // x^4 + x^3 + x^2 + x + 1 is irreducible but alpha has order 5
  EXPECT_THROW(Field(0x1F), std::invalid_argument);
  // x^4 + x^2 + 1 = (x^2 + x + 1)^2
  EXPECT_THROW(Field(0x15), std::invalid_argument);
  EXPECT_THROW(Field(0x3), std::invalid_argument);

  Field gf8(0xB);
  EXPECT_EQ(gf8.order(), 7);
}
