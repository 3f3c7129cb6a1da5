#include <gtest/gtest.h>

// allows us to test private methods
#define protected public
#define private public

#include "code/bch.hpp"
#include "util/errors.hpp"
#include "test/fixtures.cxx"

using namespace Code;

class BCHTests : public SeededTest {
protected:
  const BCH& code = BCH::getInstance();
};

TEST_F(BCHTests, Params) {
  EXPECT_EQ(code.params().n, 15);
  EXPECT_EQ(code.params().k, 7);
  EXPECT_EQ(code.params().t, 2);
  EXPECT_EQ(code.variant(), Variant::BCH);
  EXPECT_EQ(&BlockCode::get(Variant::BCH), &code);
}

TEST_F(BCHTests, GeneratorPolynomial) {
  // x^8 + x^7 + x^6 + x^4 + 1
  EXPECT_EQ(code.generatorPolynomial(), 0x1D1);
}

TEST_F(BCHTests, GeneratorIsOrthogonal) {
  const GF2::Matrix& G = code.generator();
  const GF2::Matrix& H = code.parityCheck();
  ASSERT_EQ(G.dim(), (std::make_pair<size_t, size_t>(7, 15)));
  ASSERT_EQ(H.dim(), (std::make_pair<size_t, size_t>(8, 15)));
  EXPECT_EQ(G * H.transpose(), GF2::Matrix(7, 8));
  EXPECT_EQ(G.rank(), 7);
  EXPECT_EQ(H.rank(), 8);
}

TEST_F(BCHTests, Encode) {
  // the last message bit selects g(x) itself
  EXPECT_EQ(code.encode(BitString("0000001")), BitString("000000111010001"));
  EXPECT_EQ(code.encode(BitString(7)), BitString(15));
}

TEST_F(BCHTests, EncodeIsSystematic) {
  for (uint32_t m = 0; m < (1u << 7); m++) {
    BitString message = BitString::fromUInt(m, 7);
    BitString codeword = code.encode(message);

    EXPECT_EQ((codeword[{0, 7}]), message);
    EXPECT_EQ(code.extract(codeword), message);
    EXPECT_EQ(code.syndrome(codeword).weight(), 0);
    EXPECT_EQ(code.syndromes(codeword), (std::make_pair<uint16_t, uint16_t>(0, 0)));
  }
}

TEST_F(BCHTests, WrongSize) {
  EXPECT_THROW(code.decode(BitString(14)), DimensionMismatch);
  EXPECT_THROW(code.extract(BitString(16)), DimensionMismatch);
  EXPECT_THROW(code.encode(BitString(8)), DimensionMismatch);
}

TEST_F(BCHTests, CorrectsEverySingleAndDoubleError) {
  for (uint32_t m = 0; m < (1u << 7); m++) {
    BitString message = BitString::fromUInt(m, 7);
    BitString codeword = code.encode(message);

    for (size_t a = 0; a < 15; a++) {
      Decoded decoded = code.decode(flip(codeword, {a}));
      ASSERT_EQ(decoded.codeword, codeword) << "message " << message << ", error at " << a;
      ASSERT_EQ(decoded.errors, std::set<size_t>({a}));

      for (size_t b = a + 1; b < 15; b++) {
        decoded = code.decode(flip(codeword, {a, b}));
        ASSERT_EQ(decoded.codeword, codeword)
          << "message " << message << ", errors at " << a << ", " << b;
        ASSERT_EQ(decoded.errors, std::set<size_t>({a, b}));
        ASSERT_EQ(code.extract(decoded.codeword), message);
      }
    }
  }
}

TEST_F(BCHTests, RandomDoubleErrors) {
  BitString message("1100110");
  BitString codeword = code.encode(message);
  for (int i = 0; i < 1000; i++) {
    std::vector<uint32_t> positions = sampleDistinct(2, 15, rng);
    Decoded decoded = code.decode(flip(codeword, {positions[0], positions[1]}));
    ASSERT_EQ(code.extract(decoded.codeword), message);
  }
}

TEST_F(BCHTests, TripleErrorsAreNeverSilentlyRight) {
  BitString codeword = code.encode(BitString("1100110"));

  size_t raised = 0, miscorrected = 0;
  for (size_t a = 0; a < 15; a++) {
    for (size_t b = a + 1; b < 15; b++) {
      for (size_t c = b + 1; c < 15; c++) {
        try {
          Decoded decoded = code.decode(flip(codeword, {a, b, c}));
          // distance 5 puts any other decoding on a different codeword
          EXPECT_NE(decoded.codeword, codeword);
          EXPECT_EQ(code.syndrome(decoded.codeword).weight(), 0);
          miscorrected++;
        } catch (const UncorrectableError&) {
          raised++;
        }
      }
    }
  }
  EXPECT_EQ(raised + miscorrected, 455);
  EXPECT_GT(raised, 0);
  EXPECT_GT(miscorrected, 0);
}

TEST_F(BCHTests, SyndromesOfSingleError) {
  // an error at position p has locator alpha^(14 - p)
  const GF2::Field& field = GF2::Field::GF16();
  for (size_t p = 0; p < 15; p++) {
    BitString error = BitString::fromSupport({p}, 15);
    auto s = code.syndromes(error);
    EXPECT_EQ(s.first, field.exp(14 - p));
    EXPECT_EQ(s.second, field.pow(s.first, 3));
  }
}

TEST_F(BCHTests, ChienSearch) {
  const GF2::Field& field = GF2::Field::GF16();
  // locators alpha^(14 - 3) and alpha^(14 - 9) give sigma1 = X1 + X2, sigma2 = X1 X2
  uint16_t x1 = field.exp(11), x2 = field.exp(5);
  EXPECT_EQ(code.chienSearch(x1 ^ x2, field.multiply(x1, x2)), std::set<size_t>({3, 9}));

  // 1 + alpha x vanishes only at alpha^-1, the locator of position 13
  EXPECT_EQ(code.chienSearch(field.exp(1), 0), std::set<size_t>({13}));
}

TEST_F(BCHTests, ToPolynomial) {
  EXPECT_EQ(code.toPolynomial(BitString("000000111010001")), 0x1D1);
  EXPECT_EQ(code.toPolynomial(BitString::fromSupport({0}, 15)), 1u << 14);
}
