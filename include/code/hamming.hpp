#pragma once

#include <vector>

#include "code/code.hpp"

namespace Code {

/**
 * the (15, 11) hamming code
 *
 * column i of H is the binary representation of i + 1 (bit j in row j), so a
 * non-zero syndrome read as a number is the 1-based position of a single error.
 * parity bits sit at the power-of-two positions 1, 2, 4, 8 (1-based) and the
 * message fills the remaining positions in order.
 *
 * any error of weight >= 2 produces some non-zero syndrome and is "corrected"
 * to a wrong codeword without notice.
 */
class Hamming : public BlockCode {
public:
  static const Hamming& getInstance() {
    static const Hamming instance;
    return instance;
  }

  Variant variant() const override { return Variant::Hamming; }
  const Params& params() const override { return params_; }
  const GF2::Matrix& generator() const override { return G; }
  const GF2::Matrix& parityCheck() const override { return H; }

  Decoded decode(const BitString& received) const override;
  BitString extract(const BitString& codeword) const override;

  // 0-based codeword positions holding the message bits
  const std::vector<size_t>& dataPositions() const { return data; }

private:
  Hamming();

  Params params_;
  GF2::Matrix G;
  GF2::Matrix H;
  std::vector<size_t> data;
};

}
