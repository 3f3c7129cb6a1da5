#include "code/hamming.hpp"

#include "util/errors.hpp"

namespace Code {

Hamming::Hamming() : params_(15, 11, 1) {
  const size_t n = params_.n, r = params_.n - params_.k;

  H = GF2::Matrix(r, n);
  for (size_t i = 0; i < n; i++) {
    for (size_t j = 0; j < r; j++) {
      H.set({j, i}, ((i + 1) >> j) & 0x01);
    }
  }

  // message bits go wherever the 1-based position is not a power of two
  for (size_t pos = 1; pos <= n; pos++) {
    if (pos & (pos - 1)) { data.push_back(pos - 1); }
  }

  // each parity bit 2^j covers the positions with bit j set
  G = GF2::Matrix(params_.k, n);
  for (size_t row = 0; row < data.size(); row++) {
    size_t pos = data[row] + 1;
    G.set({row, data[row]}, true);
    for (size_t j = 0; j < r; j++) {
      if ((pos >> j) & 0x01) { G.set({row, (size_t(1) << j) - 1}, true); }
    }
  }
}

Decoded Hamming::decode(const BitString& received) const {
  BitString s = this->syndrome(received);
  Decoded out{received, {}};
  if (s.weight() == 0) { return out; }

  // locate the column of H equal to the syndrome
  for (size_t col = 0; col < params_.n; col++) {
    if (H.column(col) == s) {
      out.codeword[col] ^= true;
      out.errors.insert(col);
      return out;
    }
  }

  throw UncorrectableError(
    "[Code::Hamming::decode] syndrome " + s.toString() + " matches no column of H"
  );
}

BitString Hamming::extract(const BitString& codeword) const {
  if (codeword.size() != params_.n) {
    throw DimensionMismatch(
      "[Code::Hamming::extract] codeword of size " + std::to_string(codeword.size())
    );
  }
  BitString message(params_.k);
  for (size_t i = 0; i < data.size(); i++) {
    message[i] = codeword[data[i]];
  }
  return message;
}

}
