#include "gf2/matrix.hpp"

#include <set>
#include <stdexcept>

#include "util/defines.hpp"
#include "util/errors.hpp"

namespace GF2 {

////////////////////////////////////////////////////////////////////////////////
// CONSTRUCTION
////////////////////////////////////////////////////////////////////////////////

Matrix::Matrix(const std::vector<BitString>& rows)
  : width(rows.empty() ? 0 : rows[0].size()), rows(rows)
{
  for (const BitString& row : rows) {
    if (row.size() != this->width) {
      throw DimensionMismatch(
        "[GF2::Matrix] ragged rows (" + std::to_string(row.size()) + " vs. "
        + std::to_string(this->width) + ")"
      );
    }
  }
}

Matrix Matrix::fromStrings(const std::vector<std::string>& rows) {
  std::vector<BitString> bits;
  for (const std::string& row : rows) { bits.emplace_back(row); }
  return Matrix(bits);
}

Matrix Matrix::identity(size_t size) {
  Matrix out(size, size);
  for (size_t i = 0; i < size; i++) { out.rows[i][i] = true; }
  return out;
}

Matrix Matrix::permutation(const std::vector<uint32_t>& perm) {
  std::set<uint32_t> seen(perm.begin(), perm.end());
  if (seen.size() != perm.size() || (!perm.empty() && *seen.rbegin() >= perm.size())) {
    throw std::invalid_argument("[GF2::Matrix::permutation] input is not a permutation");
  }

  Matrix out(perm.size(), perm.size());
  for (size_t i = 0; i < perm.size(); i++) { out.rows[i][perm[i]] = true; }
  return out;
}

Matrix Matrix::sample(size_t height, size_t width, RandomSource& rng) {
  Matrix out(height, width);
  for (BitString& row : out.rows) { row = rng.bits(width); }
  return out;
}

std::pair<Matrix, Matrix> Matrix::sampleInvertible(size_t size, RandomSource& rng) {
  for (size_t attempt = 0; attempt < MAX_SAMPLE_ATTEMPTS; attempt++) {
    Matrix candidate = Matrix::sample(size, size, rng);
    try {
      Matrix inverse = candidate.inverse();
      return std::make_pair(candidate, inverse);
    } catch (const SingularMatrix&) {
      // singular, draw again
    }
  }
  throw std::runtime_error(
    "[GF2::Matrix::sampleInvertible] no invertible " + std::to_string(size) + "x"
    + std::to_string(size) + " matrix after " + std::to_string(MAX_SAMPLE_ATTEMPTS) + " attempts"
  );
}

Matrix Matrix::samplePermutation(size_t size, RandomSource& rng) {
  return Matrix::permutation(::samplePermutation(size, rng));
}

////////////////////////////////////////////////////////////////////////////////
// ACCESS
////////////////////////////////////////////////////////////////////////////////

bool Matrix::operator[](std::pair<size_t, size_t> idx) const {
  if (idx.first >= this->rows.size() || idx.second >= this->width) {
    throw std::out_of_range("[GF2::Matrix::operator[](std::pair)] idx out of range");
  }
  return this->rows[idx.first][idx.second];
}

void Matrix::set(std::pair<size_t, size_t> idx, bool value) {
  if (idx.first >= this->rows.size() || idx.second >= this->width) {
    throw std::out_of_range("[GF2::Matrix::set] idx out of range");
  }
  this->rows[idx.first][idx.second] = value;
}

const BitString& Matrix::operator[](size_t idx) const {
  if (idx >= this->rows.size()) {
    throw std::out_of_range("[GF2::Matrix::operator[](size_t)] idx out of range");
  }
  return this->rows[idx];
}

BitString Matrix::column(size_t idx) const {
  if (idx >= this->width) {
    throw std::out_of_range("[GF2::Matrix::column] idx out of range");
  }
  BitString out(this->rows.size());
  for (size_t i = 0; i < this->rows.size(); i++) { out[i] = this->rows[i][idx]; }
  return out;
}

////////////////////////////////////////////////////////////////////////////////
// ARITHMETIC
////////////////////////////////////////////////////////////////////////////////

Matrix Matrix::operator*(const Matrix& other) const {
  if (this->width != other.rows.size()) {
    throw DimensionMismatch(
      "[GF2::Matrix::operator*(Matrix)] " + std::to_string(this->rows.size()) + "x"
      + std::to_string(this->width) + " times " + std::to_string(other.rows.size()) + "x"
      + std::to_string(other.width)
    );
  }

  // row i of the product is row i of this matrix multiplied into `other`
  Matrix out(this->rows.size(), other.width);
  for (size_t i = 0; i < this->rows.size(); i++) {
    out.rows[i] = other.leftMultiply(this->rows[i]);
  }
  return out;
}

BitString Matrix::operator*(const BitString& other) const {
  if (this->width != other.size()) {
    throw DimensionMismatch(
      "[GF2::Matrix::operator*(BitString)] vector of size " + std::to_string(other.size())
      + " against width " + std::to_string(this->width)
    );
  }
  BitString result(this->rows.size());
  for (size_t i = 0; i < this->rows.size(); i++) {
    result[i] = this->rows[i] * other;
  }
  return result;
}

BitString Matrix::leftMultiply(const BitString& vector) const {
  if (this->rows.size() != vector.size()) {
    throw DimensionMismatch(
      "[GF2::Matrix::leftMultiply] vector of size " + std::to_string(vector.size())
      + " against height " + std::to_string(this->rows.size())
    );
  }
  BitString result(this->width);
  for (size_t i = 0; i < this->rows.size(); i++) {
    if (vector[i]) { result ^= this->rows[i]; }
  }
  return result;
}

Matrix Matrix::operator^(const Matrix& other) const {
  if (this->dim() != other.dim()) {
    throw DimensionMismatch("[GF2::Matrix::operator^] dimension mismatch");
  }
  Matrix out(*this);
  for (size_t i = 0; i < out.rows.size(); i++) { out.rows[i] ^= other.rows[i]; }
  return out;
}

bool Matrix::operator==(const Matrix& other) const {
  return this->width == other.width && this->rows == other.rows;
}

Matrix Matrix::transpose() const {
  Matrix out(this->width, this->rows.size());
  for (size_t i = 0; i < this->rows.size(); i++) {
    for (size_t j = 0; j < this->width; j++) {
      if (this->rows[i][j]) { out.rows[j][i] = true; }
    }
  }
  return out;
}

////////////////////////////////////////////////////////////////////////////////
// ELIMINATION
////////////////////////////////////////////////////////////////////////////////

size_t Matrix::rank() const {
  std::vector<BitString> work(this->rows);

  size_t rank = 0;
  for (size_t col = 0; col < this->width && rank < work.size(); col++) {
    size_t pivot = rank;
    while (pivot < work.size() && !work[pivot][col]) { pivot++; }
    if (pivot == work.size()) { continue; }

    std::swap(work[rank], work[pivot]);
    for (size_t i = rank + 1; i < work.size(); i++) {
      if (work[i][col]) { work[i] ^= work[rank]; }
    }
    rank++;
  }
  return rank;
}

Matrix Matrix::inverse() const {
  const size_t size = this->rows.size();
  if (size != this->width) {
    throw DimensionMismatch(
      "[GF2::Matrix::inverse] " + std::to_string(size) + "x" + std::to_string(this->width)
      + " matrix is not square"
    );
  }

  // reduce [A | I] to [I | A^-1]
  std::vector<BitString> work(this->rows);
  Matrix out = Matrix::identity(size);

  for (size_t col = 0; col < size; col++) {
    size_t pivot = col;
    while (pivot < size && !work[pivot][col]) { pivot++; }
    if (pivot == size) {
      throw SingularMatrix(
        "[GF2::Matrix::inverse] rank " + std::to_string(this->rank()) + " < "
        + std::to_string(size)
      );
    }

    std::swap(work[col], work[pivot]);
    std::swap(out.rows[col], out.rows[pivot]);

    // back-substitution is folded in by clearing the column above the pivot as well
    for (size_t i = 0; i < size; i++) {
      if (i != col && work[i][col]) {
        work[i] ^= work[col];
        out.rows[i] ^= out.rows[col];
      }
    }
  }
  return out;
}

Matrix Matrix::blockDiagonal(size_t blocks) const {
  const size_t height = this->rows.size();
  Matrix out(blocks * height, blocks * this->width);
  for (size_t b = 0; b < blocks; b++) {
    for (size_t i = 0; i < height; i++) {
      for (size_t j = 0; j < this->width; j++) {
        if (this->rows[i][j]) { out.rows[b * height + i][b * this->width + j] = true; }
      }
    }
  }
  return out;
}

}
