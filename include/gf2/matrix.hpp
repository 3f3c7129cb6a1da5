#pragma once

#include <string>
#include <utility>
#include <vector>

#include "util/bitstring.hpp"
#include "util/random.hpp"

namespace GF2 {

// dense binary matrix stored as a vector of rows; all arithmetic is mod 2
class Matrix {
public:
  Matrix() : width(0) { }

  // all-zero matrix
  Matrix(size_t height, size_t width) : width(width), rows(height, BitString(width)) { }

  // every row must have the same length
  explicit Matrix(const std::vector<BitString>& rows);

  // rows given as strings of '0' and '1' (for constants & testing)
  static Matrix fromStrings(const std::vector<std::string>& rows);

  static Matrix identity(size_t size);

  // permutation matrix sending position i to position perm[i] (row i has its 1 in column perm[i])
  static Matrix permutation(const std::vector<uint32_t>& perm);

  // uniformly random matrix
  static Matrix sample(size_t height, size_t width, RandomSource& rng);

  // resample until invertible; returns the matrix together with its inverse
  static std::pair<Matrix, Matrix> sampleInvertible(size_t size, RandomSource& rng);

  // uniformly random permutation matrix
  static Matrix samplePermutation(size_t size, RandomSource& rng);

  // element access
  bool operator[](std::pair<size_t, size_t> idx) const;
  void set(std::pair<size_t, size_t> idx, bool value);

  // retrieve an entire row as a bitstring
  const BitString& operator[](size_t idx) const;

  // retrieve an entire column as a bitstring
  BitString column(size_t idx) const;

  // (height, width)
  std::pair<size_t, size_t> dim() const { return std::make_pair(rows.size(), width); }

  // matrix product
  Matrix operator*(const Matrix& other) const;

  // product with a column vector, i.e. M * v^T
  BitString operator*(const BitString& other) const;

  // product of a row vector with this matrix, i.e. v * M
  BitString leftMultiply(const BitString& vector) const;

  Matrix operator^(const Matrix& other) const;

  bool operator==(const Matrix& other) const;
  bool operator!=(const Matrix& other) const { return !this->operator==(other); }

  Matrix transpose() const;

  // rank over GF(2) via gaussian elimination
  size_t rank() const;

  // inverse via gauss-jordan elimination; throws SingularMatrix when rank < size
  Matrix inverse() const;

  bool isIdentity() const { return *this == identity(rows.size()); }

  // place `blocks` copies of this matrix along the diagonal
  Matrix blockDiagonal(size_t blocks) const;


private:
  size_t width;
  std::vector<BitString> rows;
};

}
