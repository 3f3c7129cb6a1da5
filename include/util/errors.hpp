#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// operand shapes do not fit together (always a programming error)
class DimensionMismatch : public std::domain_error {
public:
  explicit DimensionMismatch(const std::string& what) : std::domain_error(what) { }
};

// matrix does not have full rank over GF(2)
class SingularMatrix : public std::domain_error {
public:
  explicit SingularMatrix(const std::string& what) : std::domain_error(what) { }
};

// message or ciphertext is not a whole number of blocks for the key
class InvalidMessageLength : public std::invalid_argument {
public:
  explicit InvalidMessageLength(const std::string& what) : std::invalid_argument(what) { }
};

// the received word is not within decoding distance of any codeword
class UncorrectableError : public std::runtime_error {
public:
  explicit UncorrectableError(const std::string& what) : std::runtime_error(what) { }
  UncorrectableError(const std::string& what, std::vector<size_t> blocks)
    : std::runtime_error(what), blocks_(std::move(blocks)) { }

  // indices of the failed blocks; empty when raised by a single decoder call
  const std::vector<size_t>& blocks() const { return blocks_; }

private:
  std::vector<size_t> blocks_;
};
