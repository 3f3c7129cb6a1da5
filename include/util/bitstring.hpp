#pragma once

#include <cstdint>
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * fixed-length vector over GF(2)
 *
 * bit i lives in byte i / 8 at bit i % 8. the unused high bits of the last byte
 * are always zero, so equality and weight work on whole bytes.
 */
class BitString {
private:
  // proxy returned by the non-const index operator so single bits can be assigned
  class BitReference {
  public:
    BitReference(unsigned char& byte, unsigned char mask) : byte_(byte), mask_(mask) { }

    BitReference& operator=(bool value) {
      byte_ = value ? (byte_ | mask_) : (byte_ & ~mask_);
      return *this;
    }

    BitReference& operator=(const BitReference& other) { return *this = bool(other); }

    BitReference& operator^=(bool value) {
      if (value) { byte_ ^= mask_; }
      return *this;
    }

    operator bool() const { return (byte_ & mask_) != 0; }

  private:
    unsigned char& byte_;
    unsigned char mask_;
  };

public:
  BitString() : size_(0) { }
  explicit BitString(size_t size) : bytes((size + 7) / 8, 0), size_(size) { }

  // takes the first `size` bits of `bytes`; throws if there are too few
  BitString(std::vector<unsigned char> bytes, size_t size);

  // characters '0' and '1' (for constants & testing)
  explicit BitString(const std::string& bits);

  // bit i is bit i of `value`
  static BitString fromUInt(uint32_t value, size_t bits = 32);
  uint32_t toUInt() const;

  // 8 bits per character, most significant bit first
  static BitString fromText(const std::string& text);

  // zero pads a trailing partial byte and skips every NUL character
  std::string toText() const;

  // a vector with ones exactly at `positions`
  static BitString fromSupport(const std::set<size_t>& positions, size_t size);

  bool operator[](size_t i) const;
  BitReference operator[](size_t i);

  // the substring [from, to)
  BitString operator[](std::pair<size_t, size_t> range) const;

  // consecutive pieces of `width` bits; the size must be a multiple of `width`
  std::vector<BitString> split(size_t width) const;

  BitString& operator+=(const BitString& other);
  BitString& operator+=(bool bit);
  BitString operator+(const BitString& other) const;
  static BitString concat(const std::vector<BitString>& pieces);

  bool operator==(const BitString& other) const {
    return size_ == other.size_ && bytes == other.bytes;
  }
  bool operator!=(const BitString& other) const { return !(*this == other); }

  // element-wise operations; both sides must have the same size
  BitString& operator^=(const BitString& other);
  BitString& operator&=(const BitString& other);
  BitString& operator|=(const BitString& other);
  BitString operator^(const BitString& other) const { return BitString(*this) ^= other; }
  BitString operator&(const BitString& other) const { return BitString(*this) &= other; }
  BitString operator|(const BitString& other) const { return BitString(*this) |= other; }
  BitString operator~() const;

  // inner product over GF(2)
  bool operator*(const BitString& other) const;

  size_t size() const { return size_; }
  std::vector<unsigned char> toBytes() const { return bytes; }

  // hamming weight
  size_t weight() const;

  // positions of the set bits
  std::set<size_t> support() const;

  std::string toString() const;
  std::string toHexString() const;

private:
  // zero the unused bits of the last byte
  void clearPadding();

  // apply `op` byte by byte after checking sizes
  template <typename Op>
  BitString& combine(const BitString& other, const char* where, Op op);

  std::vector<unsigned char> bytes;
  size_t size_;
};

// short vectors print as bits, long ones as hex
std::ostream& operator<<(std::ostream& os, const BitString& bs);
