#include "util/bitstring.hpp"

#include <iomanip>
#include <sstream>

BitString::BitString(std::vector<unsigned char> bytes, size_t size)
  : bytes(std::move(bytes)), size_(size)
{
  if (this->bytes.size() * 8 < size) {
    throw std::invalid_argument(
      "[BitString] " + std::to_string(this->bytes.size()) + " bytes cannot hold "
      + std::to_string(size) + " bits"
    );
  }
  this->bytes.resize((size + 7) / 8);
  this->clearPadding();
}

BitString::BitString(const std::string& bits) : BitString(bits.size()) {
  for (size_t i = 0; i < bits.size(); i++) {
    if (bits[i] != '0' && bits[i] != '1') {
      throw std::invalid_argument(
        "[BitString(std::string)] unexpected character '" + std::string(1, bits[i]) + "'"
      );
    }
    (*this)[i] = bits[i] == '1';
  }
}

void BitString::clearPadding() {
  if (size_ % 8 != 0) {
    bytes.back() &= (unsigned char) ((1u << (size_ % 8)) - 1);
  }
}

////////////////////////////////////////////////////////////////////////////////
// CONVERSIONS
////////////////////////////////////////////////////////////////////////////////

BitString BitString::fromUInt(uint32_t value, size_t bits) {
  if (bits > 32) {
    throw std::out_of_range("[BitString::fromUInt] " + std::to_string(bits) + " bits > 32");
  }
  std::vector<unsigned char> out(4);
  for (size_t i = 0; i < 4; i++) { out[i] = (value >> (8 * i)) & 0xFF; }
  return BitString(out, bits);
}

uint32_t BitString::toUInt() const {
  if (size_ > 32) {
    throw std::out_of_range("[BitString::toUInt] " + std::to_string(size_) + " bits > 32");
  }
  uint32_t value = 0;
  for (size_t i = 0; i < bytes.size(); i++) { value |= (uint32_t) bytes[i] << (8 * i); }
  return value;
}

BitString BitString::fromText(const std::string& text) {
  BitString out;
  for (unsigned char c : text) {
    for (int i = 7; i >= 0; i--) { out += bool((c >> i) & 0x01); }
  }
  return out;
}

std::string BitString::toText() const {
  std::string out;
  for (size_t c = 0; c < size_; c += 8) {
    // a trailing partial byte is read as if padded with zeros
    unsigned char byte = 0;
    for (size_t i = c; i < c + 8; i++) { byte = (byte << 1) | (i < size_ && (*this)[i]); }

    // zero bytes are padding wherever they occur
    if (byte != 0) { out.push_back(static_cast<char>(byte)); }
  }
  return out;
}

BitString BitString::fromSupport(const std::set<size_t>& positions, size_t size) {
  BitString out(size);
  for (size_t pos : positions) { out[pos] = true; }
  return out;
}

////////////////////////////////////////////////////////////////////////////////
// ACCESS
////////////////////////////////////////////////////////////////////////////////

bool BitString::operator[](size_t i) const {
  if (i >= size_) {
    throw std::out_of_range("[BitString::operator[]] bit " + std::to_string(i) + " of "
      + std::to_string(size_));
  }
  return (bytes[i / 8] >> (i % 8)) & 0x01;
}

BitString::BitReference BitString::operator[](size_t i) {
  if (i >= size_) {
    throw std::out_of_range("[BitString::operator[]] bit " + std::to_string(i) + " of "
      + std::to_string(size_));
  }
  return BitReference(bytes[i / 8], (unsigned char) (1u << (i % 8)));
}

BitString BitString::operator[](std::pair<size_t, size_t> range) const {
  const size_t from = range.first, to = range.second;
  if (to > size_) {
    throw std::out_of_range("[BitString::operator[](std::pair)] end " + std::to_string(to)
      + " past " + std::to_string(size_));
  }
  if (from > to) {
    throw std::invalid_argument("[BitString::operator[](std::pair)] range ["
      + std::to_string(from) + ", " + std::to_string(to) + ") is reversed");
  }

  BitString out(to - from);
  for (size_t i = from; i < to; i++) { out[i - from] = (*this)[i]; }
  return out;
}

std::vector<BitString> BitString::split(size_t width) const {
  if (width == 0 || size_ % width != 0) {
    throw std::domain_error(
      "[BitString::split] " + std::to_string(size_) + " bits do not split into pieces of "
      + std::to_string(width)
    );
  }

  std::vector<BitString> out;
  out.reserve(size_ / width);
  for (size_t from = 0; from < size_; from += width) {
    out.push_back((*this)[{from, from + width}]);
  }
  return out;
}

BitString& BitString::operator+=(const BitString& other) {
  const size_t offset = size_;
  size_ += other.size_;

  // byte aligned appends copy whole bytes
  if (offset % 8 == 0) {
    bytes.insert(bytes.end(), other.bytes.begin(), other.bytes.end());
    return *this;
  }

  bytes.resize((size_ + 7) / 8, 0);
  for (size_t i = 0; i < other.size_; i++) { (*this)[offset + i] = other[i]; }
  return *this;
}

BitString& BitString::operator+=(bool bit) {
  size_++;
  bytes.resize((size_ + 7) / 8, 0);
  (*this)[size_ - 1] = bit;
  return *this;
}

BitString BitString::operator+(const BitString& other) const {
  BitString out(*this);
  out += other;
  return out;
}

BitString BitString::concat(const std::vector<BitString>& pieces) {
  BitString out;
  for (const BitString& piece : pieces) { out += piece; }
  return out;
}

////////////////////////////////////////////////////////////////////////////////
// ARITHMETIC
////////////////////////////////////////////////////////////////////////////////

template <typename Op>
BitString& BitString::combine(const BitString& other, const char* where, Op op) {
  if (other.size_ != size_) {
    throw std::domain_error(std::string("[BitString::") + where + "] size mismatch ("
      + std::to_string(size_) + " vs. " + std::to_string(other.size_) + ")");
  }
  for (size_t i = 0; i < bytes.size(); i++) { bytes[i] = op(bytes[i], other.bytes[i]); }
  return *this;
}

BitString& BitString::operator^=(const BitString& other) {
  return combine(other, "operator^=", [](unsigned char a, unsigned char b) { return a ^ b; });
}

BitString& BitString::operator&=(const BitString& other) {
  return combine(other, "operator&=", [](unsigned char a, unsigned char b) { return a & b; });
}

BitString& BitString::operator|=(const BitString& other) {
  return combine(other, "operator|=", [](unsigned char a, unsigned char b) { return a | b; });
}

BitString BitString::operator~() const {
  BitString out(*this);
  for (unsigned char& byte : out.bytes) { byte = ~byte; }
  out.clearPadding();
  return out;
}

bool BitString::operator*(const BitString& other) const {
  return (*this & other).weight() % 2 == 1;
}

size_t BitString::weight() const {
  size_t w = 0;
  for (unsigned char byte : bytes) {
    for (; byte; byte &= byte - 1) { w++; }
  }
  return w;
}

std::set<size_t> BitString::support() const {
  std::set<size_t> out;
  for (size_t i = 0; i < size_; i++) {
    if ((*this)[i]) { out.insert(i); }
  }
  return out;
}

////////////////////////////////////////////////////////////////////////////////
// PRINTING
////////////////////////////////////////////////////////////////////////////////

std::string BitString::toString() const {
  std::string out(size_, '0');
  for (size_t i = 0; i < size_; i++) {
    if ((*this)[i]) { out[i] = '1'; }
  }
  return out;
}

std::string BitString::toHexString() const {
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (unsigned char byte : bytes) { out << std::setw(2) << (int) byte; }
  return out.str();
}

std::ostream& operator<<(std::ostream& os, const BitString& bs) {
  return os << (bs.size() > 32 ? bs.toHexString() : bs.toString());
}
