#include "code/code.hpp"

#include <algorithm>
#include <cctype>

#include "code/bch.hpp"
#include "code/hamming.hpp"

namespace Code {

std::string toString(Variant variant) {
  switch (variant) {
    case Variant::Hamming: return "hamming";
    case Variant::BCH:     return "bch";
  }
  throw std::invalid_argument("[Code::toString] unknown variant");
}

Variant parseVariant(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return std::tolower(c);
  });

  if (lower == "hamming") { return Variant::Hamming; }
  if (lower == "bch")     { return Variant::BCH; }
  throw std::invalid_argument("[Code::parseVariant] unknown code '" + name + "'");
}

const BlockCode& BlockCode::get(Variant variant) {
  switch (variant) {
    case Variant::Hamming: return Hamming::getInstance();
    case Variant::BCH:     return BCH::getInstance();
  }
  throw std::invalid_argument("[Code::BlockCode::get] unknown variant");
}

BitString BlockCode::encode(const BitString& message) const {
  return this->generator().leftMultiply(message);
}

BitString BlockCode::syndrome(const BitString& received) const {
  return this->parityCheck() * received;
}

}
