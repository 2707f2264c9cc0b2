#include "signature.hpp"

#include <stdexcept>

namespace labbook::model {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  return -1;
}

} // namespace

Signature Signature::FromHex(std::string_view hex) {
  if (hex.empty()) {
    return Signature{};
  }
  if (hex.size() != kSize * 2) {
    throw std::invalid_argument("signature: expected " + std::to_string(kSize * 2) + " hex chars, got " + std::to_string(hex.size()));
  }

  Bytes bytes{};
  for (std::size_t i = 0; i < kSize; ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("signature: non-lowercase-hex character in '" + std::string(hex) + "'");
    }
    bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return Signature(bytes);
}

std::string Signature::ToHex() const {
  if (!set_) {
    return {};
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(kSize * 2);
  for (auto b : bytes_) {
    out.push_back(kHex[(b >> 4) & 0x0F]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace labbook::model
