#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace labbook::model {

/*
  Content signature: a SHA-512 digest, or empty.

  Signatures are plain values. The empty signature stands for "no signature"
  (a terminal stage); it compares equal only to another empty signature.
*/
class Signature {
 public:
  static constexpr std::size_t kSize = 64;
  using Bytes                        = std::array<std::uint8_t, kSize>;

  Signature() = default;
  explicit Signature(const Bytes& bytes) : bytes_(bytes), set_(true) {
  }

  // Parses 128 lowercase hex characters, or "" for the empty signature.
  // Throws std::invalid_argument on anything else.
  static Signature FromHex(std::string_view hex);

  std::string ToHex() const;

  bool empty() const {
    return !set_;
  }
  const Bytes& bytes() const {
    return bytes_;
  }

  bool operator==(const Signature& other) const {
    return set_ == other.set_ && bytes_ == other.bytes_;
  }
  bool operator!=(const Signature& other) const {
    return !(*this == other);
  }

 private:
  Bytes bytes_{};
  bool  set_{false};
};

// Dependency stage name -> signature. Ordered so diagnostics are stable.
using SignatureMap = std::map<std::string, Signature>;

} // namespace labbook::model
