#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../utils/types.h"

namespace pprl {

constexpr size_t kTokenLimbs = 4;
constexpr size_t kTokenBytes = kTokenLimbs * sizeof(common::utils::Ring);

// Most significant bit of limb 0. Clear for every real token, set for every
// sentinel, so the two value spaces are disjoint.
constexpr uint64_t kSentinelBit = 1ULL << 63;

// Fixed width 256-bit value derived from one identifier. Immutable.
class Token {
  std::array<common::utils::Ring, kTokenLimbs> limbs_{};

  explicit Token(const std::array<common::utils::Ring, kTokenLimbs>& limbs)
      : limbs_(limbs) {}

 public:
  // Builds a real token from a 32 byte digest (big endian limbs).
  static Token fromDigest(const uint8_t* digest);

  // Padding value owned by `party` at padding position `index`. Sentinels of
  // different parties, or of one party at different positions, differ.
  static Token sentinel(int party, uint64_t index);

  [[nodiscard]] const std::array<common::utils::Ring, kTokenLimbs>& limbs() const {
    return limbs_;
  }
  [[nodiscard]] bool isSentinel() const { return (limbs_[0] & kSentinelBit) != 0; }
  [[nodiscard]] std::string hex() const;

  bool operator==(const Token& rhs) const { return limbs_ == rhs.limbs_; }
  bool operator!=(const Token& rhs) const { return !(*this == rhs); }
  bool operator<(const Token& rhs) const { return limbs_ < rhs.limbs_; }
};

// Exactly `bound` tokens: the party's real tokens followed by sentinels.
class PaddedTokenSet {
  std::vector<Token> tokens_;
  size_t real_count_{0};

 public:
  PaddedTokenSet() = default;
  PaddedTokenSet(std::vector<Token> tokens, size_t real_count)
      : tokens_(std::move(tokens)), real_count_(real_count) {}

  [[nodiscard]] size_t size() const { return tokens_.size(); }
  // Known to the owner only; never enters the protocol.
  [[nodiscard]] size_t realCount() const { return real_count_; }

  const Token& operator[](size_t idx) const { return tokens_[idx]; }
  [[nodiscard]] std::vector<Token>::const_iterator begin() const { return tokens_.begin(); }
  [[nodiscard]] std::vector<Token>::const_iterator end() const { return tokens_.end(); }
};

};  // namespace pprl
