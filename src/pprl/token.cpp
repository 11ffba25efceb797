#include "token.h"

#include <iomanip>
#include <sstream>

namespace pprl {

// "SENTINEL" in ASCII, carried by limb 1 of every padding token.
constexpr uint64_t kSentinelPattern = 0x53454e54494e454cULL;

Token Token::fromDigest(const uint8_t* digest) {
  std::array<common::utils::Ring, kTokenLimbs> limbs{};
  for (size_t i = 0; i < kTokenLimbs; ++i) {
    uint64_t limb = 0;
    for (size_t b = 0; b < sizeof(uint64_t); ++b) {
      limb = (limb << 8) | digest[i * sizeof(uint64_t) + b];
    }
    limbs[i] = limb;
  }
  limbs[0] &= ~kSentinelBit;
  return Token(limbs);
}

Token Token::sentinel(int party, uint64_t index) {
  std::array<common::utils::Ring, kTokenLimbs> limbs{};
  limbs[0] = kSentinelBit | (static_cast<uint64_t>(party & 0x7fffffff) << 32) |
             (index & 0xffffffffULL);
  limbs[1] = kSentinelPattern;
  limbs[2] = index;
  limbs[3] = static_cast<uint64_t>(party);
  return Token(limbs);
}

std::string Token::hex() const {
  std::ostringstream os;
  os << std::hex << std::setfill('0');
  for (auto limb : limbs_) {
    os << std::setw(16) << limb;
  }
  return os.str();
}

};  // namespace pprl
