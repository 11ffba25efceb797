#pragma once

#include <cstdint>
#include <optional>

#include "primitives.h"
#include "token.h"

namespace pprl {

// Data holders. Every other party runs the engine without a dataset.
constexpr int kPartyA = 1;
constexpr int kPartyB = 2;

struct MatchConfig {
  int pid;
  int num_parties;  // Computing parties, not counting the helper.
  size_t bound;     // Public padded size L.
};

// Counts the identifiers common to the datasets of parties A and B without
// revealing anything else. All parties call run() with the same config.
class MatchingEngine {
  MatchConfig cfg_;
  SharingPrimitives& prims_;

  void validate(const PaddedTokenSet* own) const;

 public:
  MatchingEngine(MatchConfig cfg, SharingPrimitives& prims);

  // `own` is the caller's padded dataset and must be nullptr for parties that
  // hold none. Returns the match count, or std::nullopt for parties that
  // receive no output. Throws ProtocolAbortError if the protocol fails.
  std::optional<uint64_t> run(const PaddedTokenSet* own);

  [[nodiscard]] static bool isDataOwner(int pid) { return pid == kPartyA || pid == kPartyB; }
};

};  // namespace pprl
