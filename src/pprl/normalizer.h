#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "token.h"

namespace pprl {

struct NormalizerOptions {
  // Public string mixed into every digest. All parties must use the same one.
  std::string token_domain = "pprl-token-v1";
  // Fold ASCII letters to lower case before hashing.
  bool case_insensitive = false;
};

enum class InvalidRecordPolicy { kSkip, kReject };

struct NormalizationReport {
  size_t accepted{0};
  size_t skipped{0};
  size_t duplicates_removed{0};
};

// Maps raw identifiers to tokens. Holds no party specific state, so two
// parties with the same options produce identical tokens for equal
// identifiers.
class IdentityNormalizer {
  NormalizerOptions opts_;

 public:
  IdentityNormalizer() = default;
  explicit IdentityNormalizer(NormalizerOptions opts);

  [[nodiscard]] const NormalizerOptions& options() const { return opts_; }

  // Canonical form that is hashed; throws InvalidInputError.
  [[nodiscard]] std::string canonicalize(std::string_view raw) const;

  [[nodiscard]] Token normalize(std::string_view raw) const;

  // Normalizes a column of identifiers. Deduplication, when requested, keeps
  // the first occurrence of each token.
  std::vector<Token> normalizeAll(const std::vector<std::string>& raws,
                                  InvalidRecordPolicy policy, bool deduplicate = false,
                                  NormalizationReport* report = nullptr) const;
};

};  // namespace pprl
