#pragma once

#include <vector>

#include "token.h"

namespace pprl {

// Pads `tokens` to exactly `bound` entries with sentinels owned by `party`.
// Throws CapacityExceededError if the dataset does not fit; it is never
// truncated.
PaddedTokenSet pad(std::vector<Token> tokens, size_t bound, int party);

};  // namespace pprl
