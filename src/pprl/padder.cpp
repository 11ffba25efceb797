#include "padder.h"

#include <boost/format.hpp>
#include <stdexcept>

#include "errors.h"

namespace pprl {

PaddedTokenSet pad(std::vector<Token> tokens, size_t bound, int party) {
  if (bound == 0) {
    throw std::invalid_argument("Padding bound must be positive.");
  }
  if (tokens.size() > bound) {
    throw CapacityExceededError(boost::str(
        boost::format("Dataset has %1% records but the agreed bound is %2%.") %
        tokens.size() % bound));
  }

  size_t real_count = tokens.size();
  tokens.reserve(bound);
  for (size_t i = real_count; i < bound; ++i) {
    tokens.push_back(Token::sentinel(party, i));
  }
  return {std::move(tokens), real_count};
}

};  // namespace pprl
