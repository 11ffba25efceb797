#include "matching_engine.h"

#include <boost/format.hpp>
#include <limits>
#include <stdexcept>
#include <vector>

#include "errors.h"

namespace pprl {

MatchingEngine::MatchingEngine(MatchConfig cfg, SharingPrimitives& prims)
    : cfg_(cfg), prims_(prims) {
  if (cfg_.bound == 0) {
    throw std::invalid_argument("Padding bound must be positive.");
  }
  // L * L must fit in the ring.
  if (cfg_.bound > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument("Padding bound is too large.");
  }
  if (cfg_.num_parties < 2) {
    throw std::invalid_argument("At least two computing parties are required.");
  }
  if (cfg_.pid < 0 || cfg_.pid > cfg_.num_parties) {
    throw std::invalid_argument(
        boost::str(boost::format("Party ID %1% out of range 0..%2%.") % cfg_.pid %
                   cfg_.num_parties));
  }
  if (prims_.partyId() != cfg_.pid) {
    throw std::invalid_argument(
        boost::str(boost::format("Primitives act for party %1%, engine runs as party %2%.") %
                   prims_.partyId() % cfg_.pid));
  }
}

void MatchingEngine::validate(const PaddedTokenSet* own) const {
  if (isDataOwner(cfg_.pid)) {
    if (own == nullptr) {
      throw std::invalid_argument(
          boost::str(boost::format("Party %1% must provide a dataset.") % cfg_.pid));
    }
    if (own->size() != cfg_.bound) {
      throw std::invalid_argument(
          boost::str(boost::format("Dataset has %1% tokens but the bound is %2%.") %
                     own->size() % cfg_.bound));
    }
  } else if (own != nullptr) {
    throw std::invalid_argument(
        boost::str(boost::format("Party %1% holds no dataset.") % cfg_.pid));
  }
}

std::optional<uint64_t> MatchingEngine::run(const PaddedTokenSet* own) {
  validate(own);

  const size_t L = cfg_.bound;
  std::optional<common::utils::Ring> count;

  try {
    auto shares_a = prims_.shareInput(kPartyA, L, cfg_.pid == kPartyA ? own : nullptr);
    auto shares_b = prims_.shareInput(kPartyB, L, cfg_.pid == kPartyB ? own : nullptr);

    // All pairs, including sentinels, so the access pattern is independent of
    // the data.
    std::vector<SharedValue> eq;
    eq.reserve(L * L);
    for (size_t i = 0; i < L; ++i) {
      for (size_t j = 0; j < L; ++j) {
        eq.push_back(prims_.secureEqual(shares_a[i], shares_b[j]));
      }
    }

    auto total = prims_.secureSum(eq);
    count = prims_.reveal(total);

  } catch (const ProtocolAbortError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProtocolAbortError(boost::str(boost::format("Matching failed: %1%") % ex.what()));
  }

  if (count.has_value() && *count > static_cast<uint64_t>(L) * L) {
    throw ProtocolAbortError(
        boost::str(boost::format("Revealed count %1% exceeds %2% pairs.") % *count % (L * L)));
  }
  return count;
}

};  // namespace pprl
