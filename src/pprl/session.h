#pragma once

#include <emp-tool/emp-tool.h>

#include <array>
#include <cstdint>
#include <string>

#include "../io/netmp.h"
#include "token.h"

namespace pprl {

constexpr uint32_t kProtocolVersion = 1;

// Public parameters every party must agree on before anything is shared.
struct SessionParams {
  uint32_t version{kProtocolVersion};
  int num_parties{2};
  size_t bound{0};
  size_t token_limbs{kTokenLimbs};
  std::string token_domain;
  bool case_insensitive{false};

  [[nodiscard]] std::array<uint8_t, emp::Hash::DIGEST_SIZE> digest() const;
};

// Size a data owner declares during negotiation: real_size rounded up to a
// multiple of bucket. A bucket of 0 or 1 declares the exact size.
uint64_t declaredSize(size_t real_size, size_t bucket);

// Data owners send their declared sizes to the helper, which sends
// L = max(declared) + margin to all computing parties. Neither owner sees the
// other's declared size. Parties without a dataset pass 0 as declared.
// Returns L (at least 1). Throws ProtocolAbortError if a peer is lost.
size_t negotiateBound(io::NetIOMP& network, int pid, int nP, uint64_t declared,
                      size_t margin);

// Handshake run by all parties (helper included) before sharing. Party 1
// collects a parameter digest and a readiness flag from every party and sends
// back one verdict. Throws ProtocolAbortError on every party if the digests
// differ or any party is not ready.
void agreeOnSession(io::NetIOMP& network, int pid, int nP, const SessionParams& params,
                    bool ready);

};  // namespace pprl
