#include "session.h"

#include <algorithm>
#include <boost/format.hpp>

#include "errors.h"
#include "matching_engine.h"

namespace pprl {

namespace {

// The helper learns both declared sizes; the data owners only learn L.
constexpr int kSizeCollector = 0;
constexpr int kCoordinator = 1;

enum Verdict : uint8_t { kAgreed = 0, kMismatch = 1, kNotReady = 2 };

struct HandshakeMsg {
  std::array<uint8_t, emp::Hash::DIGEST_SIZE> digest;
  uint8_t ready;
};

}  // namespace

std::array<uint8_t, emp::Hash::DIGEST_SIZE> SessionParams::digest() const {
  emp::Hash hash;
  uint64_t fields[5] = {version, static_cast<uint64_t>(num_parties), bound, token_limbs,
                        case_insensitive ? 1ULL : 0ULL};
  hash.put(fields, sizeof(fields));

  uint64_t domain_len = token_domain.size();
  hash.put(&domain_len, sizeof(domain_len));
  if (domain_len > 0) {
    hash.put(token_domain.data(), static_cast<int>(domain_len));
  }

  std::array<uint8_t, emp::Hash::DIGEST_SIZE> res{};
  hash.digest(res.data());
  return res;
}

uint64_t declaredSize(size_t real_size, size_t bucket) {
  if (bucket <= 1) {
    return real_size;
  }
  return ((real_size + bucket - 1) / bucket) * bucket;
}

size_t negotiateBound(io::NetIOMP& network, int pid, int nP, uint64_t declared,
                      size_t margin) {
  uint64_t bound = 0;

  try {
    if (pid == kSizeCollector) {
      uint64_t declared_a = 0;
      uint64_t declared_b = 0;
      network.recv(kPartyA, &declared_a, sizeof(uint64_t));
      network.recv(kPartyB, &declared_b, sizeof(uint64_t));
      bound = std::max<uint64_t>(std::max(declared_a, declared_b) + margin, 1);

      for (int p = 1; p <= nP; ++p) {
        network.send(p, &bound, sizeof(uint64_t));
      }
      network.flush();
    } else {
      if (pid == kPartyA || pid == kPartyB) {
        network.send(kSizeCollector, &declared, sizeof(uint64_t));
        network.flush(kSizeCollector);
      }
      network.recv(kSizeCollector, &bound, sizeof(uint64_t));
    }
  } catch (const io::NetworkError& ex) {
    throw ProtocolAbortError(
        boost::str(boost::format("Size negotiation failed: %1%") % ex.what()));
  }

  return bound;
}

void agreeOnSession(io::NetIOMP& network, int pid, int nP, const SessionParams& params,
                    bool ready) {
  HandshakeMsg own{params.digest(), static_cast<uint8_t>(ready ? 1 : 0)};
  uint8_t verdict = kAgreed;

  try {
    if (pid == kCoordinator) {
      bool mismatch = false;
      bool all_ready = ready;
      for (int p = 0; p <= nP; ++p) {
        if (p == pid) {
          continue;
        }
        HandshakeMsg peer{};
        network.recv(p, peer.digest.data(), peer.digest.size());
        network.recv(p, &peer.ready, sizeof(uint8_t));
        if (peer.digest != own.digest) {
          mismatch = true;
        }
        if (peer.ready == 0) {
          all_ready = false;
        }
      }

      if (mismatch) {
        verdict = kMismatch;
      } else if (!all_ready) {
        verdict = kNotReady;
      }

      for (int p = 0; p <= nP; ++p) {
        if (p != pid) {
          network.send(p, &verdict, sizeof(uint8_t));
        }
      }
      network.flush();
    } else {
      network.send(kCoordinator, own.digest.data(), own.digest.size());
      network.send(kCoordinator, &own.ready, sizeof(uint8_t));
      network.flush(kCoordinator);
      network.recv(kCoordinator, &verdict, sizeof(uint8_t));
    }
  } catch (const io::NetworkError& ex) {
    throw ProtocolAbortError(
        boost::str(boost::format("Session handshake failed: %1%") % ex.what()));
  }

  switch (verdict) {
    case kAgreed:
      return;
    case kMismatch:
      throw ProtocolAbortError("Parties disagree on the session parameters.");
    case kNotReady:
      throw ProtocolAbortError("A party failed to prepare its input.");
    default:
      throw ProtocolAbortError(
          boost::str(boost::format("Unknown handshake verdict %1%.") % static_cast<int>(verdict)));
  }
}

};  // namespace pprl
