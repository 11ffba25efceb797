#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../io/netmp.h"
#include "primitives.h"
#include "rand_gen_pool.h"

namespace pprl {

// Sharing primitives run by the helper (party 0) and computing parties
// 1..nP over the network. The recorded circuit is preprocessed by the helper
// and evaluated online when the result is revealed.
//
// The calling thread must have initialised the field (initField()).
class MpcPrimitives : public CircuitPrimitives {
 public:
  // Called with "preprocessing", "online" and "done" as the evaluation moves
  // through its phases.
  using PhaseHook = std::function<void(const std::string&)>;

 private:
  int nP_;
  std::shared_ptr<io::NetIOMP> network_;
  RandGenPool rgen_;
  int latency_;
  bool use_pking_;
  PhaseHook hook_;

  void phase(const std::string& name) const;

 protected:
  std::optional<common::utils::Ring> evaluate(common::utils::wire_t output) override;

 public:
  MpcPrimitives(int pid, int nP, std::shared_ptr<io::NetIOMP> network, RandGenPool rgen,
                int latency = 0, bool use_pking = true);

  void setPhaseHook(PhaseHook hook) { hook_ = std::move(hook); }
};

};  // namespace pprl
