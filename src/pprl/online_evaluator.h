#pragma once

#include <emp-tool/emp-tool.h>

#include <memory>
#include <unordered_map>
#include <vector>

#include "../io/netmp.h"
#include "../utils/circuit.h"
#include "../utils/types.h"
#include "preproc.h"
#include "sharing.h"

using namespace common::utils;

namespace pprl {
class OnlineEvaluator {
  int nP_;
  int id_;
  int latency_;     // Simulated network latency in microseconds
  bool use_pking_;  // Use king party for reconstruction
  std::shared_ptr<io::NetIOMP> network_;
  PreprocCircuit preproc_;
  common::utils::LevelOrderedCircuit circ_;
  std::vector<AddShare> wires_;
  // Running digest of every reconstructed value; compared before outputs are
  // released.
  emp::Hash transcript_;

  // Opens shares_list to all computing parties, via the king party or by a
  // direct all-to-all exchange.
  void reconstruct(const std::vector<AddShare>& shares_list,
                   std::vector<Field>& reconstructed_list);

 public:
  OnlineEvaluator(int nP, int id, std::shared_ptr<io::NetIOMP> network,
                  PreprocCircuit preproc, common::utils::LevelOrderedCircuit circ,
                  int latency = 0, bool use_pking = true);

  // Inputs owned by this party. Input sharing is local: the preprocessed mask
  // is already shared among the computing parties.
  void setInputs(const std::unordered_map<common::utils::wire_t, Field>& inputs);

  void multEvaluate(const std::vector<common::utils::FIn2Gate>& mult_gates);

  void eqzEvaluate(const std::vector<common::utils::FIn1Gate>& eqz_gates);

  void evaluateGatesAtDepth(size_t depth);

  std::vector<Field> getOutputs();

  // Evaluate online phase for circuit
  std::vector<Field> evaluateCircuit(const std::unordered_map<common::utils::wire_t, Field>& inputs);

  // Checks that all computing parties opened the same values. Throws
  // ProtocolAbortError otherwise.
  void verify();
};

};  // namespace pprl
