#pragma once

#include <memory>
#include <unordered_map>
#include <vector>

#include "../utils/circuit.h"
#include "../utils/types.h"
#include "sharing.h"

using namespace common::utils;

namespace pprl {
// Preprocessed data for a gate.
struct PreprocGate {
  PreprocGate() = default;
  virtual ~PreprocGate() = default;
};

using preprocg_ptr_t = std::unique_ptr<PreprocGate>;

struct PreprocInput : public PreprocGate {
  // ID of party providing input on wire.
  int pid{};
  // Share of the input mask.
  AddShare share_r;
  // Mask in the clear; only set on the input owner.
  Field r;
  PreprocInput() = default;
  PreprocInput(int pid, const AddShare& share_r, const Field& r)
      : PreprocGate(), pid(pid), share_r(share_r), r(r) {}
};

struct PreprocMultGate : public PreprocGate {
  AddShare triple_a;  // Share of a random value a
  AddShare triple_b;  // Share of a random value b
  AddShare triple_c;  // Share of c = a * b

  PreprocMultGate() = default;
  PreprocMultGate(const AddShare& triple_a, const AddShare& triple_b,
                  const AddShare& triple_c)
      : PreprocGate(), triple_a(triple_a), triple_b(triple_b), triple_c(triple_c) {}
};

struct PreprocEqzGate : public PreprocGate {
  // Random r1 and its bit decomposition.
  AddShare share_r1;
  std::vector<AddShare> share_r1_bits;
  // Random r2 and the one-hot vector with a 1 at slot (r2 mod EQZSLOTS).
  AddShare share_r2;
  std::vector<AddShare> share_r2_onehot;
  PreprocEqzGate() = default;
  PreprocEqzGate(const AddShare& share_r1, std::vector<AddShare> share_r1_bits,
                 const AddShare& share_r2, std::vector<AddShare> share_r2_onehot)
      : PreprocGate(),
        share_r1(share_r1),
        share_r1_bits(std::move(share_r1_bits)),
        share_r2(share_r2),
        share_r2_onehot(std::move(share_r2_onehot)) {}
};

// Preprocessed data for the circuit.
struct PreprocCircuit {
  std::unordered_map<wire_t, preprocg_ptr_t> gates;
  PreprocCircuit() = default;
};

};  // namespace pprl
