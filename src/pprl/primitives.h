#pragma once

#include <array>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "../utils/circuit.h"
#include "../utils/types.h"
#include "token.h"

namespace pprl {

// Opaque handle to a secret shared value in Z_{2^64}.
struct SharedValue {
  common::utils::wire_t wire{0};
};

using SharedToken = std::array<SharedValue, kTokenLimbs>;

// Operations the matching logic needs from a secret sharing scheme. Every
// party calls the same operations in the same order.
class SharingPrimitives {
 public:
  virtual ~SharingPrimitives() = default;

  // Party these primitives act for.
  [[nodiscard]] virtual int partyId() const = 0;

  // Shares `length` tokens owned by `owner`. Only the owner passes values;
  // everybody else passes nullptr.
  virtual std::vector<SharedToken> shareInput(int owner, size_t length,
                                              const PaddedTokenSet* values) = 0;

  // Sharing of 1 if the tokens are equal and 0 otherwise.
  virtual SharedValue secureEqual(const SharedToken& a, const SharedToken& b) = 0;

  virtual SharedValue secureSum(const std::vector<SharedValue>& values) = 0;

  // Opens `value` to every computing party. Parties that receive no output
  // get std::nullopt.
  virtual std::optional<common::utils::Ring> reveal(SharedValue value) = 0;
};

// Records operations as an arithmetic circuit that is evaluated once the
// single output is revealed.
class CircuitPrimitives : public SharingPrimitives {
 protected:
  int pid_;
  common::utils::Circuit<common::utils::Ring> circ_;
  std::unordered_map<common::utils::wire_t, int> input_pid_map_;
  // Values of the input wires owned by this party.
  std::unordered_map<common::utils::wire_t, common::utils::Ring> inputs_;
  bool revealed_{false};

  // Evaluates circ_ with `output` as its only output wire.
  virtual std::optional<common::utils::Ring> evaluate(common::utils::wire_t output) = 0;

 public:
  explicit CircuitPrimitives(int pid) : pid_(pid) {}

  [[nodiscard]] int partyId() const override { return pid_; }

  std::vector<SharedToken> shareInput(int owner, size_t length,
                                      const PaddedTokenSet* values) override {
    if (revealed_) {
      throw std::logic_error("Circuit was already evaluated.");
    }
    if (owner == pid_ && (values == nullptr || values->size() != length)) {
      throw std::invalid_argument("Input owner must provide exactly `length` tokens.");
    }

    std::vector<SharedToken> shares(length);
    for (size_t i = 0; i < length; ++i) {
      for (size_t k = 0; k < kTokenLimbs; ++k) {
        auto wid = circ_.newInputWire();
        input_pid_map_[wid] = owner;
        if (owner == pid_) {
          inputs_[wid] = (*values)[i].limbs()[k];
        }
        shares[i][k] = SharedValue{wid};
      }
    }
    return shares;
  }

  SharedValue secureEqual(const SharedToken& a, const SharedToken& b) override {
    using common::utils::GateType;

    std::array<common::utils::wire_t, kTokenLimbs> eq{};
    for (size_t k = 0; k < kTokenLimbs; ++k) {
      auto diff = circ_.addGate(GateType::kSub, a[k].wire, b[k].wire);
      eq[k] = circ_.addGate(GateType::kEqz, diff);
    }

    // Product tree keeps the multiplicative depth at two.
    auto lo = circ_.addGate(GateType::kMul, eq[0], eq[1]);
    auto hi = circ_.addGate(GateType::kMul, eq[2], eq[3]);
    return SharedValue{circ_.addGate(GateType::kMul, lo, hi)};
  }

  SharedValue secureSum(const std::vector<SharedValue>& values) override {
    if (values.empty()) {
      throw std::invalid_argument("Cannot sum an empty list of values.");
    }
    auto acc = values[0].wire;
    for (size_t i = 1; i < values.size(); ++i) {
      acc = circ_.addGate(common::utils::GateType::kAdd, acc, values[i].wire);
    }
    return SharedValue{acc};
  }

  std::optional<common::utils::Ring> reveal(SharedValue value) override {
    if (revealed_) {
      throw std::logic_error("Only one value can be revealed per circuit.");
    }
    circ_.setAsOutput(value.wire);
    revealed_ = true;
    return evaluate(value.wire);
  }

  [[nodiscard]] const common::utils::Circuit<common::utils::Ring>& circuit() const {
    return circ_;
  }
};

};  // namespace pprl
