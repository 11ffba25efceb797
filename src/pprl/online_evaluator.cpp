#include "online_evaluator.h"

#include <NTL/ZZ_p.h>
#include <unistd.h>

#include <array>
#include <boost/format.hpp>
#include <cstring>

#include "../utils/helpers.h"
#include "errors.h"

namespace pprl {

OnlineEvaluator::OnlineEvaluator(int nP, int id, std::shared_ptr<io::NetIOMP> network,
                                 PreprocCircuit preproc,
                                 common::utils::LevelOrderedCircuit circ, int latency,
                                 bool use_pking)
    : nP_(nP),
      id_(id),
      latency_(latency),
      use_pking_(use_pking),
      network_(std::move(network)),
      preproc_(std::move(preproc)),
      circ_(std::move(circ)),
      wires_(circ_.num_wires) {
  uint64_t shape[2] = {circ_.num_gates, circ_.num_wires};
  transcript_.put(shape, sizeof(shape));
}

void OnlineEvaluator::reconstruct(const std::vector<AddShare>& shares_list,
                                  std::vector<Field>& reconstructed_list) {
  if (id_ == 0) { return; }

  int pKing = 1;
  size_t num_shares = shares_list.size();

  std::vector<Ring> shares_to_send(num_shares);
  for (size_t i = 0; i < num_shares; ++i) {
    shares_to_send[i] = fieldToU64(shares_list[i].valueAt());
  }

  // Sums of words wrap modulo 2^64, which is the share modulus.
  std::vector<Ring> opened(num_shares, 0);

  if (use_pking_) {
    if (id_ != pKing) {
      network_->send(pKing, shares_to_send.data(), num_shares * sizeof(Ring));
      if (latency_ > 0) { usleep(latency_); }
      network_->recv(pKing, opened.data(), num_shares * sizeof(Ring));
    } else {
      opened = shares_to_send;
      std::vector<Ring> share_recv(num_shares);
      if (latency_ > 0) { usleep(latency_); }
      for (int p = 1; p <= nP_; ++p) {
        if (p != pKing) {
          network_->recv(p, share_recv.data(), num_shares * sizeof(Ring));
          for (size_t i = 0; i < num_shares; ++i) {
            opened[i] += share_recv[i];
          }
        }
      }

      for (int p = 1; p <= nP_; ++p) {
        if (p != pKing) {
          network_->send(p, opened.data(), num_shares * sizeof(Ring));
          network_->flush(p);
        }
      }
    }
  } else {
    // Direct reconstruction (all parties exchange shares)
    opened = shares_to_send;
    for (int p = 1; p <= nP_; ++p) {
      if (p != id_) {
        network_->send(p, shares_to_send.data(), num_shares * sizeof(Ring));
      }
    }
    network_->flush();

    if (latency_ > 0) { usleep(latency_); }

    std::vector<Ring> share_recv(num_shares);
    for (int p = 1; p <= nP_; ++p) {
      if (p != id_) {
        network_->recv(p, share_recv.data(), num_shares * sizeof(Ring));
        for (size_t i = 0; i < num_shares; ++i) {
          opened[i] += share_recv[i];
        }
      }
    }
  }

  if (num_shares > 0) {
    transcript_.put(opened.data(), static_cast<int>(num_shares * sizeof(Ring)));
  }
  reconstructed_list = unpackFields(opened);
}

void OnlineEvaluator::setInputs(const std::unordered_map<common::utils::wire_t, Field>& inputs) {
  if (id_ == 0) { return; }

  // Input gates have depth 0.
  for (auto& g : circ_.gates_by_level[0]) {
    if (g->type != common::utils::GateType::kInp) {
      continue;
    }
    auto* pre_input = static_cast<PreprocInput*>(preproc_.gates.at(g->out).get());
    AddShare share_inp;
    if (pre_input->pid == id_) {
      auto it = inputs.find(g->out);
      if (it == inputs.end()) {
        throw std::invalid_argument(
            boost::str(boost::format("Missing value for input wire %1%.") % g->out));
      }
      // x + r - [r]_owner, while every other party holds -[r]_p.
      share_inp.pushValue(it->second + pre_input->r - pre_input->share_r.valueAt());
    } else {
      share_inp.pushValue(-pre_input->share_r.valueAt());
    }
    wires_[g->out] = share_inp;
  }
}

void OnlineEvaluator::multEvaluate(const std::vector<common::utils::FIn2Gate>& mult_gates) {
  if (id_ == 0) { return; }

  size_t num_mult_gates = mult_gates.size();
  if (num_mult_gates == 0) { return; }

  // For z = x * y with a Beaver triple (a, b, c = a * b): open u = x - a and
  // v = y - b, then z = u*v + u*b + v*a + c. Shares to open are interleaved
  // as u0, v0, u1, v1, ...
  std::vector<AddShare> shares_to_send(2 * num_mult_gates);

  NTL::ZZ_pContext field_ctx;
  field_ctx.save();

#pragma omp parallel
  {
    field_ctx.restore();
#pragma omp for
    for (size_t i = 0; i < num_mult_gates; ++i) {
      const auto& mult_gate = mult_gates[i];
      const auto* pre_out = static_cast<PreprocMultGate*>(preproc_.gates.at(mult_gate.out).get());
      shares_to_send[2 * i] = wires_[mult_gate.in1] - pre_out->triple_a;
      shares_to_send[2 * i + 1] = wires_[mult_gate.in2] - pre_out->triple_b;
    }
  }

  std::vector<Field> reconstructed(2 * num_mult_gates);
  reconstruct(shares_to_send, reconstructed);

#pragma omp parallel
  {
    field_ctx.restore();
#pragma omp for
    for (size_t i = 0; i < num_mult_gates; ++i) {
      const auto& mult_gate = mult_gates[i];
      const auto* pre_out = static_cast<PreprocMultGate*>(preproc_.gates.at(mult_gate.out).get());

      const Field& u = reconstructed[2 * i];
      const Field& v = reconstructed[2 * i + 1];

      AddShare out = pre_out->triple_c + pre_out->triple_b * u + pre_out->triple_a * v;
      out.add(u * v, id_);
      wires_[mult_gate.out] = out;
    }
  }
}

void OnlineEvaluator::eqzEvaluate(const std::vector<common::utils::FIn1Gate>& eqz_gates) {
  if (id_ == 0) { return; }

  size_t num_eqz_gates = eqz_gates.size();
  if (num_eqz_gates == 0) { return; }

  NTL::ZZ_pContext field_ctx;
  field_ctx.save();

  // Open m1 = x + r1.
  std::vector<AddShare> share_m1(num_eqz_gates);
#pragma omp parallel
  {
    field_ctx.restore();
#pragma omp for
    for (size_t i = 0; i < num_eqz_gates; ++i) {
      const auto* pre_eqz = static_cast<PreprocEqzGate*>(preproc_.gates.at(eqz_gates[i].out).get());
      share_m1[i] = wires_[eqz_gates[i].in] + pre_eqz->share_r1;
    }
  }

  std::vector<Field> recon_m1(num_eqz_gates);
  reconstruct(share_m1, recon_m1);

  // Hamming distance between the public bits of m1 and the shared bits of
  // r1, masked with r2. It is zero iff x == 0.
  std::vector<AddShare> share_m2(num_eqz_gates);
#pragma omp parallel
  {
    field_ctx.restore();
#pragma omp for
    for (size_t i = 0; i < num_eqz_gates; ++i) {
      const auto* pre_eqz = static_cast<PreprocEqzGate*>(preproc_.gates.at(eqz_gates[i].out).get());
      auto m1_bits = bitDecompose(fieldToU64(recon_m1[i]));

      AddShare ham;
      ham.pushValue(Field(0));
      for (int j = 0; j < RINGSIZEBITS; ++j) {
        // m + r - 2*m*r for a public bit m and a shared bit r.
        if (m1_bits[j] == 0) {
          ham += pre_eqz->share_r1_bits[j];
        } else {
          ham -= pre_eqz->share_r1_bits[j];
          ham.add(Field(1), id_);
        }
      }
      share_m2[i] = ham + pre_eqz->share_r2;
    }
  }

  std::vector<Field> recon_m2(num_eqz_gates);
  reconstruct(share_m2, recon_m2);

  // The one-hot vector has its 1 at r2 mod EQZSLOTS; the opened slot hits it
  // iff the distance was zero.
  for (size_t i = 0; i < num_eqz_gates; ++i) {
    const auto* pre_eqz = static_cast<PreprocEqzGate*>(preproc_.gates.at(eqz_gates[i].out).get());
    uint64_t idx = fieldToU64(recon_m2[i]) % EQZSLOTS;
    wires_[eqz_gates[i].out] = pre_eqz->share_r2_onehot[idx];
  }
}

void OnlineEvaluator::evaluateGatesAtDepth(size_t depth) {
  std::vector<common::utils::FIn2Gate> mult_gates;
  std::vector<common::utils::FIn1Gate> eqz_gates;

  // First pass: batch interactive gates.
  for (auto& gate : circ_.gates_by_level[depth]) {
    switch (gate->type) {
      case common::utils::GateType::kMul: {
        auto* g = static_cast<common::utils::FIn2Gate*>(gate.get());
        mult_gates.push_back(*g);
        break;
      }
      case common::utils::GateType::kEqz: {
        auto* g = static_cast<common::utils::FIn1Gate*>(gate.get());
        eqz_gates.push_back(*g);
        break;
      }
      default:
        break;
    }
  }

  if (!mult_gates.empty()) { multEvaluate(mult_gates); }
  if (!eqz_gates.empty()) { eqzEvaluate(eqz_gates); }

  if (id_ == 0) { return; }

  // Second pass: handle locally evaluable gates.
  for (auto& gate : circ_.gates_by_level[depth]) {
    switch (gate->type) {
      case common::utils::GateType::kAdd: {
        auto* g = static_cast<common::utils::FIn2Gate*>(gate.get());
        wires_[g->out] = wires_[g->in1] + wires_[g->in2];
        break;
      }
      case common::utils::GateType::kSub: {
        auto* g = static_cast<common::utils::FIn2Gate*>(gate.get());
        wires_[g->out] = wires_[g->in1] - wires_[g->in2];
        break;
      }
      default:
        break;
    }
  }
}

std::vector<Field> OnlineEvaluator::getOutputs() {
  std::vector<Field> outvals(circ_.outputs.size());
  if (circ_.outputs.empty() || id_ == 0) {
    return outvals;
  }

  std::vector<AddShare> output_shares(circ_.outputs.size());
  for (size_t i = 0; i < circ_.outputs.size(); ++i) {
    output_shares[i] = wires_[circ_.outputs[i]];
  }
  reconstruct(output_shares, outvals);

  verify();

  return outvals;
}

std::vector<Field> OnlineEvaluator::evaluateCircuit(
    const std::unordered_map<common::utils::wire_t, Field>& inputs) {
  setInputs(inputs);
  for (size_t i = 0; i < circ_.gates_by_level.size(); ++i) {
    evaluateGatesAtDepth(i);
  }
  return getOutputs();
}

void OnlineEvaluator::verify() {
  if (id_ == 0) { return; }

  std::array<uint8_t, emp::Hash::DIGEST_SIZE> digest{};
  transcript_.digest(digest.data());

  for (int p = 1; p <= nP_; ++p) {
    if (p != id_) {
      network_->send(p, digest.data(), digest.size());
    }
  }
  network_->flush();

  if (latency_ > 0) { usleep(latency_); }

  bool match = true;
  for (int p = 1; p <= nP_; ++p) {
    if (p != id_) {
      std::array<uint8_t, emp::Hash::DIGEST_SIZE> peer{};
      network_->recv(p, peer.data(), peer.size());
      if (std::memcmp(peer.data(), digest.data(), digest.size()) != 0) {
        match = false;
      }
    }
  }

  if (!match) {
    throw ProtocolAbortError("Parties opened different values; transcript mismatch.");
  }
}

};  // namespace pprl
