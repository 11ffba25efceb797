#include "offline_evaluator.h"

#include <stdexcept>

#include "../utils/helpers.h"

namespace pprl {

OfflineEvaluator::OfflineEvaluator(int nP, int my_id,
                                   std::shared_ptr<io::NetIOMP> network,
                                   common::utils::LevelOrderedCircuit circ,
                                   RandGenPool rgen)
    : nP_(nP),
      id_(my_id),
      rgen_(std::move(rgen)),
      network_(std::move(network)),
      circ_(std::move(circ)) {}

void OfflineEvaluator::randomShare(int nP, int pid, RandGenPool& rgen, AddShare& share) {
  if (pid == 0) {
    Field val;
    Field valn = Field(0);
    for (int i = 1; i <= nP; i++) {
      randomizeZZp(rgen.pi(i), val);
      valn += val;
    }
    share.pushValue(valn);
  } else {
    share.randomize(rgen.p0());
  }
}

void OfflineEvaluator::randomShareSecret(int nP, int pid, RandGenPool& rgen,
                                         AddShare& share, const Field& secret,
                                         std::vector<Field>& rand_sh_sec,
                                         size_t& idx_rand_sh_sec) {
  if (pid == 0) {
    Field val;
    Field valn = secret;
    share.pushValue(secret);

    for (int i = 1; i < nP; i++) {
      randomizeZZp(rgen.pi(i), val);
      valn -= val;
    }
    rand_sh_sec.push_back(valn);

  } else if (pid != nP) {
    share.randomize(rgen.p0());
  } else {
    share.pushValue(rand_sh_sec.at(idx_rand_sh_sec));
    idx_rand_sh_sec++;
  }
}

void OfflineEvaluator::setWireMasksParty(
    const std::unordered_map<common::utils::wire_t, int>& input_pid_map,
    std::vector<Field>& rand_sh_sec) {
  size_t idx_rand_sh_sec = 0;

  for (const auto& level : circ_.gates_by_level) {
    for (const auto& gate : level) {
      switch (gate->type) {
        case common::utils::GateType::kInp: {
          auto pid = input_pid_map.at(gate->out);

          // Sample the mask value; known to the helper and the input owner.
          Field r = Field(0);
          if (id_ == 0) {
            randomizeZZp(rgen_.pi(pid), r);
          } else if (pid == id_) {
            randomizeZZp(rgen_.p0(), r);
          }

          AddShare r_sh;
          randomShareSecret(nP_, id_, rgen_, r_sh, r, rand_sh_sec, idx_rand_sh_sec);

          preproc_.gates[gate->out] = std::make_unique<PreprocInput>(pid, r_sh, r);
          break;
        }

        case common::utils::GateType::kMul: {
          AddShare triple_a;
          AddShare triple_b;
          AddShare triple_c;

          randomShare(nP_, id_, rgen_, triple_a);
          randomShare(nP_, id_, rgen_, triple_b);

          Field tp_prod = Field(0);
          if (id_ == 0) {
            tp_prod = triple_a.valueAt() * triple_b.valueAt();
          }
          randomShareSecret(nP_, id_, rgen_, triple_c, tp_prod, rand_sh_sec, idx_rand_sh_sec);
          preproc_.gates[gate->out] =
              std::make_unique<PreprocMultGate>(triple_a, triple_b, triple_c);
          break;
        }

        case common::utils::GateType::kEqz: {
          AddShare share_r1;
          AddShare share_r2;
          std::vector<AddShare> share_r1_bits(RINGSIZEBITS);
          std::vector<AddShare> share_r2_onehot(EQZSLOTS);
          std::vector<int> tp_r1_bits(RINGSIZEBITS, 0);

          // sharing r1 and r1_bits
          randomShare(nP_, id_, rgen_, share_r1);
          if (id_ == 0) {
            tp_r1_bits = bitDecompose(fieldToU64(share_r1.valueAt()));
          }
          for (int i = 0; i < RINGSIZEBITS; ++i) {
            randomShareSecret(nP_, id_, rgen_, share_r1_bits[i], Field(tp_r1_bits[i]),
                              rand_sh_sec, idx_rand_sh_sec);
          }

          // sharing r2 and the one-hot encoding of r2 mod EQZSLOTS
          Field tp_r2 = Field(0);
          uint64_t tp_slot = 0;
          if (id_ == 0) {
            randomizeZZp(rgen_.self(), tp_r2);
            tp_slot = fieldToU64(tp_r2) % EQZSLOTS;
          }
          randomShareSecret(nP_, id_, rgen_, share_r2, tp_r2, rand_sh_sec, idx_rand_sh_sec);

          for (int i = 0; i < EQZSLOTS; ++i) {
            Field tp_bit = Field(0);
            if (id_ == 0 && static_cast<uint64_t>(i) == tp_slot) {
              tp_bit = Field(1);
            }
            randomShareSecret(nP_, id_, rgen_, share_r2_onehot[i], tp_bit, rand_sh_sec,
                              idx_rand_sh_sec);
          }

          preproc_.gates[gate->out] = std::make_unique<PreprocEqzGate>(
              share_r1, std::move(share_r1_bits), share_r2, std::move(share_r2_onehot));
          break;
        }

        default: {
          break;
        }
      }
    }
  }
}

void OfflineEvaluator::setWireMasks(
    const std::unordered_map<common::utils::wire_t, int>& input_pid_map) {
  std::vector<Field> rand_sh_sec;

  if (id_ == 0) {
    setWireMasksParty(input_pid_map, rand_sh_sec);

    uint64_t rand_sh_sec_num = rand_sh_sec.size();
    auto words = packFields(rand_sh_sec);
    network_->send(nP_, &rand_sh_sec_num, sizeof(uint64_t));
    network_->send(nP_, words.data(), sizeof(Ring) * words.size());
    network_->flush(nP_);

  } else if (id_ != nP_) {
    setWireMasksParty(input_pid_map, rand_sh_sec);

  } else {
    uint64_t rand_sh_sec_num = 0;
    network_->recv(0, &rand_sh_sec_num, sizeof(uint64_t));

    std::vector<Ring> words(rand_sh_sec_num);
    network_->recv(0, words.data(), sizeof(Ring) * words.size());
    rand_sh_sec = unpackFields(words);

    setWireMasksParty(input_pid_map, rand_sh_sec);
  }
}

PreprocCircuit OfflineEvaluator::getPreproc() {
  return std::move(preproc_);
}

PreprocCircuit OfflineEvaluator::run(
    const std::unordered_map<common::utils::wire_t, int>& input_pid_map) {
  for (const auto& g : circ_.gates_by_level[0]) {
    if (g->type == common::utils::GateType::kInp) {
      auto it = input_pid_map.find(g->out);
      if (it == input_pid_map.end() || it->second < 1 || it->second > nP_) {
        throw std::invalid_argument("Every input wire needs an owner in 1..nP.");
      }
    }
  }

  setWireMasks(input_pid_map);

  return std::move(preproc_);
}

};  // namespace pprl
