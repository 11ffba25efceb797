#pragma once

#include <emp-tool/emp-tool.h>

#include <memory>
#include <unordered_map>
#include <vector>

#include "../io/netmp.h"
#include "../utils/circuit.h"
#include "../utils/types.h"
#include "preproc.h"
#include "rand_gen_pool.h"
#include "sharing.h"

using namespace common::utils;

namespace pprl {

// Preprocessing with a dealer. The helper (party 0) knows every random value
// and derives the shares of parties 1..nP-1 from the PRG it shares with them;
// the shares of party nP are sent in a single message at the end.
class OfflineEvaluator {
  int nP_;
  int id_;
  RandGenPool rgen_;
  std::shared_ptr<io::NetIOMP> network_;
  common::utils::LevelOrderedCircuit circ_;
  PreprocCircuit preproc_;

 public:
  OfflineEvaluator(int nP, int my_id, std::shared_ptr<io::NetIOMP> network,
                   common::utils::LevelOrderedCircuit circ, RandGenPool rgen);

  // Generate sharing of a random unknown value. The helper's share holds the
  // value itself.
  static void randomShare(int nP, int pid, RandGenPool& rgen, AddShare& share);

  // Generate sharing of a value known to the helper. Computing parties pass
  // any value as secret. The helper appends party nP's share to
  // rand_sh_sec; party nP consumes it from there.
  static void randomShareSecret(int nP, int pid, RandGenPool& rgen, AddShare& share,
                                const Field& secret, std::vector<Field>& rand_sh_sec,
                                size_t& idx_rand_sh_sec);

  // Set masks for each wire. Should be called before running any of the other
  // subprotocols.
  void setWireMasksParty(const std::unordered_map<common::utils::wire_t, int>& input_pid_map,
                         std::vector<Field>& rand_sh_sec);

  void setWireMasks(const std::unordered_map<common::utils::wire_t, int>& input_pid_map);

  PreprocCircuit getPreproc();

  PreprocCircuit run(const std::unordered_map<common::utils::wire_t, int>& input_pid_map);
};

};  // namespace pprl
