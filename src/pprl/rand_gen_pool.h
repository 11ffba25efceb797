#pragma once

#include <emp-tool/emp-tool.h>

#include <cstdint>
#include <vector>

#include "../io/netmp.h"

namespace pprl {

// PRGs with keys shared between subsets of parties. Party 0 is the helper
// that deals preprocessing material; parties 1..nP compute.
//
// - pi(i) on the helper and p0() on party i share a key, so the helper can
//   derive party i's shares without sending them.
// - all_minus_0() is shared by all computing parties.
// - self() is private.
class RandGenPool {
  int id_;
  int nP_;

  emp::PRG k_self_;
  emp::PRG k_all_minus_0_;
  std::vector<emp::PRG> k_pi_;

 public:
  // Keys derived from a common seed. Only meaningful when all parties live in
  // one process, e.g. in tests.
  RandGenPool(int my_id, int num_parties, uint64_t seed = 200);

  // Keys: pair_keys[i] shared with party i (only pair_keys[0] is used by a
  // computing party), all_key shared by the computing parties.
  RandGenPool(int my_id, int num_parties, emp::block self_key,
              const std::vector<emp::block>& pair_keys, emp::block all_key);

  // Samples fresh keys and distributes them over the network: the helper
  // sends one key to each computing party, party 1 sends the common key to
  // parties 2..nP.
  static RandGenPool setup(int my_id, int num_parties, io::NetIOMP& network);

  emp::PRG& self();
  emp::PRG& all_minus_0();
  emp::PRG& p0();
  emp::PRG& pi(int i);
};

};  // namespace pprl
