#include "rand_gen_pool.h"

#include <boost/format.hpp>
#include <stdexcept>

#include "errors.h"

namespace pprl {

RandGenPool::RandGenPool(int my_id, int num_parties, uint64_t seed)
    : id_{my_id}, nP_{num_parties}, k_pi_(num_parties + 1) {
  auto self_key = emp::makeBlock(seed, static_cast<uint64_t>(my_id) + (1ULL << 32));
  k_self_.reseed(&self_key);

  auto all_key = emp::makeBlock(seed, 1ULL << 33);
  k_all_minus_0_.reseed(&all_key);

  for (int i = 0; i <= nP_; ++i) {
    // Helper keeps one key per computing party; party i keeps the one it
    // shares with the helper in slot 0.
    int peer = (id_ == 0) ? i : id_;
    auto pair_key = emp::makeBlock(seed, static_cast<uint64_t>(peer));
    k_pi_[i].reseed(&pair_key);
  }
}

RandGenPool::RandGenPool(int my_id, int num_parties, emp::block self_key,
                         const std::vector<emp::block>& pair_keys, emp::block all_key)
    : id_{my_id}, nP_{num_parties}, k_pi_(num_parties + 1) {
  if (pair_keys.size() != static_cast<size_t>(num_parties) + 1) {
    throw std::invalid_argument("Expected one pair key per party.");
  }
  k_self_.reseed(&self_key);
  k_all_minus_0_.reseed(&all_key);
  for (int i = 0; i <= nP_; ++i) {
    k_pi_[i].reseed(&pair_keys[i]);
  }
}

RandGenPool RandGenPool::setup(int my_id, int num_parties, io::NetIOMP& network) {
  emp::PRG fresh;
  emp::block self_key;
  emp::block all_key = emp::zero_block;
  std::vector<emp::block> pair_keys(num_parties + 1, emp::zero_block);
  fresh.random_block(&self_key, 1);

  try {
    if (my_id == 0) {
      fresh.random_block(pair_keys.data(), num_parties + 1);
      for (int i = 1; i <= num_parties; ++i) {
        network.send(i, &pair_keys[i], sizeof(emp::block));
        network.flush(i);
      }
    } else {
      network.recv(0, &pair_keys[0], sizeof(emp::block));
      if (my_id == 1) {
        fresh.random_block(&all_key, 1);
        for (int i = 2; i <= num_parties; ++i) {
          network.send(i, &all_key, sizeof(emp::block));
          network.flush(i);
        }
      } else {
        network.recv(1, &all_key, sizeof(emp::block));
      }
    }
  } catch (const io::NetworkError& ex) {
    throw ProtocolAbortError(
        boost::str(boost::format("Key distribution failed: %1%") % ex.what()));
  }

  return {my_id, num_parties, self_key, pair_keys, all_key};
}

emp::PRG& RandGenPool::self() { return k_self_; }

emp::PRG& RandGenPool::all_minus_0() { return k_all_minus_0_; }

emp::PRG& RandGenPool::p0() { return k_pi_[0]; }

emp::PRG& RandGenPool::pi(int i) { return k_pi_.at(i); }

};  // namespace pprl
