#include "mpc_primitives.h"

#include <boost/format.hpp>
#include <stdexcept>
#include <unordered_map>

#include "../utils/helpers.h"
#include "errors.h"
#include "offline_evaluator.h"
#include "online_evaluator.h"

namespace pprl {

MpcPrimitives::MpcPrimitives(int pid, int nP, std::shared_ptr<io::NetIOMP> network,
                             RandGenPool rgen, int latency, bool use_pking)
    : CircuitPrimitives(pid),
      nP_(nP),
      network_(std::move(network)),
      rgen_(std::move(rgen)),
      latency_(latency),
      use_pking_(use_pking) {
  if (nP_ < 2) {
    throw std::invalid_argument("At least two computing parties are required.");
  }
  if (pid < 0 || pid > nP_) {
    throw std::invalid_argument(
        boost::str(boost::format("Party ID %1% out of range 0..%2%.") % pid % nP_));
  }
  if (!network_ || network_->nP != static_cast<size_t>(nP_) + 1) {
    throw std::invalid_argument("Network must connect the helper and every computing party.");
  }
}

void MpcPrimitives::phase(const std::string& name) const {
  if (hook_) {
    hook_(name);
  }
}

std::optional<common::utils::Ring> MpcPrimitives::evaluate(common::utils::wire_t output) {
  try {
    auto level_circ = circ_.orderGatesByLevel();

    phase("preprocessing");
    OfflineEvaluator off_eval(nP_, pid_, network_, level_circ, std::move(rgen_));
    auto preproc = off_eval.run(input_pid_map_);
    network_->sync();

    phase("online");
    std::unordered_map<common::utils::wire_t, Field> inputs;
    for (const auto& [wire, val] : inputs_) {
      inputs[wire] = u64ToField(val);
    }

    OnlineEvaluator eval(nP_, pid_, network_, std::move(preproc), std::move(level_circ),
                         latency_, use_pking_);
    auto outputs = eval.evaluateCircuit(inputs);
    network_->sync();
    phase("done");

    if (pid_ == 0) {
      return std::nullopt;
    }
    if (outputs.size() != 1) {
      throw ProtocolAbortError("Expected exactly one output.");
    }
    return fieldToU64(outputs[0]);

  } catch (const ProtocolAbortError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProtocolAbortError(
        boost::str(boost::format("Secure evaluation of wire %1% failed: %2%") % output % ex.what()));
  }
}

};  // namespace pprl
