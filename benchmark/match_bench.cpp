#include <io/netmp.h>
#include <pprl/errors.h>
#include <pprl/matching_engine.h>
#include <pprl/mpc_primitives.h>
#include <pprl/normalizer.h>
#include <pprl/padder.h>
#include <pprl/rand_gen_pool.h>
#include <pprl/session.h>

#include <algorithm>
#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <numeric>
#include <optional>
#include <random>

#include "utils.h"

using namespace pprl;
using json = nlohmann::json;
namespace bpo = boost::program_options;

// Request and dispense style identifier lists: the dispense list reuses
// `overlap` identifiers sampled from the request list and is filled up with
// fresh ones. Both data owners derive the lists from the same seed.
std::vector<std::string> generateDataset(int pid, size_t size, size_t overlap, size_t seed) {
  std::vector<std::string> requests(size);
  for (size_t i = 0; i < size; ++i) {
    requests[i] = boost::str(boost::format("patient-%1$08d") % i);
  }
  if (pid == kPartyA) {
    return requests;
  }

  std::vector<size_t> idx(size);
  std::iota(idx.begin(), idx.end(), 0);
  std::mt19937_64 rng(seed);
  std::shuffle(idx.begin(), idx.end(), rng);

  std::vector<std::string> dispense;
  dispense.reserve(size);
  for (size_t i = 0; i < overlap; ++i) {
    dispense.push_back(requests[idx[i]]);
  }
  for (size_t i = overlap; i < size; ++i) {
    dispense.push_back(boost::str(boost::format("dispense-%1$08d") % i));
  }
  std::shuffle(dispense.begin(), dispense.end(), rng);
  return dispense;
}

void benchmark(const bpo::variables_map& opts) {
  bool save_output = false;
  std::string save_file;
  if (opts.count("output") != 0) {
    save_output = true;
    save_file = opts["output"].as<std::string>();
  }

  auto nP = opts["num-parties"].as<int>();
  auto pid = opts["pid"].as<int>();
  auto size = opts["size"].as<size_t>();
  auto overlap = opts["overlap"].as<size_t>();
  auto latency = opts["latency"].as<double>();
  auto threads = opts["threads"].as<size_t>();
  auto seed = opts["seed"].as<size_t>();
  auto port = opts["port"].as<int>();
  auto use_pking = opts["use-pking"].as<bool>();

  if (overlap > size) {
    throw std::invalid_argument("Overlap cannot exceed the dataset size.");
  }

  initRuntime(threads);

  std::cout << "Starting benchmarks" << std::endl;

  auto network = createNetwork(pid, nP, port, opts["localhost"].as<bool>(),
                               opts.count("net-config") != 0
                                   ? opts["net-config"].as<std::string>()
                                   : std::string());

  // Every open round carries up to L*L words.
  size_t expected_round_bytes = size * size * sizeof(common::utils::Ring);
  int buffer_size = static_cast<int>(std::min<size_t>(
      std::max<size_t>(128 * 1024 * 1024, expected_round_bytes), 1 << 30));
  increaseSocketBuffers(network.get(), buffer_size, &std::cout);

  json output_data;
  output_data["details"] = {{"num_parties", nP},
                            {"size", size},
                            {"overlap", overlap},
                            {"pairs", size * size},
                            {"latency (ms)", latency},
                            {"pid", pid},
                            {"threads", threads},
                            {"seed", seed},
                            {"use_pking", use_pking}};
  output_data["benchmarks"] = json::array();

  std::cout << "--- Details ---" << std::endl;
  for (const auto& [key, value] : output_data["details"].items()) {
    std::cout << key << ": " << value << std::endl;
  }
  std::cout << std::endl;

  std::optional<PaddedTokenSet> padded;
  if (MatchingEngine::isDataOwner(pid)) {
    IdentityNormalizer normalizer;
    auto tokens = normalizer.normalizeAll(generateDataset(pid, size, overlap, seed),
                                          InvalidRecordPolicy::kReject);
    padded = pad(std::move(tokens), size, pid);
  }

  SessionParams params;
  params.num_parties = nP;
  params.bound = size;
  params.token_domain = NormalizerOptions().token_domain;
  agreeOnSession(*network, pid, nP, params, true);

  StatsPoint start(*network);
  auto rgen = RandGenPool::setup(pid, nP, *network);
  MpcPrimitives prims(pid, nP, network, std::move(rgen), static_cast<int>(latency * 1000),
                      use_pking);

  std::unique_ptr<StatsPoint> preproc_start;
  std::unique_ptr<StatsPoint> online_start;
  json preproc_rbench;
  json online_rbench;
  prims.setPhaseHook([&](const std::string& phase) {
    if (phase == "preprocessing") {
      std::cout << "--- Circuit ---" << std::endl;
      std::cout << prims.circuit().orderGatesByLevel() << std::endl;
      std::cout << "Starting preprocessing" << std::endl;
      preproc_start = std::make_unique<StatsPoint>(*network);
    } else if (phase == "online") {
      StatsPoint now(*network);
      preproc_rbench = now - *preproc_start;
      std::cout << "Starting online evaluation" << std::endl;
      online_start = std::make_unique<StatsPoint>(*network);
    } else if (phase == "done") {
      StatsPoint now(*network);
      online_rbench = now - *online_start;
    }
  });

  MatchingEngine engine({pid, nP, size}, prims);
  auto count = engine.run(padded ? &*padded : nullptr);
  network->sync();
  StatsPoint end(*network);

  auto total_rbench = end - start;
  output_data["benchmarks"].push_back(preproc_rbench);
  output_data["benchmarks"].push_back(online_rbench);
  output_data["benchmarks"].push_back(total_rbench);

  std::cout << "preproc time: " << preproc_rbench["time"] << " ms" << std::endl;
  std::cout << "preproc sent: " << totalBytes(preproc_rbench) << " bytes" << std::endl;
  std::cout << "online time: " << online_rbench["time"] << " ms" << std::endl;
  std::cout << "online sent: " << totalBytes(online_rbench) << " bytes" << std::endl;
  std::cout << "total time: " << total_rbench["time"] << " ms" << std::endl;
  std::cout << "total sent: " << totalBytes(total_rbench) << " bytes" << std::endl;
  std::cout << std::endl;

  output_data["stats"] = {{"peak_virtual_memory", peakVirtualMemory()},
                          {"peak_resident_set_size", peakResidentSetSize()}};
  if (count.has_value()) {
    output_data["stats"]["match_count"] = *count;
    output_data["stats"]["match_count_verified"] = (*count == overlap);
  }

  std::cout << "--- Statistics ---" << std::endl;
  for (const auto& [key, value] : output_data["stats"].items()) {
    std::cout << key << ": " << value << std::endl;
  }
  std::cout << std::endl;

  if (save_output) {
    saveJson(output_data, save_file);
  }
}

// clang-format off
bpo::options_description programOptions() {
  bpo::options_description desc("Following options are supported by config file too.");
  desc.add_options()
    ("num-parties,n", bpo::value<int>()->default_value(2), "Number of computing parties.")
    ("size,s", bpo::value<size_t>()->required(), "Records per data owner; also the padding bound.")
    ("overlap", bpo::value<size_t>()->default_value(0), "Number of records common to both datasets.")
    ("latency,l", bpo::value<double>()->default_value(0.5), "Network latency in ms.")
    ("pid,p", bpo::value<int>()->required(), "Party ID.")
    ("threads,t", bpo::value<size_t>()->default_value(6), "Number of threads (recommended 6).")
    ("seed", bpo::value<size_t>()->default_value(200), "Value of the random seed.")
    ("net-config", bpo::value<std::string>(), "Path to JSON file containing network details of all parties.")
    ("localhost", bpo::bool_switch(), "All parties are on same machine.")
    ("port", bpo::value<int>()->default_value(10000), "Base port for networking.")
    ("output,o", bpo::value<std::string>(), "File to save benchmarks.")
    ("use-pking", bpo::value<bool>()->default_value(true), "Use king party for reconstruction (true) or direct reconstruction (false).");
  return desc;
}
// clang-format on

int main(int argc, char* argv[]) {
  auto prog_opts(programOptions());
  bpo::options_description cmdline("Benchmark secure record matching.");
  cmdline.add(prog_opts);
  cmdline.add_options()(
      "config,c", bpo::value<std::string>(),
      "configuration file for easy specification of cmd line arguments")(
      "help,h", "produce help message");
  bpo::variables_map opts;
  bpo::store(bpo::command_line_parser(argc, argv).options(cmdline).run(), opts);
  if (opts.count("help") != 0) {
    std::cout << cmdline << std::endl;
    return 0;
  }
  if (opts.count("config") > 0) {
    std::string cpath(opts["config"].as<std::string>());
    std::ifstream fin(cpath.c_str());
    if (fin.fail()) {
      std::cerr << "Could not open configuration file at " << cpath << std::endl;
      return 1;
    }
    bpo::store(bpo::parse_config_file(fin, prog_opts), opts);
  }
  try {
    bpo::notify(opts);
    if (!opts["localhost"].as<bool>() && (opts.count("net-config") == 0)) {
      throw std::runtime_error("Expected one of 'localhost' or 'net-config'");
    }
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
  }
  try {
    benchmark(opts);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\nFatal error" << std::endl;
    return 1;
  }
  return 0;
}
