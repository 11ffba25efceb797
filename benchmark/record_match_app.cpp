#include "record_match_app.h"

#include <io/netmp.h>
#include <pprl/dataset.h>
#include <pprl/errors.h>
#include <pprl/matching_engine.h>
#include <pprl/mpc_primitives.h>
#include <pprl/normalizer.h>
#include <pprl/padder.h>
#include <pprl/rand_gen_pool.h>
#include <pprl/session.h>

#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include <exception>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>

#include "utils.h"

using namespace pprl;
using json = nlohmann::json;
namespace bpo = boost::program_options;

namespace {

char parseDelimiter(const std::string& value) {
  if (value == "tab" || value == "\\t") {
    return '\t';
  }
  if (value.size() != 1) {
    throw std::invalid_argument("Delimiter must be a single character or 'tab'.");
  }
  return value[0];
}

InvalidRecordPolicy parsePolicy(const std::string& value) {
  if (value == "skip") {
    return InvalidRecordPolicy::kSkip;
  }
  if (value == "reject") {
    return InvalidRecordPolicy::kReject;
  }
  throw std::invalid_argument("Expected 'skip' or 'reject' for invalid-records.");
}

void run(const bpo::variables_map& opts, std::ostream& out, std::ostream& err) {
  bool save_output = false;
  std::string save_file;
  if (opts.count("output") != 0) {
    save_output = true;
    save_file = opts["output"].as<std::string>();
  }

  auto pid = opts["pid"].as<int>();
  auto nP = opts["num-parties"].as<int>();
  auto port = opts["port"].as<int>();
  auto threads = opts["threads"].as<size_t>();
  auto latency = opts["latency"].as<double>();
  auto timeout = opts["timeout"].as<int>();
  auto use_pking = opts["use-pking"].as<bool>();
  auto margin = opts["margin"].as<size_t>();
  auto size_bucket = opts["size-bucket"].as<size_t>();
  auto policy = parsePolicy(opts["invalid-records"].as<std::string>());
  auto dedup = opts["dedup"].as<bool>();
  auto verbose = opts["verbose"].as<bool>();

  NormalizerOptions norm_opts;
  norm_opts.token_domain = opts["token-domain"].as<std::string>();
  norm_opts.case_insensitive = opts["case-insensitive"].as<bool>();

  // stdout carries the result only.
  auto log = [verbose, &err](const std::string& msg) {
    if (verbose) {
      err << msg << std::endl;
    }
  };

  if (nP < 2) {
    throw std::invalid_argument("At least two computing parties are required.");
  }
  if (pid < 0 || pid > nP) {
    throw std::invalid_argument(
        boost::str(boost::format("Party ID %1% out of range 0..%2%.") % pid % nP));
  }

  bool data_owner = MatchingEngine::isDataOwner(pid);
  if (data_owner && (opts.count("input") == 0 || opts.count("column") == 0)) {
    throw std::invalid_argument(
        boost::str(boost::format("Party %1% needs 'input' and 'column'.") % pid));
  }

  initRuntime(threads);

  // Local failures are held back until the handshake so that every party
  // aborts together.
  std::exception_ptr local_error;
  std::vector<Token> tokens;

  if (data_owner) {
    try {
      auto raws = readIdentifierColumn(opts["input"].as<std::string>(),
                                       opts["column"].as<std::string>(),
                                       parseDelimiter(opts["delimiter"].as<std::string>()));
      IdentityNormalizer normalizer(norm_opts);
      NormalizationReport report;
      tokens = normalizer.normalizeAll(raws, policy, dedup, &report);
      log(boost::str(boost::format("Loaded %1% records: %2% accepted, %3% skipped, %4% "
                                   "duplicates removed") %
                     raws.size() % report.accepted % report.skipped %
                     report.duplicates_removed));
    } catch (const std::exception& ex) {
      log(boost::str(boost::format("Could not prepare dataset: %1%") % ex.what()));
      local_error = std::current_exception();
      tokens.clear();
    }
  }

  log("Connecting to parties");
  auto network = createNetwork(pid, nP, port, opts["localhost"].as<bool>(),
                               opts.count("net-config") != 0
                                   ? opts["net-config"].as<std::string>()
                                   : std::string());
  if (timeout > 0) {
    network->setTimeout(timeout);
  }
  increaseSocketBuffers(network.get(), 128 * 1024 * 1024, verbose ? &err : nullptr);

  StatsPoint start(*network);

  size_t bound = 0;
  if (opts.count("bound") != 0) {
    bound = opts["bound"].as<size_t>();
  } else {
    uint64_t declared = data_owner ? declaredSize(tokens.size(), size_bucket) : 0;
    bound = negotiateBound(*network, pid, nP, declared, margin);
  }
  log(boost::str(boost::format("Padding bound: %1%") % bound));

  std::optional<PaddedTokenSet> padded;
  if (data_owner && !local_error) {
    try {
      padded = pad(std::move(tokens), bound, pid);
    } catch (const std::exception& ex) {
      log(boost::str(boost::format("Could not pad dataset: %1%") % ex.what()));
      local_error = std::current_exception();
    }
  }

  SessionParams params;
  params.num_parties = nP;
  params.bound = bound;
  params.token_domain = norm_opts.token_domain;
  params.case_insensitive = norm_opts.case_insensitive;

  try {
    agreeOnSession(*network, pid, nP, params, !local_error);
  } catch (const ProtocolAbortError&) {
    if (local_error) {
      std::rethrow_exception(local_error);
    }
    throw;
  }

  auto rgen = RandGenPool::setup(pid, nP, *network);
  MpcPrimitives prims(pid, nP, network, std::move(rgen),
                      static_cast<int>(latency * 1000), use_pking);

  json output_data;
  output_data["details"] = {{"num_parties", nP},
                            {"pid", pid},
                            {"bound", bound},
                            {"latency (ms)", latency},
                            {"threads", threads},
                            {"use_pking", use_pking}};
  output_data["benchmarks"] = json::array();

  std::unique_ptr<StatsPoint> preproc_start;
  std::unique_ptr<StatsPoint> online_start;
  prims.setPhaseHook([&](const std::string& phase) {
    log("Phase: " + phase);
    if (phase == "preprocessing") {
      preproc_start = std::make_unique<StatsPoint>(*network);
    } else if (phase == "online") {
      StatsPoint now(*network);
      output_data["benchmarks"].push_back(now - *preproc_start);
      online_start = std::make_unique<StatsPoint>(*network);
    } else if (phase == "done") {
      StatsPoint now(*network);
      output_data["benchmarks"].push_back(now - *online_start);
    }
  });

  MatchingEngine engine({pid, nP, bound}, prims);
  auto count = engine.run(padded ? &*padded : nullptr);

  StatsPoint end(*network);
  auto total_rbench = end - start;
  output_data["benchmarks"].push_back(total_rbench);
  output_data["stats"] = {{"peak_virtual_memory", peakVirtualMemory()},
                          {"peak_resident_set_size", peakResidentSetSize()}};

  log(boost::str(boost::format("total time: %1% ms") % total_rbench["time"].get<double>()));
  log(boost::str(boost::format("total sent: %1% bytes") % totalBytes(total_rbench)));

  if (count.has_value()) {
    out << *count << std::endl;
  }

  if (save_output) {
    saveJson(output_data, save_file);
  }
}

}  // namespace

// clang-format off
bpo::options_description recordMatchOptions() {
  bpo::options_description desc("Following options are supported by config file too.");
  desc.add_options()
    ("pid,p", bpo::value<int>()->required(), "Party ID: 0 is the helper, 1 and 2 hold data.")
    ("num-parties,n", bpo::value<int>()->default_value(2), "Number of computing parties.")
    ("localhost", bpo::bool_switch(), "All parties are on same machine.")
    ("net-config", bpo::value<std::string>(), "Path to JSON file containing network details of all parties.")
    ("port", bpo::value<int>()->default_value(10000), "Base port for networking.")
    ("input,i", bpo::value<std::string>(), "Delimited file with the identifiers.")
    ("column", bpo::value<std::string>(), "Header name of the identifier column.")
    ("delimiter", bpo::value<std::string>()->default_value(","), "Field delimiter or 'tab'.")
    ("bound,L", bpo::value<size_t>(), "Public padded dataset size. Negotiated when absent.")
    ("margin", bpo::value<size_t>()->default_value(0), "Added to the negotiated bound.")
    ("size-bucket", bpo::value<size_t>()->default_value(16), "Declared sizes are rounded up to a multiple of this. The helper learns the rounded sizes.")
    ("invalid-records", bpo::value<std::string>()->default_value("skip"), "Invalid identifiers: 'skip' or 'reject'.")
    ("dedup", bpo::bool_switch(), "Remove duplicate identifiers before matching.")
    ("case-insensitive", bpo::bool_switch(), "Fold ASCII case before hashing.")
    ("token-domain", bpo::value<std::string>()->default_value("pprl-token-v1"), "Domain separation string for tokens.")
    ("threads,t", bpo::value<size_t>()->default_value(6), "Number of threads.")
    ("latency,l", bpo::value<double>()->default_value(0.0), "Simulated network latency in ms.")
    ("timeout", bpo::value<int>()->default_value(0), "Abort when a peer stalls for this many seconds (0 waits forever).")
    ("use-pking", bpo::value<bool>()->default_value(true), "Use king party for reconstruction (true) or direct reconstruction (false).")
    ("output,o", bpo::value<std::string>(), "File to save statistics.")
    ("verbose,v", bpo::bool_switch(), "Print progress on stderr.");
  return desc;
}
// clang-format on

int runRecordMatch(int argc, const char* const argv[], std::ostream& out, std::ostream& err) {
  auto prog_opts(recordMatchOptions());
  bpo::options_description cmdline("Count records common to two datasets without revealing them.");
  cmdline.add(prog_opts);
  cmdline.add_options()(
      "config,c", bpo::value<std::string>(),
      "configuration file for easy specification of cmd line arguments")(
      "help,h", "produce help message");
  bpo::variables_map opts;
  try {
    bpo::store(bpo::command_line_parser(argc, argv).options(cmdline).run(), opts);
    if (opts.count("help") != 0) {
      out << cmdline << std::endl;
      return 0;
    }
    if (opts.count("config") > 0) {
      std::string cpath(opts["config"].as<std::string>());
      std::ifstream fin(cpath.c_str());
      if (fin.fail()) {
        err << "Could not open configuration file at " << cpath << std::endl;
        return 1;
      }
      bpo::store(bpo::parse_config_file(fin, prog_opts), opts);
    }
    bpo::notify(opts);
    if (!opts["localhost"].as<bool>() && (opts.count("net-config") == 0)) {
      throw std::runtime_error("Expected one of 'localhost' or 'net-config'");
    }
  } catch (const std::exception& ex) {
    err << ex.what() << std::endl;
    return 1;
  }

  try {
    run(opts, out, err);
  } catch (const std::exception& ex) {
    err << ex.what() << "\nAborted" << std::endl;
    return 1;
  }
  return 0;
}
