#pragma once

#include <io/netmp.h>

#include <chrono>
#include <memory>
#include <ostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct TimePoint {
  using timepoint_t = std::chrono::high_resolution_clock::time_point;
  using timeunit_t = std::chrono::duration<double, std::milli>;

  TimePoint();
  double operator-(const TimePoint& rhs) const;

  timepoint_t time;
};

struct CommPoint {
  std::vector<uint64_t> stats;

  explicit CommPoint(io::NetIOMP& network);
  std::vector<uint64_t> operator-(const CommPoint& rhs) const;
};

class StatsPoint {
  TimePoint tpoint_;
  CommPoint cpoint_;

 public:
  explicit StatsPoint(io::NetIOMP& network);
  nlohmann::json operator-(const StatsPoint& rhs);
};

// Sum of the per peer byte counts of a StatsPoint difference.
uint64_t totalBytes(const nlohmann::json& bench);

bool saveJson(const nlohmann::json& data, const std::string& fpath);
int64_t peakVirtualMemory();
int64_t peakResidentSetSize();
// Field modulus and OpenMP worker count for the calling process.
void initRuntime(size_t num_threads);
// Requested and granted sizes are written to log when it is set.
void increaseSocketBuffers(io::NetIOMP* network, int buffer_size, std::ostream* log = nullptr);
// Connects the helper (party 0) and nP computing parties. The network config
// is a JSON array with one address per party.
std::shared_ptr<io::NetIOMP> createNetwork(int pid, int nP, int port, bool localhost,
                                           const std::string& net_config_path);
