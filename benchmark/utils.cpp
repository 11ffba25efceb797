#include "utils.h"

#include <omp.h>
#include <sys/socket.h>
#include <utils/helpers.h>

#include <cerrno>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

void increaseSocketBuffers(io::NetIOMP* network, int buffer_size, std::ostream* log) {
  int actual_sndbuf = 0;
  int actual_rcvbuf = 0;
  socklen_t optlen = sizeof(int);
  bool first_socket = true;

  for (size_t i = 0; i < network->nP; ++i) {
    if (i == network->party) {
      continue;
    }
    auto* send_channel = network->getSendChannel(i);
    auto* recv_channel = network->getRecvChannel(i);

    for (auto* chan : {send_channel, recv_channel}) {
      if (chan == nullptr || chan->consocket < 0) {
        continue;
      }
      int fd = chan->consocket;
      int ret1 = setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &buffer_size, sizeof(buffer_size));
      int ret2 = setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &buffer_size, sizeof(buffer_size));

      if (first_socket) {
        getsockopt(fd, SOL_SOCKET, SO_SNDBUF, &actual_sndbuf, &optlen);
        getsockopt(fd, SOL_SOCKET, SO_RCVBUF, &actual_rcvbuf, &optlen);
        first_socket = false;

        if (ret1 != 0 || ret2 != 0) {
          std::cerr << "Warning: setsockopt failed (errno: " << errno << ")" << std::endl;
        }
      }
    }
  }

  if (log != nullptr) {
    *log << "Requested socket buffers: " << buffer_size << " bytes" << std::endl;
    if (actual_sndbuf > 0 || actual_rcvbuf > 0) {
      *log << "Actual socket buffers: SNDBUF=" << actual_sndbuf
                << " bytes, RCVBUF=" << actual_rcvbuf << " bytes" << std::endl;
    }
  }
}

std::shared_ptr<io::NetIOMP> createNetwork(int pid, int nP, int port, bool localhost,
                                           const std::string& net_config_path) {
  if (localhost) {
    return std::make_shared<io::NetIOMP>(pid, nP + 1, port, nullptr, true);
  }

  std::ifstream fnet(net_config_path);
  if (!fnet.good()) {
    fnet.close();
    throw std::runtime_error("Could not open network config file");
  }
  nlohmann::json netdata;
  fnet >> netdata;
  fnet.close();

  if (!netdata.is_array() || netdata.size() < static_cast<size_t>(nP) + 1) {
    throw std::runtime_error("Network config must list an address for every party");
  }

  std::vector<std::string> ipaddress(nP + 1);
  std::vector<char*> ip(nP + 1);
  for (int i = 0; i < nP + 1; ++i) {
    ipaddress[i] = netdata[i].get<std::string>();
    ip[i] = ipaddress[i].data();
  }
  return std::make_shared<io::NetIOMP>(pid, nP + 1, port, ip.data(), false);
}

TimePoint::TimePoint() : time(timepoint_t::clock::now()) {}

double TimePoint::operator-(const TimePoint& rhs) const {
  return std::chrono::duration_cast<timeunit_t>(time - rhs.time).count();
}

CommPoint::CommPoint(io::NetIOMP& network) : stats(network.nP) {
  for (size_t i = 0; i < network.nP; ++i) {
    if (i != network.party) {
      stats[i] = network.get(i, false)->counter + network.get(i, true)->counter;
    }
  }
}

std::vector<uint64_t> CommPoint::operator-(const CommPoint& rhs) const {
  std::vector<uint64_t> res(stats.size());
  for (size_t i = 0; i < stats.size(); ++i) {
    res[i] = stats[i] - rhs.stats[i];
  }
  return res;
}

StatsPoint::StatsPoint(io::NetIOMP& network) : cpoint_(network) {}

nlohmann::json StatsPoint::operator-(const StatsPoint& rhs) {
  return {{"time", tpoint_ - rhs.tpoint_},
          {"communication", cpoint_ - rhs.cpoint_}};
}

uint64_t totalBytes(const nlohmann::json& bench) {
  uint64_t total = 0;
  for (const auto& val : bench["communication"]) {
    total += val.get<uint64_t>();
  }
  return total;
}

bool saveJson(const nlohmann::json& data, const std::string& fpath) {
  std::ofstream fout;
  fout.open(fpath, std::fstream::app);
  if (!fout.is_open()) {
    std::cerr << "Could not open save file at " << fpath << std::endl;
    return false;
  }

  fout << data;
  fout << std::endl;
  fout.close();

  return true;
}

void initRuntime(size_t num_threads) {
  common::utils::initField();
  omp_set_num_threads(static_cast<int>(num_threads));
}

#ifdef __linux__
// Reference: https://gist.github.com/k3vur/4169316
int64_t getProcStatus(const std::string& key) {
  int64_t value = 0;

  const char* filename = "/proc/self/status";

  std::ifstream procfile(filename);
  std::string word;
  while (procfile.good()) {
    procfile >> word;
    if (word == key) {
      procfile >> value;
      break;
    }

    // Skip to end of line.
    procfile.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
  }

  if (procfile.fail()) {
    return -1;
  }

  return value;
}

int64_t peakVirtualMemory() { return getProcStatus("VmPeak:"); }

int64_t peakResidentSetSize() { return getProcStatus("VmHWM:"); }
#else
int64_t peakVirtualMemory() { return -1; }

int64_t peakResidentSetSize() { return -1; }
#endif
