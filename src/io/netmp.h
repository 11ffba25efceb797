#pragma once

#include <emp-tool/emp-tool.h>
#include <poll.h>
#include <sys/socket.h>

#include <boost/format.hpp>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace io {

// A peer closed its connection, a socket operation failed, or a peer stalled
// for longer than the configured timeout.
class NetworkError : public std::runtime_error {
 public:
  explicit NetworkError(const std::string& what) : std::runtime_error(what) {}
};

// Pairwise channels between nP parties. Every pair (i, j) with i < j is
// connected by two NetIO instances: on ios the smaller party is the client and
// on ios2 it is the server. Party i sends to j on ios and j sends to i on
// ios2, so both directions are buffered and flushed independently.
//
// NetIO establishes the connections and counts the bytes sent. Data is moved
// on the connected sockets directly so that failures are reported as
// NetworkError instead of terminating the process.
class NetIOMP {
  // Pending data is written out once a peer's buffer grows past this.
  static constexpr size_t kFlushThreshold = 1 << 20;

  std::vector<std::vector<char>> pending_;
  int timeout_ms_{-1};

  // Blocks until fd is ready for `events`.
  void waitFor(size_t peer, int fd, short events) const {
    while (true) {
      struct pollfd pfd {};
      pfd.fd = fd;
      pfd.events = events;
      int ready = ::poll(&pfd, 1, timeout_ms_);
      if (ready > 0) {
        return;
      }
      if (ready == 0) {
        throw NetworkError(
            boost::str(boost::format("Timed out waiting for party %1%.") % peer));
      }
      if (errno != EINTR) {
        throw NetworkError(boost::str(boost::format("Polling party %1% failed: %2%") % peer %
                                      std::strerror(errno)));
      }
    }
  }

  void writeAll(size_t dst, const char* data, size_t len) {
    int fd = getSendChannel(dst)->consocket;
    size_t done = 0;
    while (done < len) {
      waitFor(dst, fd, POLLOUT);
      ssize_t n = ::send(fd, data + done, len - done, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
          continue;
        }
        throw NetworkError(boost::str(boost::format("Sending to party %1% failed: %2%") % dst %
                                      std::strerror(errno)));
      }
      done += static_cast<size_t>(n);
    }
  }

  void readAll(size_t src, char* data, size_t len) {
    int fd = getRecvChannel(src)->consocket;
    size_t done = 0;
    while (done < len) {
      waitFor(src, fd, POLLIN);
      ssize_t n = ::recv(fd, data + done, len - done, 0);
      if (n == 0) {
        throw NetworkError(
            boost::str(boost::format("Party %1% closed the connection.") % src));
      }
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
          continue;
        }
        throw NetworkError(boost::str(boost::format("Receiving from party %1% failed: %2%") %
                                      src % std::strerror(errno)));
      }
      done += static_cast<size_t>(n);
    }
  }

 public:
  size_t nP;
  size_t party;
  std::vector<std::unique_ptr<emp::NetIO>> ios;
  std::vector<std::unique_ptr<emp::NetIO>> ios2;
  std::vector<bool> sent;

  // IP must hold nP addresses unless localhost is set.
  NetIOMP(size_t party, size_t nP, int port, char* IP[], bool localhost = false)
      : pending_(nP), nP(nP), party(party), ios(nP), ios2(nP), sent(nP, false) {
    if (party >= nP) {
      throw std::invalid_argument("Party ID out of range.");
    }

    for (size_t i = 0; i < nP; ++i) {
      for (size_t j = i + 1; j < nP; ++j) {
        int pair_port = port + 2 * static_cast<int>(i * nP + j);
        if (i == party) {
          const char* addr = localhost ? "127.0.0.1" : IP[j];
          ios[j] = std::make_unique<emp::NetIO>(addr, pair_port, true);
          ios2[j] = std::make_unique<emp::NetIO>(nullptr, pair_port + 1, true);
        } else if (j == party) {
          const char* addr = localhost ? "127.0.0.1" : IP[i];
          ios[i] = std::make_unique<emp::NetIO>(nullptr, pair_port, true);
          ios2[i] = std::make_unique<emp::NetIO>(addr, pair_port + 1, true);
        }
      }
    }
  }

  // Channel used to send to idx (b = false) or to receive from idx (b = true).
  emp::NetIO* get(size_t idx, bool b = false) {
    if (b) {
      return idx < party ? ios[idx].get() : ios2[idx].get();
    }
    return party < idx ? ios[idx].get() : ios2[idx].get();
  }

  emp::NetIO* getSendChannel(size_t idx) { return get(idx, false); }
  emp::NetIO* getRecvChannel(size_t idx) { return get(idx, true); }

  void send(size_t dst, const void* data, size_t len) {
    if (dst == party) {
      return;
    }
    const auto* bytes = static_cast<const char*>(data);
    pending_[dst].insert(pending_[dst].end(), bytes, bytes + len);
    getSendChannel(dst)->counter += len;
    sent[dst] = true;
    if (pending_[dst].size() >= kFlushThreshold) {
      flush(static_cast<int>(dst));
    }
  }

  void recv(size_t src, void* data, size_t len) {
    if (src == party) {
      return;
    }
    if (sent[src]) {
      flush(static_cast<int>(src));
    }
    readAll(src, static_cast<char*>(data), len);
  }

  void flush(int idx = -1) {
    if (idx == -1) {
      for (size_t i = 0; i < nP; ++i) {
        if (i != party) {
          flush(static_cast<int>(i));
        }
      }
    } else if (static_cast<size_t>(idx) != party) {
      auto& buf = pending_[idx];
      if (!buf.empty()) {
        writeAll(idx, buf.data(), buf.size());
        buf.clear();
      }
      sent[idx] = false;
    }
  }

  // Barrier across all parties. Pairs are processed in increasing order of
  // the peer's id so that the exchange cannot deadlock.
  void sync() {
    char tmp = 0;
    for (size_t i = 0; i < nP; ++i) {
      if (i == party) {
        continue;
      }
      if (party < i) {
        send(i, &tmp, 1);
        recv(i, &tmp, 1);
      } else {
        recv(i, &tmp, 1);
        send(i, &tmp, 1);
        flush(i);
      }
    }
  }

  // Sends and receives that stall for longer than `seconds` throw
  // NetworkError. A value of 0 waits forever.
  void setTimeout(int seconds) { timeout_ms_ = seconds > 0 ? seconds * 1000 : -1; }
};

};  // namespace io
