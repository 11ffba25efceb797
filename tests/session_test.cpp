#include <io/netmp.h>
#include <pprl/errors.h>
#include <pprl/session.h>

#include <gtest/gtest.h>

#include <functional>
#include <future>
#include <memory>
#include <vector>

using namespace pprl;

namespace {

template <class R>
std::vector<R> runParties(int nP, int port, const std::function<R(int, io::NetIOMP&)>& fn) {
  std::vector<std::future<R>> parties;
  for (int pid = 0; pid <= nP; ++pid) {
    parties.push_back(std::async(std::launch::async, [=]() {
      io::NetIOMP network(pid, nP + 1, port, nullptr, true);
      return fn(pid, network);
    }));
  }

  std::vector<R> res;
  for (auto& p : parties) {
    res.push_back(p.get());
  }
  return res;
}

SessionParams defaultParams(int nP, size_t bound) {
  SessionParams params;
  params.num_parties = nP;
  params.bound = bound;
  params.token_domain = "pprl-token-v1";
  return params;
}

TEST(SessionTest, DeclaredSizeIsRoundedUp) {
  EXPECT_EQ(declaredSize(0, 10), 0);
  EXPECT_EQ(declaredSize(1, 10), 10);
  EXPECT_EQ(declaredSize(10, 10), 10);
  EXPECT_EQ(declaredSize(11, 10), 20);
  EXPECT_EQ(declaredSize(7, 1), 7);
  EXPECT_EQ(declaredSize(7, 0), 7);
}

TEST(SessionTest, DigestCoversEveryParameter) {
  auto base = defaultParams(2, 5);
  EXPECT_EQ(base.digest(), defaultParams(2, 5).digest());

  auto other = base;
  other.bound = 6;
  EXPECT_NE(base.digest(), other.digest());

  other = base;
  other.num_parties = 3;
  EXPECT_NE(base.digest(), other.digest());

  other = base;
  other.token_domain = "pprl-token-v2";
  EXPECT_NE(base.digest(), other.digest());

  other = base;
  other.case_insensitive = true;
  EXPECT_NE(base.digest(), other.digest());

  other = base;
  other.version = kProtocolVersion + 1;
  EXPECT_NE(base.digest(), other.digest());
}

TEST(SessionTest, BoundIsLargestDeclaredSizePlusMargin) {
  std::function<size_t(int, io::NetIOMP&)> party = [](int pid, io::NetIOMP& network) {
    uint64_t declared = 0;
    if (pid == 1) {
      declared = 3;
    } else if (pid == 2) {
      declared = 7;
    }
    return negotiateBound(network, pid, 3, declared, 2);
  };

  auto res = runParties(3, 15000, party);
  for (auto bound : res) {
    EXPECT_EQ(bound, 9);
  }
}

TEST(SessionTest, BoundIsNeverZero) {
  std::function<size_t(int, io::NetIOMP&)> party = [](int pid, io::NetIOMP& network) {
    return negotiateBound(network, pid, 2, 0, 0);
  };

  auto res = runParties(2, 15100, party);
  for (auto bound : res) {
    EXPECT_EQ(bound, 1);
  }
}

TEST(SessionTest, DataOwnersReportSizesOnlyToTheHelper) {
  // {bound, bytes sent to party 0, to party 1, to party 2}
  std::function<std::vector<uint64_t>(int, io::NetIOMP&)> party = [](int pid,
                                                                     io::NetIOMP& network) {
    uint64_t declared = 0;
    if (pid == 1) {
      declared = 10;
    } else if (pid == 2) {
      declared = 3;
    }
    std::vector<uint64_t> res{negotiateBound(network, pid, 2, declared, 0)};
    for (int p = 0; p <= 2; ++p) {
      res.push_back(p == pid ? 0 : network.getSendChannel(p)->counter);
    }
    return res;
  };

  auto res = runParties(2, 15600, party);
  EXPECT_EQ(res[0], (std::vector<uint64_t>{10, 0, 8, 8}));
  EXPECT_EQ(res[1], (std::vector<uint64_t>{10, 8, 0, 0}));
  EXPECT_EQ(res[2], (std::vector<uint64_t>{10, 8, 0, 0}));
}

TEST(SessionTest, NegotiationAbortsWhenADataOwnerDisconnects) {
  std::function<bool(int, io::NetIOMP&)> party = [](int pid, io::NetIOMP& network) {
    if (pid == 2) {
      return false;
    }
    network.setTimeout(10);
    try {
      negotiateBound(network, pid, 2, 4, 0);
    } catch (const ProtocolAbortError&) {
      return true;
    }
    return false;
  };

  auto aborted = runParties(2, 15700, party);
  EXPECT_TRUE(aborted[0]);
  EXPECT_TRUE(aborted[1]);
}

// Returns whether each party aborted.
std::vector<bool> handshake(int port, const std::function<SessionParams(int)>& params,
                            const std::function<bool(int)>& ready) {
  std::function<bool(int, io::NetIOMP&)> party = [&](int pid, io::NetIOMP& network) {
    try {
      agreeOnSession(network, pid, 2, params(pid), ready(pid));
    } catch (const ProtocolAbortError&) {
      return true;
    }
    return false;
  };
  return runParties(2, port, party);
}

TEST(SessionTest, AgreementSucceeds) {
  auto aborted = handshake(
      15200, [](int) { return defaultParams(2, 5); }, [](int) { return true; });
  EXPECT_EQ(aborted, (std::vector<bool>{false, false, false}));
}

TEST(SessionTest, ParameterMismatchAbortsEveryParty) {
  auto aborted = handshake(
      15300,
      [](int pid) {
        auto params = defaultParams(2, 5);
        if (pid == 2) {
          params.bound = 6;
        }
        return params;
      },
      [](int) { return true; });
  EXPECT_EQ(aborted, (std::vector<bool>{true, true, true}));
}

TEST(SessionTest, PartyNotReadyAbortsEveryParty) {
  auto aborted = handshake(
      15400, [](int) { return defaultParams(2, 5); }, [](int pid) { return pid != 2; });
  EXPECT_EQ(aborted, (std::vector<bool>{true, true, true}));
}

TEST(SessionTest, CoordinatorNotReadyAbortsEveryParty) {
  auto aborted = handshake(
      15500, [](int) { return defaultParams(2, 5); }, [](int pid) { return pid != 1; });
  EXPECT_EQ(aborted, (std::vector<bool>{true, true, true}));
}

}  // namespace
