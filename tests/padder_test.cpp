#include <pprl/errors.h>
#include <pprl/normalizer.h>
#include <pprl/padder.h>

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

using namespace pprl;

namespace {

std::vector<Token> makeTokens(const std::vector<std::string>& ids) {
  IdentityNormalizer normalizer;
  std::vector<Token> tokens;
  for (const auto& id : ids) {
    tokens.push_back(normalizer.normalize(id));
  }
  return tokens;
}

TEST(PadderTest, PadsToBoundWithSentinelsAfterRealTokens) {
  auto tokens = makeTokens({"p1", "p2", "p3"});
  auto padded = pad(tokens, 5, 1);

  ASSERT_EQ(padded.size(), 5);
  EXPECT_EQ(padded.realCount(), 3);
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(padded[i], tokens[i]);
  }
  EXPECT_TRUE(padded[3].isSentinel());
  EXPECT_TRUE(padded[4].isSentinel());
  EXPECT_NE(padded[3], padded[4]);
}

TEST(PadderTest, ExactFitAndEmptyInput) {
  auto padded = pad(makeTokens({"x", "y"}), 2, 2);
  EXPECT_EQ(padded.size(), 2);
  EXPECT_EQ(padded.realCount(), 2);

  auto empty = pad({}, 3, 1);
  EXPECT_EQ(empty.size(), 3);
  EXPECT_EQ(empty.realCount(), 0);
}

TEST(PadderTest, NeverTruncates) {
  std::vector<std::string> ids;
  for (int i = 0; i < 10; ++i) {
    ids.push_back("id" + std::to_string(i));
  }
  EXPECT_THROW(pad(makeTokens(ids), 5, 1), CapacityExceededError);
  EXPECT_THROW(pad({}, 0, 1), std::invalid_argument);
}

TEST(PadderTest, SentinelsOfDifferentPartiesNeverCoincide) {
  auto a = pad({}, 50, 1);
  auto b = pad({}, 50, 2);
  std::set<Token> seen(a.begin(), a.end());
  EXPECT_EQ(seen.size(), 50);
  for (const auto& tok : b) {
    EXPECT_EQ(seen.count(tok), 0);
  }
}

}  // namespace
