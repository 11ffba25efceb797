#include <pprl/dataset.h>

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pprl;

namespace {

class DatasetTest : public ::testing::Test {
 protected:
  std::string path_;

  void SetUp() override {
    path_ = ::testing::TempDir() + "pprl_dataset_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".csv";
  }

  void TearDown() override { std::remove(path_.c_str()); }

  void write(const std::string& content) {
    std::ofstream fout(path_, std::ios::binary);
    fout << content;
  }
};

TEST_F(DatasetTest, SelectsColumnByHeader) {
  write("dispense_id,subject_id_md5,quantity\nD0001,abc,10\nD0002,def,30\n");
  EXPECT_EQ(readIdentifierColumn(path_, "subject_id_md5"),
            (std::vector<std::string>{"abc", "def"}));
  EXPECT_EQ(readIdentifierColumn(path_, "dispense_id"),
            (std::vector<std::string>{"D0001", "D0002"}));
}

TEST_F(DatasetTest, HandlesQuotesAndLineEndings) {
  write("\xEF\xBB\xBFid,note\r\n\"a,b\",\"said \"\"hi\"\"\"\r\n\r\n\"multi\nline\",x\r\nlast,y");
  EXPECT_EQ(readIdentifierColumn(path_, "id"),
            (std::vector<std::string>{"a,b", "multi\nline", "last"}));
  EXPECT_EQ(readIdentifierColumn(path_, "note"),
            (std::vector<std::string>{"said \"hi\"", "x", "y"}));
}

TEST_F(DatasetTest, ShortRowsYieldEmptyValues) {
  write("a;b\n1;2\n3\n");
  EXPECT_EQ(readIdentifierColumn(path_, "b", ';'), (std::vector<std::string>{"2", ""}));
}

TEST_F(DatasetTest, ReportsMissingColumnAndFile) {
  write("a,b\n1,2\n");
  EXPECT_THROW(readIdentifierColumn(path_, "c"), std::invalid_argument);
  EXPECT_THROW(readIdentifierColumn(path_ + ".missing", "a"), std::runtime_error);

  write("");
  EXPECT_THROW(readIdentifierColumn(path_, "a"), std::invalid_argument);
}

TEST(ParseDelimitedTest, RejectsUnterminatedQuote) {
  EXPECT_THROW(parseDelimited("a,\"b\n", ','), std::invalid_argument);
}

}  // namespace
