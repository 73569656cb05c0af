#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "io/reader.hpp"

namespace usage {
namespace {

class ReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path_ = (std::filesystem::temp_directory_path() /
             (std::string("codex_usage_reader_") + info->name() + ".log")).string();
    std::filesystem::remove(path_);
  }

  void TearDown() override { std::filesystem::remove(path_); }

  void write(const std::string& text, bool append = true) {
    std::ofstream out(path_, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    out << text;
  }

  LineSink collect() {
    return [this](const std::string& line) { lines_.push_back(line); };
  }

  std::string path_;
  std::vector<std::string> lines_;
  Metrics metrics_;
};

TEST_F(ReaderTest, ReadsEveryLineAndStripsCarriageReturns) {
  write("first\r\nsecond\nthird");
  ASSERT_TRUE(readLogFile(path_, collect(), metrics_));
  EXPECT_EQ(lines_, (std::vector<std::string>{"first", "second", "third"}));
  EXPECT_EQ(metrics_.snapshot().read_lines, 3);
}

TEST_F(ReaderTest, MissingFileIsAnError) {
  EXPECT_FALSE(readLogFile(path_, collect(), metrics_));
  EXPECT_TRUE(lines_.empty());
}

TEST_F(ReaderTest, TailHoldsBackPartialLines) {
  LogTail tail(path_);
  EXPECT_FALSE(tail.poll(collect(), metrics_));

  write("one\ntw");
  ASSERT_TRUE(tail.poll(collect(), metrics_));
  EXPECT_EQ(lines_, (std::vector<std::string>{"one"}));

  write("o\nthree\n");
  ASSERT_TRUE(tail.poll(collect(), metrics_));
  EXPECT_EQ(lines_, (std::vector<std::string>{"one", "two", "three"}));
  EXPECT_EQ(tail.offset(), 14u);

  ASSERT_TRUE(tail.poll(collect(), metrics_));
  EXPECT_EQ(lines_.size(), 3u);
}

TEST_F(ReaderTest, TailRestartsAfterTruncation) {
  LogTail tail(path_);
  write("a long first line\n");
  ASSERT_TRUE(tail.poll(collect(), metrics_));
  ASSERT_EQ(lines_.size(), 1u);

  write("new\n", false);
  ASSERT_TRUE(tail.poll(collect(), metrics_));
  ASSERT_EQ(lines_.size(), 2u);
  EXPECT_EQ(lines_[1], "new");
  EXPECT_EQ(tail.offset(), 4u);
}

} // namespace
} // namespace usage
