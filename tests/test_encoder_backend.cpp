#include <gtest/gtest.h>

#include "adaptive_encoder/encoder_backend.hpp"
#include "test_support.hpp"

using namespace adaptive_encoder;
using namespace adaptive_encoder::testing_support;

TEST(DiagnosticTail, KeepsLastNonEmptyLines) {
  TempDir dir("tail");
  std::string path = dir.file("stderr.txt",
                              "line 1\nline 2\n\nline 3\nline 4\nline 5\n");
  EXPECT_EQ(read_tail_lines(path, 3),
            (std::vector<std::string>{"line 3", "line 4", "line 5"}));
  EXPECT_EQ(read_tail_lines(path, 10).size(), 5u);
}

TEST(DiagnosticTail, MissingFileOrZeroLines) {
  TempDir dir("tail_missing");
  EXPECT_TRUE(read_tail_lines(dir.path("absent.txt"), 20).empty());
  std::string path = dir.file("stderr.txt", "error\n");
  EXPECT_TRUE(read_tail_lines(path, 0).empty());
}
