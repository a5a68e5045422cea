#include "sandbox/output_buffer.hpp"

#include "gtest/gtest.h"

namespace {

using sandbox::OutputBuffer;

TEST(OutputBufferTest, TestBelowLimit) {
  OutputBuffer buffer(10);
  buffer.Append("hello", 5);
  EXPECT_EQ(buffer.Release(), "hello");
  EXPECT_FALSE(buffer.Truncated());
}

TEST(OutputBufferTest, TestExactlyAtLimit) {
  OutputBuffer buffer(5);
  buffer.Append("hel", 3);
  buffer.Append("lo", 2);
  EXPECT_EQ(buffer.Release(), "hello");
  EXPECT_FALSE(buffer.Truncated());
}

TEST(OutputBufferTest, TestOverLimit) {
  OutputBuffer buffer(4);
  buffer.Append("hel", 3);
  buffer.Append("lo world", 8);
  buffer.Append("!", 1);
  EXPECT_EQ(buffer.Release(), "hell");
  EXPECT_TRUE(buffer.Truncated());
}

TEST(OutputBufferTest, TestNoLimit) {
  OutputBuffer buffer(0);
  std::string data(100000, 'x');
  buffer.Append(data.data(), data.size());
  EXPECT_EQ(buffer.Release(), data);
  EXPECT_FALSE(buffer.Truncated());
}

}  // namespace
