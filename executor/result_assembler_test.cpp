#include "executor/result_assembler.hpp"

#include <signal.h>

#include "gtest/gtest.h"
#include "sandbox/output_buffer.hpp"

namespace {

using executor::AssembleResult;
using executor::SanitizeUtf8;

TEST(SanitizeUtf8Test, TestValid) {
  EXPECT_EQ(SanitizeUtf8("hello"), "hello");
  EXPECT_EQ(SanitizeUtf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"),
            "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
  EXPECT_EQ(SanitizeUtf8(std::string("a\0b", 3)), std::string("a\0b", 3));
}

TEST(SanitizeUtf8Test, TestInvalid) {
  EXPECT_EQ(SanitizeUtf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
  EXPECT_EQ(SanitizeUtf8("\x80"), "\xEF\xBF\xBD");
  // Overlong encodings and surrogates.
  EXPECT_EQ(SanitizeUtf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
  EXPECT_EQ(SanitizeUtf8("\xED\xA0\x80"),
            "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(SanitizeUtf8Test, TestTruncatedSequence) {
  // A sequence cut by the output ceiling becomes a single replacement.
  EXPECT_EQ(SanitizeUtf8("ok\xE2\x82"), "ok\xEF\xBF\xBD");
  EXPECT_EQ(SanitizeUtf8("\xF0\x9F\x98" "x"), "\xEF\xBF\xBD" "x");
}

TEST(SanitizeUtf8Test, TestCutByCeiling) {
  // The incomplete character at the end of a truncated stream is dropped.
  EXPECT_EQ(SanitizeUtf8("ok\xE2\x82", true), "ok");
  EXPECT_EQ(SanitizeUtf8("ok\xC3", true), "ok");
  // Replacements never make a truncated stream longer than it was.
  EXPECT_EQ(SanitizeUtf8("\xFF\xFF\xFF\xFF", true),
            "\xEF\xBF\xBD");
  EXPECT_EQ(SanitizeUtf8("ab\xFF", true), "ab");
}

TEST(AssembleResultTest, TestNormalExit) {
  sandbox::ExecutionInfo info;
  info.status_code = 3;
  info.stdout_data = "out";
  info.stderr_data = "err";
  info.wall_time_millis = 42;
  proto::ExecutionResult result = AssembleResult(info);
  ASSERT_TRUE(result.has_exit_code());
  EXPECT_EQ(result.exit_code(), 3);
  EXPECT_EQ(result.stdout(), "out");
  EXPECT_EQ(result.stderr(), "err");
  EXPECT_EQ(result.duration_ms(), 42);
  EXPECT_FALSE(result.timed_out());
  EXPECT_FALSE(result.truncated());
}

TEST(AssembleResultTest, TestSignal) {
  sandbox::ExecutionInfo info;
  info.signal = SIGSEGV;
  proto::ExecutionResult result = AssembleResult(info);
  ASSERT_TRUE(result.has_exit_code());
  EXPECT_EQ(result.exit_code(), -SIGSEGV);
  EXPECT_EQ(result.signal(), SIGSEGV);
}

TEST(AssembleResultTest, TestTimedOut) {
  sandbox::ExecutionInfo info;
  info.signal = SIGKILL;
  info.timed_out = true;
  info.stdout_data = "partial";
  proto::ExecutionResult result = AssembleResult(info);
  EXPECT_FALSE(result.has_exit_code());
  EXPECT_TRUE(result.timed_out());
  EXPECT_EQ(result.stdout(), "partial");
}

TEST(AssembleResultTest, TestTruncated) {
  sandbox::ExecutionInfo info;
  info.stderr_truncated = true;
  proto::ExecutionResult result = AssembleResult(info);
  EXPECT_TRUE(result.truncated());
  EXPECT_FALSE(result.stdout_truncated());
  EXPECT_TRUE(result.stderr_truncated());
}

TEST(AssembleResultTest, TestCharacterStraddlingCeiling) {
  sandbox::OutputBuffer buffer(100);
  std::string output = std::string(99, 'a') + "\xC3\xA9" + "tail";
  buffer.Append(output.data(), output.size());
  sandbox::ExecutionInfo info;
  info.stdout_truncated = buffer.Truncated();
  info.stdout_data = buffer.Release();
  proto::ExecutionResult result = AssembleResult(info);
  EXPECT_TRUE(result.truncated());
  EXPECT_LE(result.stdout().size(), 100u);
  EXPECT_EQ(result.stdout(), std::string(99, 'a'));
}

TEST(AssembleResultTest, TestAsciiTruncatedToCeiling) {
  sandbox::ExecutionInfo info;
  info.stdout_truncated = true;
  info.stdout_data = std::string(100, 'x');
  EXPECT_EQ(AssembleResult(info).stdout().size(), 100u);
}

}  // namespace
