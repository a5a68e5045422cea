#include "executor/local_executor.hpp"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::EndsWith;
using ::testing::StartsWith;

class LocalExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tmp_.reset(new util::TempDir(::testing::TempDir()));
    config_.root = util::File::RealPath(tmp_->Path());
    config_.interpreter = "/bin/sh";
    config_.script_suffix = ".sh";
    config_.max_concurrent = 4;
  }

  proto::ExecutionRequest Request(const std::string& code,
                                  double timeout_s = 5) {
    proto::ExecutionRequest request;
    request.set_code(code);
    request.set_timeout_s(timeout_s);
    return request;
  }

  std::unique_ptr<util::TempDir> tmp_;
  core::SandboxConfig config_;
};

TEST_F(LocalExecutorTest, TestOutputAndExitCode) {
  executor::LocalExecutor executor(config_);
  proto::ExecutionResult result =
      executor.Execute(Request("echo out; echo err >&2; exit 2"));
  EXPECT_EQ(result.stdout(), "out\n");
  EXPECT_EQ(result.stderr(), "err\n");
  ASSERT_TRUE(result.has_exit_code());
  EXPECT_EQ(result.exit_code(), 2);
  EXPECT_FALSE(result.timed_out());
  EXPECT_FALSE(result.truncated());
}

TEST_F(LocalExecutorTest, TestWorkingDirectoryIsRoot) {
  executor::LocalExecutor executor(config_);
  proto::ExecutionResult result = executor.Execute(Request("pwd -P"));
  EXPECT_EQ(result.stdout(), config_.root + "\n");
}

TEST_F(LocalExecutorTest, TestStagedFileRemoved) {
  executor::LocalExecutor executor(config_);
  proto::ExecutionResult result = executor.Execute(Request("echo \"$0\""));
  ASSERT_EQ(result.exit_code(), 0);
  std::string script = result.stdout().substr(0, result.stdout().size() - 1);
  EXPECT_THAT(script, StartsWith(config_.root + "/.codebox-"));
  EXPECT_THAT(script, EndsWith(".sh"));
  EXPECT_FALSE(util::File::Exists(script));
}

TEST_F(LocalExecutorTest, TestStagedFileRemovedOnTimeout) {
  executor::LocalExecutor executor(config_);
  proto::ExecutionResult result =
      executor.Execute(Request("echo \"$0\"; sleep 10", 0.3));
  EXPECT_TRUE(result.timed_out());
  std::string script = result.stdout().substr(0, result.stdout().size() - 1);
  EXPECT_THAT(script, StartsWith(config_.root + "/.codebox-"));
  EXPECT_FALSE(util::File::Exists(script));
}

TEST_F(LocalExecutorTest, TestSideEffectsPersist) {
  executor::LocalExecutor executor(config_);
  executor.Execute(Request("echo data > file.txt"));
  proto::ExecutionResult result = executor.Execute(Request("cat file.txt"));
  EXPECT_EQ(result.stdout(), "data\n");
}

TEST_F(LocalExecutorTest, TestChildEnvironment) {
  config_.child_env = {"PYTHONUTF8=1"};
  executor::LocalExecutor executor(config_);
  proto::ExecutionResult result =
      executor.Execute(Request("echo \"$PYTHONUTF8 ${HOME-unset}\""));
  EXPECT_EQ(result.stdout(), "1 unset\n");
}

TEST_F(LocalExecutorTest, TestTimeout) {
  executor::LocalExecutor executor(config_);
  proto::ExecutionResult result =
      executor.Execute(Request("sleep 30 & echo started; wait", 0.5));
  EXPECT_TRUE(result.timed_out());
  EXPECT_FALSE(result.has_exit_code());
  EXPECT_EQ(result.stdout(), "started\n");
  EXPECT_GE(result.duration_ms(), 500);
  EXPECT_LT(result.duration_ms(), 3000);
}

TEST_F(LocalExecutorTest, TestTruncation) {
  config_.max_output_bytes = 100;
  executor::LocalExecutor executor(config_);
  proto::ExecutionResult result = executor.Execute(
      Request("head -c 5000 /dev/zero | tr '\\000' a; echo done >&2"));
  EXPECT_EQ(result.stdout(), std::string(100, 'a'));
  EXPECT_TRUE(result.stdout_truncated());
  EXPECT_TRUE(result.truncated());
  EXPECT_EQ(result.stderr(), "done\n");
  EXPECT_EQ(result.exit_code(), 0);
}

TEST_F(LocalExecutorTest, TestValidation) {
  executor::LocalExecutor executor(config_);
  EXPECT_THROW(executor.Execute(Request("")), executor::validation_error);
  EXPECT_THROW(executor.Execute(Request("true", 0)),
               executor::validation_error);
  EXPECT_THROW(executor.Execute(Request("true", -1)),
               executor::validation_error);
  EXPECT_THROW(executor.Execute(Request("true", config_.max_timeout_s + 1)),
               executor::validation_error);
  proto::ExecutionRequest no_timeout;
  no_timeout.set_code("true");
  EXPECT_THROW(executor.Execute(no_timeout), executor::validation_error);
}

TEST_F(LocalExecutorTest, TestMissingInterpreter) {
  config_.interpreter = config_.root + "/no_such_interpreter";
  executor::LocalExecutor executor(config_);
  try {
    executor.Execute(Request("true"));
    FAIL() << "Expected launch_failure";
  } catch (const executor::launch_failure& exc) {
    EXPECT_EQ(exc.error_code(), ENOENT);
    EXPECT_THAT(exc.what(), StartsWith("exec:"));
  }
}

TEST_F(LocalExecutorTest, TestReadOnlyRoot) {
  if (geteuid() == 0) GTEST_SKIP() << "permissions are not enforced for root";
  ASSERT_EQ(chmod(config_.root.c_str(), 0500), 0);
  manager::EventQueue events;
  executor::LocalExecutor executor(config_, &events);
  try {
    executor.Execute(Request("true"));
    ADD_FAILURE() << "Expected launch_failure";
  } catch (const executor::launch_failure& exc) {
    EXPECT_EQ(exc.error_code(), EACCES);
  }
  chmod(config_.root.c_str(), 0700);
  events.Stop();
  absl::optional<proto::Event> event;
  proto::Event last;
  while ((event = events.Dequeue())) last = *event;
  EXPECT_EQ(last.event_oneof_case(), proto::Event::kFailed);
  EXPECT_EQ(last.failed().kind(), proto::FailedEvent::LAUNCH);
}

TEST_F(LocalExecutorTest, TestRootNotADirectory) {
  std::string file = config_.root + "/plain_file";
  ASSERT_EQ(close(open(file.c_str(), O_CREAT | O_WRONLY, 0600)), 0);
  config_.root = file;
  executor::LocalExecutor executor(config_);
  try {
    executor.Execute(Request("true"));
    FAIL() << "Expected launch_failure";
  } catch (const executor::launch_failure& exc) {
    EXPECT_EQ(exc.error_code(), ENOTDIR);
  }
}

TEST_F(LocalExecutorTest, TestConcurrentExecutions) {
  executor::LocalExecutor executor(config_);
  const int kNumRequests = 8;
  std::vector<std::string> outputs(kNumRequests);
  std::vector<std::thread> threads;
  for (int i = 0; i < kNumRequests; i++) {
    threads.emplace_back([this, &executor, &outputs, i] {
      outputs[i] = executor
                       .Execute(Request(absl::StrCat(
                           "for n in 1 2 3; do echo marker-", i, "; done")))
                       .stdout();
    });
  }
  for (std::thread& t : threads) t.join();
  for (int i = 0; i < kNumRequests; i++) {
    std::string marker = absl::StrCat("marker-", i, "\n");
    EXPECT_EQ(outputs[i], marker + marker + marker);
  }
}

TEST_F(LocalExecutorTest, TestQueueing) {
  config_.max_concurrent = 1;
  executor::LocalExecutor executor(config_);
  auto start = std::chrono::steady_clock::now();
  std::vector<std::thread> threads;
  for (int i = 0; i < 2; i++) {
    threads.emplace_back(
        [this, &executor] { executor.Execute(Request("sleep 0.3")); });
  }
  for (std::thread& t : threads) t.join();
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
                .count(),
            600);
}

TEST_F(LocalExecutorTest, TestEvents) {
  manager::EventQueue events;
  executor::LocalExecutor executor(config_, &events);
  executor.Execute(Request("exit 1"));
  EXPECT_THROW(executor.Execute(Request("")), executor::validation_error);
  events.Stop();

  std::vector<proto::Event> received;
  while (absl::optional<proto::Event> event = events.Dequeue()) {
    received.push_back(*event);
  }
  ASSERT_EQ(received.size(), 4u);
  EXPECT_EQ(received[0].event_oneof_case(), proto::Event::kQueued);
  EXPECT_EQ(received[1].event_oneof_case(), proto::Event::kStarted);
  EXPECT_EQ(received[2].event_oneof_case(), proto::Event::kFinished);
  EXPECT_EQ(received[2].finished().result().exit_code(), 1);
  EXPECT_EQ(received[0].request_id(), received[2].request_id());
  EXPECT_EQ(received[3].event_oneof_case(), proto::Event::kFailed);
  EXPECT_EQ(received[3].failed().kind(), proto::FailedEvent::VALIDATION);
  EXPECT_NE(received[3].request_id(), received[0].request_id());
}

TEST_F(LocalExecutorTest, TestTimeoutEvent) {
  manager::EventQueue events;
  executor::LocalExecutor executor(config_, &events);
  executor.Execute(Request("sleep 10", 0.2));
  events.Stop();
  absl::optional<proto::Event> event;
  proto::Event last;
  while ((event = events.Dequeue())) last = *event;
  EXPECT_EQ(last.event_oneof_case(), proto::Event::kTimedOut);
  EXPECT_GE(last.timed_out().duration_ms(), 200);
}

class PythonExecutorTest : public LocalExecutorTest {
 protected:
  void SetUp() override {
    LocalExecutorTest::SetUp();
    config_.interpreter = CODEBOX_TEST_PYTHON;
    config_.script_suffix = ".py";
    config_.child_env = {"PYTHONUTF8=1"};
  }
};

TEST_F(PythonExecutorTest, TestHello) {
  executor::LocalExecutor executor(config_);
  proto::ExecutionResult result =
      executor.Execute(Request("print('hello from sandbox')"));
  EXPECT_EQ(result.stdout(), "hello from sandbox\n");
  EXPECT_EQ(result.stderr(), "");
  ASSERT_TRUE(result.has_exit_code());
  EXPECT_EQ(result.exit_code(), 0);
  EXPECT_FALSE(result.timed_out());
}

TEST_F(PythonExecutorTest, TestInfiniteLoop) {
  executor::LocalExecutor executor(config_);
  proto::ExecutionResult result =
      executor.Execute(Request("while True: pass", 1));
  EXPECT_TRUE(result.timed_out());
  EXPECT_FALSE(result.has_exit_code());
  EXPECT_GE(result.duration_ms(), 1000);
  EXPECT_LT(result.duration_ms(), 3000);
}

TEST_F(PythonExecutorTest, TestException) {
  executor::LocalExecutor executor(config_);
  proto::ExecutionResult result = executor.Execute(
      Request("import sys\nprint('x')\nraise ValueError('boom')"));
  EXPECT_EQ(result.stdout(), "x\n");
  EXPECT_THAT(result.stderr(), ::testing::HasSubstr("ValueError: boom"));
  EXPECT_EQ(result.exit_code(), 1);
}

}  // namespace
