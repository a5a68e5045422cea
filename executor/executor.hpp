#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include "proto/execution.pb.h"

namespace executor {

class Executor {
 public:
  // Runs the code of a request and returns the result of the execution.
  // The request must already be normalized: timeout_s is set and valid.
  // Throws validation_error, sandbox::path_escape, launch_failure, or
  // std::system_error for unexpected system errors.
  virtual proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
