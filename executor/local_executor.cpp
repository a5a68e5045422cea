#include "executor/local_executor.hpp"

#include <cmath>
#include <cstdlib>
#include <memory>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "executor/result_assembler.hpp"
#include "glog/logging.h"
#include "sandbox/confinement.hpp"
#include "util/file.hpp"

namespace executor {

LocalExecutor::LocalExecutor(core::SandboxConfig config,
                             manager::EventQueue* events)
    : config_(std::move(config)), events_(events) {
  CHECK_GT(config_.max_concurrent, 0);
}

proto::ExecutionResult LocalExecutor::Execute(
    const proto::ExecutionRequest& request) {
  int64_t request_id = next_request_id_++;
  try {
    return Run(request_id, request);
  } catch (const validation_error& exc) {
    if (events_) {
      events_->Failed(request_id, proto::FailedEvent::VALIDATION, exc.what());
    }
    throw;
  } catch (const sandbox::path_escape& exc) {
    if (events_) {
      events_->Failed(request_id, proto::FailedEvent::PATH_ESCAPE, exc.what());
    }
    throw;
  } catch (const launch_failure& exc) {
    if (events_) {
      events_->Failed(request_id, proto::FailedEvent::LAUNCH, exc.what());
    }
    throw;
  } catch (const std::exception& exc) {
    if (events_) {
      events_->Failed(request_id, proto::FailedEvent::INTERNAL, exc.what());
    }
    throw;
  }
}

proto::ExecutionResult LocalExecutor::Run(
    int64_t request_id, const proto::ExecutionRequest& request) {
  if (request.code().empty()) {
    throw validation_error("code must be a non-empty string");
  }
  if (!request.has_timeout_s()) {
    throw validation_error("timeout_s is not set");
  }
  double timeout_s = request.timeout_s();
  if (!std::isfinite(timeout_s) || timeout_s <= 0 ||
      timeout_s > config_.max_timeout_s) {
    throw validation_error(absl::StrCat("timeout_s must be in (0, ",
                                        config_.max_timeout_s, "]"));
  }

  SlotGuard guard(this, request_id);

  std::unique_ptr<util::TempFile> script;
  std::string dir, script_path;
  try {
    dir = sandbox::Confine(config_.root, ".");
    script.reset(new util::TempFile(dir, kScriptPrefix, config_.script_suffix,
                                    request.code()));
    script_path = sandbox::Confine(config_.root, script->Path());
  } catch (const std::system_error& exc) {
    throw launch_failure(exc.what(), exc.code().value());
  }

  sandbox::ExecutionOptions options = MakeOptions(dir, script_path, timeout_s);
  if (events_) {
    events_->Started(request_id, timeout_s, request.code().size());
  }

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  sandbox::ExecutionInfo info;
  std::string error_msg;
  int error_code = 0;
  if (!sb->Execute(options, &info, &error_msg, &error_code)) {
    throw launch_failure(error_msg, error_code);
  }

  proto::ExecutionResult result = AssembleResult(info);
  if (events_) {
    if (result.timed_out()) {
      events_->TimedOut(request_id, result.duration_ms());
    } else {
      events_->Finished(request_id, result);
    }
  }
  return result;
}

sandbox::ExecutionOptions LocalExecutor::MakeOptions(
    const std::string& dir, const std::string& script,
    double timeout_s) const {
  sandbox::ExecutionOptions options(dir, config_.interpreter);
  options.args = config_.interpreter_args;
  options.args.push_back(script);

  const char* path = std::getenv("PATH");
  if (path != nullptr) options.env.push_back(absl::StrCat("PATH=", path));
  options.env.insert(options.env.end(), config_.child_env.begin(),
                     config_.child_env.end());

  options.wall_limit_millis = std::ceil(timeout_s * 1000);
  options.max_output_bytes = config_.max_output_bytes;
  options.memory_limit_kb = config_.memory_limit_kb;
  options.max_file_size_kb = config_.max_file_size_kb;
  options.max_files = config_.max_files;
  return options;
}

LocalExecutor::SlotGuard::SlotGuard(LocalExecutor* executor,
                                    int64_t request_id)
    : executor_(executor) {
  absl::MutexLock lck(&executor_->slots_mutex_);
  if (executor_->events_) {
    executor_->events_->Queued(request_id, executor_->running_,
                               executor_->config_.max_concurrent);
  }
  auto cond = [this]() {
    executor_->slots_mutex_.AssertHeld();
    return executor_->running_ < executor_->config_.max_concurrent;
  };
  executor_->slots_mutex_.Await(absl::Condition(&cond));
  executor_->running_++;
}

LocalExecutor::SlotGuard::~SlotGuard() {
  absl::MutexLock lck(&executor_->slots_mutex_);
  executor_->running_--;
}

}  // namespace executor
