#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <atomic>
#include <cstdint>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "core/config.hpp"
#include "executor/errors.hpp"
#include "executor/executor.hpp"
#include "manager/event_queue.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Runs the requests on this machine, in the sandbox root. At most
// max_concurrent requests run at the same time, the others wait for a free
// slot.
class LocalExecutor : public Executor {
 public:
  proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request) override;

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;
  // config must have been prepared with core::PrepareConfig. If events is not
  // null, the progress of every request is reported there.
  explicit LocalExecutor(core::SandboxConfig config,
                         manager::EventQueue* events = nullptr);

  const core::SandboxConfig& Config() const { return config_; }

 private:
  class SlotGuard {
   public:
    SlotGuard(LocalExecutor* executor, int64_t request_id);
    ~SlotGuard();
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;
    SlotGuard(SlotGuard&&) = delete;
    SlotGuard& operator=(SlotGuard&&) = delete;

   private:
    LocalExecutor* executor_;
  };

  static const constexpr char* kScriptPrefix = ".codebox-";

  proto::ExecutionResult Run(int64_t request_id,
                             const proto::ExecutionRequest& request);
  sandbox::ExecutionOptions MakeOptions(const std::string& dir,
                                        const std::string& script,
                                        double timeout_s) const;

  const core::SandboxConfig config_;
  manager::EventQueue* events_;
  std::atomic<int64_t> next_request_id_{1};

  absl::Mutex slots_mutex_;
  int32_t running_ GUARDED_BY(slots_mutex_) = 0;
};

}  // namespace executor

#endif
