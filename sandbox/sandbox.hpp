#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values, 0 means no limit.
  int64_t wall_limit_millis = 0;
  uint64_t max_output_bytes = 0;
  int64_t memory_limit_kb = 0;
  int64_t max_file_size_kb = 0;
  int32_t max_files = 0;

  // Arguments after the executable name.
  std::vector<std::string> args;
  // Full environment of the program, as KEY=VALUE strings.
  std::vector<std::string> env;

  // Required values
  std::string root;
  std::string executable;
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the wall time limit expired and the process group was killed.
  bool timed_out = false;

  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
};

// Process launcher. The only implementation is Unix, the executor and the
// tests go through this interface.
class Sandbox {
 public:
  // Returns a new instance of the launcher for this system.
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false, sets error_msg and,
  // if the failure was caused by a system call, error_code.
  // Each instance runs a single program, distinct instances are independent.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg, int* error_code) = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

}  // namespace sandbox

#endif
