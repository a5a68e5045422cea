#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>

#include <memory>
#include <string>
#include <vector>

#include "sandbox/output_buffer.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/timeout_supervisor.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems. The program runs in a new session, so that
// it and all of its descendants can be killed together through the process
// group, and its output is collected through pipes.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg, int* error_code) override;
  static Sandbox* Create() { return new Unix(); }

  ~Unix() override;

 protected:
  Unix() = default;

  // Executed before creating the child process: creates the pipes and
  // prepares everything the child needs, so that the child does not have to
  // allocate memory. Returns false and sets error_msg if setup fails.
  bool Setup(std::string* error_msg, int* error_code);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and never returns.
  bool DoFork(std::string* error_msg, int* error_code);

  // Function that is executed in the child process. Only async-signal-safe
  // functions may be called here.
  [[noreturn]] void Child();

  // Waits for exec to succeed in the child. Returns false and sets error_msg
  // if the child reported an error before exec, in which case the child has
  // already been reaped.
  bool WaitForExec(std::string* error_msg, int* error_code);

  // Collects the output of the child until it exits or the wall time limit
  // expires, then kills whatever is left of its process group. Throws
  // std::system_error if the child cannot be supervised.
  void Supervise(ExecutionInfo* info);

 private:
  // Reads everything available on the output pipes. Returns false and sets
  // errno on a read error.
  bool Drain();
  // Polls the output pipes for at most timeout_millis and reads from the
  // ready ones.
  bool PollOutput(int timeout_millis);
  // Kills the process group, reaps the leader and waits for the other
  // members. Returns false and sets errno if the leader could not be reaped.
  bool Terminate(int* status, struct rusage* rusage);
  void CloseFds();

  int error_pipe_[2] = {-1, -1};
  int stdout_pipe_[2] = {-1, -1};
  int stderr_pipe_[2] = {-1, -1};
  int devnull_fd_ = -1;
  pid_t child_pid_ = 0;

  const ExecutionOptions* options_ = nullptr;
  std::unique_ptr<TimeoutSupervisor> supervisor_;
  std::unique_ptr<OutputBuffer> stdout_buffer_;
  std::unique_ptr<OutputBuffer> stderr_buffer_;

  // NUL-terminated copies of the arguments and of the environment.
  std::vector<std::vector<char>> storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
};

}  // namespace sandbox

#endif
