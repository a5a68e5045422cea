#ifndef SANDBOX_TIMEOUT_SUPERVISOR_HPP
#define SANDBOX_TIMEOUT_SUPERVISOR_HPP

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>

namespace sandbox {

// Tracks the wall clock deadline of one execution. The execution ends exactly
// once: either the program exits (Complete) or the deadline expires (Expire),
// whichever happens first. The losing call returns false.
class TimeoutSupervisor {
 public:
  enum class State { kRunning, kCompleted, kTimedOut };
  using clock = std::chrono::steady_clock;

  // A limit of zero means no deadline.
  explicit TimeoutSupervisor(int64_t wall_limit_millis);

  // Milliseconds left before the deadline, never negative. Returns -1 if
  // there is no deadline.
  int64_t RemainingMillis() const;
  bool DeadlinePassed() const { return RemainingMillis() == 0; }
  int64_t ElapsedMillis() const;

  bool Complete() { return Transition(State::kCompleted); }
  bool Expire() { return Transition(State::kTimedOut); }
  State GetState() const { return state_.load(); }

  // Sends SIGKILL to every process of the group. A group that is already
  // empty is not an error.
  static void KillProcessGroup(pid_t pgid);

  // Keeps killing the group until none of its processes is left, for at most
  // grace_millis. Zombies count as members, so the leader must be reaped
  // first. Returns false if some process was still alive when the wait ended.
  static bool AwaitProcessGroupExit(pid_t pgid, int64_t grace_millis);

 private:
  bool Transition(State to);

  clock::time_point start_;
  int64_t wall_limit_millis_;
  std::atomic<State> state_{State::kRunning};
};

}  // namespace sandbox

#endif
