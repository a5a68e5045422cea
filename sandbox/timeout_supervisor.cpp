#include "sandbox/timeout_supervisor.hpp"

#include <errno.h>
#include <signal.h>

#include <thread>

#include "glog/logging.h"

namespace sandbox {

TimeoutSupervisor::TimeoutSupervisor(int64_t wall_limit_millis)
    : start_(clock::now()), wall_limit_millis_(wall_limit_millis) {}

int64_t TimeoutSupervisor::ElapsedMillis() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() -
                                                               start_)
      .count();
}

int64_t TimeoutSupervisor::RemainingMillis() const {
  if (wall_limit_millis_ <= 0) return -1;
  auto deadline = start_ + std::chrono::milliseconds(wall_limit_millis_);
  auto now = clock::now();
  if (now >= deadline) return 0;
  // Round up, so that a positive remaining time is never reported as zero.
  auto left =
      std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);
  return (left.count() + 999) / 1000;
}

bool TimeoutSupervisor::Transition(State to) {
  State expected = State::kRunning;
  return state_.compare_exchange_strong(expected, to);
}

void TimeoutSupervisor::KillProcessGroup(pid_t pgid) {
  if (killpg(pgid, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(ERROR) << "killpg " << pgid;
  }
}

bool TimeoutSupervisor::AwaitProcessGroupExit(pid_t pgid,
                                              int64_t grace_millis) {
  auto deadline = clock::now() + std::chrono::milliseconds(grace_millis);
  // The members of the group other than the leader are not our children and
  // cannot be waited for: poll until the group is empty.
  while (true) {
    if (killpg(pgid, SIGKILL) == -1) {
      if (errno == ESRCH) return true;
      PLOG(ERROR) << "killpg " << pgid;
      return false;
    }
    if (clock::now() >= deadline) {
      LOG(WARNING) << "Process group " << pgid << " still alive after "
                   << grace_millis << "ms";
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

}  // namespace sandbox
