#include "sandbox/unix.hpp"

#include <algorithm>
#include <system_error>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

void CloseFd(int* fd) {
  if (*fd == -1) return;
  if (close(*fd) == -1) PLOG(WARNING) << "close " << *fd;
  *fd = -1;
}

int64_t ToMillis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kMaxStepLen = 64;
static const constexpr size_t kReadBufSize = 64 * 1024;
// Polling interval while waiting for the child.
static const constexpr int kPollMillis = 10;
// How long to wait for the rest of the process group, and for the pipes to be
// closed, once the leader has been killed or has exited.
static const constexpr int64_t kGraceMillis = 1000;

Unix::~Unix() { CloseFds(); }

void Unix::CloseFds() {
  for (int* fd : {&error_pipe_[0], &error_pipe_[1], &stdout_pipe_[0],
                  &stdout_pipe_[1], &stderr_pipe_[0], &stderr_pipe_[1],
                  &devnull_fd_}) {
    CloseFd(fd);
  }
}

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg, int* error_code) {
  CHECK(child_pid_ == 0) << "A Unix sandbox can only be used once";
  options_ = &options;
  *error_code = 0;
  if (!Setup(error_msg, error_code)) {
    CloseFds();
    return false;
  }
  supervisor_.reset(new TimeoutSupervisor(options.wall_limit_millis));
  if (!DoFork(error_msg, error_code)) {
    CloseFds();
    return false;
  }
  if (!WaitForExec(error_msg, error_code)) {
    CloseFds();
    return false;
  }
  // On failure Supervise throws and the pipes are closed by the destructor.
  Supervise(info);
  CloseFds();
  return true;
}

bool Unix::Setup(std::string* error_msg, int* error_code) {
  auto fail = [error_msg, error_code](const char* step) {
    char buf[kStrErrorBufSize] = {};
    *error_code = errno;
    *error_msg = step;
    *error_msg += ": ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  };
  if (pipe2(error_pipe_, O_CLOEXEC) == -1) return fail("pipe2");
  if (pipe2(stdout_pipe_, O_CLOEXEC) == -1) return fail("pipe2");
  if (pipe2(stderr_pipe_, O_CLOEXEC) == -1) return fail("pipe2");
  devnull_fd_ = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (devnull_fd_ == -1) return fail("open /dev/null");

  auto add = [this](const std::string& s) {
    storage_.emplace_back(s.begin(), s.end());
    storage_.back().push_back(0);
  };
  add(options_->executable);
  for (const std::string& arg : options_->args) add(arg);
  for (const std::string& var : options_->env) add(var);
  size_t num_args = options_->args.size() + 1;
  for (size_t i = 0; i < storage_.size(); i++) {
    (i < num_args ? argv_ : envp_).push_back(storage_[i].data());
  }
  argv_.push_back(nullptr);
  envp_.push_back(nullptr);

  stdout_buffer_.reset(new OutputBuffer(options_->max_output_bytes));
  stderr_buffer_.reset(new OutputBuffer(options_->max_output_bytes));
  return true;
}

bool Unix::DoFork(std::string* error_msg, int* error_code) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_code = errno;
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  } else {
    Child();
  }
}

void Unix::Child() {
  // Reports the failing step and errno to the parent. The message is written
  // with a single write, which is atomic for sizes below PIPE_BUF.
  auto die = [this](const char* step, int err) {
    char buf[sizeof(int) + kMaxStepLen] = {};
    memcpy(buf, &err, sizeof(int));
    size_t len = strlen(step);
    if (len > kMaxStepLen) len = kMaxStepLen;
    memcpy(buf + sizeof(int), step, len);
    ssize_t written = write(error_pipe_[1], buf, sizeof(int) + len);
    (void)written;
    _Exit(127);
  };

  // New session, so that the whole tree can be killed at once and it does not
  // receive the signals of our terminal.
  if (setsid() == -1) die("setsid", errno);

  // dup2 clears the close-on-exec flag on the new descriptors only.
  if (dup2(devnull_fd_, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_pipe_[1], STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_pipe_[1], STDERR_FILENO) == -1) die("redir stderr", errno);

  if (chdir(options_->root.c_str()) == -1) die("chdir", errno);

  // Do not leak the dispositions and the mask of the service.
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = SIG_DFL;
  for (int sig = 1; sig < NSIG; sig++) {
    if (sig == SIGKILL || sig == SIGSTOP) continue;
    sigaction(sig, &sa, nullptr);
  }
  sigset_t mask;
  sigemptyset(&mask);
  if (sigprocmask(SIG_SETMASK, &mask, nullptr) == -1) {
    die("sigprocmask", errno);
  }

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlimit " #res, errno);          \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlimit CORE", errno);

  int count = 0;
  do {
    execve(argv_[0], argv_.data(), envp_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(127);
}

bool Unix::WaitForExec(std::string* error_msg, int* error_code) {
  CloseFd(&error_pipe_[1]);
  CloseFd(&stdout_pipe_[1]);
  CloseFd(&stderr_pipe_[1]);
  CloseFd(&devnull_fd_);

  char buf[sizeof(int) + kMaxStepLen] = {};
  ssize_t len;
  do {
    len = read(error_pipe_[0], buf, sizeof(buf));
  } while (len == -1 && errno == EINTR);
  int read_errno = errno;
  CloseFd(&error_pipe_[0]);
  if (len == 0) return true;

  // The child did not reach exec, or we cannot tell whether it did: either
  // way it must not survive.
  if (len == -1) kill(child_pid_, SIGKILL);
  int status = 0;
  while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
  }
  char err_buf[kStrErrorBufSize] = {};
  if (len == -1) {
    *error_code = read_errno;
    *error_msg = "read: ";
    *error_msg += mystrerror(read_errno, err_buf, kStrErrorBufSize);
    return false;
  }
  if (static_cast<size_t>(len) < sizeof(int)) {
    *error_code = 0;
    *error_msg = "Invalid message from the child process";
    return false;
  }
  memcpy(error_code, buf, sizeof(int));
  *error_msg = std::string(buf + sizeof(int), len - sizeof(int));
  *error_msg += ": ";
  *error_msg += mystrerror(*error_code, err_buf, kStrErrorBufSize);
  return false;
}

bool Unix::Drain() {
  char buf[kReadBufSize];
  for (auto stream : {std::make_pair(&stdout_pipe_[0], stdout_buffer_.get()),
                      std::make_pair(&stderr_pipe_[0], stderr_buffer_.get())}) {
    int* fd = stream.first;
    while (*fd != -1) {
      ssize_t n = read(*fd, buf, sizeof(buf));
      if (n > 0) {
        stream.second->Append(buf, n);
        continue;
      }
      if (n == 0) {
        CloseFd(fd);
        break;
      }
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) break;
      return false;
    }
  }
  return true;
}

bool Unix::PollOutput(int timeout_millis) {
  struct pollfd fds[2];
  nfds_t num_fds = 0;
  for (int fd : {stdout_pipe_[0], stderr_pipe_[0]}) {
    if (fd == -1) continue;
    fds[num_fds].fd = fd;
    fds[num_fds].events = POLLIN;
    fds[num_fds].revents = 0;
    num_fds++;
  }
  int ret = poll(num_fds ? fds : nullptr, num_fds, timeout_millis);
  if (ret == -1) return errno == EINTR;
  if (ret == 0) return true;
  return Drain();
}

bool Unix::Terminate(int* status, struct rusage* rusage) {
  // The leader has not been reaped yet, so its pid, and the process group
  // id, cannot have been reused.
  TimeoutSupervisor::KillProcessGroup(child_pid_);
  pid_t ret;
  do {
    ret = wait4(child_pid_, status, 0, rusage);
  } while (ret == -1 && errno == EINTR);
  if (ret == -1) return false;
  TimeoutSupervisor::AwaitProcessGroupExit(child_pid_, kGraceMillis);
  return true;
}

void Unix::Supervise(ExecutionInfo* info) {
  for (int fd : {stdout_pipe_[0], stderr_pipe_[0]}) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
      int err = errno;
      int status;
      struct rusage rusage;
      Terminate(&status, &rusage);
      throw std::system_error(err, std::system_category(), "fcntl");
    }
  }

  auto internal_error = [this](const char* what) {
    int err = errno;
    LOG(ERROR) << what << " failed while supervising " << child_pid_;
    int status;
    struct rusage rusage;
    if (!Terminate(&status, &rusage)) {
      PLOG(ERROR) << "wait4 " << child_pid_;
    }
    throw std::system_error(err, std::system_category(), what);
  };

  while (true) {
    int64_t remaining = supervisor_->RemainingMillis();
    if (remaining == 0) {
      if (supervisor_->Expire()) break;
    }
    int timeout = kPollMillis;
    if (remaining > 0 && remaining < timeout) timeout = remaining;
    if (!PollOutput(timeout)) internal_error("read");

    // Check for termination without reaping: the zombie keeps the process
    // group id reserved until the stragglers have been killed.
    siginfo_t si;
    si.si_pid = 0;
    if (waitid(P_PID, child_pid_, &si, WEXITED | WNOHANG | WNOWAIT) == -1 &&
        errno != EINTR) {
      internal_error("waitid");
    }
    if (si.si_pid == child_pid_ && supervisor_->Complete()) break;
  }
  info->wall_time_millis = supervisor_->ElapsedMillis();
  info->timed_out =
      supervisor_->GetState() == TimeoutSupervisor::State::kTimedOut;
  if (info->timed_out) {
    VLOG(1) << "Process " << child_pid_ << " exceeded the wall time limit of "
            << options_->wall_limit_millis << "ms";
  }

  int status = 0;
  struct rusage rusage;
  memset(&rusage, 0, sizeof(rusage));
  if (!Terminate(&status, &rusage)) internal_error("wait4");

  // Every writer is dead now, unless something left the process group.
  TimeoutSupervisor deadline(kGraceMillis);
  while ((stdout_pipe_[0] != -1 || stderr_pipe_[0] != -1) &&
         !deadline.DeadlinePassed()) {
    if (!PollOutput(kPollMillis)) {
      throw std::system_error(errno, std::system_category(), "read");
    }
  }
  if (stdout_pipe_[0] != -1 || stderr_pipe_[0] != -1) {
    LOG(WARNING) << "The output of process " << child_pid_
                 << " is still open after it was terminated";
  }

  info->status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
  info->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  info->cpu_time_millis = ToMillis(rusage.ru_utime);
  info->sys_time_millis = ToMillis(rusage.ru_stime);
  // ru_maxrss is in kilobytes on Linux.
  info->memory_usage_kb = rusage.ru_maxrss;
  info->stdout_truncated = stdout_buffer_->Truncated();
  info->stderr_truncated = stderr_buffer_->Truncated();
  info->stdout_data = stdout_buffer_->Release();
  info->stderr_data = stderr_buffer_->Release();
}

}  // namespace sandbox
