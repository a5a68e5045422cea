#ifndef EXECUTOR_ERRORS_HPP
#define EXECUTOR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace executor {

// The request is malformed. Nothing has been executed.
class validation_error : public std::invalid_argument {
 public:
  explicit validation_error(const std::string& msg)
      : std::invalid_argument(msg) {}
};

// The program could not be started. error_code is the errno of the failing
// step, or 0 if the failure was not caused by a system call.
class launch_failure : public std::runtime_error {
 public:
  launch_failure(const std::string& msg, int error_code)
      : std::runtime_error(msg), error_code_(error_code) {}
  int error_code() const { return error_code_; }

 private:
  int error_code_;
};

}  // namespace executor

#endif
