#ifndef EXECUTOR_RESULT_ASSEMBLER_HPP
#define EXECUTOR_RESULT_ASSEMBLER_HPP

#include <string>

#include "proto/execution.pb.h"
#include "sandbox/sandbox.hpp"

namespace executor {

// Replaces every invalid UTF-8 sequence of data with U+FFFD. If data was cut
// by the output ceiling, a sequence left incomplete at its end is dropped and
// the result is never longer than data.
std::string SanitizeUtf8(const std::string& data, bool truncated = false);

// Builds the result of an execution that was started, whatever its outcome.
proto::ExecutionResult AssembleResult(const sandbox::ExecutionInfo& info);

}  // namespace executor

#endif
