#ifndef REMOTE_REQUEST_ADAPTER_HPP
#define REMOTE_REQUEST_ADAPTER_HPP

#include <string>

#include "core/config.hpp"
#include "executor/executor.hpp"
#include "proto/execution.pb.h"

namespace remote {

// Fills in the default timeout and checks the values of a request. Throws
// executor::validation_error if the request is not valid.
void NormalizeRequest(const core::SandboxConfig& config,
                      proto::ExecutionRequest* request);

// Parses a request in JSON format. The document must be an object with a
// non-empty string "code" and an optional number "timeout_s"; other members
// are ignored. Throws executor::validation_error.
proto::ExecutionRequest ParseRequest(const core::SandboxConfig& config,
                                     const std::string& json);

// Serializes the fields of a result that are part of the JSON contract.
// exit_code is null when the result has none.
std::string ResultToJson(const proto::ExecutionResult& result);

// Serializes an error as {"error": {"kind": kind, "message": message}}.
std::string ErrorToJson(const std::string& kind, const std::string& message);

// Handles one JSON request and returns the JSON response, or the JSON error
// if the request could not be executed. Never throws.
std::string HandleJsonRequest(const core::SandboxConfig& config,
                              executor::Executor* executor,
                              const std::string& json);

}  // namespace remote

#endif
