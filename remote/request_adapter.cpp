#include "remote/request_adapter.hpp"

#include <cmath>

#include "absl/strings/str_cat.h"
#include "executor/errors.hpp"
#include "executor/result_assembler.hpp"
#include "glog/logging.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "sandbox/confinement.hpp"

namespace {

std::string ToJson(const google::protobuf::Struct& message) {
  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Cannot serialize to JSON: " + status.ToString());
  }
  return json;
}

}  // namespace

namespace remote {

void NormalizeRequest(const core::SandboxConfig& config,
                      proto::ExecutionRequest* request) {
  if (request->code().empty()) {
    throw executor::validation_error("code must be a non-empty string");
  }
  if (!request->has_timeout_s()) {
    request->set_timeout_s(config.default_timeout_s);
  }
  double timeout_s = request->timeout_s();
  if (!std::isfinite(timeout_s) || timeout_s <= 0 ||
      timeout_s > config.max_timeout_s) {
    throw executor::validation_error(absl::StrCat(
        "timeout_s must be in (0, ", config.max_timeout_s, "], got ",
        timeout_s));
  }
}

proto::ExecutionRequest ParseRequest(const core::SandboxConfig& config,
                                     const std::string& json) {
  google::protobuf::Struct document;
  auto status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw executor::validation_error(
        "The request must be a JSON object: " + status.ToString());
  }

  proto::ExecutionRequest request;
  const auto& fields = document.fields();
  auto code = fields.find("code");
  if (code == fields.end() ||
      code->second.kind_case() != google::protobuf::Value::kStringValue) {
    throw executor::validation_error("code must be a non-empty string");
  }
  request.set_code(code->second.string_value());

  auto timeout = fields.find("timeout_s");
  if (timeout != fields.end()) {
    switch (timeout->second.kind_case()) {
      case google::protobuf::Value::kNullValue:
        break;
      case google::protobuf::Value::kNumberValue:
        request.set_timeout_s(timeout->second.number_value());
        break;
      default:
        throw executor::validation_error("timeout_s must be a number");
    }
  }
  NormalizeRequest(config, &request);
  return request;
}

std::string ResultToJson(const proto::ExecutionResult& result) {
  google::protobuf::Struct document;
  auto* fields = document.mutable_fields();
  (*fields)["stdout"].set_string_value(result.stdout());
  (*fields)["stderr"].set_string_value(result.stderr());
  if (result.has_exit_code()) {
    (*fields)["exit_code"].set_number_value(result.exit_code());
  } else {
    (*fields)["exit_code"].set_null_value(google::protobuf::NULL_VALUE);
  }
  (*fields)["timed_out"].set_bool_value(result.timed_out());
  (*fields)["truncated"].set_bool_value(result.truncated());
  (*fields)["duration_ms"].set_number_value(result.duration_ms());
  return ToJson(document);
}

std::string ErrorToJson(const std::string& kind, const std::string& message) {
  google::protobuf::Struct document;
  auto* error = (*document.mutable_fields())["error"].mutable_struct_value();
  (*error->mutable_fields())["kind"].set_string_value(kind);
  (*error->mutable_fields())["message"].set_string_value(
      executor::SanitizeUtf8(message));
  return ToJson(document);
}

std::string HandleJsonRequest(const core::SandboxConfig& config,
                              executor::Executor* executor,
                              const std::string& json) {
  std::string kind;
  std::string message;
  try {
    proto::ExecutionRequest request = ParseRequest(config, json);
    return ResultToJson(executor->Execute(request));
  } catch (const executor::validation_error& exc) {
    kind = "ValidationError";
    message = exc.what();
  } catch (const sandbox::path_escape& exc) {
    kind = "PathEscape";
    message = exc.what();
  } catch (const executor::launch_failure& exc) {
    kind = "LaunchFailure";
    message = exc.what();
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Request failed: " << exc.what();
    kind = "InternalError";
    message = exc.what();
  }
  return ErrorToJson(kind, message);
}

}  // namespace remote
