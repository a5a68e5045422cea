#include "remote/service.hpp"

#include <errno.h>

#include "executor/errors.hpp"
#include "glog/logging.h"
#include "remote/request_adapter.hpp"
#include "sandbox/confinement.hpp"

namespace remote {

grpc::Status CodeBoxServiceImpl::Run(grpc::ServerContext* context,
                                     const proto::ExecutionRequest* request,
                                     proto::ExecutionResult* result) {
  VLOG(1) << "Run request, " << request->code().size() << " bytes of code";
  try {
    proto::ExecutionRequest normalized = *request;
    NormalizeRequest(config_, &normalized);
    *result = executor_->Execute(normalized);
    return grpc::Status::OK;
  } catch (const executor::validation_error& exc) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, exc.what());
  } catch (const sandbox::path_escape& exc) {
    return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, exc.what());
  } catch (const executor::launch_failure& exc) {
    switch (exc.error_code()) {
      case EAGAIN:
      case ENOMEM:
      case EMFILE:
      case ENFILE:
        return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, exc.what());
      default:
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, exc.what());
    }
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Run: " << exc.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, exc.what());
  }
}

}  // namespace remote
