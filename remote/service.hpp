#ifndef REMOTE_SERVICE_HPP
#define REMOTE_SERVICE_HPP

#include "core/config.hpp"
#include "executor/executor.hpp"
#include "grpc++/server_context.h"
#include "proto/codebox.grpc.pb.h"

namespace remote {

class CodeBoxServiceImpl : public proto::CodeBox::Service {
 public:
  CodeBoxServiceImpl(const core::SandboxConfig& config,
                     executor::Executor* executor)
      : config_(config), executor_(executor) {}

  grpc::Status Run(grpc::ServerContext* context,
                   const proto::ExecutionRequest* request,
                   proto::ExecutionResult* result) override;

 private:
  const core::SandboxConfig& config_;
  executor::Executor* executor_;
};

}  // namespace remote

#endif
