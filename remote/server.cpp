#include <memory>
#include <string>

#include "core/config.hpp"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "manager/event_logger.hpp"
#include "manager/event_queue.hpp"
#include "remote/service.hpp"
#include "util/flags.hpp"

DEFINE_string(address, "127.0.0.1", "address to listen on");
DEFINE_int32(port, 9000, "port to listen on");

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Runs code in a sandbox directory, over gRPC");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  core::SandboxConfig config;
  try {
    config = core::LoadConfig();
    core::PrepareConfig(&config);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Invalid configuration: " << exc.what();
    return 1;
  }
  LOG(WARNING) << "All executions share " << config.root
               << " and can see each other's files";

  manager::EventQueue events;
  manager::EventLogger logger(&events);
  executor::LocalExecutor executor(config, &events);
  remote::CodeBoxServiceImpl service(executor.Config(), &executor);

  std::string server_address = FLAGS_address + ":" + std::to_string(FLAGS_port);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    LOG(ERROR) << "Cannot listen on " << server_address;
    return 1;
  }
  LOG(INFO) << "Server listening on " << server_address << ", "
            << config.max_concurrent << " concurrent executions";
  server->Wait();
}
