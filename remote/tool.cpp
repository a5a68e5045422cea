#include <iostream>
#include <string>

#include "core/config.hpp"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "manager/event_logger.hpp"
#include "manager/event_queue.hpp"
#include "remote/request_adapter.hpp"
#include "util/flags.hpp"

// Reads one JSON request per line from stdin and writes one JSON response per
// line to stdout. Requests are handled one at a time, in order.
int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs code in a sandbox directory, JSON requests on stdin");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  // stdout carries the responses.
  FLAGS_logtostderr = true;
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

  manager::EventQueue events;
  manager::EventLogger logger(&events);
  executor::LocalExecutor executor(config, &events);

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    std::cout << remote::HandleJsonRequest(executor.Config(), &executor, line)
              << std::endl;
  }
  return 0;
}
