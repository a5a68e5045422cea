#ifndef CORE_CONFIG_HPP
#define CORE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace core {

// Service-wide settings, resolved once at startup and never modified
// afterwards.
struct SandboxConfig {
  // Canonical absolute path once PrepareConfig has run.
  std::string root;
  // Absolute path of the interpreter once PrepareConfig has run.
  std::string interpreter;
  std::vector<std::string> interpreter_args;
  std::string script_suffix = ".py";
  // KEY=VALUE pairs, PATH excluded.
  std::vector<std::string> child_env;

  double default_timeout_s = 5;
  double max_timeout_s = 60;
  uint64_t max_output_bytes = 1 << 20;
  int32_t max_concurrent = 1;

  int64_t memory_limit_kb = 0;
  int64_t max_file_size_kb = 0;
  int32_t max_files = 0;
};

// Builds the configuration from the command line flags. For the flags that
// have an environment fallback, a value given on the command line wins over
// the environment, which wins over the default. Throws std::invalid_argument
// on malformed or inconsistent values.
SandboxConfig LoadConfig();

// Creates the sandbox root if needed, replaces it with its canonical path and
// resolves the interpreter in PATH. Throws std::runtime_error (or a subclass)
// if the root is not a usable directory or the interpreter cannot be found.
void PrepareConfig(SandboxConfig* config);

}  // namespace core

#endif
