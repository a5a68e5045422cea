#include "core/config.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <thread>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace {

const constexpr char* kRootEnv = "SANDBOX_ROOT";
const constexpr char* kMaxTimeoutEnv = "SANDBOX_MAX_TIMEOUT_S";
const constexpr char* kMaxOutputEnv = "SANDBOX_MAX_OUTPUT_BYTES";
const constexpr char* kMaxConcurrentEnv = "SANDBOX_MAX_CONCURRENT";

// Returns the environment value to use instead of the given flag, or nullptr
// if the flag was set explicitly or the variable is unset.
const char* EnvOverride(const char* flag, const char* env) {
  if (!gflags::GetCommandLineFlagInfoOrDie(flag).is_default) return nullptr;
  const char* value = std::getenv(env);
  if (value == nullptr || *value == '\0') return nullptr;
  return value;
}

template <typename T>
T ParseEnv(const char* env, const char* value) {
  T parsed;
  if (!absl::SimpleAtoi(value, &parsed)) {
    throw std::invalid_argument(
        absl::StrCat("Invalid value for ", env, ": ", value));
  }
  return parsed;
}

template <>
double ParseEnv<double>(const char* env, const char* value) {
  double parsed;
  if (!absl::SimpleAtod(value, &parsed)) {
    throw std::invalid_argument(
        absl::StrCat("Invalid value for ", env, ": ", value));
  }
  return parsed;
}

}  // namespace

namespace core {

SandboxConfig LoadConfig() {
  SandboxConfig config;

  config.root = FLAGS_sandbox_root;
  if (const char* root = EnvOverride("sandbox_root", kRootEnv)) {
    config.root = root;
  }
  if (config.root.empty()) {
    throw std::invalid_argument("The sandbox root cannot be empty");
  }

  config.max_timeout_s = FLAGS_max_timeout_s;
  if (const char* value = EnvOverride("max_timeout_s", kMaxTimeoutEnv)) {
    config.max_timeout_s = ParseEnv<double>(kMaxTimeoutEnv, value);
  }
  if (!std::isfinite(config.max_timeout_s) || config.max_timeout_s <= 0) {
    throw std::invalid_argument(
        absl::StrCat("Invalid maximum timeout: ", config.max_timeout_s));
  }

  config.default_timeout_s = FLAGS_default_timeout_s;
  if (!std::isfinite(config.default_timeout_s) ||
      config.default_timeout_s <= 0 ||
      config.default_timeout_s > config.max_timeout_s) {
    throw std::invalid_argument(absl::StrCat(
        "The default timeout must be in (0, ", config.max_timeout_s,
        "], got ", config.default_timeout_s));
  }

  config.max_output_bytes = FLAGS_max_output_bytes;
  if (const char* value = EnvOverride("max_output_bytes", kMaxOutputEnv)) {
    config.max_output_bytes = ParseEnv<uint64_t>(kMaxOutputEnv, value);
  }
  if (config.max_output_bytes == 0) {
    throw std::invalid_argument("The output ceiling must be positive");
  }

  config.max_concurrent = FLAGS_max_concurrent;
  if (const char* value = EnvOverride("max_concurrent", kMaxConcurrentEnv)) {
    config.max_concurrent = ParseEnv<int32_t>(kMaxConcurrentEnv, value);
  }
  if (config.max_concurrent < 0) {
    throw std::invalid_argument(absl::StrCat(
        "Invalid number of concurrent executions: ", config.max_concurrent));
  }
  if (config.max_concurrent == 0) {
    config.max_concurrent = std::thread::hardware_concurrency();
    if (config.max_concurrent == 0) config.max_concurrent = 1;
  }

  config.interpreter = FLAGS_interpreter;
  if (config.interpreter.empty()) {
    throw std::invalid_argument("No interpreter specified");
  }
  std::vector<std::string> interpreter_args =
      absl::StrSplit(FLAGS_interpreter_args, ',', absl::SkipEmpty());
  config.interpreter_args = std::move(interpreter_args);
  config.script_suffix = FLAGS_script_suffix;
  if (config.script_suffix.find('/') != std::string::npos) {
    throw std::invalid_argument("The script suffix cannot contain /");
  }
  std::vector<std::string> child_env =
      absl::StrSplit(FLAGS_child_env, ',', absl::SkipEmpty());
  for (const std::string& var : child_env) {
    size_t eq = var.find('=');
    if (eq == std::string::npos || eq == 0) {
      throw std::invalid_argument("Invalid environment variable: " + var);
    }
    if (var.compare(0, eq, "PATH") == 0) {
      throw std::invalid_argument("PATH is always forwarded, do not set it");
    }
    config.child_env.push_back(var);
  }

  config.memory_limit_kb = FLAGS_memory_limit_kb;
  config.max_file_size_kb = FLAGS_max_file_size_kb;
  config.max_files = FLAGS_max_files;
  if (config.memory_limit_kb < 0 || config.max_file_size_kb < 0 ||
      config.max_files < 0) {
    throw std::invalid_argument("Resource limits cannot be negative");
  }
  return config;
}

void PrepareConfig(SandboxConfig* config) {
  if (!util::File::Exists(config->root)) {
    LOG(INFO) << "Creating sandbox root " << config->root;
    util::File::MakeDirs(config->root);
  }
  if (!util::File::IsDirectory(config->root)) {
    throw std::runtime_error("The sandbox root is not a directory: " +
                             config->root);
  }
  config->root = util::File::RealPath(config->root);

  std::string interpreter = util::which(config->interpreter);
  if (interpreter.empty()) {
    throw util::file_not_found("Interpreter not found: " +
                               config->interpreter);
  }
  config->interpreter = interpreter;
  LOG(INFO) << "Sandbox root: " << config->root;
  LOG(INFO) << "Interpreter: " << config->interpreter;
}

}  // namespace core
