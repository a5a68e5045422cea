#include "util/which.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <unordered_map>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"
#include "util/file.hpp"

namespace {

absl::Mutex cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache
    GUARDED_BY(cache_mutex);

bool IsExecutableFile(const std::string& path) {
  struct stat buffer {};
  if (stat(path.c_str(), &buffer) != 0) return false;
  return S_ISREG(buffer.st_mode) && access(path.c_str(), X_OK) == 0;
}

}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.empty()) return "";
  if (cmd.find('/') != std::string::npos) {
    return IsExecutableFile(cmd) ? cmd : "";
  }

  if (use_cache) {
    absl::MutexLock lck(&cache_mutex);
    auto it = cmd_cache.find(cmd);
    if (it != cmd_cache.end()) return it->second;
  }

  const char* path = std::getenv("PATH");
  if (path == nullptr) return "";
  std::vector<std::string> dirs = absl::StrSplit(path, ':', absl::SkipEmpty());
  for (const std::string& dir : dirs) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (!IsExecutableFile(fullpath)) continue;
    absl::MutexLock lck(&cache_mutex);
    cmd_cache[cmd] = fullpath;
    return fullpath;
  }
  return "";
}

}  // namespace util
