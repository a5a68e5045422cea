#include "sandbox/confinement.hpp"

#include <errno.h>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

#include <deque>
#include <system_error>
#include <vector>

#include "absl/strings/str_split.h"

namespace {

const constexpr int kMaxSymlinks = 40;

std::string JoinComponents(const std::vector<std::string>& components) {
  if (components.empty()) return "/";
  std::string path;
  for (const std::string& c : components) {
    path += '/';
    path += c;
  }
  return path;
}

void PushComponents(const std::string& path, std::deque<std::string>* queue) {
  std::vector<std::string> parts =
      absl::StrSplit(path, '/', absl::SkipEmpty());
  queue->insert(queue->begin(), parts.begin(), parts.end());
}

}  // namespace

namespace sandbox {

bool IsWithin(const std::string& root, const std::string& path) {
  if (root == "/") return !path.empty() && path[0] == '/';
  if (path.compare(0, root.size(), root) != 0) return false;
  return path.size() == root.size() || path[root.size()] == '/';
}

std::string Confine(const std::string& root, const std::string& path) {
  if (path.empty()) throw path_escape("Empty path");
  if (path.find('\0') != std::string::npos) {
    throw path_escape("Path contains a NUL byte");
  }

  std::vector<std::string> current;
  std::deque<std::string> pending;
  PushComponents(path, &pending);
  if (path[0] != '/') PushComponents(root, &pending);

  // While the component at missing_depth is missing, the components below it
  // cannot be symlinks. A ".." above it brings the walk back to existing
  // directories.
  size_t missing_depth = 0;
  int symlinks = 0;
  while (!pending.empty()) {
    std::string component = std::move(pending.front());
    pending.pop_front();
    if (component == ".") continue;
    if (component == "..") {
      if (!current.empty()) current.pop_back();
      if (current.size() < missing_depth) missing_depth = 0;
      continue;
    }
    current.push_back(std::move(component));
    if (missing_depth != 0) continue;

    std::string prefix = JoinComponents(current);
    struct stat st;
    if (lstat(prefix.c_str(), &st) == -1) {
      if (errno == ENOENT || errno == ENOTDIR) {
        missing_depth = current.size();
        continue;
      }
      throw std::system_error(errno, std::system_category(),
                              "lstat " + prefix);
    }
    if (!S_ISLNK(st.st_mode)) continue;

    if (++symlinks > kMaxSymlinks) {
      throw std::system_error(ELOOP, std::system_category(), path);
    }
    char target[PATH_MAX];
    ssize_t len = readlink(prefix.c_str(), target, sizeof(target) - 1);
    if (len == -1) {
      throw std::system_error(errno, std::system_category(),
                              "readlink " + prefix);
    }
    target[len] = '\0';
    current.pop_back();
    if (target[0] == '/') current.clear();
    PushComponents(target, &pending);
  }

  std::string resolved = JoinComponents(current);
  if (!IsWithin(root, resolved)) {
    throw path_escape(path + " resolves outside of the sandbox root");
  }
  return resolved;
}

}  // namespace sandbox
