#include "util/file.hpp"

#include <fcntl.h>
#include <ftw.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <vector>

#include "glog/logging.h"

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) {
  return remove(path.c_str()) != -1 || errno == ENOENT;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back('\0');
  if (mkdtemp(data.data()) == nullptr) {
    return "";
  }
  return data.data();
}

// Returns the fd of the new file, or -1 and sets errno.
int OsTempFile(const std::string& dir, const std::string& prefix,
               const std::string& suffix, std::string* path) {
  std::string tmp = util::File::JoinPath(dir, prefix + "XXXXXX" + suffix);
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back('\0');
  int fd = mkostemps(data.data(), suffix.size(), O_CLOEXEC);
  *path = data.data();
  return fd;
}

// Returns errno, or 0 on success.
int OsWriteAll(int fd, const std::string& contents) {
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.data() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return errno;
    pos += written;
  }
  return 0;
}

}  // namespace

namespace util {

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0])) return second;
  if (first.empty()) return second;
  if (strchr(kPathSeparators, first.back())) return first + second;
  return first + kPathSeparators[0] + second;
}

bool File::Exists(const std::string& path) {
  struct stat buf {};
  return stat(path.c_str(), &buf) != -1;
}

bool File::IsDirectory(const std::string& path) {
  struct stat buf {};
  if (stat(path.c_str(), &buf) == -1) return false;
  return S_ISDIR(buf.st_mode);
}

std::string File::RealPath(const std::string& path) {
  std::unique_ptr<char, decltype(&free)> resolved{
      realpath(path.c_str(), nullptr), &free};
  if (!resolved) {
    if (errno == ENOENT) throw file_not_found("realpath " + path);
    throw std::system_error(errno, std::system_category(), "realpath " + path);
  }
  return resolved.get();
}

TempFile::TempFile(const std::string& dir, const std::string& prefix,
                   const std::string& suffix, const std::string& contents) {
  int fd = OsTempFile(dir, prefix, suffix, &path_);
  if (fd == -1) {
    int error = errno;
    path_.clear();
    throw std::system_error(error, std::system_category(),
                            "mkostemps " + dir);
  }
  int error = OsWriteAll(fd, contents);
  if (close(fd) == -1 && error == 0) error = errno;
  if (error != 0) {
    std::string path = path_;
    if (!OsRemove(path_)) PLOG(WARNING) << "Could not remove " << path_;
    path_.clear();
    throw std::system_error(error, std::system_category(), "write " + path);
  }
}

TempFile::~TempFile() {
  if (path_.empty()) return;
  if (!OsRemove(path_)) {
    PLOG(WARNING) << "Could not remove " << path_;
  }
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}

TempDir::~TempDir() {
  if (moved_) return;
  if (!OsRemoveTree(path_)) {
    PLOG(WARNING) << "Could not remove " << path_;
  }
}

}  // namespace util
