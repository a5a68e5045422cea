#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <string>
#include <system_error>

namespace util {

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

class File {
 public:
  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Joins two paths. If second is absolute, it is returned unchanged.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Returns true if a file (or directory) exists
  static bool Exists(const std::string& path);

  // Returns true if path exists and is a directory, following symlinks.
  static bool IsDirectory(const std::string& path);

  // Returns the canonical absolute form of an existing path, with all the
  // symlinks resolved. Throws file_not_found if some component is missing.
  static std::string RealPath(const std::string& path);
};

// A file created with a unique name in a given folder and filled with the
// given contents. The file is removed on destruction.
class TempFile {
 public:
  // The name of the file is prefix, six random characters and suffix.
  TempFile(const std::string& dir, const std::string& prefix,
           const std::string& suffix, const std::string& contents);

  // Returns the path of the file.
  const std::string& Path() const { return path_; }

  ~TempFile();

  TempFile(TempFile&& other) noexcept { *this = std::move(other); }
  TempFile& operator=(TempFile&& other) noexcept {
    path_ = std::move(other.path_);
    other.path_.clear();
    return *this;
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

 private:
  std::string path_;
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const { return path_; }

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    other.moved_ = true;
    return *this;
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool moved_ = false;
};

}  // namespace util

#endif
