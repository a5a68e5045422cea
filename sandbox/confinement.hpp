#ifndef SANDBOX_CONFINEMENT_HPP
#define SANDBOX_CONFINEMENT_HPP

#include <stdexcept>
#include <string>

namespace sandbox {

// Thrown when a path resolves outside of the sandbox root.
class path_escape : public std::runtime_error {
 public:
  explicit path_escape(const std::string& msg) : std::runtime_error(msg) {}
};

// Resolves path against root and checks that the result is root itself or
// one of its descendants. Relative paths are taken relative to root. "." and
// ".." are collapsed and the symlinks of every existing prefix are resolved,
// the missing tail of the path is normalized lexically.
// root must be a canonical absolute path (see util::File::RealPath).
// Returns the resolved path, throws path_escape otherwise. Throws
// std::system_error if a prefix cannot be inspected or if there are too many
// symlinks to follow.
std::string Confine(const std::string& root, const std::string& path);

// Returns true if path is root or lies below it. Both must be normalized
// absolute paths.
bool IsWithin(const std::string& root, const std::string& path);

}  // namespace sandbox

#endif
