#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// file called cmd in the directories listed in PATH, or an empty string.
// Commands containing a / are returned unchanged if they are executable.
// Positive results are cached, unless explicitly disabled; the cache is
// shared between threads.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
