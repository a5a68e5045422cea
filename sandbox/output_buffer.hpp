#ifndef SANDBOX_OUTPUT_BUFFER_HPP
#define SANDBOX_OUTPUT_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace sandbox {

// Accumulates the bytes read from one output stream of the program, keeping
// at most limit of them (all of them if limit is 0). The bytes past the limit
// are discarded, but the stream should still be drained by the caller so that
// the writer never blocks.
class OutputBuffer {
 public:
  explicit OutputBuffer(uint64_t limit) : limit_(limit) {}

  void Append(const char* data, size_t size);

  std::string Release() { return std::move(data_); }
  bool Truncated() const { return truncated_; }

 private:
  uint64_t limit_;
  bool truncated_ = false;
  std::string data_;
};

}  // namespace sandbox

#endif
