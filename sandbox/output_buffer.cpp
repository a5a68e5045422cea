#include "sandbox/output_buffer.hpp"

namespace sandbox {

void OutputBuffer::Append(const char* data, size_t size) {
  if (limit_ == 0) {
    data_.append(data, size);
    return;
  }
  uint64_t room = limit_ - data_.size();
  if (size > room) {
    truncated_ = true;
    size = room;
  }
  data_.append(data, size);
}

}  // namespace sandbox
