#include "capture/bounded_buffer.hpp"

#include <algorithm>

namespace capture {

size_t BoundedBuffer::Append(const char* data, size_t size) {
  size_t room = capacity_ - data_.size();
  size_t kept = std::min(room, size);
  data_.append(data, kept);
  if (kept < size) truncated_ = true;
  return kept;
}

}  // namespace capture
