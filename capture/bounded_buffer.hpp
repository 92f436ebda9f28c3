#ifndef CAPTURE_BOUNDED_BUFFER_HPP
#define CAPTURE_BOUNDED_BUFFER_HPP

#include <cstddef>
#include <string>

namespace capture {

// Keeps the first capacity bytes appended to it and drops the rest, noting
// that it did.
class BoundedBuffer {
 public:
  explicit BoundedBuffer(size_t capacity) : capacity_(capacity) {}

  // Returns the number of bytes kept.
  size_t Append(const char* data, size_t size);
  size_t Append(const std::string& data) {
    return Append(data.data(), data.size());
  }

  const std::string& Data() const { return data_; }
  bool Truncated() const { return truncated_; }
  size_t Capacity() const { return capacity_; }

 private:
  size_t capacity_;
  std::string data_;
  bool truncated_ = false;
};

}  // namespace capture

#endif
