#ifndef CAPTURE_OUTPUT_CAPTURE_HPP
#define CAPTURE_OUTPUT_CAPTURE_HPP

#include <string>
#include <vector>

#include "capture/bounded_buffer.hpp"
#include "sandbox/governor.hpp"
#include "script/output.hpp"

namespace capture {

// A pipe whose read end is drained into a BoundedBuffer.
class CapturePipe : public sandbox::Stream {
 public:
  // If limit_is_fatal, overflowing the buffer asks the supervisor to stop the
  // writer; otherwise the excess is silently discarded.
  CapturePipe(size_t capacity, bool limit_is_fatal)
      : buffer_(capacity), limit_is_fatal_(limit_is_fatal) {}
  ~CapturePipe() override;

  CapturePipe(const CapturePipe&) = delete;
  CapturePipe& operator=(const CapturePipe&) = delete;

  bool Open(std::string* error_msg);

  int WriteEnd() const override { return fds_[1]; }
  int ReadEnd() const override { return fds_[0]; }
  void CloseWriteEnd() override;
  Status Drain() override;

  const BoundedBuffer& Buffer() const { return buffer_; }

 private:
  BoundedBuffer buffer_;
  bool limit_is_fatal_;
  int fds_[2] = {-1, -1};
};

// Supervisor side of a run's standard output and error channels.
class OutputCapture {
 public:
  explicit OutputCapture(size_t capacity)
      : stdout_(capacity, false), stderr_(capacity, false) {}

  bool Open(std::string* error_msg) {
    return stdout_.Open(error_msg) && stderr_.Open(error_msg);
  }

  CapturePipe* StdoutPipe() { return &stdout_; }
  CapturePipe* StderrPipe() { return &stderr_; }

  const BoundedBuffer& Stdout() const { return stdout_.Buffer(); }
  const BoundedBuffer& Stderr() const { return stderr_.Buffer(); }

 private:
  CapturePipe stdout_;
  CapturePipe stderr_;
};

// Makes target_fd refer to source_fd for the lifetime of the object, then
// puts the previous descriptor back.
class ScopedRedirect {
 public:
  ScopedRedirect(int target_fd, int source_fd);
  ~ScopedRedirect();

  ScopedRedirect(const ScopedRedirect&) = delete;
  ScopedRedirect& operator=(const ScopedRedirect&) = delete;

 private:
  int target_fd_;
  int saved_fd_ = -1;
};

// Unbuffered sink writing straight to a descriptor. After the first failed
// write every later write is dropped.
class FdSink : public script::OutputSink {
 public:
  explicit FdSink(int fd) : fd_(fd) {}
  void Write(const std::string& data) override;
  bool Failed() const { return failed_; }

 private:
  int fd_;
  bool failed_ = false;
};

}  // namespace capture

#endif
