#include "capture/output_capture.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <kj/debug.h>

namespace capture {

namespace {
const constexpr size_t kReadChunk = 64 * 1024;
// Bounds the time spent in one Drain call when the writer is fast.
const constexpr int kMaxReadsPerDrain = 16;
}  // namespace

CapturePipe::~CapturePipe() {
  if (fds_[0] != -1) close(fds_[0]);
  if (fds_[1] != -1) close(fds_[1]);
}

bool CapturePipe::Open(std::string* error_msg) {
  if (pipe2(fds_, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = "pipe2: ";
    *error_msg += strerror(errno);  // NOLINT
    return false;
  }
  if (fcntl(fds_[0], F_SETFL, O_NONBLOCK) == -1) {
    *error_msg = "fcntl: ";
    *error_msg += strerror(errno);  // NOLINT
    return false;
  }
  return true;
}

void CapturePipe::CloseWriteEnd() {
  if (fds_[1] == -1) return;
  close(fds_[1]);
  fds_[1] = -1;
}

sandbox::Stream::Status CapturePipe::Drain() {
  char buf[kReadChunk];
  for (int i = 0; i < kMaxReadsPerDrain; i++) {
    ssize_t num_read = read(fds_[0], buf, kReadChunk);
    if (num_read == 0) return Status::CLOSED;
    if (num_read == -1) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) break;
      KJ_FAIL_SYSCALL("read", errno);
    }
    // Excess data is read anyway, so the writer never blocks.
    buffer_.Append(buf, num_read);
  }
  if (limit_is_fatal_ && buffer_.Truncated()) return Status::LIMIT_EXCEEDED;
  return Status::OPEN;
}

ScopedRedirect::ScopedRedirect(int target_fd, int source_fd)
    : target_fd_(target_fd) {
  saved_fd_ = fcntl(target_fd, F_DUPFD_CLOEXEC, 0);
  if (saved_fd_ == -1 && errno != EBADF) {
    KJ_FAIL_SYSCALL("fcntl", errno, target_fd);
  }
  KJ_SYSCALL(dup2(source_fd, target_fd), target_fd, source_fd);
}

ScopedRedirect::~ScopedRedirect() {
  if (saved_fd_ == -1) {
    close(target_fd_);
    return;
  }
  // On failure target_fd_ stays redirected; there is no caller to tell.
  while (dup2(saved_fd_, target_fd_) == -1 && errno == EINTR) {
  }
  close(saved_fd_);
}

void FdSink::Write(const std::string& data) {
  const char* pos = data.data();
  size_t size = data.size();
  while (size > 0 && !failed_) {
    ssize_t written = write(fd_, pos, size);
    if (written == -1) {
      if (errno == EINTR) continue;
      failed_ = true;
      break;
    }
    pos += written;
    size -= written;
  }
}

}  // namespace capture
