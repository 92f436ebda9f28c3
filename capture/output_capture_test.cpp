#include "capture/output_capture.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <fcntl.h>
#include <unistd.h>
#include <cstdio>

namespace {

using capture::CapturePipe;
using sandbox::Stream;

void WriteString(int fd, const std::string& data) {
  ASSERT_EQ(write(fd, data.data(), data.size()),
            static_cast<ssize_t>(data.size()));
}

// NOLINTNEXTLINE
TEST(CapturePipe, DrainsUntilClosed) {
  CapturePipe pipe(1024, false);
  std::string error_msg;
  ASSERT_TRUE(pipe.Open(&error_msg)) << error_msg;
  EXPECT_EQ(pipe.Drain(), Stream::Status::OPEN);
  WriteString(pipe.WriteEnd(), "hello");
  EXPECT_EQ(pipe.Drain(), Stream::Status::OPEN);
  pipe.CloseWriteEnd();
  EXPECT_EQ(pipe.WriteEnd(), -1);
  EXPECT_EQ(pipe.Drain(), Stream::Status::CLOSED);
  EXPECT_EQ(pipe.Buffer().Data(), "hello");
}

// NOLINTNEXTLINE
TEST(CapturePipe, ExcessIsDiscarded) {
  CapturePipe pipe(4, false);
  std::string error_msg;
  ASSERT_TRUE(pipe.Open(&error_msg)) << error_msg;
  WriteString(pipe.WriteEnd(), "abcdefgh");
  pipe.CloseWriteEnd();
  while (pipe.Drain() != Stream::Status::CLOSED) {
  }
  EXPECT_EQ(pipe.Buffer().Data(), "abcd");
  EXPECT_TRUE(pipe.Buffer().Truncated());
}

// NOLINTNEXTLINE
TEST(CapturePipe, FatalLimit) {
  CapturePipe pipe(4, true);
  std::string error_msg;
  ASSERT_TRUE(pipe.Open(&error_msg)) << error_msg;
  WriteString(pipe.WriteEnd(), "abc");
  EXPECT_EQ(pipe.Drain(), Stream::Status::OPEN);
  WriteString(pipe.WriteEnd(), "de");
  EXPECT_EQ(pipe.Drain(), Stream::Status::LIMIT_EXCEEDED);
}

// NOLINTNEXTLINE
TEST(OutputCapture, ChannelsAreSeparate) {
  capture::OutputCapture capture(64);
  std::string error_msg;
  ASSERT_TRUE(capture.Open(&error_msg)) << error_msg;
  WriteString(capture.StdoutPipe()->WriteEnd(), "out");
  WriteString(capture.StderrPipe()->WriteEnd(), "err");
  capture.StdoutPipe()->CloseWriteEnd();
  capture.StderrPipe()->CloseWriteEnd();
  capture.StdoutPipe()->Drain();
  capture.StderrPipe()->Drain();
  EXPECT_EQ(capture.Stdout().Data(), "out");
  EXPECT_EQ(capture.Stderr().Data(), "err");
}

// NOLINTNEXTLINE
TEST(ScopedRedirect, RestoresTarget) {
  int fds[2];
  ASSERT_EQ(pipe2(fds, O_CLOEXEC), 0);
  int target = dup(fds[1]);
  ASSERT_NE(target, -1);
  int other[2];
  ASSERT_EQ(pipe2(other, O_CLOEXEC), 0);
  {
    capture::ScopedRedirect redirect(target, other[1]);
    WriteString(target, "redirected");
  }
  WriteString(target, "original");
  close(target);
  close(fds[1]);
  close(other[1]);
  char buf[64];
  ssize_t n = read(other[0], buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, n), "redirected");
  n = read(fds[0], buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, n), "original");
  close(fds[0]);
  close(other[0]);
}

// NOLINTNEXTLINE
TEST(FdSink, WritesAndRemembersFailure) {
  int fds[2];
  ASSERT_EQ(pipe2(fds, O_CLOEXEC), 0);
  capture::FdSink sink(fds[1]);
  sink.Write("line\n");
  EXPECT_FALSE(sink.Failed());
  close(fds[1]);
  char buf[16];
  ssize_t n = read(fds[0], buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, n), "line\n");
  close(fds[0]);

  capture::FdSink broken(-1);
  broken.Write("lost");
  EXPECT_TRUE(broken.Failed());
}

}  // namespace
