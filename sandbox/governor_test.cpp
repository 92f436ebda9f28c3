#include "sandbox/governor.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <new>
#include <stdexcept>
#include <thread>

#include <kj/debug.h>
#include <kj/exception.h>

namespace {

using ::testing::HasSubstr;
using namespace sandbox;

// A pipe collected into a string.
class StringStream : public Stream {
 public:
  explicit StringStream(bool fail_on_data = false)
      : fail_on_data_(fail_on_data) {
    // Only the read end is non-blocking; the child writes with blocking
    // semantics.
    if (pipe2(fds_, O_CLOEXEC) == -1) {
      fds_[0] = fds_[1] = -1;
    } else {
      fcntl(fds_[0], F_SETFL, O_NONBLOCK);
    }
  }
  ~StringStream() override {
    if (fds_[0] != -1) close(fds_[0]);
    if (fds_[1] != -1) close(fds_[1]);
  }
  int WriteEnd() const override { return fds_[1]; }
  int ReadEnd() const override { return fds_[0]; }
  void CloseWriteEnd() override {
    close(fds_[1]);
    fds_[1] = -1;
  }
  Status Drain() override {
    char buf[4096];
    while (true) {
      ssize_t n = read(fds_[0], buf, sizeof(buf));
      if (n == 0) return Status::CLOSED;
      if (n == -1) break;
      data_.append(buf, n);
    }
    if (fail_on_data_ && !data_.empty()) return Status::LIMIT_EXCEEDED;
    return Status::OPEN;
  }
  const std::string& Data() const { return data_; }

 private:
  bool fail_on_data_;
  int fds_[2];
  std::string data_;
};

// Fails as soon as the child writes anything.
class BrokenStream : public StringStream {
 public:
  Status Drain() override {
    StringStream::Drain();
    if (!Data().empty()) KJ_FAIL_REQUIRE("stream broken");
    return Status::OPEN;
  }
};

bool WriteString(int fd, const char* data) {
  return write(fd, data, strlen(data)) == static_cast<ssize_t>(strlen(data));
}

void BusyLoop() {
  volatile uint64_t counter = 0;
  while (true) counter = counter + 1;
}

RunInfo RunBody(const Limits& limits, const Governor::Body& body,
                const std::vector<Stream*>& streams = {},
                const std::atomic<bool>* cancelled = nullptr) {
  Governor governor(limits);
  RunInfo info;
  std::string error_msg;
  EXPECT_TRUE(governor.Run(streams, body, cancelled, &info, &error_msg))
      << error_msg;
  return info;
}

Limits DefaultLimits() {
  Limits limits;
  limits.wall_limit_millis = 5000;
  limits.cpu_limit_millis = 5000;
  limits.memory_limit_kb = 256 * 1024;
  limits.grace_period_millis = 1000;
  return limits;
}

// NOLINTNEXTLINE
TEST(Governor, Completed) {
  RunInfo info = RunBody(DefaultLimits(), []() { return 0; });
  EXPECT_EQ(info.state, RunState::COMPLETED);
  EXPECT_TRUE(info.reaped);
  EXPECT_GT(info.pid, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(info.signal, 0);
}

// NOLINTNEXTLINE
TEST(Governor, NonZeroExitIsACrash) {
  RunInfo info = RunBody(DefaultLimits(), []() { return 7; });
  EXPECT_EQ(info.state, RunState::CRASHED);
  EXPECT_EQ(info.status_code, 7);
  EXPECT_EQ(info.message, "exited with status 7");
}

// NOLINTNEXTLINE
TEST(Governor, SignalIsACrash) {
  RunInfo info = RunBody(DefaultLimits(), []() {
    raise(SIGSEGV);
    return 0;
  });
  EXPECT_EQ(info.state, RunState::CRASHED);
  EXPECT_EQ(info.signal, SIGSEGV);
  EXPECT_THAT(info.message, HasSubstr("killed by signal"));
}

// NOLINTNEXTLINE
TEST(Governor, ExceptionsDoNotEscapeTheChild) {
  RunInfo info = RunBody(DefaultLimits(), []() -> int {
    throw std::runtime_error("boom");
  });
  EXPECT_EQ(info.state, RunState::CRASHED);
  EXPECT_EQ(info.status_code, Governor::kExitInternalError);
}

// NOLINTNEXTLINE
TEST(Governor, WallTimeout) {
  Limits limits = DefaultLimits();
  limits.wall_limit_millis = 200;
  auto start = std::chrono::steady_clock::now();
  RunInfo info = RunBody(limits, []() {
    BusyLoop();
    return 0;
  });
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(info.state, RunState::TIMED_OUT);
  EXPECT_TRUE(info.reaped);
  EXPECT_GE(info.wall_time_millis, 200);
  EXPECT_LT(elapsed, std::chrono::seconds(3));
}

// NOLINTNEXTLINE
TEST(Governor, SleepingChildTimesOut) {
  Limits limits = DefaultLimits();
  limits.wall_limit_millis = 100;
  RunInfo info = RunBody(limits, []() {
    while (true) pause();
    return 0;
  });
  EXPECT_EQ(info.state, RunState::TIMED_OUT);
}

// NOLINTNEXTLINE
TEST(Governor, CpuLimit) {
  Limits limits = DefaultLimits();
  limits.wall_limit_millis = 10000;
  limits.cpu_limit_millis = 500;
  RunInfo info = RunBody(limits, []() {
    BusyLoop();
    return 0;
  });
  EXPECT_EQ(info.state, RunState::RESOURCE_EXCEEDED);
  EXPECT_EQ(info.resource, Resource::CPU);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 500);
}

// NOLINTNEXTLINE
TEST(Governor, AllocationFailureIsMemoryExhaustion) {
  RunInfo info = RunBody(DefaultLimits(), []() -> int {
    throw std::bad_alloc();
  });
  EXPECT_EQ(info.state, RunState::RESOURCE_EXCEEDED);
  EXPECT_EQ(info.resource, Resource::MEMORY);
}

// NOLINTNEXTLINE
TEST(Governor, MemoryLimit) {
  Limits limits = DefaultLimits();
  limits.memory_limit_kb = 64 * 1024;
  RunInfo info = RunBody(limits, []() {
    std::vector<char> big(512 * 1024 * 1024, 'x');
    return big[12345] == 'x' ? 0 : 1;
  });
  EXPECT_EQ(info.state, RunState::RESOURCE_EXCEEDED);
  EXPECT_EQ(info.resource, Resource::MEMORY);
}

// NOLINTNEXTLINE
TEST(Governor, StreamsAreCollected) {
  StringStream first;
  StringStream second;
  RunInfo info = RunBody(
      DefaultLimits(),
      []() {
        bool ok = WriteString(Governor::kFirstStreamFd, "report") &&
                  WriteString(Governor::kFirstStreamFd + 1, "log");
        return ok ? 0 : 1;
      },
      {&first, &second});
  EXPECT_EQ(info.state, RunState::COMPLETED);
  EXPECT_EQ(first.Data(), "report");
  EXPECT_EQ(second.Data(), "log");
}

// NOLINTNEXTLINE
TEST(Governor, LargeOutputDoesNotBlockTheChild) {
  StringStream stream;
  RunInfo info = RunBody(
      DefaultLimits(),
      []() {
        std::string chunk(64 * 1024, 'a');
        for (int i = 0; i < 64; i++) {
          if (!WriteString(Governor::kFirstStreamFd, chunk.c_str())) return 1;
        }
        return 0;
      },
      {&stream});
  EXPECT_EQ(info.state, RunState::COMPLETED);
  EXPECT_EQ(stream.Data().size(), 64u * 64 * 1024);
}

// NOLINTNEXTLINE
TEST(Governor, StreamLimitStopsTheChild) {
  StringStream stream(/*fail_on_data=*/true);
  RunInfo info = RunBody(
      DefaultLimits(),
      []() {
        WriteString(Governor::kFirstStreamFd, "too much");
        while (true) pause();
        return 0;
      },
      {&stream});
  EXPECT_EQ(info.state, RunState::RESOURCE_EXCEEDED);
  EXPECT_EQ(info.resource, Resource::REPORT);
}

// NOLINTNEXTLINE
TEST(Governor, InheritedDescriptorsAreClosed) {
  int leaked = open("/dev/null", O_RDONLY);  // No O_CLOEXEC on purpose.
  ASSERT_NE(leaked, -1);
  RunInfo info = RunBody(DefaultLimits(), [leaked]() {
    if (fcntl(leaked, F_GETFD) != -1 || errno != EBADF) return 1;
    if (fcntl(STDIN_FILENO, F_GETFD) != -1) return 2;
    // The error pipe right after the streams is closed once setup is over.
    if (fcntl(Governor::kFirstStreamFd, F_GETFD) != -1) return 3;
    return 0;
  });
  close(leaked);
  EXPECT_EQ(info.state, RunState::COMPLETED) << info.message;
}

// NOLINTNEXTLINE
TEST(Governor, Cancellation) {
  std::atomic<bool> cancelled{false};
  std::thread canceller([&cancelled]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancelled = true;
  });
  RunInfo info = RunBody(
      DefaultLimits(),
      []() {
        while (true) pause();
        return 0;
      },
      {}, &cancelled);
  canceller.join();
  EXPECT_EQ(info.state, RunState::CANCELLED);
  EXPECT_TRUE(info.reaped);
}

// NOLINTNEXTLINE
TEST(Governor, UnkillableChildIsReported) {
  Limits limits = DefaultLimits();
  limits.wall_limit_millis = 100;
  limits.grace_period_millis = 100;
  Governor governor(limits);
  int kill_calls = 0;
  governor.SetKillFunction([&kill_calls](pid_t, int) {
    kill_calls++;
    return 0;
  });
  RunInfo info;
  std::string error_msg;
  ASSERT_TRUE(governor.Run(
      {},
      []() {
        while (true) pause();
        return 0;
      },
      nullptr, &info, &error_msg));
  EXPECT_EQ(kill_calls, 1);
  EXPECT_FALSE(info.reaped);
  EXPECT_EQ(info.state, RunState::TIMED_OUT);
  // The detached reaper collects it once it really dies.
  EXPECT_EQ(kill(info.pid, SIGKILL), 0);
}

// NOLINTNEXTLINE
TEST(Governor, SupervisorFailureKillsTheChild) {
  Governor governor(DefaultLimits());
  pid_t killed = 0;
  governor.SetKillFunction([&killed](pid_t pid, int sig) {
    killed = pid;
    return kill(pid, sig);
  });
  BrokenStream stream;
  RunInfo info;
  std::string error_msg;
  EXPECT_THROW(governor.Run(
                   {&stream},
                   []() {
                     WriteString(Governor::kFirstStreamFd, "data");
                     while (true) pause();
                     return 0;
                   },
                   nullptr, &info, &error_msg),
               kj::Exception);
  ASSERT_EQ(killed, info.pid);
  // The background reaper collects it, so the pid eventually disappears.
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (kill(killed, 0) == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(kill(killed, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

// NOLINTNEXTLINE
TEST(Governor, Names) {
  EXPECT_STREQ(RunStateName(RunState::TIMED_OUT), "timed out");
  EXPECT_STREQ(ResourceName(Resource::MEMORY), "memory");
}

}  // namespace
