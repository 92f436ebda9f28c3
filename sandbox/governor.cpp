#include "sandbox/governor.hpp"

#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <new>
#include <thread>

#include <kj/common.h>
#include <kj/debug.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

const constexpr int kPollMillis = 10;
const constexpr int kReapPollMillis = 5;

bool WriteAll(int fd, const void* data, size_t size) {
  const char* pos = static_cast<const char*>(data);
  while (size > 0) {
    ssize_t written = write(fd, pos, size);
    if (written == -1) {
      if (errno == EINTR) continue;
      return false;
    }
    pos += written;
    size -= written;
  }
  return true;
}

// Size of the calling process' address space, from /proc/self/statm.
int64_t AddressSpaceKb() {
  int fd = open("/proc/self/statm", O_RDONLY | O_CLOEXEC);
  if (fd == -1) return -1;
  char buf[256] = {};
  ssize_t num_read = read(fd, buf, sizeof(buf) - 1);
  close(fd);
  if (num_read <= 0) return -1;
  int64_t pages = 0;
  if (sscanf(buf, "%" SCNd64, &pages) != 1) return -1;  // NOLINT
  return pages * (sysconf(_SC_PAGESIZE) / 1024);
}

// Closes every descriptor numbered first or above. EBADF from descriptors
// that were never open is expected.
void CloseFrom(int first) {
#ifdef SYS_close_range
  if (syscall(SYS_close_range, first, ~0U, 0) == 0) return;
#endif
  struct rlimit rlim {};
  int last = 65536;
  if (getrlimit(RLIMIT_NOFILE, &rlim) == 0 && rlim.rlim_cur != RLIM_INFINITY) {
    last = std::min<rlim_t>(rlim.rlim_cur, 1 << 20);
  }
  for (int fd = first; fd < last; fd++) close(fd);
}

// Drains every stream with pending data, waiting at most timeout_millis for
// some. Streams that reached their end are dropped from open. Returns the
// number of streams that had activity.
int PollStreams(std::vector<sandbox::Stream*>* open, int timeout_millis,
                bool* limit_exceeded) {
  if (open->empty()) {
    if (timeout_millis > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(timeout_millis));
    }
    return 0;
  }
  std::vector<pollfd> fds;
  for (sandbox::Stream* stream : *open) {
    fds.push_back(pollfd{stream->ReadEnd(), POLLIN, 0});
  }
  int ready = poll(fds.data(), fds.size(), timeout_millis);
  if (ready == -1) {
    if (errno == EINTR) return 0;
    KJ_FAIL_SYSCALL("poll", errno);
  }
  std::vector<sandbox::Stream*> still_open;
  for (size_t i = 0; i < fds.size(); i++) {
    sandbox::Stream* stream = (*open)[i];
    if (fds[i].revents == 0) {
      still_open.push_back(stream);
      continue;
    }
    if (fds[i].revents & POLLNVAL) continue;
    switch (stream->Drain()) {
      case sandbox::Stream::Status::OPEN:
        still_open.push_back(stream);
        break;
      case sandbox::Stream::Status::LIMIT_EXCEEDED:
        if (limit_exceeded) *limit_exceeded = true;
        still_open.push_back(stream);
        break;
      case sandbox::Stream::Status::CLOSED:
        break;
    }
  }
  *open = std::move(still_open);
  return ready;
}

// Collects the exit status of a child nobody waits for anymore.
void ReapInBackground(pid_t pid) {
  std::thread([pid]() {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
  }).detach();
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

const char* RunStateName(RunState state) {
  switch (state) {
    case RunState::PENDING:
      return "pending";
    case RunState::RUNNING:
      return "running";
    case RunState::COMPLETED:
      return "completed";
    case RunState::TIMED_OUT:
      return "timed out";
    case RunState::RESOURCE_EXCEEDED:
      return "resource exceeded";
    case RunState::CRASHED:
      return "crashed";
    case RunState::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

const char* ResourceName(Resource resource) {
  switch (resource) {
    case Resource::NONE:
      return "none";
    case Resource::CPU:
      return "cpu";
    case Resource::MEMORY:
      return "memory";
    case Resource::REPORT:
      return "report";
  }
  return "unknown";
}

Governor::Governor(const Limits& limits)
    : limits_(limits), kill_function_([](pid_t pid, int signal) {
        return kill(pid, signal);
      }) {}

bool Governor::Run(const std::vector<Stream*>& streams, const Body& body,
                   const std::atomic<bool>* cancelled, RunInfo* info,
                   std::string* error_msg) {
  info->state = RunState::PENDING;
  if (!Setup(error_msg)) return false;
  if (!DoFork(streams, body, error_msg)) return false;
  info->state = RunState::RUNNING;
  info->pid = child_pid_;
  return Wait(streams, cancelled, info, error_msg);
}

bool Governor::Setup(std::string* error_msg) {
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = "pipe2: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  parent_pid_ = getpid();
  return true;
}

bool Governor::DoFork(const std::vector<Stream*>& streams, const Body& body,
                      std::string* error_msg) {
  pid_t fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child(streams, body);
}

void Governor::Child(const std::vector<Stream*>& streams, const Body& body) {
  close(pipe_fds_[0]);
  int error_fd = pipe_fds_[1];
  auto die2 = [&error_fd](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    if (WriteAll(error_fd, &len, sizeof(len))) WriteAll(error_fd, buf, len);
    _exit(kExitInternalError);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // Die with the thread that started us.
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) die("prctl", errno);
  if (getppid() != parent_pid_) _exit(kExitInternalError);

  // Change process group, so that we do not receive Ctrl-Cs in the terminal.
  if (setsid() == -1) die("setsid", errno);

  sigset_t no_signals;
  sigemptyset(&no_signals);
  if (sigprocmask(SIG_SETMASK, &no_signals, nullptr) == -1) {
    die("sigprocmask", errno);
  }
  for (int sig : {SIGINT, SIGTERM, SIGXCPU, SIGSEGV, SIGBUS, SIGFPE, SIGILL,
                  SIGABRT}) {
    if (signal(sig, SIG_DFL) == SIG_ERR) die("signal", errno);
  }
  // Writes to a closed pipe fail with EPIPE instead of killing the child.
  if (signal(SIGPIPE, SIG_IGN) == SIG_ERR) die("signal", errno);

  // Move the streams and the error pipe onto consecutive descriptors,
  // through copies that cannot collide with the targets.
  const int first_free = kFirstStreamFd + streams.size() + 1;
  std::vector<int> sources;
  for (Stream* stream : streams) sources.push_back(stream->WriteEnd());
  sources.push_back(error_fd);
  std::vector<int> copies;
  for (int fd : sources) {
    int copy = fcntl(fd, F_DUPFD, first_free);
    if (copy == -1) die("fcntl", errno);
    copies.push_back(copy);
  }
  error_fd = copies.back();
  for (size_t i = 0; i < copies.size(); i++) {
    if (dup2(copies[i], kFirstStreamFd + i) == -1) die("dup2", errno);
  }
  error_fd = kFirstStreamFd + streams.size();
  CloseFrom(first_free);
  if (close(STDIN_FILENO) == -1 && errno != EBADF) die("close", errno);

  int64_t inherited_kb = 0;
  if (limits_.memory_limit_kb != 0) {
    inherited_kb = AddressSpaceKb();
    if (inherited_kb < 0) die2("statm", "cannot read the address space size");
  }

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, soft, hard)               \
  {                                             \
    rlim.rlim_cur = soft;                       \
    rlim.rlim_max = hard;                       \
    if (setrlimit(RLIMIT_##res, &rlim) < 0) {   \
      die("setrlim " #res, errno);              \
    }                                           \
  }

  if (limits_.memory_limit_kb != 0) {
    rlim_t bytes = (inherited_kb + limits_.memory_limit_kb) * 1024;
    SET_RLIM(AS, bytes, bytes);
  }
  if (limits_.cpu_limit_millis != 0) {
    // SIGXCPU at the soft limit, SIGKILL one second later.
    rlim_t seconds = (limits_.cpu_limit_millis + 999) / 1000;
    SET_RLIM(CPU, seconds, seconds + 1);
  }
  rlim_t max_files = std::max<rlim_t>(limits_.max_files, first_free);
  SET_RLIM(NOFILE, max_files, max_files);
  SET_RLIM(FSIZE, 0, 0);
  SET_RLIM(NPROC, 0, 0);
  SET_RLIM(MEMLOCK, 0, 0);
  SET_RLIM(CORE, 0, 0);
#undef SET_RLIM

  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) die("prctl", errno);

  // Setup is over: closing the error pipe tells the supervisor.
  close(error_fd);

  int exit_code = kExitInternalError;
  // Nothing may unwind past the fork point.
  try {
    exit_code = body();
  } catch (const std::bad_alloc&) {
    exit_code = kExitMemoryExhausted;
  } catch (...) {
    exit_code = kExitInternalError;
  }
  _exit(exit_code);
}

bool Governor::Wait(const std::vector<Stream*>& streams,
                    const std::atomic<bool>* cancelled, RunInfo* info,
                    std::string* error_msg) {
  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  close(pipe_fds_[1]);
  for (Stream* stream : streams) stream->CloseWriteEnd();

  // If a syscall below throws, the child must not outlive the supervisor.
  bool settled = false;
  pid_t pid = child_pid_;
  auto abandon = kj::defer([this, &settled, pid]() {
    if (settled) return;
    kill_function_(pid, SIGKILL);
    ReapInBackground(pid);
  });

  ssize_t error_len = 0;
  ssize_t header = 0;
  do {
    header = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (header == -1 && errno == EINTR);
  if (header == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    error_len = std::min<ssize_t>(error_len, PIPE_BUF - 1);
    KJ_SYSCALL(read(pipe_fds_[0], error, error_len), "Failed to read from fd");
    close(pipe_fds_[0]);
    int child_status = 0;
    KJ_SYSCALL(waitpid(child_pid_, &child_status, 0));
    settled = true;
    *error_msg = error;
    return false;
  }
  close(pipe_fds_[0]);

  std::vector<Stream*> open = streams;
  StopReason reason = StopReason::NONE;
  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};

  auto try_reap = [&]() {
    pid_t ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno != EINTR) KJ_FAIL_SYSCALL("wait4", errno);
    return ret == child_pid_;
  };

  while (true) {
    bool report_too_large = false;
    PollStreams(&open, kPollMillis, &report_too_large);
    if (try_reap()) {
      has_exited = true;
      break;
    }
    if (report_too_large) {
      reason = StopReason::REPORT;
    } else if (cancelled != nullptr && cancelled->load()) {
      reason = StopReason::CANCELLED;
    } else if (limits_.wall_limit_millis != 0 &&
               elapsed_millis() >= limits_.wall_limit_millis) {
      reason = StopReason::TIMEOUT;
    }
    if (reason != StopReason::NONE) break;
  }

  if (!has_exited) {
    if (kill_function_(child_pid_, SIGKILL) == -1 && errno != ESRCH) {
      char buf[kStrErrorBufSize] = {};
      info->message = "kill: ";
      info->message += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    }
    auto killed_at = std::chrono::steady_clock::now();
    auto grace = std::chrono::milliseconds(limits_.grace_period_millis);
    while (!has_exited) {
      // Keep draining: output written before the kill is still returned.
      PollStreams(&open, kReapPollMillis, nullptr);
      has_exited = try_reap();
      if (std::chrono::steady_clock::now() - killed_at >= grace) break;
    }
  }
  info->wall_time_millis = elapsed_millis();

  if (!has_exited) {
    info->reaped = false;
    settled = true;
    ReapInBackground(pid);
  } else {
    settled = true;
    // The child is gone, so every write end is closed.
    while (!open.empty() && PollStreams(&open, 0, nullptr) > 0) {
    }
  }

  info->memory_usage_kb = rusage.ru_maxrss;
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  Classify(reason, child_status, info);
  return true;
}

void Governor::Classify(StopReason reason, int child_status,
                        RunInfo* info) const {
  switch (reason) {
    case StopReason::TIMEOUT:
      info->state = RunState::TIMED_OUT;
      return;
    case StopReason::CANCELLED:
      info->state = RunState::CANCELLED;
      return;
    case StopReason::REPORT:
      info->state = RunState::RESOURCE_EXCEEDED;
      info->resource = Resource::REPORT;
      return;
    case StopReason::NONE:
      break;
  }
  if (WIFSIGNALED(child_status)) {
    int64_t cpu_millis = info->cpu_time_millis + info->sys_time_millis;
    if (info->signal == SIGXCPU ||
        (info->signal == SIGKILL && limits_.cpu_limit_millis != 0 &&
         cpu_millis >= limits_.cpu_limit_millis)) {
      info->state = RunState::RESOURCE_EXCEEDED;
      info->resource = Resource::CPU;
      return;
    }
    info->state = RunState::CRASHED;
    info->message = std::string("killed by signal: ") + strsignal(info->signal);
    return;
  }
  switch (info->status_code) {
    case 0:
      info->state = RunState::COMPLETED;
      return;
    case kExitMemoryExhausted:
      info->state = RunState::RESOURCE_EXCEEDED;
      info->resource = Resource::MEMORY;
      return;
    default:
      info->state = RunState::CRASHED;
      info->message =
          "exited with status " + std::to_string(info->status_code);
      return;
  }
}

}  // namespace sandbox
