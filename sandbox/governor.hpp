#ifndef SANDBOX_GOVERNOR_HPP
#define SANDBOX_GOVERNOR_HPP

#include <sys/types.h>
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace sandbox {

// One-directional stream from the isolated child to the supervisor. The
// child inherits the write end; the supervisor drains the read end while the
// child runs.
class Stream {
 public:
  enum class Status { OPEN, CLOSED, LIMIT_EXCEEDED };

  virtual int WriteEnd() const = 0;
  virtual int ReadEnd() const = 0;
  // Called in the supervisor once the child holds its own copy.
  virtual void CloseWriteEnd() = 0;
  // Consumes whatever is readable without blocking. LIMIT_EXCEEDED asks the
  // supervisor to stop the child.
  virtual Status Drain() = 0;
  virtual ~Stream() = default;
};

enum class RunState {
  PENDING,
  RUNNING,
  COMPLETED,
  TIMED_OUT,
  RESOURCE_EXCEEDED,
  CRASHED,
  CANCELLED
};

// Which ceiling a RESOURCE_EXCEEDED run hit.
enum class Resource { NONE, CPU, MEMORY, REPORT };

const char* RunStateName(RunState state);
const char* ResourceName(Resource resource);

// Ceilings applied to one child. Zero disables a limit.
struct Limits {
  int64_t wall_limit_millis = 0;
  int64_t cpu_limit_millis = 0;
  // Address space the child may add on top of what it inherits.
  int64_t memory_limit_kb = 0;
  int64_t grace_period_millis = 1000;
  int32_t max_files = 16;
};

// Results of the supervision.
struct RunInfo {
  RunState state = RunState::PENDING;
  Resource resource = Resource::NONE;
  // False if the child was still alive after the grace period that followed
  // the kill signal.
  bool reaped = true;
  pid_t pid = 0;
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  std::string message;
};

// Runs a function in a forked child under resource ceilings, and classifies
// how it ended. The child starts with stdin closed, the given streams on
// descriptors kFirstStreamFd, kFirstStreamFd + 1, ..., and every other
// inherited descriptor closed. It cannot gain privileges, create processes
// or write files, and dies with the thread that started it.
class Governor {
 public:
  static const constexpr int kFirstStreamFd = 3;
  // Exit codes the child body may use.
  static const constexpr int kExitMemoryExhausted = 3;
  static const constexpr int kExitInternalError = 4;

  using Body = std::function<int()>;
  using KillFunction = std::function<int(pid_t, int)>;

  explicit Governor(const Limits& limits);

  // Replaces kill(2) for the termination signal. Tests use it to simulate a
  // child that cannot be stopped.
  void SetKillFunction(KillFunction kill_function) {
    kill_function_ = std::move(kill_function);
  }

  // Returns false only if the child could not be started; every way a
  // started child can end is described by info.
  bool Run(const std::vector<Stream*>& streams, const Body& body,
           const std::atomic<bool>* cancelled, RunInfo* info,
           std::string* error_msg);

 private:
  enum class StopReason { NONE, TIMEOUT, CANCELLED, REPORT };

  bool Setup(std::string* error_msg);
  bool DoFork(const std::vector<Stream*>& streams, const Body& body,
              std::string* error_msg);
  [[noreturn]] void Child(const std::vector<Stream*>& streams,
                          const Body& body);
  bool Wait(const std::vector<Stream*>& streams,
            const std::atomic<bool>* cancelled, RunInfo* info,
            std::string* error_msg);
  void Classify(StopReason reason, int child_status, RunInfo* info) const;

  Limits limits_;
  KillFunction kill_function_;
  int pipe_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
  pid_t parent_pid_ = 0;
};

}  // namespace sandbox

#endif
