#ifndef COORDINATOR_COORDINATOR_HPP
#define COORDINATOR_COORDINATOR_HPP

#include <string>

#include "capture/output_capture.hpp"
#include "context/context_builder.hpp"
#include "coordinator/cancellation.hpp"
#include "coordinator/config.hpp"
#include "coordinator/execution.hpp"
#include "coordinator/worker_pool.hpp"
#include "policy/capability_policy.hpp"
#include "sandbox/governor.hpp"

namespace coordinator {

// Runs strategy programs. Each call to Run validates the request, builds a
// fresh context, runs the program in its own isolated child under the
// resource governor and reports the outcome as data: no exception ever
// leaves Run. Safe to call from many threads at once; runs beyond the
// configured worker count wait their turn.
class Coordinator {
 public:
  explicit Coordinator(const Config& config,
                       const policy::CapabilityPolicy& policy =
                           policy::CapabilityPolicy::Get());

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  ExecutionResult Run(const ExecutionRequest& request) {
    return Run(request, CancellationToken());
  }
  ExecutionResult Run(const ExecutionRequest& request,
                      const CancellationToken& cancellation);

  // Replaces the signal delivery used to stop children. Only for tests.
  void SetKillFunction(sandbox::Governor::KillFunction kill_function) {
    kill_function_ = std::move(kill_function);
  }

  const Config& GetConfig() const { return config_; }
  const WorkerPool& Pool() const { return pool_; }

 private:
  bool Validate(const ExecutionRequest& request, ExecutionError* error) const;
  void Execute(const ExecutionRequest& request,
               const context::ExecutionContext& context,
               const CancellationToken& cancellation, ExecutionResult* result);
  void Classify(const ExecutionRequest& request, const sandbox::RunInfo& info,
                const std::string& report, ExecutionResult* result) const;
  static void Fail(ExecutionError error, ExecutionResult* result);

  const Config config_;
  context::ContextBuilder builder_;
  WorkerPool pool_;
  sandbox::Governor::KillFunction kill_function_;
};

// Describes a child that ended abnormally. A program fault kills the child
// with a signal; exiting with Governor::kExitInternalError means the
// supervision code in the child failed instead.
ExecutionError CrashError(const sandbox::RunInfo& info);

}  // namespace coordinator

#endif
