#include "coordinator/coordinator.hpp"

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>
#include <cctype>
#include <cstring>

#include "capnp/execution.capnp.h"
#include "coordinator/isolated_run.hpp"
#include "coordinator/wire.hpp"
#include "script/lexer.hpp"

namespace coordinator {

namespace {
ExecutionError MakeError(ErrorKind kind, std::string message) {
  ExecutionError error;
  error.kind = kind;
  error.message = std::move(message);
  return error;
}

const char* RejectionLabel(context::RejectedBinding::Reason reason) {
  switch (reason) {
    case context::RejectedBinding::Reason::INVALID_NAME:
      return "InvalidName";
    case context::RejectedBinding::Reason::RESERVED_NAME:
      return "ReservedName";
    case context::RejectedBinding::Reason::NOT_TRANSFERABLE:
      return "NotTransferable";
  }
  return "";
}

bool IsBlank(const std::string& code) {
  for (char c : code) {
    if (!isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}
}  // namespace

ExecutionError CrashError(const sandbox::RunInfo& info) {
  if (info.signal == 0 &&
      info.status_code == sandbox::Governor::kExitInternalError) {
    return MakeError(ErrorKind::INTERNAL_ERROR,
                     "the isolated run failed outside the program (" +
                         info.message + ")");
  }
  ExecutionError error = MakeError(ErrorKind::RUNTIME_FAULT, info.message);
  error.label = "Crashed";
  return error;
}

Coordinator::Coordinator(const Config& config,
                         const policy::CapabilityPolicy& policy)
    : config_(config), builder_(policy), pool_(config.workers) {}

void Coordinator::Fail(ExecutionError error, ExecutionResult* result) {
  result->succeeded_ = false;
  result->has_result_ = false;
  result->result_ = script::Value::None();
  result->updated_bindings_.clear();
  result->has_error_ = true;
  result->error_ = std::move(error);
}

ExecutionResult Coordinator::Run(const ExecutionRequest& request,
                                 const CancellationToken& cancellation) {
  ExecutionResult result;
  try {
    ExecutionError error;
    if (!Validate(request, &error)) {
      KJ_LOG(INFO, "invalid request", error.message);
      Fail(std::move(error), &result);
      return result;
    }

    context::ExecutionContext context;
    context::RejectedBinding rejection;
    if (!builder_.Build(request.tier, request.bindings, &context,
                        &rejection)) {
      KJ_LOG(WARNING, "rejected binding", rejection.name, rejection.message);
      error = MakeError(ErrorKind::REJECTED_BINDING, rejection.message);
      error.label = RejectionLabel(rejection.reason);
      Fail(std::move(error), &result);
      return result;
    }

    std::unique_ptr<WorkerPool::Slot> slot =
        pool_.Acquire(cancellation.Flag());
    if (!slot) {
      KJ_LOG(INFO, "run cancelled while queued");
      Fail(MakeError(ErrorKind::CANCELLED, "cancelled before it started"),
           &result);
      return result;
    }
    Execute(request, context, cancellation, &result);
  } catch (const kj::Exception& e) {
    Fail(MakeError(ErrorKind::INTERNAL_ERROR, e.getDescription().cStr()),
         &result);
  } catch (const std::exception& e) {
    Fail(MakeError(ErrorKind::INTERNAL_ERROR, e.what()), &result);
  }
  if (result.has_error_ && IsOperationalFault(result.error_.kind)) {
    KJ_LOG(ERROR, result.error_.ToString());
  } else if (result.has_error_) {
    KJ_LOG(INFO, result.error_.ToString());
  }
  return result;
}

bool Coordinator::Validate(const ExecutionRequest& request,
                           ExecutionError* error) const {
  if (request.timeout_millis <= 0) {
    *error = MakeError(ErrorKind::INVALID_REQUEST,
                       "timeout must be positive, got " +
                           std::to_string(request.timeout_millis) + "ms");
    return false;
  }
  if (request.timeout_millis > config_.max_timeout_millis) {
    *error = MakeError(ErrorKind::INVALID_REQUEST,
                       "timeout of " + std::to_string(request.timeout_millis) +
                           "ms exceeds the maximum of " +
                           std::to_string(config_.max_timeout_millis) + "ms");
    error->limit_millis = config_.max_timeout_millis;
    return false;
  }
  if (IsBlank(request.code)) {
    *error = MakeError(ErrorKind::INVALID_REQUEST, "code is empty");
    return false;
  }
  for (const std::string& name : request.observe) {
    if (!script::IsIdentifier(name)) {
      *error = MakeError(ErrorKind::INVALID_REQUEST,
                         "cannot observe '" + name +
                             "': not a valid identifier");
      return false;
    }
  }
  return true;
}

void Coordinator::Execute(const ExecutionRequest& request,
                          const context::ExecutionContext& context,
                          const CancellationToken& cancellation,
                          ExecutionResult* result) {
  capture::OutputCapture capture(config_.output_capacity);
  capture::CapturePipe report(config_.report_capacity,
                              /*limit_is_fatal=*/true);
  std::string error_msg;
  if (!report.Open(&error_msg) || !capture.Open(&error_msg)) {
    Fail(MakeError(ErrorKind::INTERNAL_ERROR, error_msg), result);
    return;
  }

  sandbox::Limits limits;
  limits.wall_limit_millis = request.timeout_millis;
  limits.cpu_limit_millis = config_.cpu_limit_millis != 0
                                ? config_.cpu_limit_millis
                                : request.timeout_millis;
  limits.memory_limit_kb = config_.memory_limit_kb;
  limits.grace_period_millis = config_.grace_period_millis;
  sandbox::Governor governor(limits);
  if (kill_function_) governor.SetKillFunction(kill_function_);

  // Must match kReportFd, kStdoutPipeFd and kStderrPipeFd.
  std::vector<sandbox::Stream*> streams = {&report, capture.StdoutPipe(),
                                           capture.StderrPipe()};
  sandbox::RunInfo info;
  bool started = governor.Run(
      streams,
      [&request, &context]() {
        return RunIsolated(request.code, context, request.observe);
      },
      cancellation.Flag(), &info, &error_msg);

  result->stdout_.data = capture.Stdout().Data();
  result->stdout_.truncated = capture.Stdout().Truncated();
  result->stderr_.data = capture.Stderr().Data();
  result->stderr_.truncated = capture.Stderr().Truncated();
  result->usage_.wall_millis = info.wall_time_millis;
  result->usage_.cpu_millis = info.cpu_time_millis;
  result->usage_.sys_millis = info.sys_time_millis;
  result->usage_.peak_memory_kb = info.memory_usage_kb;

  if (!started) {
    Fail(MakeError(ErrorKind::INTERNAL_ERROR,
                   "cannot start the isolated run: " + error_msg),
         result);
    return;
  }
  // A report cut short by its ceiling cannot be decoded.
  if (info.state == sandbox::RunState::COMPLETED &&
      report.Buffer().Truncated()) {
    info.state = sandbox::RunState::RESOURCE_EXCEEDED;
    info.resource = sandbox::Resource::REPORT;
  }
  Classify(request, info, report.Buffer().Data(), result);
}

void Coordinator::Classify(const ExecutionRequest& request,
                           const sandbox::RunInfo& info,
                           const std::string& report,
                           ExecutionResult* result) const {
  ExecutionError error;
  error.elapsed_millis = info.wall_time_millis;
  if (!info.reaped) {
    error.kind = ErrorKind::TERMINATION_FAULT;
    error.message = "isolated run " + std::to_string(info.pid) +
                    " still alive " +
                    std::to_string(config_.grace_period_millis) +
                    "ms after being killed";
    if (!info.message.empty()) error.message += " (" + info.message + ")";
    error.limit_millis = request.timeout_millis;
    Fail(std::move(error), result);
    return;
  }
  switch (info.state) {
    case sandbox::RunState::COMPLETED:
      break;
    case sandbox::RunState::TIMED_OUT:
      error.kind = ErrorKind::TIMED_OUT;
      error.message = "the run did not finish in time";
      error.limit_millis = request.timeout_millis;
      Fail(std::move(error), result);
      return;
    case sandbox::RunState::CANCELLED:
      error.kind = ErrorKind::CANCELLED;
      error.message = "the run was cancelled";
      Fail(std::move(error), result);
      return;
    case sandbox::RunState::RESOURCE_EXCEEDED:
      error.kind = ErrorKind::RESOURCE_EXCEEDED;
      error.resource = sandbox::ResourceName(info.resource);
      switch (info.resource) {
        case sandbox::Resource::CPU:
          error.message = "CPU time limit exceeded";
          error.limit_millis = config_.cpu_limit_millis != 0
                                   ? config_.cpu_limit_millis
                                   : request.timeout_millis;
          break;
        case sandbox::Resource::MEMORY:
          error.message = "memory limit of " +
                          std::to_string(config_.memory_limit_kb) +
                          "KiB exceeded";
          break;
        default:
          error.message = "the run report exceeds " +
                          std::to_string(config_.report_capacity) + " bytes";
          break;
      }
      Fail(std::move(error), result);
      return;
    case sandbox::RunState::CRASHED: {
      ExecutionError crash = CrashError(info);
      crash.elapsed_millis = info.wall_time_millis;
      Fail(std::move(crash), result);
      return;
    }
    case sandbox::RunState::PENDING:
    case sandbox::RunState::RUNNING:
      Fail(MakeError(ErrorKind::INTERNAL_ERROR,
                     std::string("unexpected run state: ") +
                         sandbox::RunStateName(info.state)),
           result);
      return;
  }

  // The child exited normally, so its report says how the program ended.
  if (report.empty() || report.size() % sizeof(capnp::word) != 0) {
    Fail(MakeError(ErrorKind::INTERNAL_ERROR, "malformed run report"), result);
    return;
  }
  kj::Array<capnp::word> words =
      kj::heapArray<capnp::word>(report.size() / sizeof(capnp::word));
  memcpy(words.begin(), report.data(), report.size());
  capnp::ReaderOptions options;
  options.traversalLimitInWords = 2 * words.size() + 1024;
  options.nestingLimit = Wire::kNestingLimit;
  capnp::FlatArrayMessageReader reader(words, options);
  auto outcome = reader.getRoot<capnproto::RunReport>().getOutcome();
  switch (outcome.which()) {
    case capnproto::RunReport::Outcome::COMPLETED: {
      auto completed = outcome.getCompleted();
      if (completed.getResult().isValue()) {
        result->has_result_ = true;
        result->result_ = Wire::ReadValue(completed.getResult().getValue());
      }
      result->updated_bindings_ = Wire::ReadBindings(completed.getObserved());
      result->succeeded_ = true;
      return;
    }
    case capnproto::RunReport::Outcome::SYNTAX_FAULT: {
      auto fault = outcome.getSyntaxFault();
      error.kind = ErrorKind::SYNTAX_FAULT;
      error.label = "SyntaxError";
      error.message = fault.getMessage().cStr();
      error.line = fault.getLine();
      error.column = fault.getColumn();
      Fail(std::move(error), result);
      return;
    }
    case capnproto::RunReport::Outcome::RUNTIME_FAULT: {
      auto fault = outcome.getRuntimeFault();
      error.kind = ErrorKind::RUNTIME_FAULT;
      error.label = fault.getLabel().cStr();
      error.message = fault.getMessage().cStr();
      error.line = fault.getLine();
      Fail(std::move(error), result);
      return;
    }
  }
  KJ_FAIL_ASSERT("unknown run report outcome",
                 static_cast<int>(outcome.which()));
}

}  // namespace coordinator
