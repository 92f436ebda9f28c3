#ifndef COORDINATOR_EXECUTION_HPP
#define COORDINATOR_EXECUTION_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "policy/capability_policy.hpp"
#include "script/value.hpp"

namespace coordinator {

enum class ErrorKind {
  INVALID_REQUEST,
  REJECTED_BINDING,
  SYNTAX_FAULT,
  RUNTIME_FAULT,
  TIMED_OUT,
  RESOURCE_EXCEEDED,
  TERMINATION_FAULT,
  CANCELLED,
  INTERNAL_ERROR
};

// CamelCase name of the kind, e.g. "TimedOut".
const char* ErrorKindName(ErrorKind kind);

// True for the kinds that indicate a host problem rather than a problem
// with the request or the program.
bool IsOperationalFault(ErrorKind kind);

struct ExecutionError {
  ErrorKind kind = ErrorKind::INTERNAL_ERROR;
  // Fault classification, e.g. "NameError"; empty when not applicable.
  std::string label;
  std::string message;
  // 0 when unknown.
  int32_t line = 0;
  int32_t column = 0;
  int64_t elapsed_millis = 0;
  int64_t limit_millis = 0;
  // Ceiling hit by a RESOURCE_EXCEEDED run: "cpu", "memory" or "report".
  std::string resource;

  std::string ToString() const;
};

struct ExecutionRequest {
  std::string code;
  std::map<std::string, script::Value> bindings;
  int64_t timeout_millis = 0;
  policy::Tier tier = policy::Tier::MINIMAL;
  // Global names copied back into the result after a successful run.
  std::vector<std::string> observe;
};

struct CapturedChannel {
  std::string data;
  bool truncated = false;
};

struct ResourceUsage {
  int64_t wall_millis = 0;
  int64_t cpu_millis = 0;
  int64_t sys_millis = 0;
  int64_t peak_memory_kb = 0;
};

// Outcome of one run. Built by the coordinator, immutable afterwards.
class ExecutionResult {
 public:
  bool Succeeded() const { return succeeded_; }
  bool HasResult() const { return has_result_; }
  const script::Value& Result() const { return result_; }
  const CapturedChannel& Stdout() const { return stdout_; }
  const CapturedChannel& Stderr() const { return stderr_; }
  bool HasError() const { return has_error_; }
  const ExecutionError& Error() const { return error_; }
  const std::map<std::string, script::Value>& UpdatedBindings() const {
    return updated_bindings_;
  }
  const ResourceUsage& Usage() const { return usage_; }

 private:
  friend class Coordinator;
  friend class Wire;

  bool succeeded_ = false;
  bool has_result_ = false;
  script::Value result_;
  CapturedChannel stdout_;
  CapturedChannel stderr_;
  bool has_error_ = false;
  ExecutionError error_;
  std::map<std::string, script::Value> updated_bindings_;
  ResourceUsage usage_;
};

}  // namespace coordinator

#endif
