#include "coordinator/execution.hpp"

namespace coordinator {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::INVALID_REQUEST:
      return "InvalidRequest";
    case ErrorKind::REJECTED_BINDING:
      return "RejectedBinding";
    case ErrorKind::SYNTAX_FAULT:
      return "SyntaxFault";
    case ErrorKind::RUNTIME_FAULT:
      return "RuntimeFault";
    case ErrorKind::TIMED_OUT:
      return "TimedOut";
    case ErrorKind::RESOURCE_EXCEEDED:
      return "ResourceExceeded";
    case ErrorKind::TERMINATION_FAULT:
      return "TerminationFault";
    case ErrorKind::CANCELLED:
      return "Cancelled";
    case ErrorKind::INTERNAL_ERROR:
      return "InternalError";
  }
  return "InternalError";
}

bool IsOperationalFault(ErrorKind kind) {
  return kind == ErrorKind::TERMINATION_FAULT ||
         kind == ErrorKind::INTERNAL_ERROR;
}

std::string ExecutionError::ToString() const {
  std::string text = ErrorKindName(kind);
  if (!label.empty()) text += " (" + label + ")";
  if (!message.empty()) text += ": " + message;
  if (line != 0) {
    text += " at line " + std::to_string(line);
    if (column != 0) text += ", column " + std::to_string(column);
  }
  if (!resource.empty()) text += " [" + resource + "]";
  if (limit_millis != 0) {
    text += " after " + std::to_string(elapsed_millis) + "ms, limit " +
            std::to_string(limit_millis) + "ms";
  }
  return text;
}

}  // namespace coordinator
