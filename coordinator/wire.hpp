#ifndef COORDINATOR_WIRE_HPP
#define COORDINATOR_WIRE_HPP

#include <map>
#include <string>

#include "capnp/execution.capnp.h"
#include "capnp/value.capnp.h"
#include "coordinator/execution.hpp"
#include "script/value.hpp"

namespace coordinator {

// Conversions between the in-memory types and their Cap'n Proto messages.
// Malformed messages raise kj exceptions.
class Wire {
 public:
  // Only transferable values can be written.
  static void WriteValue(const script::Value& value,
                         capnproto::Value::Builder builder);
  static script::Value ReadValue(capnproto::Value::Reader reader);

  static void WriteBindings(
      const std::map<std::string, script::Value>& bindings,
      capnp::List<capnproto::Binding>::Builder builder);
  static std::map<std::string, script::Value> ReadBindings(
      capnp::List<capnproto::Binding>::Reader reader);

  static void WriteRequest(const ExecutionRequest& request,
                           capnproto::ExecutionRequest::Builder builder);
  static ExecutionRequest ReadRequest(
      capnproto::ExecutionRequest::Reader reader);

  static void WriteError(const ExecutionError& error,
                         capnproto::ExecutionError::Builder builder);
  static ExecutionError ReadError(capnproto::ExecutionError::Reader reader);

  static void WriteResult(const ExecutionResult& result,
                          capnproto::ExecutionResult::Builder builder);
  static ExecutionResult ReadResult(capnproto::ExecutionResult::Reader reader);

  // Nesting limit for readers of messages carrying values. A dict level
  // costs two pointer hops (the entry list, then the entry value).
  static const constexpr int kNestingLimit =
      2 * script::Value::kMaxTransferDepth + 8;

 private:
  static script::Value ReadValue(capnproto::Value::Reader reader, int depth);
};

}  // namespace coordinator

#endif
