#ifndef CONTEXT_CONTEXT_BUILDER_HPP
#define CONTEXT_CONTEXT_BUILDER_HPP

#include <map>
#include <string>

#include "policy/capability_policy.hpp"
#include "script/interpreter.hpp"
#include "script/value.hpp"

namespace context {

using Bindings = std::map<std::string, script::Value>;

// Why a caller-supplied binding was refused.
struct RejectedBinding {
  enum class Reason { INVALID_NAME, RESERVED_NAME, NOT_TRANSFERABLE };
  std::string name;
  Reason reason = Reason::INVALID_NAME;
  std::string message;
};

// The namespace exposed to a single run: the names of one capability tier
// plus private copies of the caller's bindings. Built once, never modified,
// and owned by exactly one run.
class ExecutionContext {
 public:
  ExecutionContext() = default;
  ExecutionContext(ExecutionContext&&) = default;
  ExecutionContext& operator=(ExecutionContext&&) = default;
  ExecutionContext(const ExecutionContext&) = delete;
  ExecutionContext& operator=(const ExecutionContext&) = delete;

  const policy::Names& PolicyNames() const { return policy_names_; }
  const Bindings& UserBindings() const { return bindings_; }

  // Binds every name of the context as a global of the interpreter.
  void InstallInto(script::Interpreter* interpreter) const;

 private:
  friend class ContextBuilder;
  policy::Names policy_names_;
  Bindings bindings_;
};

class ContextBuilder {
 public:
  explicit ContextBuilder(const policy::CapabilityPolicy& policy)
      : policy_(policy) {}

  // Builds the context of a run. Returns false and fills rejection if a
  // binding name is not an identifier, collides with a reserved name, or if
  // its value cannot cross the isolation boundary. Accepted values are deep
  // copied, so the run never aliases caller state.
  bool Build(policy::Tier tier, const Bindings& bindings,
             ExecutionContext* context, RejectedBinding* rejection) const;

 private:
  const policy::CapabilityPolicy& policy_;
};

}  // namespace context

#endif
