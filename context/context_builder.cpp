#include "context/context_builder.hpp"

#include "script/lexer.hpp"

namespace context {

void ExecutionContext::InstallInto(script::Interpreter* interpreter) const {
  for (const auto& entry : policy_names_) {
    interpreter->Bind(entry.first, entry.second);
  }
  for (const auto& entry : bindings_) {
    interpreter->Bind(entry.first, entry.second);
  }
}

bool ContextBuilder::Build(policy::Tier tier, const Bindings& bindings,
                           ExecutionContext* context,
                           RejectedBinding* rejection) const {
  auto reject = [rejection](const std::string& name,
                            RejectedBinding::Reason reason,
                            const std::string& message) {
    rejection->name = name;
    rejection->reason = reason;
    rejection->message = message;
    return false;
  };
  // Check everything before copying anything.
  for (const auto& entry : bindings) {
    const std::string& name = entry.first;
    if (!script::IsIdentifier(name) && !script::IsKeyword(name)) {
      return reject(name, RejectedBinding::Reason::INVALID_NAME,
                    "binding name '" + name + "' is not a valid identifier");
    }
    if (policy_.IsReserved(name)) {
      return reject(name, RejectedBinding::Reason::RESERVED_NAME,
                    "binding name '" + name + "' is reserved");
    }
    if (!entry.second.IsTransferable()) {
      return reject(name, RejectedBinding::Reason::NOT_TRANSFERABLE,
                    "binding '" + name + "' holds a value of type '" +
                        entry.second.TypeName() +
                        "' that cannot be transferred into a run");
    }
  }
  ExecutionContext built;
  built.policy_names_ = policy_.Resolve(tier);
  for (const auto& entry : bindings) {
    built.bindings_.emplace(entry.first, entry.second.DeepCopy());
  }
  *context = std::move(built);
  return true;
}

}  // namespace context
