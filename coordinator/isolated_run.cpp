#include "coordinator/isolated_run.hpp"

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <unistd.h>
#include <new>
#include <stdexcept>

#include "capture/output_capture.hpp"
#include "coordinator/wire.hpp"
#include "policy/capability_policy.hpp"
#include "script/errors.hpp"
#include "script/interpreter.hpp"
#include "script/parser.hpp"

namespace coordinator {

void BuildReport(const script::Interpreter& interpreter,
                 const std::vector<std::string>& observe,
                 capnproto::RunReport::Builder report) {
  const script::Value* result = interpreter.Lookup(policy::kResultName);
  if (result != nullptr && !result->IsTransferable()) {
    auto fault = report.getOutcome().initRuntimeFault();
    fault.setLabel("TypeError");
    fault.setMessage("'" + result->TypeName() +
                     "' value bound to 'result' cannot be returned");
    return;
  }
  auto completed = report.getOutcome().initCompleted();
  if (result == nullptr) {
    completed.getResult().setAbsent();
  } else {
    Wire::WriteValue(*result, completed.getResult().initValue());
  }
  std::vector<std::pair<std::string, const script::Value*>> observed;
  for (const std::string& name : observe) {
    const script::Value* value = interpreter.Lookup(name);
    if (value == nullptr || !value->IsTransferable()) continue;
    observed.emplace_back(name, value);
  }
  auto list = completed.initObserved(observed.size());
  for (size_t i = 0; i < observed.size(); i++) {
    list[i].setName(observed[i].first);
    Wire::WriteValue(*observed[i].second, list[i].initValue());
  }
}

int RunIsolated(const std::string& code,
                const context::ExecutionContext& context,
                const std::vector<std::string>& observe) {
  capture::ScopedRedirect redirect_stdout(STDOUT_FILENO, kStdoutPipeFd);
  capture::ScopedRedirect redirect_stderr(STDERR_FILENO, kStderrPipeFd);
  capture::FdSink out(STDOUT_FILENO);
  capture::FdSink err(STDERR_FILENO);

  capnp::MallocMessageBuilder message;
  auto report = message.initRoot<capnproto::RunReport>();
  try {
    std::shared_ptr<const script::Program> program = script::Parse(code);
    script::Interpreter interpreter(&out, &err);
    context.InstallInto(&interpreter);
    try {
      interpreter.Run(program);
      BuildReport(interpreter, observe, report);
    } catch (const script::ScriptError& e) {
      auto fault = report.getOutcome().initRuntimeFault();
      fault.setLabel(e.Label());
      fault.setMessage(e.what());
      fault.setLine(e.Line());
    }
  } catch (const script::SyntaxError& e) {
    auto fault = report.getOutcome().initSyntaxFault();
    fault.setMessage(e.what());
    fault.setLine(e.Line());
    fault.setColumn(e.Column());
  } catch (const std::bad_alloc&) {
    return sandbox::Governor::kExitMemoryExhausted;
  } catch (const std::length_error&) {
    return sandbox::Governor::kExitMemoryExhausted;
  }
  capnp::writeMessageToFd(kReportFd, message);
  return 0;
}

}  // namespace coordinator
